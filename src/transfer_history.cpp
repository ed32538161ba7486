#include "transfer_history.hpp"

#include <utility>

void TransferHistory::record(ReceivedFile entry) {
  if(entry.received_at == std::chrono::system_clock::time_point{}) {
    entry.received_at = std::chrono::system_clock::now();
  }
  std::lock_guard lg(m_);
  entries_.insert(entries_.begin(), std::move(entry));
}

std::vector<ReceivedFile> TransferHistory::entries() const {
  std::lock_guard lg(m_);
  return entries_;
}

std::size_t TransferHistory::size() const {
  std::lock_guard lg(m_);
  return entries_.size();
}

void TransferHistory::clear() {
  std::lock_guard lg(m_);
  entries_.clear();
}
