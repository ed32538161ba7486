#include "transfer_queue.hpp"

#include <algorithm>
#include <utility>

#include "utils.hpp"

const char* queue_status_name(QueueItemStatus status) {
  switch(status) {
    case QueueItemStatus::Pending: return "pending";
    case QueueItemStatus::Sending: return "sending";
    case QueueItemStatus::Completed: return "completed";
    case QueueItemStatus::Failed: return "failed";
    case QueueItemStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

TransferQueue::TransferQueue(PeerIdentity destination,
                             std::shared_ptr<FileSender> sender,
                             std::shared_ptr<Logger> logger)
  : sender_(std::move(sender)),
    logger_(std::move(logger)),
    destination_(std::move(destination)) {}

std::string TransferQueue::enqueue(const std::filesystem::path& path) {
  QueueItem item;
  item.transfer_id = make_transfer_id(path.filename().string());
  item.path = path;
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if(!ec) item.total_bytes = size;

  bool idle = false;
  {
    std::lock_guard lg(m_);
    items_.push_back(item);
    idle = !active_.has_value();
  }
  log_debug(logger_.get(), "Queued {} for {} as {}", path.string(), destination().address, item.transfer_id);
  notify(item);
  if(idle) start_next();
  return item.transfer_id;
}

void TransferQueue::start_next() {
  SendRequest request;
  QueueItem snapshot;
  {
    std::lock_guard lg(m_);
    if(active_) return;
    auto it = std::find_if(items_.begin(), items_.end(),
                           [](const QueueItem& i){ return i.status == QueueItemStatus::Pending; });
    if(it == items_.end()) return;
    it->status = QueueItemStatus::Sending;
    active_ = it->transfer_id;
    request.transfer_id = it->transfer_id;
    request.file_path = it->path;
    request.destination = destination_;
    request.kind = PayloadKind::Data;
    snapshot = *it;
  }
  notify(snapshot);

  std::weak_ptr<TransferQueue> weak = weak_from_this();
  const std::string id = request.transfer_id;
  sender_->send(request,
    [weak, id](uint64_t total, uint64_t sent){
      if(auto self = weak.lock()) self->on_progress(id, total, sent);
    },
    [weak, id](const TransferOutcome& outcome){
      if(auto self = weak.lock()) self->on_complete(id, outcome);
    });
}

void TransferQueue::on_progress(const std::string& transfer_id, uint64_t total, uint64_t sent) {
  QueueItem snapshot;
  {
    std::lock_guard lg(m_);
    auto* item = find_locked(transfer_id);
    if(!item) return;
    item->total_bytes = total;
    item->sent_bytes = sent;
    snapshot = *item;
  }
  notify(snapshot);
}

void TransferQueue::on_complete(const std::string& transfer_id, const TransferOutcome& outcome) {
  QueueItem snapshot;
  {
    std::lock_guard lg(m_);
    if(active_ && *active_ == transfer_id) active_.reset();
    auto* item = find_locked(transfer_id);
    if(!item) return;
    if(outcome.ok()) {
      item->status = QueueItemStatus::Completed;
      item->message = "sent";
    } else if(outcome.error == TransferError::Cancelled) {
      item->status = QueueItemStatus::Cancelled;
      item->message = "cancelled";
    } else {
      item->status = QueueItemStatus::Failed;
      item->message = outcome.message;
    }
    snapshot = *item;
  }
  if(snapshot.status == QueueItemStatus::Failed) {
    log_warn(logger_.get(), "Send of {} failed: {}", snapshot.path.filename().string(), snapshot.message);
  }
  notify(snapshot);
  start_next();
}

void TransferQueue::cancel_all() {
  std::optional<std::string> in_flight;
  std::size_t dropped = 0;
  {
    std::lock_guard lg(m_);
    auto before = items_.size();
    items_.erase(std::remove_if(items_.begin(), items_.end(),
                                [](const QueueItem& i){ return i.status == QueueItemStatus::Pending; }),
                 items_.end());
    dropped = before - items_.size();
    in_flight = active_;
  }
  log_info(logger_.get(), "Cancelling queue for {} ({} pending dropped)", destination().address, dropped);
  if(in_flight) sender_->cancel(*in_flight);
}

void TransferQueue::set_item_listener(ItemListener listener) {
  std::lock_guard lg(m_);
  listener_ = std::move(listener);
}

void TransferQueue::update_destination(const PeerIdentity& destination) {
  std::lock_guard lg(m_);
  destination_ = destination;
}

PeerIdentity TransferQueue::destination() const {
  std::lock_guard lg(m_);
  return destination_;
}

std::vector<QueueItem> TransferQueue::items() const {
  std::lock_guard lg(m_);
  return items_;
}

std::size_t TransferQueue::pending() const {
  std::lock_guard lg(m_);
  return static_cast<std::size_t>(std::count_if(items_.begin(), items_.end(),
    [](const QueueItem& i){ return i.status == QueueItemStatus::Pending; }));
}

bool TransferQueue::busy() const {
  std::lock_guard lg(m_);
  return active_.has_value();
}

QueueItem* TransferQueue::find_locked(const std::string& transfer_id) {
  for(auto& item : items_) {
    if(item.transfer_id == transfer_id) return &item;
  }
  return nullptr;
}

void TransferQueue::notify(const QueueItem& item) {
  ItemListener listener;
  PeerIdentity peer;
  {
    std::lock_guard lg(m_);
    listener = listener_;
    peer = destination_;
  }
  if(listener) listener(peer, item);
}

TransferQueueManager::TransferQueueManager(std::shared_ptr<FileSender> sender,
                                           std::shared_ptr<Logger> logger)
  : sender_(std::move(sender)),
    logger_(std::move(logger)) {}

std::string TransferQueueManager::enqueue(const PeerIdentity& destination,
                                          const std::filesystem::path& path) {
  std::shared_ptr<TransferQueue> queue;
  {
    std::lock_guard lg(m_);
    auto& slot = queues_[destination.address];
    if(!slot) {
      slot = std::make_shared<TransferQueue>(destination, sender_, logger_);
      slot->set_item_listener(listener_);
    } else {
      slot->update_destination(destination);
    }
    queue = slot;
  }
  return queue->enqueue(path);
}

void TransferQueueManager::cancel(const std::string& peer_key) {
  if(auto queue = queue_for(peer_key)) queue->cancel_all();
}

void TransferQueueManager::cancel_all() {
  std::vector<std::shared_ptr<TransferQueue>> queues;
  {
    std::lock_guard lg(m_);
    for(const auto& kv : queues_) queues.push_back(kv.second);
  }
  for(auto& queue : queues) queue->cancel_all();
}

void TransferQueueManager::set_item_listener(TransferQueue::ItemListener listener) {
  std::lock_guard lg(m_);
  listener_ = listener;
  for(auto& kv : queues_) kv.second->set_item_listener(listener);
}

std::vector<QueueItem> TransferQueueManager::items(const std::string& peer_key) const {
  auto queue = queue_for(peer_key);
  if(!queue) return {};
  return queue->items();
}

std::vector<std::string> TransferQueueManager::peers() const {
  std::lock_guard lg(m_);
  std::vector<std::string> out;
  for(const auto& kv : queues_) out.push_back(kv.first);
  return out;
}

std::shared_ptr<TransferQueue> TransferQueueManager::queue_for(const std::string& peer_key) const {
  std::lock_guard lg(m_);
  auto it = queues_.find(peer_key);
  if(it == queues_.end()) return nullptr;
  return it->second;
}
