#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "file_sender.hpp"
#include "log.hpp"
#include "protocol.hpp"

enum class QueueItemStatus { Pending, Sending, Completed, Failed, Cancelled };

const char* queue_status_name(QueueItemStatus status);

struct QueueItem {
  std::string transfer_id;
  std::filesystem::path path;
  QueueItemStatus status = QueueItemStatus::Pending;
  uint64_t total_bytes = 0;
  uint64_t sent_bytes = 0;
  std::string message;
};

// Strict FIFO of sends to one peer. One send at a time; finished items stay
// listed with their outcome for the rest of the session.
class TransferQueue : public std::enable_shared_from_this<TransferQueue> {
public:
  using ItemListener = std::function<void(const PeerIdentity& peer, const QueueItem& item)>;

  TransferQueue(PeerIdentity destination,
                std::shared_ptr<FileSender> sender,
                std::shared_ptr<Logger> logger = nullptr);

  // Returns the transfer id. Starts sending right away when idle.
  std::string enqueue(const std::filesystem::path& path);

  // Drops pending items and cancels the one in flight.
  void cancel_all();

  void set_item_listener(ItemListener listener);
  void update_destination(const PeerIdentity& destination);

  PeerIdentity destination() const;
  std::vector<QueueItem> items() const;
  std::size_t pending() const;
  bool busy() const;

private:
  void start_next();
  void on_progress(const std::string& transfer_id, uint64_t total, uint64_t sent);
  void on_complete(const std::string& transfer_id, const TransferOutcome& outcome);
  QueueItem* find_locked(const std::string& transfer_id);
  void notify(const QueueItem& item);

  std::shared_ptr<FileSender> sender_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  PeerIdentity destination_;
  std::vector<QueueItem> items_;
  std::optional<std::string> active_;
  ItemListener listener_;
};

// Independent queues, one per destination address.
class TransferQueueManager {
public:
  TransferQueueManager(std::shared_ptr<FileSender> sender, std::shared_ptr<Logger> logger = nullptr);

  std::string enqueue(const PeerIdentity& destination, const std::filesystem::path& path);
  void cancel(const std::string& peer_key);
  void cancel_all();

  void set_item_listener(TransferQueue::ItemListener listener);

  std::vector<QueueItem> items(const std::string& peer_key) const;
  std::vector<std::string> peers() const;
  std::shared_ptr<TransferQueue> queue_for(const std::string& peer_key) const;

private:
  std::shared_ptr<FileSender> sender_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  std::map<std::string, std::shared_ptr<TransferQueue>> queues_;
  TransferQueue::ItemListener listener_;
};
