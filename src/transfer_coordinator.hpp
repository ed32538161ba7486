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
#include <unordered_map>

#include "avatar_cache.hpp"
#include "inbound_transfer.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "transfer_history.hpp"
#include "user_profile.hpp"

class PeerRegistry;

// The single table of receives in progress, keyed by the sending peer's
// address. At most one live entry per key; finalize and abort always remove
// the entry before doing anything that can fail.
class TransferCoordinator {
public:
  using FileReceivedListener = std::function<void(const ReceivedFile&)>;
  using ListenerHandle = std::size_t;

  TransferCoordinator(std::shared_ptr<UserProfile> profile,
                      std::shared_ptr<TransferHistory> history,
                      std::shared_ptr<AvatarCache> avatars,
                      std::filesystem::path staging_dir,
                      std::shared_ptr<Logger> logger = nullptr);
  ~TransferCoordinator();

  // Optional; used to clear pending avatar fetches and re-emit the peer list.
  void set_registry(std::weak_ptr<PeerRegistry> registry);

  // Opens the sink for a new transfer. Fails with Filesystem when the sink
  // cannot be created and with ProtocolFormat when the key is already busy.
  // No entry is registered on failure.
  TransferOutcome begin(const std::string& source_key, const TransferMetadata& metadata);

  // False when no transfer is registered under the key or the sink failed.
  bool write(const std::string& source_key, const char* data, std::size_t size);

  TransferOutcome finalize(const std::string& source_key);
  TransferOutcome abort(const std::string& source_key, const std::string& reason);

  // Aborts every receive in progress, deleting partial files whose bytes do
  // not verify. Returns how many were aborted.
  std::size_t abort_all(const std::string& reason);

  ListenerHandle add_file_received_listener(FileReceivedListener listener);
  void remove_file_received_listener(ListenerHandle handle);

  bool is_active(const std::string& source_key) const;
  std::size_t active_count() const;
  std::optional<uint64_t> received_bytes(const std::string& source_key) const;

private:
  std::unique_ptr<InboundTransfer> take(const std::string& source_key);
  void discard(const std::string& source_key, InboundTransfer& transfer, const std::string& reason);
  TransferOutcome complete_data(InboundTransfer& transfer);
  TransferOutcome complete_capability(InboundTransfer& transfer);
  void settle_avatar_fetch(const std::string& peer_key, bool success);

  std::shared_ptr<UserProfile> profile_;
  std::shared_ptr<TransferHistory> history_;
  std::shared_ptr<AvatarCache> avatars_;
  std::filesystem::path staging_dir_;
  std::shared_ptr<Logger> logger_;
  std::weak_ptr<PeerRegistry> registry_;

  mutable std::mutex m_;
  std::map<std::string, std::unique_ptr<InboundTransfer>> active_;

  std::mutex listener_mutex_;
  std::unordered_map<ListenerHandle, FileReceivedListener> listeners_;
  ListenerHandle next_listener_ = 1;
};
