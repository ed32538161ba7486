#include "transfer_coordinator.hpp"

#include <fstream>
#include <iterator>
#include <utility>

#include "peer_registry.hpp"

TransferCoordinator::TransferCoordinator(std::shared_ptr<UserProfile> profile,
                                         std::shared_ptr<TransferHistory> history,
                                         std::shared_ptr<AvatarCache> avatars,
                                         std::filesystem::path staging_dir,
                                         std::shared_ptr<Logger> logger)
  : profile_(profile ? std::move(profile) : std::make_shared<UserProfile>()),
    history_(std::move(history)),
    avatars_(std::move(avatars)),
    staging_dir_(std::move(staging_dir)),
    logger_(std::move(logger)) {}

TransferCoordinator::~TransferCoordinator() {
  abort_all("shutting down");
}

void TransferCoordinator::set_registry(std::weak_ptr<PeerRegistry> registry) {
  registry_ = std::move(registry);
}

TransferOutcome TransferCoordinator::begin(const std::string& source_key,
                                           const TransferMetadata& metadata) {
  std::filesystem::path directory = metadata.kind == PayloadKind::Capability
    ? staging_dir_
    : profile_->current().download_directory;
  if(directory.empty()) {
    return TransferOutcome::failure(TransferError::Filesystem, "no destination directory configured");
  }

  std::lock_guard lg(m_);
  if(active_.count(source_key)) {
    log_warn(logger_.get(), "Rejecting {} from {}: a transfer from this peer is already active",
             metadata.file_name, source_key);
    return TransferOutcome::failure(TransferError::ProtocolFormat,
                                    "transfer already active for " + source_key);
  }

  std::string error;
  auto transfer = InboundTransfer::open(source_key, metadata, directory, error);
  if(!transfer) {
    log_error(logger_.get(), "Cannot receive {} from {}: {}", metadata.file_name, source_key, error);
    return TransferOutcome::failure(TransferError::Filesystem, error);
  }
  log_info(logger_.get(), "Receiving {} ({} bytes, {}) from {} into {}",
           metadata.file_name, metadata.size_bytes, payload_kind_name(metadata.kind),
           metadata.sender_name, transfer->destination().string());
  active_.emplace(source_key, std::move(transfer));
  return TransferOutcome::success();
}

bool TransferCoordinator::write(const std::string& source_key, const char* data, std::size_t size) {
  std::lock_guard lg(m_);
  auto it = active_.find(source_key);
  if(it == active_.end()) {
    log_debug(logger_.get(), "Dropping {} stray bytes from {}", size, source_key);
    return false;
  }
  return it->second->write(data, size);
}

std::unique_ptr<InboundTransfer> TransferCoordinator::take(const std::string& source_key) {
  std::lock_guard lg(m_);
  auto it = active_.find(source_key);
  if(it == active_.end()) return nullptr;
  auto transfer = std::move(it->second);
  active_.erase(it);
  return transfer;
}

TransferOutcome TransferCoordinator::finalize(const std::string& source_key) {
  auto transfer = take(source_key);
  if(!transfer) {
    return TransferOutcome::failure(TransferError::ProtocolFormat, "no transfer active for " + source_key);
  }
  transfer->close_sink();
  const auto& metadata = transfer->metadata();

  auto verification = transfer->verify();
  if(verification == InboundTransfer::Verification::Mismatch) {
    log_error(logger_.get(), "Checksum mismatch for {}: expected {}, got {}",
              metadata.file_name, metadata.expected_checksum,
              transfer->actual_checksum().value_or("<none>"));
    transfer->delete_file(logger_.get());
    if(metadata.kind == PayloadKind::Capability) settle_avatar_fetch(source_key, false);
    return TransferOutcome::failure(TransferError::ChecksumMismatch, "checksum mismatch");
  }
  if(verification == InboundTransfer::Verification::Skipped) {
    log_debug(logger_.get(), "Skipping verification of {} ({})", metadata.file_name,
              metadata.expected_checksum.empty() ? "no checksum" : metadata.expected_checksum);
  }

  if(metadata.kind == PayloadKind::Capability) {
    return complete_capability(*transfer);
  }
  return complete_data(*transfer);
}

TransferOutcome TransferCoordinator::abort(const std::string& source_key, const std::string& reason) {
  auto transfer = take(source_key);
  if(!transfer) {
    return TransferOutcome::failure(TransferError::ProtocolFormat, "no transfer active for " + source_key);
  }
  discard(source_key, *transfer, reason);
  return TransferOutcome::failure(TransferError::Network, reason);
}

std::size_t TransferCoordinator::abort_all(const std::string& reason) {
  std::map<std::string, std::unique_ptr<InboundTransfer>> pending;
  {
    std::lock_guard lg(m_);
    pending.swap(active_);
  }
  for(auto& entry : pending) {
    discard(entry.first, *entry.second, reason);
  }
  return pending.size();
}

void TransferCoordinator::discard(const std::string& source_key, InboundTransfer& transfer,
                                  const std::string& reason) {
  transfer.close_sink();
  const auto& metadata = transfer.metadata();
  log_warn(logger_.get(), "Transfer of {} from {} aborted after {}/{} bytes: {}",
           metadata.file_name, source_key, transfer.received_bytes(), metadata.size_bytes, reason);

  bool keep = metadata.kind == PayloadKind::Data &&
              metadata.verification_required() &&
              transfer.verify() == InboundTransfer::Verification::Match;
  if(keep) {
    log_warn(logger_.get(), "Partial {} matches the declared checksum; keeping {}",
             metadata.file_name, transfer.destination().string());
  } else {
    transfer.delete_file(logger_.get());
  }
  if(metadata.kind == PayloadKind::Capability) settle_avatar_fetch(source_key, false);
}

TransferOutcome TransferCoordinator::complete_data(InboundTransfer& transfer) {
  const auto& metadata = transfer.metadata();
  ReceivedFile entry;
  entry.path = transfer.destination();
  entry.sender = metadata.sender_name;
  entry.size = metadata.size_bytes;
  entry.speed_mbps = transfer.speed_mbps();
  entry.received_at = std::chrono::system_clock::now();

  log_info(logger_.get(), "Received {} from {} ({} bytes, {:.2f} MB/s)",
           entry.path.string(), entry.sender, entry.size, entry.speed_mbps);
  if(history_) history_->record(entry);

  std::vector<FileReceivedListener> targets;
  {
    std::lock_guard lg(listener_mutex_);
    for(const auto& kv : listeners_) targets.push_back(kv.second);
  }
  for(auto& listener : targets) {
    try {
      listener(entry);
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "File-received listener failed: {}", e.what());
    }
  }
  return TransferOutcome::success();
}

TransferOutcome TransferCoordinator::complete_capability(InboundTransfer& transfer) {
  const std::string& key = transfer.source_key();
  AvatarBytes bytes;
  {
    std::ifstream in(transfer.destination(), std::ios::binary);
    if(in) bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }
  transfer.delete_file(logger_.get());

  if(!looks_like_image(bytes)) {
    log_warn(logger_.get(), "Avatar from {} is not a recognised image ({} bytes)", key, bytes.size());
    settle_avatar_fetch(key, false);
    return TransferOutcome::failure(TransferError::ProtocolFormat, "avatar is not an image");
  }
  if(!avatars_ || !avatars_->put(key, std::move(bytes))) {
    settle_avatar_fetch(key, false);
    return TransferOutcome::failure(TransferError::Filesystem, "avatar could not be cached");
  }
  log_info(logger_.get(), "Cached avatar for {}", key);
  settle_avatar_fetch(key, true);
  return TransferOutcome::success();
}

void TransferCoordinator::settle_avatar_fetch(const std::string& peer_key, bool success) {
  auto registry = registry_.lock();
  if(!registry) return;
  registry->complete_avatar_fetch(peer_key, success);
  if(success) registry->notify_changed();
}

TransferCoordinator::ListenerHandle
TransferCoordinator::add_file_received_listener(FileReceivedListener listener) {
  std::lock_guard lg(listener_mutex_);
  auto handle = next_listener_++;
  listeners_[handle] = std::move(listener);
  return handle;
}

void TransferCoordinator::remove_file_received_listener(ListenerHandle handle) {
  std::lock_guard lg(listener_mutex_);
  listeners_.erase(handle);
}

bool TransferCoordinator::is_active(const std::string& source_key) const {
  std::lock_guard lg(m_);
  return active_.count(source_key) != 0;
}

std::size_t TransferCoordinator::active_count() const {
  std::lock_guard lg(m_);
  return active_.size();
}

std::optional<uint64_t> TransferCoordinator::received_bytes(const std::string& source_key) const {
  std::lock_guard lg(m_);
  auto it = active_.find(source_key);
  if(it == active_.end()) return std::nullopt;
  return it->second->received_bytes();
}
