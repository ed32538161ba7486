#include "peer_registry.hpp"

#include <utility>

PeerRegistry::PeerRegistry(std::shared_ptr<AvatarCache> avatars,
                           std::chrono::milliseconds peer_timeout,
                           std::shared_ptr<Logger> logger)
  : avatars_(std::move(avatars)),
    peer_timeout_(peer_timeout),
    logger_(std::move(logger)) {
  if(peer_timeout_.count() <= 0) {
    peer_timeout_ = kDefaultPeerTimeout;
  }
}

void PeerRegistry::set_local_address(const std::string& address) {
  std::vector<std::string> dropped;
  PeerSnapshot snap;
  {
    std::lock_guard lg(m_);
    local_address_ = address;
    auto it = peers_.find(address);
    if(it == peers_.end()) return;
    peers_.erase(it);
    snap = snapshot_locked();
  }
  log_debug(logger_.get(), "Dropped self entry {} after local address change", address);
  emit(snap);
}

std::string PeerRegistry::local_address() const {
  std::lock_guard lg(m_);
  return local_address_;
}

bool PeerRegistry::add_or_refresh(const PeerIdentity& identity, Clock::time_point now) {
  if(identity.address.empty()) return false;
  const bool cached = avatars_ && avatars_->has(identity.address);

  bool is_new = false;
  bool changed = false;
  bool want_avatar = false;
  PeerSnapshot snap;
  {
    std::lock_guard lg(m_);
    if(identity.address == local_address_) return false;

    auto it = peers_.find(identity.address);
    if(it == peers_.end()) {
      PeerRecord record;
      record.identity = identity;
      record.last_seen = now;
      if(!cached) {
        record.pending_avatar_fetch = true;
        record.avatar_requested_at = now;
        want_avatar = true;
      }
      peers_.emplace(identity.address, std::move(record));
      is_new = true;
      changed = true;
    } else {
      it->second.last_seen = now;
      if(it->second.identity != identity) {
        it->second.identity = identity;
        changed = true;
      }
    }
    if(changed) snap = snapshot_locked();
  }

  if(is_new) {
    log_info(logger_.get(), "Discovered peer {} ({}:{})",
             identity.display_name, identity.address, identity.transfer_port);
  } else if(changed) {
    log_info(logger_.get(), "Peer {} is now {} on port {}",
             identity.address, identity.display_name, identity.transfer_port);
  }
  if(changed) emit(snap);

  if(want_avatar) {
    AvatarNeededListener listener;
    {
      std::lock_guard lg(listener_mutex_);
      listener = avatar_needed_;
    }
    if(listener) {
      listener(identity);
    } else {
      // Nobody will fetch it; leave the door open for a later listener.
      complete_avatar_fetch(identity.address, false);
    }
  }
  return is_new;
}

std::vector<std::string> PeerRegistry::sweep(Clock::time_point now) {
  std::vector<std::string> evicted;
  PeerSnapshot snap;
  {
    std::lock_guard lg(m_);
    for(auto it = peers_.begin(); it != peers_.end();) {
      auto& record = it->second;
      if(now - record.last_seen > peer_timeout_) {
        evicted.push_back(it->first);
        it = peers_.erase(it);
        continue;
      }
      if(record.pending_avatar_fetch && now - record.avatar_requested_at > peer_timeout_) {
        record.pending_avatar_fetch = false;
        log_debug(logger_.get(), "Avatar fetch for {} expired", it->first);
      }
      ++it;
    }
    if(!evicted.empty()) snap = snapshot_locked();
  }

  for(const auto& key : evicted) {
    log_info(logger_.get(), "Removing inactive peer {}", key);
    if(avatars_) avatars_->remove(key);
  }
  if(!evicted.empty()) emit(snap);
  return evicted;
}

void PeerRegistry::start_sweep(asio::io_context& io) {
  sweep_timer_ = std::make_unique<asio::steady_timer>(io);
  schedule_sweep();
}

void PeerRegistry::stop_sweep() {
  if(sweep_timer_) {
    sweep_timer_->cancel();
  }
}

void PeerRegistry::schedule_sweep() {
  if(!sweep_timer_) return;
  sweep_timer_->expires_after(peer_timeout_);
  std::weak_ptr<PeerRegistry> weak = weak_from_this();
  sweep_timer_->async_wait([weak](const std::error_code& ec){
    if(ec) return;
    auto self = weak.lock();
    if(!self) return;
    self->sweep();
    self->schedule_sweep();
  });
}

PeerRegistry::SubscriptionHandle PeerRegistry::subscribe(SnapshotListener listener) {
  if(!listener) return 0;
  SubscriptionHandle handle;
  {
    std::lock_guard lg(listener_mutex_);
    handle = next_handle_++;
    listeners_[handle] = listener;
  }
  listener(snapshot());
  return handle;
}

void PeerRegistry::unsubscribe(SubscriptionHandle handle) {
  std::lock_guard lg(listener_mutex_);
  listeners_.erase(handle);
}

void PeerRegistry::set_avatar_needed_listener(AvatarNeededListener listener) {
  std::lock_guard lg(listener_mutex_);
  avatar_needed_ = std::move(listener);
}

void PeerRegistry::complete_avatar_fetch(const std::string& peer_key, bool success) {
  std::lock_guard lg(m_);
  auto it = peers_.find(peer_key);
  if(it == peers_.end()) return;
  it->second.pending_avatar_fetch = false;
  if(!success) {
    log_debug(logger_.get(), "Avatar fetch for {} failed; will retry on rediscovery", peer_key);
  }
}

bool PeerRegistry::avatar_fetch_pending(const std::string& peer_key) const {
  std::lock_guard lg(m_);
  auto it = peers_.find(peer_key);
  return it != peers_.end() && it->second.pending_avatar_fetch;
}

void PeerRegistry::notify_changed() {
  emit(snapshot());
}

PeerSnapshot PeerRegistry::snapshot() const {
  std::lock_guard lg(m_);
  return snapshot_locked();
}

PeerSnapshot PeerRegistry::snapshot_locked() const {
  PeerSnapshot out;
  out.reserve(peers_.size());
  for(const auto& kv : peers_) {
    out.push_back(kv.second.identity);
  }
  return out;
}

std::optional<PeerIdentity> PeerRegistry::find(const std::string& peer_key) const {
  std::lock_guard lg(m_);
  auto it = peers_.find(peer_key);
  if(it == peers_.end()) return std::nullopt;
  return it->second.identity;
}

std::optional<PeerIdentity> PeerRegistry::resolve(const std::string& address_or_name) const {
  std::lock_guard lg(m_);
  auto it = peers_.find(address_or_name);
  if(it != peers_.end()) return it->second.identity;
  for(const auto& kv : peers_) {
    if(kv.second.identity.display_name == address_or_name) return kv.second.identity;
  }
  return std::nullopt;
}

std::size_t PeerRegistry::size() const {
  std::lock_guard lg(m_);
  return peers_.size();
}

void PeerRegistry::emit(const PeerSnapshot& snapshot) {
  std::vector<SnapshotListener> targets;
  {
    std::lock_guard lg(listener_mutex_);
    targets.reserve(listeners_.size());
    for(const auto& kv : listeners_) targets.push_back(kv.second);
  }
  for(auto& listener : targets) {
    listener(snapshot);
  }
}
