#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "avatar_cache.hpp"
#include "log.hpp"
#include "protocol.hpp"

struct PeerRecord {
  using Clock = std::chrono::steady_clock;

  PeerIdentity identity;
  Clock::time_point last_seen{};
  bool pending_avatar_fetch = false;
  Clock::time_point avatar_requested_at{};
};

using PeerSnapshot = std::vector<PeerIdentity>;

// Known peers keyed by address. Mutation is serialized by one mutex; the
// snapshot stream is push based and a new subscriber immediately gets the
// latest snapshot.
class PeerRegistry : public std::enable_shared_from_this<PeerRegistry> {
public:
  using Clock = PeerRecord::Clock;
  using SnapshotListener = std::function<void(const PeerSnapshot&)>;
  using AvatarNeededListener = std::function<void(const PeerIdentity&)>;
  using SubscriptionHandle = std::size_t;

  static constexpr std::chrono::seconds kDefaultPeerTimeout{30};

  PeerRegistry(std::shared_ptr<AvatarCache> avatars,
               std::chrono::milliseconds peer_timeout = kDefaultPeerTimeout,
               std::shared_ptr<Logger> logger = nullptr);

  void set_local_address(const std::string& address);
  std::string local_address() const;

  // Returns true if the peer was new.
  bool add_or_refresh(const PeerIdentity& identity, Clock::time_point now = Clock::now());

  // Evicts peers idle for longer than the timeout and expires stale avatar
  // fetches. Returns the evicted keys.
  std::vector<std::string> sweep(Clock::time_point now = Clock::now());

  // Runs sweep() every peer_timeout on the given context until stop_sweep().
  void start_sweep(asio::io_context& io);
  void stop_sweep();

  SubscriptionHandle subscribe(SnapshotListener listener);
  void unsubscribe(SubscriptionHandle handle);

  // Event channel for "fetch the avatar of this peer".
  void set_avatar_needed_listener(AvatarNeededListener listener);

  // Fetch finished (successfully or not). Clears the pending marker.
  void complete_avatar_fetch(const std::string& peer_key, bool success);
  bool avatar_fetch_pending(const std::string& peer_key) const;

  // Re-emits the current snapshot, e.g. after an avatar arrived.
  void notify_changed();

  PeerSnapshot snapshot() const;
  std::optional<PeerIdentity> find(const std::string& peer_key) const;
  // Matches an address first, then a display name (case sensitive).
  std::optional<PeerIdentity> resolve(const std::string& address_or_name) const;
  std::size_t size() const;
  std::chrono::milliseconds peer_timeout() const { return peer_timeout_; }

private:
  PeerSnapshot snapshot_locked() const;
  void emit(const PeerSnapshot& snapshot);
  void schedule_sweep();

  std::shared_ptr<AvatarCache> avatars_;
  std::chrono::milliseconds peer_timeout_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::string local_address_;
  std::map<std::string, PeerRecord> peers_;

  mutable std::mutex listener_mutex_;
  std::unordered_map<SubscriptionHandle, SnapshotListener> listeners_;
  SubscriptionHandle next_handle_ = 1;
  AvatarNeededListener avatar_needed_;

  std::unique_ptr<asio::steady_timer> sweep_timer_;
};
