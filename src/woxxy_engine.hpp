#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "peer_registry.hpp"
#include "protocol.hpp"
#include "transfer_coordinator.hpp"
#include "transfer_history.hpp"
#include "transfer_queue.hpp"
#include "user_profile.hpp"

class AvatarCache;
class DiscoveryEngine;
class OutboundSender;
class SettingsManager;
class TransferListener;
class WoxxyCLI;

// First IPv4 address a UDP socket would use to leave this host, or nullopt
// when there is no route.
std::optional<std::string> detect_local_ipv4();

// Builds the live profile from settings, resolving an empty download_dir to
// ~/Downloads.
ProfileSnapshot profile_from_settings(const SettingsManager& settings);

class WoxxyEngine {
public:
  struct Options {
    bool start_cli_thread = false;
    bool enable_discovery = true;
  };

  WoxxyEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~WoxxyEngine();

  // Builds every component and binds the sockets. Throws on invalid ports,
  // bind failure or when no local IPv4 address can be found.
  void start();
  void run();
  void start_background();
  void stop();
  // Makes run() return; safe from any thread, including the CLI's.
  void request_shutdown() { io_.stop(); }

  void execute_command(const std::string& line);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  LogListenerHandle add_log_listener(Logger::Listener listener);
  void remove_log_listener(LogListenerHandle handle);

  PeerSnapshot peers() const;
  PeerRegistry::SubscriptionHandle subscribe_peers(PeerRegistry::SnapshotListener listener);
  void unsubscribe_peers(PeerRegistry::SubscriptionHandle handle);
  std::optional<PeerIdentity> resolve_peer(const std::string& address_or_name) const;

  // Queues each path for the peer (address or display name). Returns the
  // transfer ids, empty with error set when the peer is unknown.
  std::vector<std::string> send_files(const std::string& peer,
                                      const std::vector<std::filesystem::path>& paths,
                                      std::string& error);
  bool cancel_peer(const std::string& peer);
  std::vector<QueueItem> queue_items(const std::string& peer) const;
  std::vector<std::string> queued_peers() const;
  void set_queue_listener(TransferQueue::ItemListener listener);

  std::vector<ReceivedFile> history() const;
  TransferCoordinator::ListenerHandle add_file_received_listener(TransferCoordinator::FileReceivedListener listener);
  void remove_file_received_listener(TransferCoordinator::ListenerHandle handle);

  // Sets a value and pushes the live parts (name, avatar, download
  // directory, checksum) to the running components.
  bool apply_setting(const std::string& key, const std::string& value, std::string& error);

  PeerIdentity identity() const;
  uint16_t transfer_port() const { return transfer_port_; }
  uint16_t discovery_port() const { return discovery_port_; }
  const std::string& local_address() const { return local_address_; }
  std::shared_ptr<UserProfile> profile() const { return profile_; }

  struct Stats {
    std::size_t known_peers = 0;
    std::size_t active_receives = 0;
    std::size_t sends_in_flight = 0;
    std::size_t received_files = 0;
    std::size_t connections_accepted = 0;
    std::size_t receives_failed = 0;
  };

  Stats stats() const;

private:
  uint16_t port_setting(const char* key) const;
  void wire_events();
  void refresh_profile();
  void start_cli();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  asio::io_context io_;
  std::thread io_thread_;
  bool started_ = false;
  bool cli_thread_running_ = false;

  std::shared_ptr<Logger> logger_;
  std::shared_ptr<UserProfile> profile_;
  std::shared_ptr<AvatarCache> avatars_;
  std::shared_ptr<TransferHistory> history_;
  std::shared_ptr<PeerRegistry> registry_;
  std::shared_ptr<TransferCoordinator> coordinator_;
  std::unique_ptr<TransferListener> listener_;
  std::shared_ptr<OutboundSender> sender_;
  std::unique_ptr<TransferQueueManager> queues_;
  std::shared_ptr<DiscoveryEngine> discovery_;
  std::unique_ptr<WoxxyCLI> cli_;

  std::string local_address_;
  uint16_t transfer_port_ = 0;
  uint16_t discovery_port_ = 0;
};
