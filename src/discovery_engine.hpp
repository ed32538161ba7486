#pragma once
#include <asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "log.hpp"
#include "peer_registry.hpp"
#include "protocol.hpp"

// Presence over UDP: periodic announcement broadcast plus a listener that
// validates announcements and avatar requests. Never touches the filesystem;
// avatar sends go through the injected handler.
class DiscoveryEngine : public std::enable_shared_from_this<DiscoveryEngine> {
public:
  struct Options {
    uint16_t discovery_port = kDefaultDiscoveryPort;
    std::string broadcast_address = "255.255.255.255";
    std::chrono::milliseconds announce_interval{5000};
  };

  using AvatarRequestHandler = std::function<void(const PeerIdentity& requester)>;

  DiscoveryEngine(asio::io_context& io,
                  std::shared_ptr<PeerRegistry> registry,
                  Options options,
                  std::shared_ptr<Logger> logger = nullptr);

  void set_avatar_request_handler(AvatarRequestHandler handler);

  // Address and name used from the next broadcast on. An empty address
  // pauses broadcasting.
  void update_identity(const std::string& address, const std::string& username, uint16_t transfer_port);
  PeerIdentity identity() const;

  // Binds the discovery port. Throws std::system_error on failure.
  void start();
  void stop();

  // Sends one announcement now. Returns false when the local address is
  // unknown or the socket is closed.
  bool announce();

  // Asks a peer to push its avatar to our transfer port.
  bool request_avatar(const PeerIdentity& peer);

  // Entry point for every received datagram; public so it can be driven
  // without sockets.
  void handle_datagram(const std::string& message, const std::string& source_address);

  uint16_t bound_port() const { return bound_port_; }

  struct Stats {
    std::size_t announcements_sent = 0;
    std::size_t datagrams_received = 0;
    std::size_t datagrams_rejected = 0;
  };
  Stats stats() const;

private:
  using udp = asio::ip::udp;

  void do_receive();
  void schedule_announce();
  void send_datagram(const std::string& message, const udp::endpoint& target);

  asio::io_context& io_;
  std::shared_ptr<PeerRegistry> registry_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  std::unique_ptr<udp::socket> socket_;
  std::unique_ptr<asio::steady_timer> announce_timer_;
  std::array<char, 2048> recv_buf_{};
  udp::endpoint remote_;
  std::atomic<bool> running_{false};
  uint16_t bound_port_ = 0;

  mutable std::mutex m_;
  PeerIdentity self_;
  AvatarRequestHandler avatar_handler_;

  std::atomic<std::size_t> sent_{0};
  std::atomic<std::size_t> received_{0};
  std::atomic<std::size_t> rejected_{0};
};
