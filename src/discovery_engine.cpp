#include "discovery_engine.hpp"

#include <memory>
#include <utility>

DiscoveryEngine::DiscoveryEngine(asio::io_context& io,
                                 std::shared_ptr<PeerRegistry> registry,
                                 Options options,
                                 std::shared_ptr<Logger> logger)
  : io_(io),
    registry_(std::move(registry)),
    options_(std::move(options)),
    logger_(std::move(logger)) {
  if(options_.announce_interval.count() <= 0) {
    options_.announce_interval = std::chrono::milliseconds(5000);
  }
}

void DiscoveryEngine::set_avatar_request_handler(AvatarRequestHandler handler) {
  std::lock_guard lg(m_);
  avatar_handler_ = std::move(handler);
}

void DiscoveryEngine::update_identity(const std::string& address,
                                      const std::string& username,
                                      uint16_t transfer_port) {
  {
    std::lock_guard lg(m_);
    self_.address = address;
    self_.display_name = username;
    self_.transfer_port = transfer_port;
  }
  if(registry_) registry_->set_local_address(address);
  log_debug(logger_.get(), "Announcing as {} at {}:{}", username, address, transfer_port);
}

PeerIdentity DiscoveryEngine::identity() const {
  std::lock_guard lg(m_);
  return self_;
}

void DiscoveryEngine::start() {
  if(running_) return;
  socket_ = std::make_unique<udp::socket>(io_);
  udp::endpoint endpoint(asio::ip::address_v4::any(), options_.discovery_port);
  socket_->open(endpoint.protocol());
  socket_->set_option(udp::socket::reuse_address(true));
  socket_->set_option(asio::socket_base::broadcast(true));
  socket_->bind(endpoint);
  bound_port_ = socket_->local_endpoint().port();
  if(options_.discovery_port == 0) options_.discovery_port = bound_port_;
  running_ = true;

  log_info(logger_.get(), "Discovery listening on UDP {}", bound_port_);
  do_receive();

  announce_timer_ = std::make_unique<asio::steady_timer>(io_);
  announce();
  schedule_announce();
}

void DiscoveryEngine::stop() {
  if(!running_.exchange(false)) return;
  if(announce_timer_) announce_timer_->cancel();
  if(socket_) {
    std::error_code ec;
    socket_->close(ec);
    if(ec) {
      log_warn(logger_.get(), "Closing discovery socket: {}", ec.message());
    }
  }
}

void DiscoveryEngine::schedule_announce() {
  if(!announce_timer_) return;
  announce_timer_->expires_after(options_.announce_interval);
  std::weak_ptr<DiscoveryEngine> weak = weak_from_this();
  announce_timer_->async_wait([weak](const std::error_code& ec){
    if(ec) return;
    auto self = weak.lock();
    if(!self || !self->running_) return;
    self->announce();
    self->schedule_announce();
  });
}

bool DiscoveryEngine::announce() {
  auto self = identity();
  if(self.address.empty()) {
    log_debug(logger_.get(), "Skipping announcement: local address unknown");
    return false;
  }
  if(!running_ || !socket_) return false;

  std::error_code ec;
  auto target_address = asio::ip::make_address(options_.broadcast_address, ec);
  if(ec) {
    log_error(logger_.get(), "Invalid broadcast address {}: {}", options_.broadcast_address, ec.message());
    return false;
  }
  send_datagram(make_announcement(self), udp::endpoint(target_address, options_.discovery_port));
  sent_++;
  return true;
}

bool DiscoveryEngine::request_avatar(const PeerIdentity& peer) {
  auto self = identity();
  if(self.address.empty() || !running_ || !socket_) {
    log_debug(logger_.get(), "Cannot request avatar from {} yet", peer.address);
    return false;
  }
  std::error_code ec;
  auto address = asio::ip::make_address(peer.address, ec);
  if(ec) {
    log_warn(logger_.get(), "Cannot request avatar from {}: {}", peer.address, ec.message());
    return false;
  }
  log_debug(logger_.get(), "Requesting avatar from {} ({})", peer.display_name, peer.address);
  send_datagram(make_avatar_request(self.address, self.transfer_port),
                udp::endpoint(address, options_.discovery_port));
  return true;
}

void DiscoveryEngine::send_datagram(const std::string& message, const udp::endpoint& target) {
  auto payload = std::make_shared<std::string>(message);
  std::weak_ptr<DiscoveryEngine> weak = weak_from_this();
  socket_->async_send_to(asio::buffer(*payload), target,
    [weak, payload, target](std::error_code ec, std::size_t){
      if(!ec) return;
      auto self = weak.lock();
      if(!self) return;
      log_warn(self->logger_.get(), "UDP send to {} failed: {}", target.address().to_string(), ec.message());
    });
}

void DiscoveryEngine::do_receive() {
  if(!socket_) return;
  std::weak_ptr<DiscoveryEngine> weak = weak_from_this();
  socket_->async_receive_from(asio::buffer(recv_buf_), remote_,
    [weak](std::error_code ec, std::size_t bytes){
      auto self = weak.lock();
      if(!self || !self->running_) return;
      if(ec) {
        log_warn(self->logger_.get(), "Discovery receive error: {}", ec.message());
      } else {
        std::string message(self->recv_buf_.data(), bytes);
        self->handle_datagram(message, self->remote_.address().to_string());
      }
      self->do_receive();
    });
}

void DiscoveryEngine::handle_datagram(const std::string& message, const std::string& source_address) {
  received_++;
  auto self = identity();
  if(!self.address.empty() && source_address == self.address) return;

  std::string error;
  if(message.rfind(kAnnouncePrefix, 0) == 0) {
    auto peer = parse_announcement(message, source_address, error);
    if(!peer) {
      rejected_++;
      log_debug(logger_.get(), "Ignoring announcement from {}: {}", source_address, error);
      return;
    }
    if(registry_) registry_->add_or_refresh(*peer);
    return;
  }

  if(message.rfind(kAvatarRequestPrefix, 0) == 0) {
    auto request = parse_avatar_request(message, source_address, error);
    if(!request) {
      rejected_++;
      log_debug(logger_.get(), "Ignoring avatar request from {}: {}", source_address, error);
      return;
    }
    PeerIdentity requester;
    requester.address = request->address;
    requester.transfer_port = request->transfer_port;
    if(registry_) {
      if(auto known = registry_->find(request->address)) requester.display_name = known->display_name;
    }
    AvatarRequestHandler handler;
    {
      std::lock_guard lg(m_);
      handler = avatar_handler_;
    }
    log_info(logger_.get(), "Avatar requested by {}:{}", requester.address, requester.transfer_port);
    if(handler) handler(requester);
    return;
  }

  rejected_++;
  log_debug(logger_.get(), "Ignoring unknown datagram from {} ({} bytes)", source_address, message.size());
}

DiscoveryEngine::Stats DiscoveryEngine::stats() const {
  Stats out;
  out.announcements_sent = sent_.load();
  out.datagrams_received = received_.load();
  out.datagrams_rejected = rejected_.load();
  return out;
}
