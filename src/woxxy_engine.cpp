#include "woxxy_engine.hpp"

#include <stdexcept>
#include <utility>

#include "WoxxyCLI.hpp"
#include "avatar_cache.hpp"
#include "discovery_engine.hpp"
#include "outbound_sender.hpp"
#include "settings_manager.hpp"
#include "transfer_listener.hpp"

std::optional<std::string> detect_local_ipv4() {
  // Connecting a UDP socket sends nothing; it only selects the outbound route.
  asio::io_context io;
  asio::ip::udp::socket probe(io);
  std::error_code ec;
  probe.open(asio::ip::udp::v4(), ec);
  if(ec) return std::nullopt;
  probe.connect(asio::ip::udp::endpoint(asio::ip::make_address_v4("8.8.8.8", ec), 80), ec);
  if(ec) return std::nullopt;
  auto local = probe.local_endpoint(ec);
  if(ec || local.address().is_unspecified()) return std::nullopt;
  return local.address().to_string();
}

ProfileSnapshot profile_from_settings(const SettingsManager& settings) {
  ProfileSnapshot profile;
  profile.username = settings.get<std::string>("username");
  profile.avatar_path = settings.get<std::string>("avatar_path");
  profile.checksum_enabled = settings.get<bool>("checksum_enabled");
  auto download = settings.get<std::string>("download_dir");
  profile.download_directory = download.empty()
    ? SettingsManager::home_directory() / "Downloads"
    : std::filesystem::path(download);
  return profile;
}

WoxxyEngine::WoxxyEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("woxxy")) {}

WoxxyEngine::~WoxxyEngine() {
  stop();
}

uint16_t WoxxyEngine::port_setting(const char* key) const {
  int value = settings_->get<int>(key);
  if(value < 0 || value > 65535) {
    logger_->error("Invalid {} '{}'", key, value);
    throw std::runtime_error(std::string("Invalid ") + key);
  }
  return static_cast<uint16_t>(value);
}

void WoxxyEngine::start() {
  if(started_) return;

  init(settings_->get<bool>("verbose"));

  profile_ = std::make_shared<UserProfile>(profile_from_settings(*settings_));
  auto profile = profile_->current();

  uint16_t transfer_port = port_setting("transfer_port");
  discovery_port_ = port_setting("discovery_port");

  local_address_ = settings_->get<std::string>("local_ip");
  if(local_address_.empty()) {
    auto detected = detect_local_ipv4();
    if(!detected) {
      logger_->error("No usable local IPv4 address; set local_ip explicitly");
      throw std::runtime_error("No usable local IPv4 address");
    }
    local_address_ = *detected;
  } else if(!is_ipv4_address(local_address_)) {
    logger_->error("Invalid local_ip '{}'", local_address_);
    throw std::runtime_error("Invalid local_ip");
  }

  auto state_root = profile.download_directory / ".woxxy";
  std::filesystem::path avatar_dir = settings_->get<std::string>("avatar_cache_dir");
  if(avatar_dir.empty()) avatar_dir = state_root / "avatars";

  auto chunk_size = static_cast<std::size_t>(settings_->get<int>("chunk_size"));
  auto peer_timeout = std::chrono::seconds(settings_->get<int>("peer_timeout_s"));

  avatars_ = std::make_shared<AvatarCache>(avatar_dir, logger_);
  history_ = std::make_shared<TransferHistory>();
  registry_ = std::make_shared<PeerRegistry>(avatars_, peer_timeout, logger_);
  registry_->set_local_address(local_address_);

  coordinator_ = std::make_shared<TransferCoordinator>(profile_, history_, avatars_,
                                                       state_root / "incoming",
                                                       logger_);
  coordinator_->set_registry(registry_);

  listener_ = std::make_unique<TransferListener>(io_, coordinator_, chunk_size,
                                                 logger_);
  try {
    listener_->start("", transfer_port);
  } catch(const std::system_error& e) {
    logger_->error("Cannot listen on TCP {}: {}", transfer_port, e.what());
    throw;
  }
  transfer_port_ = listener_->port();

  OutboundSender::Options send_options;
  send_options.connect_timeout = std::chrono::milliseconds(settings_->get<int>("connect_timeout_ms"));
  send_options.ready_timeout = std::chrono::milliseconds(settings_->get<int>("ready_timeout_ms"));
  send_options.chunk_size = chunk_size;
  sender_ = std::make_shared<OutboundSender>(io_, profile_, send_options, logger_);
  sender_->set_local_address(local_address_);

  queues_ = std::make_unique<TransferQueueManager>(sender_, logger_);

  DiscoveryEngine::Options discovery_options;
  discovery_options.discovery_port = discovery_port_;
  discovery_options.broadcast_address = settings_->get<std::string>("broadcast_address");
  discovery_options.announce_interval = std::chrono::milliseconds(settings_->get<int>("announce_interval_ms"));
  discovery_ = std::make_shared<DiscoveryEngine>(io_, registry_, discovery_options,
                                                 logger_);
  discovery_->update_identity(local_address_, profile.username, transfer_port_);

  wire_events();

  registry_->start_sweep(io_);
  if(options_.enable_discovery) {
    try {
      discovery_->start();
    } catch(const std::system_error& e) {
      logger_->error("Cannot bind discovery port {}: {}", discovery_port_, e.what());
      throw;
    }
    discovery_port_ = discovery_->bound_port();
  }

  started_ = true;
  logger_->info("{} ready at {} (tcp {}, udp {}), saving to {}",
                profile.username, local_address_, transfer_port_, discovery_port_,
                profile.download_directory.string());

  cli_ = std::make_unique<WoxxyCLI>(*this);
  if(options_.start_cli_thread) {
    start_cli();
  }
}

void WoxxyEngine::wire_events() {
  std::weak_ptr<DiscoveryEngine> weak_discovery = discovery_;
  std::weak_ptr<PeerRegistry> weak_registry = registry_;
  std::weak_ptr<OutboundSender> weak_sender = sender_;

  // registry -> "avatar needed" -> discovery
  registry_->set_avatar_needed_listener([weak_discovery, weak_registry](const PeerIdentity& peer){
    auto discovery = weak_discovery.lock();
    bool sent = discovery && discovery->request_avatar(peer);
    if(!sent) {
      if(auto registry = weak_registry.lock()) registry->complete_avatar_fetch(peer.address, false);
    }
  });

  // discovery -> "peer wants our avatar" -> sender
  discovery_->set_avatar_request_handler([weak_sender](const PeerIdentity& requester){
    if(auto sender = weak_sender.lock()) sender->send_avatar(requester);
  });
}

void WoxxyEngine::run() {
  if(!started_) start();
  io_.run();
}

void WoxxyEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void WoxxyEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(cli_) {
    cli_->stop();
    cli_thread_running_ = false;
  }

  if(discovery_) discovery_->stop();
  if(registry_) registry_->stop_sweep();
  if(queues_) queues_->cancel_all();
  if(sender_) sender_->cancel_all();
  if(listener_) listener_->stop();

  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  io_.restart();
  // Sessions stranded by the stopped loop never reach their own abort.
  if(coordinator_) {
    auto stranded = coordinator_->abort_all("engine stopped");
    if(stranded) log_info(logger_.get(), "Discarded {} unfinished receive(s)", stranded);
  }
}

void WoxxyEngine::start_cli() {
  if(!cli_ || cli_thread_running_) return;
  cli_->start();
  cli_thread_running_ = true;
}

void WoxxyEngine::execute_command(const std::string& line) {
  if(cli_) {
    cli_->execute_command(line);
  }
}

LogListenerHandle WoxxyEngine::add_log_listener(Logger::Listener listener) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener));
}

void WoxxyEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}

PeerSnapshot WoxxyEngine::peers() const {
  if(!registry_) return {};
  return registry_->snapshot();
}

PeerRegistry::SubscriptionHandle WoxxyEngine::subscribe_peers(PeerRegistry::SnapshotListener listener) {
  if(!registry_) return 0;
  return registry_->subscribe(std::move(listener));
}

void WoxxyEngine::unsubscribe_peers(PeerRegistry::SubscriptionHandle handle) {
  if(registry_) registry_->unsubscribe(handle);
}

std::optional<PeerIdentity> WoxxyEngine::resolve_peer(const std::string& address_or_name) const {
  if(!registry_) return std::nullopt;
  return registry_->resolve(address_or_name);
}

std::vector<std::string> WoxxyEngine::send_files(const std::string& peer,
                                                 const std::vector<std::filesystem::path>& paths,
                                                 std::string& error) {
  std::vector<std::string> ids;
  if(!queues_) {
    error = "engine not started";
    return ids;
  }
  auto destination = resolve_peer(peer);
  if(!destination) {
    error = "unknown peer '" + peer + "'";
    return ids;
  }
  for(const auto& path : paths) {
    ids.push_back(queues_->enqueue(*destination, path));
  }
  return ids;
}

bool WoxxyEngine::cancel_peer(const std::string& peer) {
  if(!queues_) return false;
  std::string key = peer;
  if(auto resolved = resolve_peer(peer)) key = resolved->address;
  if(!queues_->queue_for(key)) return false;
  queues_->cancel(key);
  return true;
}

std::vector<QueueItem> WoxxyEngine::queue_items(const std::string& peer) const {
  if(!queues_) return {};
  std::string key = peer;
  if(auto resolved = resolve_peer(peer)) key = resolved->address;
  return queues_->items(key);
}

std::vector<std::string> WoxxyEngine::queued_peers() const {
  if(!queues_) return {};
  return queues_->peers();
}

void WoxxyEngine::set_queue_listener(TransferQueue::ItemListener listener) {
  if(queues_) queues_->set_item_listener(std::move(listener));
}

std::vector<ReceivedFile> WoxxyEngine::history() const {
  if(!history_) return {};
  return history_->entries();
}

TransferCoordinator::ListenerHandle
WoxxyEngine::add_file_received_listener(TransferCoordinator::FileReceivedListener listener) {
  if(!coordinator_) return 0;
  return coordinator_->add_file_received_listener(std::move(listener));
}

void WoxxyEngine::remove_file_received_listener(TransferCoordinator::ListenerHandle handle) {
  if(coordinator_) coordinator_->remove_file_received_listener(handle);
}

bool WoxxyEngine::apply_setting(const std::string& key, const std::string& value, std::string& error) {
  if(!settings_->set_from_string(key, value, error)) return false;
  refresh_profile();
  return true;
}

void WoxxyEngine::refresh_profile() {
  if(!profile_) return;
  auto next = profile_from_settings(*settings_);
  profile_->update(next);
  if(discovery_) discovery_->update_identity(local_address_, next.username, transfer_port_);
}

PeerIdentity WoxxyEngine::identity() const {
  if(discovery_) return discovery_->identity();
  PeerIdentity self;
  self.address = local_address_;
  self.transfer_port = transfer_port_;
  if(profile_) self.display_name = profile_->username();
  return self;
}

WoxxyEngine::Stats WoxxyEngine::stats() const {
  Stats s;
  if(registry_) s.known_peers = registry_->size();
  if(coordinator_) s.active_receives = coordinator_->active_count();
  if(sender_) s.sends_in_flight = sender_->in_flight();
  if(history_) s.received_files = history_->size();
  if(listener_) {
    auto ls = listener_->stats();
    s.connections_accepted = ls.accepted;
    s.receives_failed = ls.failed + ls.aborted;
  }
  return s;
}
