#include "outbound_sender.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <optional>
#include <utility>
#include <vector>

#include "utils.hpp"

// One outbound transfer. Lives as long as an asio handler or the hashing job
// holds it; the sender only keeps a weak reference for cancel().
class SendOperation : public std::enable_shared_from_this<SendOperation> {
public:
  SendOperation(std::shared_ptr<OutboundSender> sender,
                SendRequest request,
                uint64_t total,
                ProgressCallback on_progress,
                SendCompletion on_complete)
    : sender_(std::move(sender)),
      request_(std::move(request)),
      on_progress_(std::move(on_progress)),
      on_complete_(std::move(on_complete)),
      socket_(sender_->io()),
      timer_(sender_->io()),
      total_(total),
      chunk_(std::max<std::size_t>(sender_->options().chunk_size, 1024)) {}

  void start();
  void abort_io();
  void fail(TransferOutcome outcome) { finish(std::move(outcome)); }

private:
  bool cancelled() const { return !sender_->is_registered(request_.transfer_id); }

  void on_digest(const std::string& digest);
  void connect();
  void write_header();
  void await_ready();
  void ready_settled(const std::string& note);
  void send_next_chunk();
  void drain_until_closed();
  void drain_read();
  void fail_io(const std::error_code& ec, const char* stage);
  void finish(TransferOutcome outcome);

  std::shared_ptr<OutboundSender> sender_;
  SendRequest request_;
  ProgressCallback on_progress_;
  SendCompletion on_complete_;
  asio::ip::tcp::socket socket_;
  asio::steady_timer timer_;
  std::ifstream file_;
  uint64_t total_ = 0;
  uint64_t sent_ = 0;
  std::vector<char> header_;
  std::vector<char> chunk_;
  std::array<unsigned char, kReadyToken.size()> ready_buf_{};
  bool connected_ = false;
  bool timed_out_ = false;
  bool ready_done_ = false;
  bool finished_ = false;
};

void SendOperation::start() {
  if(cancelled()) {
    finish(TransferOutcome::failure(TransferError::Cancelled, "cancelled"));
    return;
  }
  if(!sender_->profile()->current().checksum_enabled) {
    on_digest(kChecksumSkipped);
    return;
  }

  auto self = shared_from_this();
  sender_->post_digest_job([self]() mutable {
    auto digest = md5_file_hex(self->request_.file_path);
    std::string value = digest ? *digest : std::string(kChecksumSenderFailed);
    auto& io = self->sender_->io();
    asio::post(io, [op = std::move(self), value](){ op->on_digest(value); });
  });
}

void SendOperation::on_digest(const std::string& digest) {
  if(cancelled()) {
    finish(TransferOutcome::failure(TransferError::Cancelled, "cancelled"));
    return;
  }
  auto* logger = sender_->logger();
  if(digest == kChecksumSenderFailed) {
    log_warn(logger, "Could not hash {}; sending without a checksum", request_.file_path.string());
  }

  file_.open(request_.file_path, std::ios::binary);
  if(!file_) {
    finish(TransferOutcome::failure(TransferError::Filesystem,
                                    "cannot open " + request_.file_path.string()));
    return;
  }

  TransferMetadata metadata;
  metadata.file_name = request_.file_path.filename().string();
  metadata.size_bytes = total_;
  metadata.sender_name = sender_->profile()->username();
  metadata.sender_address = sender_->local_address();
  metadata.expected_checksum = digest;
  metadata.kind = request_.kind;
  metadata.transfer_id = request_.transfer_id;
  header_ = encode_frame_header(metadata);

  connect();
}

void SendOperation::connect() {
  std::error_code ec;
  auto address = asio::ip::make_address(request_.destination.address, ec);
  if(ec) {
    finish(TransferOutcome::failure(TransferError::Network,
                                    "invalid address " + request_.destination.address));
    return;
  }
  asio::ip::tcp::endpoint endpoint(address, request_.destination.transfer_port);

  auto self = shared_from_this();
  timer_.expires_after(sender_->options().connect_timeout);
  timer_.async_wait([self](const std::error_code& ec){
    if(ec || self->connected_ || self->finished_) return;
    self->timed_out_ = true;
    std::error_code ignored;
    self->socket_.close(ignored);
  });

  socket_.async_connect(endpoint, [self](std::error_code ec){
    self->timer_.cancel();
    if(ec) {
      if(self->timed_out_ && !self->cancelled()) {
        self->finish(TransferOutcome::failure(TransferError::Network, "connect timed out"));
      } else {
        self->fail_io(ec, "connect");
      }
      return;
    }
    self->connected_ = true;
    std::error_code opt_ec;
    self->socket_.set_option(asio::ip::tcp::no_delay(true), opt_ec);
    self->write_header();
  });
}

void SendOperation::write_header() {
  auto self = shared_from_this();
  asio::async_write(socket_, asio::buffer(header_),
    [self](std::error_code ec, std::size_t){
      if(ec) {
        self->fail_io(ec, "metadata");
        return;
      }
      self->await_ready();
    });
}

void SendOperation::await_ready() {
  auto self = shared_from_this();
  timer_.expires_after(sender_->options().ready_timeout);
  timer_.async_wait([self](const std::error_code& ec){
    if(ec || self->ready_done_) return;
    // Stop waiting; the pending read completes with operation_aborted.
    std::error_code ignored;
    self->socket_.cancel(ignored);
    self->ready_settled("ready token timed out");
  });

  asio::async_read(socket_, asio::buffer(ready_buf_),
    [self](std::error_code ec, std::size_t){
      if(self->ready_done_) return;
      self->timer_.cancel();
      if(ec == asio::error::eof && !self->cancelled()) {
        // The receiver reads the header before answering, so a close here
        // means it refused the transfer.
        self->finish(TransferOutcome::failure(TransferError::Network,
                                              "receiver closed the connection before accepting the transfer"));
      } else if(ec) {
        self->fail_io(ec, "ready");
      } else if(!std::equal(self->ready_buf_.begin(), self->ready_buf_.end(), kReadyToken.begin())) {
        self->ready_settled("unexpected ready token");
      } else {
        self->ready_settled("");
      }
    });
}

void SendOperation::ready_settled(const std::string& note) {
  ready_done_ = true;
  if(!note.empty()) {
    log_debug(sender_->logger(), "{} for {}; proceeding", note, request_.transfer_id);
  }
  if(on_progress_) on_progress_(total_, 0);
  send_next_chunk();
}

void SendOperation::send_next_chunk() {
  if(cancelled()) {
    log_info(sender_->logger(), "Transfer {} cancelled after {}/{} bytes", request_.transfer_id, sent_, total_);
    finish(TransferOutcome::failure(TransferError::Cancelled, "cancelled"));
    return;
  }
  if(sent_ >= total_) {
    drain_until_closed();
    return;
  }

  auto want = static_cast<std::size_t>(std::min<uint64_t>(chunk_.size(), total_ - sent_));
  file_.read(chunk_.data(), static_cast<std::streamsize>(want));
  auto got = static_cast<std::size_t>(file_.gcount());
  if(got != want) {
    finish(TransferOutcome::failure(TransferError::Filesystem,
                                    "read of " + request_.file_path.string() + " came up short"));
    return;
  }

  auto self = shared_from_this();
  asio::async_write(socket_, asio::buffer(chunk_.data(), got),
    [self](std::error_code ec, std::size_t written){
      if(ec) {
        self->fail_io(ec, "data");
        return;
      }
      self->sent_ += written;
      if(self->on_progress_) self->on_progress_(self->total_, self->sent_);
      self->send_next_chunk();
    });
}

// Half-closes so the receiver sees end of stream, then waits for the
// receiver to close its side. Its table entry is gone by then, so a queued
// follow-up send to the same peer is not rejected as overlapping.
void SendOperation::drain_until_closed() {
  std::error_code ec;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ec);
  if(ec) {
    fail_io(ec, "shutdown");
    return;
  }

  auto self = shared_from_this();
  timer_.expires_after(sender_->options().connect_timeout);
  timer_.async_wait([self](const std::error_code& ec){
    if(ec || self->finished_) return;
    log_debug(self->sender_->logger(), "Receiver kept {} open; closing", self->request_.transfer_id);
    self->finish(TransferOutcome::success());
  });
  drain_read();
}

void SendOperation::drain_read() {
  auto self = shared_from_this();
  socket_.async_read_some(asio::buffer(ready_buf_),
    [self](std::error_code ec, std::size_t){
      if(self->finished_) return;
      if(!ec) {
        self->drain_read();
        return;
      }
      if(ec == asio::error::eof) {
        self->finish(TransferOutcome::success());
        return;
      }
      self->fail_io(ec, "drain");
    });
}

void SendOperation::fail_io(const std::error_code& ec, const char* stage) {
  if(cancelled()) {
    finish(TransferOutcome::failure(TransferError::Cancelled, "cancelled"));
    return;
  }
  finish(TransferOutcome::failure(TransferError::Network, std::string(stage) + ": " + ec.message()));
}

void SendOperation::abort_io() {
  std::error_code ec;
  timer_.cancel();
  socket_.close(ec);
}

void SendOperation::finish(TransferOutcome outcome) {
  if(finished_) return;
  finished_ = true;

  sender_->deregister(request_.transfer_id, this);
  std::error_code ec;
  timer_.cancel();
  if(socket_.is_open()) {
    socket_.close(ec);
    if(ec) {
      log_debug(sender_->logger(), "Closing socket for {}: {}", request_.transfer_id, ec.message());
    }
  }
  file_.close();

  auto* logger = sender_->logger();
  if(outcome.ok()) {
    log_info(logger, "Sent {} to {} ({} bytes)", request_.file_path.filename().string(),
             request_.destination.address, total_);
  } else if(outcome.error != TransferError::Cancelled) {
    log_error(logger, "Sending {} to {} failed: {}", request_.file_path.filename().string(),
              request_.destination.address, outcome.message);
  }

  if(on_complete_) {
    auto cb = std::move(on_complete_);
    on_complete_ = nullptr;
    cb(outcome);
  }
}

OutboundSender::OutboundSender(asio::io_context& io,
                               std::shared_ptr<UserProfile> profile,
                               Options options,
                               std::shared_ptr<Logger> logger)
  : io_(io),
    profile_(profile ? std::move(profile) : std::make_shared<UserProfile>()),
    options_(options),
    logger_(std::move(logger)) {}

OutboundSender::~OutboundSender() {
  hash_pool_.join();
}

void OutboundSender::set_local_address(std::string address) {
  std::lock_guard lg(m_);
  local_address_ = std::move(address);
}

std::string OutboundSender::local_address() const {
  std::lock_guard lg(m_);
  return local_address_;
}

void OutboundSender::send(const SendRequest& request,
                          ProgressCallback on_progress,
                          SendCompletion on_complete) {
  auto reject = [&](TransferError kind, std::string message){
    log_error(logger_.get(), "Cannot send {}: {}", request.file_path.string(), message);
    if(!on_complete) return;
    asio::post(io_, [cb = std::move(on_complete), kind, message](){
      cb(TransferOutcome::failure(kind, message));
    });
  };

  std::error_code ec;
  if(!std::filesystem::is_regular_file(request.file_path, ec)) {
    reject(TransferError::Filesystem, "not a regular file");
    return;
  }
  auto size = std::filesystem::file_size(request.file_path, ec);
  if(ec) {
    reject(TransferError::Filesystem, ec.message());
    return;
  }

  auto op = std::make_shared<SendOperation>(shared_from_this(), request, size,
                                            std::move(on_progress), std::move(on_complete));
  if(!register_operation(request.transfer_id, op)) {
    log_error(logger_.get(), "Transfer id {} is already in flight", request.transfer_id);
    asio::post(io_, [op](){
      op->fail(TransferOutcome::failure(TransferError::ProtocolFormat, "duplicate transfer id"));
    });
    return;
  }
  log_info(logger_.get(), "Sending {} ({} bytes) to {}:{} as {}", request.file_path.filename().string(),
           size, request.destination.address, request.destination.transfer_port, request.transfer_id);
  asio::post(io_, [op](){ op->start(); });
}

bool OutboundSender::cancel(const std::string& transfer_id) {
  std::shared_ptr<SendOperation> op;
  {
    std::lock_guard lg(m_);
    auto it = in_flight_.find(transfer_id);
    if(it == in_flight_.end()) return false;
    op = it->second.lock();
    in_flight_.erase(it);
  }
  log_info(logger_.get(), "Cancelling transfer {}", transfer_id);
  if(op) {
    asio::post(io_, [op](){ op->abort_io(); });
  }
  return true;
}

void OutboundSender::cancel_all() {
  std::vector<std::string> ids;
  {
    std::lock_guard lg(m_);
    for(const auto& kv : in_flight_) ids.push_back(kv.first);
  }
  for(const auto& id : ids) cancel(id);
}

bool OutboundSender::send_avatar(const PeerIdentity& destination, SendCompletion on_complete) {
  auto avatar = profile_->current().avatar_path;
  if(avatar.empty()) {
    log_debug(logger_.get(), "No avatar configured; ignoring request from {}", destination.address);
    return false;
  }
  std::error_code ec;
  if(!std::filesystem::is_regular_file(avatar, ec)) {
    log_warn(logger_.get(), "Avatar {} does not exist", avatar.string());
    return false;
  }
  auto size = std::filesystem::file_size(avatar, ec);
  if(ec || size == 0) {
    log_warn(logger_.get(), "Avatar {} is empty or unreadable", avatar.string());
    return false;
  }
  if(size > kMaxAvatarBytes) {
    log_warn(logger_.get(), "Avatar {} is too large ({} bytes > {})", avatar.string(), size, kMaxAvatarBytes);
    return false;
  }

  SendRequest request;
  request.transfer_id = "avatar_" + destination.address + "_" + std::to_string(epoch_millis());
  request.file_path = avatar;
  request.destination = destination;
  request.kind = PayloadKind::Capability;
  send(request, nullptr, std::move(on_complete));
  return true;
}

bool OutboundSender::is_registered(const std::string& transfer_id) const {
  std::lock_guard lg(m_);
  return in_flight_.count(transfer_id) != 0;
}

std::size_t OutboundSender::in_flight() const {
  std::lock_guard lg(m_);
  return in_flight_.size();
}

bool OutboundSender::register_operation(const std::string& transfer_id,
                                        const std::shared_ptr<SendOperation>& op) {
  std::lock_guard lg(m_);
  return in_flight_.emplace(transfer_id, op).second;
}

void OutboundSender::deregister(const std::string& transfer_id, const SendOperation* op) {
  std::lock_guard lg(m_);
  auto it = in_flight_.find(transfer_id);
  if(it == in_flight_.end()) return;
  auto current = it->second.lock();
  if(!current || current.get() == op) in_flight_.erase(it);
}

void OutboundSender::post_digest_job(std::function<void()> job) {
  asio::post(hash_pool_, std::move(job));
}
