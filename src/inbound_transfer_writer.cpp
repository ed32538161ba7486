#include "inbound_transfer_writer.hpp"

#include <algorithm>
#include <utility>

const char* writer_state_name(InboundTransferWriter::State state) {
  using State = InboundTransferWriter::State;
  switch(state) {
    case State::AwaitingMetadata: return "awaiting-metadata";
    case State::Streaming: return "streaming";
    case State::Finalizing: return "finalizing";
    case State::Completed: return "completed";
    case State::Failed: return "failed";
    case State::Aborted: return "aborted";
  }
  return "unknown";
}

std::shared_ptr<InboundTransferWriter>
InboundTransferWriter::create(asio::ip::tcp::socket socket,
                              std::shared_ptr<TransferCoordinator> coordinator,
                              std::size_t chunk_size,
                              std::shared_ptr<Logger> logger) {
  return std::shared_ptr<InboundTransferWriter>(
    new InboundTransferWriter(std::move(socket), std::move(coordinator), chunk_size, std::move(logger)));
}

InboundTransferWriter::InboundTransferWriter(asio::ip::tcp::socket socket,
                                             std::shared_ptr<TransferCoordinator> coordinator,
                                             std::size_t chunk_size,
                                             std::shared_ptr<Logger> logger)
  : socket_(std::move(socket)),
    coordinator_(std::move(coordinator)),
    logger_(std::move(logger)),
    chunk_(std::max<std::size_t>(chunk_size, 1024)) {}

void InboundTransferWriter::start() {
  std::error_code ec;
  auto remote = socket_.remote_endpoint(ec);
  if(ec) {
    log_warn(logger_.get(), "Dropping connection with unknown peer: {}", ec.message());
    finish(State::Failed, TransferOutcome::failure(TransferError::Network, ec.message()));
    return;
  }
  source_key_ = remote.address().to_string();
  socket_.set_option(asio::ip::tcp::no_delay(true), ec);
  if(ec) {
    log_debug(logger_.get(), "TCP_NODELAY not set for {}: {}", source_key_, ec.message());
  }
  read_length();
}

void InboundTransferWriter::read_length() {
  auto self = shared_from_this();
  asio::async_read(socket_, asio::buffer(length_buf_),
    [self](std::error_code ec, std::size_t){
      if(ec) {
        log_debug(self->logger_.get(), "{} closed before sending metadata: {}", self->source_key_, ec.message());
        self->finish(State::Failed, TransferOutcome::failure(TransferError::ProtocolFormat, "no metadata"));
        return;
      }
      uint32_t length = decode_length_prefix(self->length_buf_.data());
      if(length == 0 || length > kMaxMetadataBytes) {
        log_warn(self->logger_.get(), "Dropping {}: metadata length {} outside 1..{}",
                 self->source_key_, length, kMaxMetadataBytes);
        self->finish(State::Failed, TransferOutcome::failure(TransferError::ProtocolFormat, "metadata length out of range"));
        return;
      }
      self->read_metadata(length);
    });
}

void InboundTransferWriter::read_metadata(uint32_t length) {
  metadata_buf_.assign(length, '\0');
  auto self = shared_from_this();
  asio::async_read(socket_, asio::buffer(&metadata_buf_[0], metadata_buf_.size()),
    [self](std::error_code ec, std::size_t){
      if(ec) {
        log_warn(self->logger_.get(), "Truncated metadata from {}: {}", self->source_key_, ec.message());
        self->finish(State::Failed, TransferOutcome::failure(TransferError::ProtocolFormat, "truncated metadata"));
        return;
      }
      self->accept_metadata();
    });
}

void InboundTransferWriter::accept_metadata() {
  std::string error;
  auto parsed = parse_metadata_document(metadata_buf_, error);
  metadata_buf_.clear();
  if(!parsed) {
    log_warn(logger_.get(), "Malformed metadata from {}: {}", source_key_, error);
    finish(State::Failed, TransferOutcome::failure(TransferError::ProtocolFormat, error));
    return;
  }
  metadata_ = std::move(*parsed);

  auto outcome = coordinator_->begin(source_key_, metadata_);
  if(!outcome.ok()) {
    finish(State::Failed, outcome);
    return;
  }
  state_ = State::Streaming;
  streaming_since_ = std::chrono::steady_clock::now();
  send_ready();
}

void InboundTransferWriter::send_ready() {
  auto self = shared_from_this();
  asio::async_write(socket_, asio::buffer(kReadyToken),
    [self](std::error_code ec, std::size_t){
      if(ec) {
        // The read side will observe the broken socket and abort.
        log_debug(self->logger_.get(), "Ready token to {} not sent: {}", self->source_key_, ec.message());
      }
      self->read_body();
    });
}

void InboundTransferWriter::read_body() {
  auto self = shared_from_this();
  socket_.async_read_some(asio::buffer(chunk_),
    [self](std::error_code ec, std::size_t bytes){
      if(self->state_ != State::Streaming) return;
      if(bytes > 0) self->handle_chunk(bytes);
      if(self->state_ != State::Streaming) return;
      if(ec == asio::error::eof) {
        self->handle_closed();
        return;
      }
      if(ec) {
        self->abort_transfer(ec.message());
        return;
      }
      self->read_body();
    });
}

void InboundTransferWriter::handle_chunk(std::size_t bytes) {
  uint64_t remaining = metadata_.size_bytes > received_ ? metadata_.size_bytes - received_ : 0;
  std::size_t usable = static_cast<std::size_t>(std::min<uint64_t>(bytes, remaining));
  if(usable < bytes && !surplus_warned_) {
    surplus_warned_ = true;
    log_warn(logger_.get(), "{} sent more than the declared {} bytes; ignoring the surplus",
             source_key_, metadata_.size_bytes);
  }
  if(usable == 0) return;
  if(!coordinator_->write(source_key_, chunk_.data(), usable)) {
    abort_transfer("write to destination failed");
    return;
  }
  received_ += usable;
}

void InboundTransferWriter::handle_closed() {
  auto elapsed = std::chrono::steady_clock::now() - streaming_since_;
  if(metadata_.size_bytes > 0 && received_ == 0 && elapsed < kEarlyCloseWindow) {
    abort_transfer("connection closed before any data arrived");
    return;
  }
  if(received_ < metadata_.size_bytes) {
    abort_transfer("connection closed after " + std::to_string(received_) + " of " +
                   std::to_string(metadata_.size_bytes) + " bytes");
    return;
  }
  state_ = State::Finalizing;
  auto outcome = coordinator_->finalize(source_key_);
  finish(outcome.ok() ? State::Completed : State::Failed, outcome);
}

void InboundTransferWriter::abort_transfer(const std::string& reason) {
  auto outcome = coordinator_->abort(source_key_, reason);
  finish(State::Aborted, outcome);
}

void InboundTransferWriter::finish(State state, const TransferOutcome& outcome) {
  state_ = state;
  close_socket();
  log_debug(logger_.get(), "Connection from {} ended {}", source_key_, writer_state_name(state));
  if(done_) {
    auto cb = std::move(done_);
    done_ = nullptr;
    cb(state, outcome);
  }
}

void InboundTransferWriter::close_socket() {
  std::error_code ec;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
  if(ec) {
    log_debug(logger_.get(), "Closing socket for {}: {}", source_key_, ec.message());
  }
}
