#pragma once
#include <asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"
#include "transfer_coordinator.hpp"

// Drives one accepted connection through
//   AwaitingMetadata -> Streaming -> Finalizing -> Completed | Failed
// with Aborted reachable from Streaming. Completion is decided when the
// sender closes the connection, never by reaching the declared size.
class InboundTransferWriter : public std::enable_shared_from_this<InboundTransferWriter> {
public:
  enum class State { AwaitingMetadata, Streaming, Finalizing, Completed, Failed, Aborted };
  using DoneCallback = std::function<void(State, const TransferOutcome&)>;

  // Zero bytes followed by a close inside this window is treated as a
  // spurious early close, not as an empty payload.
  static constexpr std::chrono::milliseconds kEarlyCloseWindow{100};

  static std::shared_ptr<InboundTransferWriter> create(asio::ip::tcp::socket socket,
                                                       std::shared_ptr<TransferCoordinator> coordinator,
                                                       std::size_t chunk_size,
                                                       std::shared_ptr<Logger> logger = nullptr);

  void set_done_callback(DoneCallback cb) { done_ = std::move(cb); }
  void start();

  State state() const { return state_.load(); }
  const std::string& source_key() const { return source_key_; }

private:
  InboundTransferWriter(asio::ip::tcp::socket socket,
                        std::shared_ptr<TransferCoordinator> coordinator,
                        std::size_t chunk_size,
                        std::shared_ptr<Logger> logger);

  void read_length();
  void read_metadata(uint32_t length);
  void accept_metadata();
  void send_ready();
  void read_body();
  void handle_chunk(std::size_t bytes);
  void handle_closed();
  void abort_transfer(const std::string& reason);
  void finish(State state, const TransferOutcome& outcome);
  void close_socket();

  asio::ip::tcp::socket socket_;
  std::shared_ptr<TransferCoordinator> coordinator_;
  std::shared_ptr<Logger> logger_;
  std::string source_key_;
  std::atomic<State> state_{State::AwaitingMetadata};

  std::array<unsigned char, kLengthPrefixBytes> length_buf_{};
  std::string metadata_buf_;
  TransferMetadata metadata_;
  std::vector<char> chunk_;
  uint64_t received_ = 0;
  bool surplus_warned_ = false;
  std::chrono::steady_clock::time_point streaming_since_{};
  DoneCallback done_;
};

const char* writer_state_name(InboundTransferWriter::State state);
