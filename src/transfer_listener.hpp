#pragma once
#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "inbound_transfer_writer.hpp"
#include "log.hpp"
#include "transfer_coordinator.hpp"

// Accepts transfer connections and hands each one to a fresh
// InboundTransferWriter.
class TransferListener {
public:
  struct Stats {
    std::size_t accepted = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t aborted = 0;
  };

  TransferListener(asio::io_context& io,
                   std::shared_ptr<TransferCoordinator> coordinator,
                   std::size_t chunk_size = 64 * 1024,
                   std::shared_ptr<Logger> logger = nullptr);
  ~TransferListener();

  // Binds and starts accepting. Port 0 picks an ephemeral port. Throws
  // std::system_error when the port cannot be bound.
  void start(const std::string& bind_address, uint16_t port);
  void stop();

  uint16_t port() const { return port_; }
  Stats stats() const;

private:
  using tcp = asio::ip::tcp;

  void do_accept();

  asio::io_context& io_;
  std::shared_ptr<TransferCoordinator> coordinator_;
  std::size_t chunk_size_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::atomic<bool> running_{false};
  uint16_t port_ = 0;

  struct Counters {
    std::atomic<std::size_t> accepted{0};
    std::atomic<std::size_t> completed{0};
    std::atomic<std::size_t> failed{0};
    std::atomic<std::size_t> aborted{0};
  };
  std::shared_ptr<Counters> counters_ = std::make_shared<Counters>();
};
