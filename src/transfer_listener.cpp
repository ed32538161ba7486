#include "transfer_listener.hpp"

#include <utility>

TransferListener::TransferListener(asio::io_context& io,
                                   std::shared_ptr<TransferCoordinator> coordinator,
                                   std::size_t chunk_size,
                                   std::shared_ptr<Logger> logger)
  : io_(io),
    coordinator_(std::move(coordinator)),
    chunk_size_(chunk_size),
    logger_(std::move(logger)) {}

TransferListener::~TransferListener() {
  stop();
}

void TransferListener::start(const std::string& bind_address, uint16_t port) {
  if(running_) return;
  auto address = bind_address.empty()
    ? asio::ip::address(asio::ip::address_v4::any())
    : asio::ip::make_address(bind_address);

  tcp::endpoint endpoint(address, port);
  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();
  port_ = acceptor_->local_endpoint().port();
  running_ = true;

  log_info(logger_.get(), "Listening for transfers on {}:{}", endpoint.address().to_string(), port_);
  do_accept();
}

void TransferListener::stop() {
  if(!running_.exchange(false)) return;
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
    if(ec) {
      log_warn(logger_.get(), "Closing transfer acceptor: {}", ec.message());
    }
  }
}

void TransferListener::do_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(!running_) return;
      if(ec) {
        log_error(logger_.get(), "Accept error: {}", ec.message());
      } else {
        counters_->accepted++;
        auto writer = InboundTransferWriter::create(std::move(socket), coordinator_, chunk_size_, logger_);
        std::weak_ptr<Counters> counters = counters_;
        writer->set_done_callback([counters](InboundTransferWriter::State state, const TransferOutcome&){
          auto c = counters.lock();
          if(!c) return;
          switch(state) {
            case InboundTransferWriter::State::Completed: c->completed++; break;
            case InboundTransferWriter::State::Aborted: c->aborted++; break;
            default: c->failed++; break;
          }
        });
        writer->start();
      }
      do_accept();
    });
}

TransferListener::Stats TransferListener::stats() const {
  Stats out;
  out.accepted = counters_->accepted.load();
  out.completed = counters_->completed.load();
  out.failed = counters_->failed.load();
  out.aborted = counters_->aborted.load();
  return out;
}
