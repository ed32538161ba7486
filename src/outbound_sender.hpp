#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "file_sender.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "user_profile.hpp"

class SendOperation;

class OutboundSender : public FileSender,
                       public std::enable_shared_from_this<OutboundSender> {
public:
  struct Options {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds ready_timeout{5000};
    std::size_t chunk_size = 64 * 1024;
  };

  static constexpr uint64_t kMaxAvatarBytes = 10 * 1024 * 1024;

  OutboundSender(asio::io_context& io,
                 std::shared_ptr<UserProfile> profile,
                 Options options,
                 std::shared_ptr<Logger> logger = nullptr);
  ~OutboundSender() override;

  void set_local_address(std::string address);
  std::string local_address() const;

  void send(const SendRequest& request,
            ProgressCallback on_progress,
            SendCompletion on_complete) override;
  bool cancel(const std::string& transfer_id) override;
  void cancel_all();

  // Sends the configured avatar as a capability payload. Returns false when
  // no usable avatar is configured (missing, empty or larger than 10 MiB).
  bool send_avatar(const PeerIdentity& destination, SendCompletion on_complete = nullptr);

  bool is_registered(const std::string& transfer_id) const;
  std::size_t in_flight() const;

  asio::io_context& io() { return io_; }
  const Options& options() const { return options_; }
  std::shared_ptr<UserProfile> profile() const { return profile_; }
  Logger* logger() const { return logger_.get(); }

private:
  friend class SendOperation;

  bool register_operation(const std::string& transfer_id, const std::shared_ptr<SendOperation>& op);
  void deregister(const std::string& transfer_id, const SendOperation* op);
  void post_digest_job(std::function<void()> job);

  asio::io_context& io_;
  std::shared_ptr<UserProfile> profile_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  asio::thread_pool hash_pool_{1};

  mutable std::mutex m_;
  std::string local_address_;
  std::map<std::string, std::weak_ptr<SendOperation>> in_flight_;
};
