#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "protocol.hpp"

struct SendRequest {
  std::string transfer_id;
  std::filesystem::path file_path;
  PeerIdentity destination;
  PayloadKind kind = PayloadKind::Data;
};

using ProgressCallback = std::function<void(uint64_t total, uint64_t sent)>;
using SendCompletion = std::function<void(const TransferOutcome&)>;

// Seam between the queue and the socket code so queues can be driven by a
// fake in tests.
class FileSender {
public:
  virtual ~FileSender() = default;

  // Completion runs exactly once, with Cancelled when cancel() won.
  virtual void send(const SendRequest& request,
                    ProgressCallback on_progress,
                    SendCompletion on_complete) = 0;

  // Returns false if nothing is in flight under the id.
  virtual bool cancel(const std::string& transfer_id) = 0;
};
