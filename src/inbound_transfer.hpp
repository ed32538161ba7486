#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"
#include "protocol.hpp"
#include "utils.hpp"

// Replaces < > : " / \ | ? * with '_' and drops any directory part.
// An empty result becomes "unknown_file".
std::string sanitize_file_name(const std::string& name);

// First free name in directory: name, name_1, name_2 ... (suffix goes before
// the extension). Past 999 collisions a millisecond timestamp is used.
std::filesystem::path unique_destination(const std::filesystem::path& directory,
                                         const std::string& file_name);

// One receive in progress: the open sink plus its bookkeeping.
class InboundTransfer {
public:
  using Clock = std::chrono::steady_clock;

  enum class Verification { Skipped, Match, Mismatch };

  // Creates the directory, picks a unique destination and opens the sink.
  // Returns nullptr with error set on any filesystem failure.
  static std::unique_ptr<InboundTransfer> open(std::string source_key,
                                               TransferMetadata metadata,
                                               const std::filesystem::path& directory,
                                               std::string& error);

  InboundTransfer(const InboundTransfer&) = delete;
  InboundTransfer& operator=(const InboundTransfer&) = delete;

  bool write(const char* data, std::size_t size);
  void close_sink();

  // Compares the running digest against the declared one. Call after
  // close_sink().
  Verification verify();

  // Removes the destination file. Failures are logged, never thrown.
  void delete_file(Logger* logger);

  double speed_mbps() const;
  bool complete() const { return received_ >= metadata_.size_bytes; }

  const std::string& source_key() const { return source_key_; }
  const TransferMetadata& metadata() const { return metadata_; }
  const std::filesystem::path& destination() const { return destination_; }
  uint64_t received_bytes() const { return received_; }
  std::optional<std::string> actual_checksum() const { return actual_checksum_; }

private:
  InboundTransfer(std::string source_key, TransferMetadata metadata, std::filesystem::path destination);

  std::string source_key_;
  TransferMetadata metadata_;
  std::filesystem::path destination_;
  std::ofstream sink_;
  uint64_t received_ = 0;
  Clock::time_point started_at_;
  std::optional<Clock::time_point> finished_at_;
  std::unique_ptr<Md5Accumulator> digest_;
  std::optional<std::string> actual_checksum_;
};
