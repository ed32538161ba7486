#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

struct ReceivedFile {
  std::filesystem::path path;
  std::string sender;
  uint64_t size = 0;
  double speed_mbps = 0.0;
  std::chrono::system_clock::time_point received_at{};
};

// Session list of completed downloads, newest first. Not persisted.
class TransferHistory {
public:
  void record(ReceivedFile entry);
  std::vector<ReceivedFile> entries() const;
  std::size_t size() const;
  void clear();

private:
  mutable std::mutex m_;
  std::vector<ReceivedFile> entries_;
};
