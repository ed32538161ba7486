#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string md5_hex(const std::string& data);

// Streams the whole file through MD5. Returns nullopt if the file cannot be
// opened or a read fails part way.
std::optional<std::string> md5_file_hex(const std::filesystem::path& path);

// Incremental MD5 over OpenSSL's EVP interface.
class Md5Accumulator {
public:
  Md5Accumulator();
  ~Md5Accumulator();

  Md5Accumulator(const Md5Accumulator&) = delete;
  Md5Accumulator& operator=(const Md5Accumulator&) = delete;

  bool update(const char* data, std::size_t size);
  // Finishes the digest. Further updates are ignored.
  std::string final_hex();

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

uint64_t epoch_millis();

// MD5 of "<file_name>_<epoch ms>", made unique within the process.
std::string make_transfer_id(const std::string& file_name);
