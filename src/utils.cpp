#include "utils.hpp"
#include <openssl/evp.h>
#include <array>
#include <atomic>
#include <chrono>
#include <fstream>
#include <sstream>
#include <iomanip>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
  std::ostringstream oss;
  for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
  return oss.str();
}

struct Md5Accumulator::Impl {
  EVP_MD_CTX* ctx = nullptr;
  bool finished = false;
  bool failed = false;
};

Md5Accumulator::Md5Accumulator() : impl_(std::make_unique<Impl>()) {
  impl_->ctx = EVP_MD_CTX_new();
  if(!impl_->ctx || EVP_DigestInit_ex(impl_->ctx, EVP_md5(), nullptr) != 1) {
    impl_->failed = true;
  }
}

Md5Accumulator::~Md5Accumulator() {
  if(impl_ && impl_->ctx) EVP_MD_CTX_free(impl_->ctx);
}

bool Md5Accumulator::update(const char* data, std::size_t size) {
  if(impl_->failed || impl_->finished) return false;
  if(size == 0) return true;
  if(EVP_DigestUpdate(impl_->ctx, data, size) != 1) {
    impl_->failed = true;
    return false;
  }
  return true;
}

std::string Md5Accumulator::final_hex() {
  if(impl_->failed || impl_->finished) return "";
  std::vector<unsigned char> out(EVP_MAX_MD_SIZE);
  unsigned int len = 0;
  impl_->finished = true;
  if(EVP_DigestFinal_ex(impl_->ctx, out.data(), &len) != 1) {
    impl_->failed = true;
    return "";
  }
  out.resize(len);
  return hex_from_bytes(out);
}

std::string md5_hex(const std::string& data){
  Md5Accumulator acc;
  acc.update(data.data(), data.size());
  return acc.final_hex();
}

std::optional<std::string> md5_file_hex(const std::filesystem::path& path){
  std::ifstream in(path, std::ios::binary);
  if(!in) return std::nullopt;
  Md5Accumulator acc;
  std::array<char, 64 * 1024> buf{};
  while(in) {
    in.read(buf.data(), buf.size());
    auto got = in.gcount();
    if(got > 0 && !acc.update(buf.data(), static_cast<std::size_t>(got))) {
      return std::nullopt;
    }
  }
  if(in.bad()) return std::nullopt;
  auto hex = acc.final_hex();
  if(hex.empty()) return std::nullopt;
  return hex;
}

uint64_t epoch_millis(){
  using namespace std::chrono;
  return static_cast<uint64_t>(
    duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

std::string make_transfer_id(const std::string& file_name){
  static std::atomic<uint64_t> counter{0};
  auto seq = counter.fetch_add(1);
  auto id = md5_hex(file_name + "_" + std::to_string(epoch_millis()));
  if(seq == 0) return id;
  return id + "-" + std::to_string(seq);
}
