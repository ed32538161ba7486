#include "inbound_transfer.hpp"

#include <algorithm>
#include <utility>

std::string sanitize_file_name(const std::string& name) {
  std::string base = name;
  auto slash = base.find_last_of("/\\");
  if(slash != std::string::npos) base = base.substr(slash + 1);
  std::replace_if(base.begin(), base.end(), [](char c){
    switch(c) {
      case '<': case '>': case ':': case '"': case '/':
      case '\\': case '|': case '?': case '*':
        return true;
      default:
        return false;
    }
  }, '_');
  if(base.empty() || base == "." || base == "..") return "unknown_file";
  return base;
}

std::filesystem::path unique_destination(const std::filesystem::path& directory,
                                         const std::string& file_name) {
  std::filesystem::path original(file_name);
  std::string stem = original.stem().string();
  std::string extension = original.extension().string();

  auto candidate = directory / file_name;
  std::error_code ec;
  for(int counter = 1; std::filesystem::exists(candidate, ec); ++counter) {
    if(counter > 999) {
      return directory / (stem + "_" + std::to_string(epoch_millis()) + extension);
    }
    candidate = directory / (stem + "_" + std::to_string(counter) + extension);
  }
  return candidate;
}

InboundTransfer::InboundTransfer(std::string source_key,
                                 TransferMetadata metadata,
                                 std::filesystem::path destination)
  : source_key_(std::move(source_key)),
    metadata_(std::move(metadata)),
    destination_(std::move(destination)),
    started_at_(Clock::now()) {
  if(metadata_.verification_required()) {
    digest_ = std::make_unique<Md5Accumulator>();
  }
}

std::unique_ptr<InboundTransfer> InboundTransfer::open(std::string source_key,
                                                       TransferMetadata metadata,
                                                       const std::filesystem::path& directory,
                                                       std::string& error) {
  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if(ec) {
    error = "cannot create " + directory.string() + ": " + ec.message();
    return nullptr;
  }

  auto destination = unique_destination(directory, sanitize_file_name(metadata.file_name));
  std::unique_ptr<InboundTransfer> transfer(
    new InboundTransfer(std::move(source_key), std::move(metadata), destination));
  transfer->sink_.open(destination, std::ios::binary | std::ios::trunc);
  if(!transfer->sink_) {
    error = "cannot open " + destination.string() + " for writing";
    return nullptr;
  }
  return transfer;
}

bool InboundTransfer::write(const char* data, std::size_t size) {
  if(!sink_.is_open()) return false;
  sink_.write(data, static_cast<std::streamsize>(size));
  if(!sink_) return false;
  if(digest_) digest_->update(data, size);
  received_ += size;
  return true;
}

void InboundTransfer::close_sink() {
  if(!finished_at_) finished_at_ = Clock::now();
  if(sink_.is_open()) {
    sink_.flush();
    sink_.close();
  }
}

InboundTransfer::Verification InboundTransfer::verify() {
  if(!metadata_.verification_required()) return Verification::Skipped;
  if(!actual_checksum_ && digest_) {
    actual_checksum_ = digest_->final_hex();
  }
  if(actual_checksum_ && !actual_checksum_->empty() && *actual_checksum_ == metadata_.expected_checksum) {
    return Verification::Match;
  }
  return Verification::Mismatch;
}

void InboundTransfer::delete_file(Logger* logger) {
  close_sink();
  std::error_code ec;
  bool removed = std::filesystem::remove(destination_, ec);
  if(ec) {
    log_warn(logger, "Failed to delete {}: {}", destination_.string(), ec.message());
  } else if(removed) {
    log_debug(logger, "Deleted {}", destination_.string());
  }
}

double InboundTransfer::speed_mbps() const {
  auto end = finished_at_ ? *finished_at_ : Clock::now();
  double seconds = std::chrono::duration<double>(end - started_at_).count();
  if(seconds <= 0.0 || metadata_.size_bytes == 0) return 0.0;
  return static_cast<double>(metadata_.size_bytes) / seconds / (1024.0 * 1024.0);
}
