#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"

using AvatarBytes = std::vector<unsigned char>;

// True for JPEG, PNG, GIF and WebP signatures.
bool looks_like_image(const AvatarBytes& bytes);

// Peer avatars keyed by peer address. Two tiers: a hot in-memory map and a
// durable directory of one file per peer. A disk hit is promoted into memory.
class AvatarCache {
public:
  explicit AvatarCache(std::filesystem::path store_dir,
                       std::shared_ptr<Logger> logger = nullptr);

  std::optional<AvatarBytes> get(const std::string& peer_key);
  bool put(const std::string& peer_key, AvatarBytes bytes);
  void remove(const std::string& peer_key);
  bool has(const std::string& peer_key) const;

  std::size_t memory_entries() const;
  const std::filesystem::path& store_dir() const { return store_dir_; }

private:
  std::filesystem::path path_for(const std::string& peer_key) const;

  std::filesystem::path store_dir_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  std::unordered_map<std::string, AvatarBytes> hot_;
};
