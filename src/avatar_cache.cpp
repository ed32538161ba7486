#include "avatar_cache.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

bool looks_like_image(const AvatarBytes& b) {
  if(b.size() < 4) return false;
  if(b[0] == 0xFF && b[1] == 0xD8) return true;                                   // JPEG
  if(b[0] == 0x89 && b[1] == 0x50 && b[2] == 0x4E && b[3] == 0x47) return true;   // PNG
  if(b[0] == 0x47 && b[1] == 0x49 && b[2] == 0x46 && b[3] == 0x38) return true;   // GIF
  if(b.size() >= 12 &&
     b[0] == 'R' && b[1] == 'I' && b[2] == 'F' && b[3] == 'F' &&
     b[8] == 'W' && b[9] == 'E' && b[10] == 'B' && b[11] == 'P') {
    return true;                                                                  // WebP
  }
  return false;
}

AvatarCache::AvatarCache(std::filesystem::path store_dir, std::shared_ptr<Logger> logger)
  : store_dir_(std::move(store_dir)),
    logger_(std::move(logger)) {}

std::filesystem::path AvatarCache::path_for(const std::string& peer_key) const {
  std::string safe = peer_key;
  std::replace_if(safe.begin(), safe.end(),
                  [](unsigned char c){ return !(std::isalnum(c) || c == '.' || c == '-'); },
                  '_');
  return store_dir_ / (safe + ".img");
}

std::optional<AvatarBytes> AvatarCache::get(const std::string& peer_key) {
  {
    std::lock_guard lg(m_);
    auto it = hot_.find(peer_key);
    if(it != hot_.end()) return it->second;
  }
  if(store_dir_.empty()) return std::nullopt;

  std::ifstream in(path_for(peer_key), std::ios::binary);
  if(!in) return std::nullopt;
  AvatarBytes bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if(!looks_like_image(bytes)) {
    log_warn(logger_.get(), "Ignoring unreadable cached avatar for {}", peer_key);
    return std::nullopt;
  }
  std::lock_guard lg(m_);
  auto it = hot_.emplace(peer_key, std::move(bytes)).first;
  log_debug(logger_.get(), "Promoted avatar for {} from disk ({} bytes)", peer_key, it->second.size());
  return it->second;
}

bool AvatarCache::put(const std::string& peer_key, AvatarBytes bytes) {
  if(peer_key.empty() || !looks_like_image(bytes)) return false;

  if(!store_dir_.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(store_dir_, ec);
    if(ec) {
      log_warn(logger_.get(), "Avatar store {} unavailable: {}", store_dir_.string(), ec.message());
    } else {
      std::ofstream out(path_for(peer_key), std::ios::binary | std::ios::trunc);
      out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
      if(!out) {
        log_warn(logger_.get(), "Failed to persist avatar for {}", peer_key);
      }
    }
  }

  std::lock_guard lg(m_);
  hot_[peer_key] = std::move(bytes);
  return true;
}

void AvatarCache::remove(const std::string& peer_key) {
  {
    std::lock_guard lg(m_);
    hot_.erase(peer_key);
  }
  if(store_dir_.empty()) return;
  std::error_code ec;
  std::filesystem::remove(path_for(peer_key), ec);
  if(ec) {
    log_warn(logger_.get(), "Failed to delete cached avatar for {}: {}", peer_key, ec.message());
  }
}

bool AvatarCache::has(const std::string& peer_key) const {
  {
    std::lock_guard lg(m_);
    if(hot_.count(peer_key)) return true;
  }
  if(store_dir_.empty()) return false;
  std::error_code ec;
  return std::filesystem::exists(path_for(peer_key), ec);
}

std::size_t AvatarCache::memory_entries() const {
  std::lock_guard lg(m_);
  return hot_.size();
}
