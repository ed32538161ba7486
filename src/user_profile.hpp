#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include <utility>

struct ProfileSnapshot {
  std::string username = "WoxxyUser";
  std::filesystem::path avatar_path;
  std::filesystem::path download_directory;
  bool checksum_enabled = true;
};

// Live user settings read by the core on every send and receive, so an edit
// takes effect on the next announcement or transfer.
class UserProfile {
public:
  UserProfile() = default;
  explicit UserProfile(ProfileSnapshot initial) : current_(std::move(initial)) {}

  ProfileSnapshot current() const {
    std::lock_guard lg(m_);
    return current_;
  }

  void update(ProfileSnapshot next) {
    std::lock_guard lg(m_);
    current_ = std::move(next);
  }

  std::string username() const {
    std::lock_guard lg(m_);
    return current_.username;
  }

  void set_username(std::string name) {
    std::lock_guard lg(m_);
    current_.username = std::move(name);
  }

private:
  mutable std::mutex m_;
  ProfileSnapshot current_;
};
