#pragma once
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "settings_manager.hpp"
#include "woxxy_engine.hpp"

class WoxxyCLI {
public:
  static constexpr std::chrono::milliseconds kProgressInterval{500};

  explicit WoxxyCLI(WoxxyEngine& engine)
    : engine_(engine), running_(true) {
    engine_.set_queue_listener([this](const PeerIdentity& peer, const QueueItem& item){
      on_queue_item(peer, item);
    });
    file_listener_ = engine_.add_file_received_listener([this](const ReceivedFile& file){
      on_file_received(file);
    });
  }

  ~WoxxyCLI() {
    engine_.set_queue_listener(nullptr);
    engine_.remove_file_received_listener(file_listener_);
    stop();
  }

  void start() {
    cli_thread_ = std::thread([this](){ run_loop(); });
  }

  void stop() {
    running_ = false;
    if(cli_thread_.joinable() && cli_thread_.get_id() != std::this_thread::get_id()) {
      cli_thread_.join();
    }
  }

  // Runs one command line. Returns false for quit.
  bool execute_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    if(cmd.empty()) return true;

    if(cmd == "peers" || cmd == "p") {
      list_peers();
    } else if(cmd == "send") {
      std::string peer;
      iss >> std::quoted(peer);
      std::vector<std::filesystem::path> paths;
      std::string path;
      while(iss >> std::quoted(path)) paths.emplace_back(path);
      send_command(peer, paths);
    } else if(cmd == "cancel") {
      std::string peer;
      iss >> std::quoted(peer);
      cancel_command(peer);
    } else if(cmd == "queue" || cmd == "q") {
      std::string peer;
      iss >> std::quoted(peer);
      queue_command(peer);
    } else if(cmd == "history") {
      history_command();
    } else if(cmd == "settings" || cmd == "s") {
      settings_command();
    } else if(cmd == "set") {
      std::string key;
      iss >> key;
      std::string value;
      std::getline(iss, value);
      set_command(key, SettingsManager::trim_copy(value));
    } else if(cmd == "whoami") {
      whoami();
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "quit" || cmd == "exit") {
      say("Quitting...");
      running_ = false;
      engine_.request_shutdown();
      return false;
    } else {
      print_help();
      say("Unknown command: " + cmd);
    }
    return true;
  }

private:
  void run_loop() {
    while(running_) {
      auto input = read_command_line("> ");
      if(!input) {
        engine_.request_shutdown();
        break;
      }
      if(!execute_command(*input)) break;
    }
  }

  std::optional<std::string> read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
#else
    std::cout << prompt;
    std::cout.flush();
    std::string line;
    if(!std::getline(std::cin, line)) return std::nullopt;
    return line;
#endif
  }

  void say(const std::string& text) {
    std::lock_guard lg(out_mutex_);
    std::cout << text << "\n";
    std::cout.flush();
  }

  void print_help() {
    std::lock_guard lg(out_mutex_);
    std::cout << "Available commands:\n";
    std::cout << "  help|h|?                     Show this help message\n";
    std::cout << "  peers|p                      List peers seen on the network\n";
    std::cout << "  send <peer> <path>...        Queue files for a peer (address or name)\n";
    std::cout << "  cancel <peer>                Drop queued sends and stop the active one\n";
    std::cout << "  queue|q [peer]               Show send queues\n";
    std::cout << "  history                      Files received this session\n";
    std::cout << "  settings|s                   Show current settings\n";
    std::cout << "  set <key> <value>            Change a setting for this session\n";
    std::cout << "  whoami                       Show what we announce\n";
    std::cout << "  quit                         Exit the application\n";
  }

  void list_peers() {
    auto peers = engine_.peers();
    std::lock_guard lg(out_mutex_);
    if(peers.empty()) {
      std::cout << "No peers found yet.\n";
      return;
    }
    for(const auto& p : peers) {
      std::cout << "  " << std::left << std::setw(20) << p.display_name
                << " " << p.address << ":" << p.transfer_port << "\n";
    }
  }

  void send_command(const std::string& peer, const std::vector<std::filesystem::path>& paths) {
    if(peer.empty() || paths.empty()) {
      say("Usage: send <peer> <path>...");
      return;
    }
    std::string error;
    auto ids = engine_.send_files(peer, paths, error);
    if(ids.empty()) {
      say("Cannot send: " + error);
      return;
    }
    say("Queued " + std::to_string(ids.size()) + " file(s) for " + peer);
  }

  void cancel_command(const std::string& peer) {
    if(peer.empty()) {
      say("Usage: cancel <peer>");
      return;
    }
    say(engine_.cancel_peer(peer) ? "Cancelled sends to " + peer : "Nothing queued for " + peer);
  }

  void queue_command(const std::string& peer) {
    std::vector<std::string> targets;
    if(peer.empty()) {
      targets = engine_.queued_peers();
    } else {
      targets.push_back(peer);
    }
    std::lock_guard lg(out_mutex_);
    if(targets.empty()) {
      std::cout << "No sends this session.\n";
      return;
    }
    for(const auto& target : targets) {
      std::cout << target << ":\n";
      for(const auto& item : engine_.queue_items(target)) {
        std::cout << "  " << std::left << std::setw(10) << queue_status_name(item.status)
                  << " " << item.path.filename().string();
        if(item.status == QueueItemStatus::Sending && item.total_bytes > 0) {
          std::cout << " " << (item.sent_bytes * 100 / item.total_bytes) << "%";
        }
        if(!item.message.empty() && item.status == QueueItemStatus::Failed) {
          std::cout << " (" << item.message << ")";
        }
        std::cout << "\n";
      }
    }
  }

  void history_command() {
    auto entries = engine_.history();
    std::lock_guard lg(out_mutex_);
    if(entries.empty()) {
      std::cout << "Nothing received this session.\n";
      return;
    }
    for(const auto& e : entries) {
      std::time_t t = std::chrono::system_clock::to_time_t(e.received_at);
      std::tm tm{};
      localtime_r(&t, &tm);
      std::cout << "  " << std::put_time(&tm, "%H:%M:%S") << "  " << e.path.string()
                << " from " << e.sender << " (" << format_size(e.size) << ", "
                << std::fixed << std::setprecision(2) << e.speed_mbps << " MB/s)\n";
    }
  }

  void settings_command() {
    auto settings = engine_.settings();
    std::lock_guard lg(out_mutex_);
    for(const auto& setting : settings->settings()) {
      if(!setting.persistent) continue;
      const auto& key = setting.key;
      std::cout << "  " << std::left << std::setw(22) << key << " = " << settings->value_as_string(key);
      auto def = settings->default_as_string(key);
      if(settings->value_as_string(key) != def) {
        std::cout << "  (default: " << def << ")";
      }
      std::cout << "\n";
    }
  }

  void set_command(const std::string& key, const std::string& value) {
    if(key.empty()) {
      settings_command();
      return;
    }
    auto settings = engine_.settings();
    auto resolved = settings->resolve_key(key);
    if(!resolved) {
      say("Unknown setting: " + key);
      return;
    }
    std::string effective = value;
    if(effective.empty() && settings->is_bool_setting(*resolved)) effective = "true";
    std::string error;
    if(!engine_.apply_setting(*resolved, effective, error)) {
      say("Invalid value for " + *resolved + ": " + error);
      return;
    }
    say(*resolved + " = " + settings->value_as_string(*resolved));
  }

  void whoami() {
    auto self = engine_.identity();
    say(self.display_name + " at " + self.address + ":" + std::to_string(self.transfer_port));
  }

  void on_queue_item(const PeerIdentity& peer, const QueueItem& item) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard lg(out_mutex_);
    switch(item.status) {
      case QueueItemStatus::Sending: {
        auto& last = last_progress_[item.transfer_id];
        if(item.sent_bytes != 0 && item.sent_bytes < item.total_bytes && now - last < kProgressInterval) return;
        last = now;
        auto percent = item.total_bytes ? item.sent_bytes * 100 / item.total_bytes : 100;
        std::cout << "[send] " << item.path.filename().string() << " -> " << peer.display_name
                  << " " << percent << "%\n";
        break;
      }
      case QueueItemStatus::Completed:
        last_progress_.erase(item.transfer_id);
        std::cout << "[send] " << item.path.filename().string() << " delivered to " << peer.display_name << "\n";
        break;
      case QueueItemStatus::Failed:
        last_progress_.erase(item.transfer_id);
        std::cout << "[send] " << item.path.filename().string() << " failed: " << item.message << "\n";
        break;
      case QueueItemStatus::Cancelled:
        last_progress_.erase(item.transfer_id);
        std::cout << "[send] " << item.path.filename().string() << " cancelled\n";
        break;
      case QueueItemStatus::Pending:
        return;
    }
    std::cout.flush();
  }

  void on_file_received(const ReceivedFile& file) {
    std::lock_guard lg(out_mutex_);
    std::cout << "[recv] " << file.path.filename().string() << " from " << file.sender
              << " (" << format_size(file.size) << ", " << std::fixed << std::setprecision(2)
              << file.speed_mbps << " MB/s)\n";
    std::cout.flush();
  }

  static std::string format_size(uint64_t bytes) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    if(bytes >= 1024ull * 1024 * 1024) out << bytes / (1024.0 * 1024 * 1024) << " GiB";
    else if(bytes >= 1024ull * 1024) out << bytes / (1024.0 * 1024) << " MiB";
    else if(bytes >= 1024) out << bytes / 1024.0 << " KiB";
    else out << bytes << " B";
    return out.str();
  }

  WoxxyEngine& engine_;
  std::atomic<bool> running_;
  std::thread cli_thread_;
  std::mutex out_mutex_;
  std::map<std::string, std::chrono::steady_clock::time_point> last_progress_;
  TransferCoordinator::ListenerHandle file_listener_ = 0;
};
