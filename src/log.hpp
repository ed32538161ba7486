#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

// Configures the shared sinks. Safe to call more than once; the last call
// decides the level.
void init(bool verbose = false);

// When disabled, records that no listener consumed are dropped instead of
// reaching stdout/stderr. The test runners turn this off.
void set_log_passthrough(bool enabled);
bool log_passthrough();

// Diagnostics carry a timestamp and level; console output is the bare text
// a user asked for (usage, CLI replies).
enum class LogStream { Diagnostic, Console };

struct LogRecord {
  std::string source;
  spdlog::level::level_enum level = spdlog::level::info;
  std::string message;
};

using LogListenerHandle = std::size_t;

// Named log source owned by one engine (or one test fixture) and shared by
// every component it wires up. Listeners see each record first; returning
// true from any of them keeps the record off the console.
class Logger {
public:
  using Listener = std::function<bool(const LogRecord&)>;

  explicit Logger(std::string name);

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(spdlog::level::warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if(!spdlog::should_log(spdlog::level::debug) && !has_listeners()) return;
    write(spdlog::level::debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  void write(spdlog::level::level_enum level, std::string message);
  bool has_listeners() const;

  const std::string name_;
  mutable std::mutex listener_mutex_;
  std::map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
void emit(LogStream stream, const LogRecord& record);

template<typename... Args>
void log_to(Logger* logger,
            spdlog::level::level_enum level,
            spdlog::format_string_t<Args...> fmt,
            Args&&... args) {
  if(logger) {
    switch(level) {
      case spdlog::level::debug: logger->debug(fmt, std::forward<Args>(args)...); return;
      case spdlog::level::warn:  logger->warn(fmt, std::forward<Args>(args)...);  return;
      case spdlog::level::err:   logger->error(fmt, std::forward<Args>(args)...); return;
      default:                   logger->info(fmt, std::forward<Args>(args)...);  return;
    }
  }
  if(level == spdlog::level::debug && !spdlog::should_log(level)) return;
  emit(LogStream::Diagnostic, LogRecord{"", level, fmt::format(fmt, std::forward<Args>(args)...)});
}
} // namespace detail

// Components hold their logger as an optional shared_ptr; these accept the
// raw pointer and fall back to the process-wide sinks when it is null.
template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, spdlog::level::warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, spdlog::level::err, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, spdlog::level::debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::emit(LogStream::Console,
               LogRecord{"", spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...)});
}

template<typename... Args>
inline void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::emit(LogStream::Console,
               LogRecord{"", spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...)});
}
