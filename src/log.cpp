#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {
constexpr const char* kDiagnosticPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kConsolePattern = "%v";

// Indexed by LogStream, then by whether the record belongs on stderr.
struct Sinks {
  std::shared_ptr<spdlog::logger> out[2];
  std::shared_ptr<spdlog::logger> err[2];
};

std::mutex g_sinks_mutex;
std::unique_ptr<Sinks> g_sinks;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_sink(const std::string& name,
                                          spdlog::sink_ptr sink,
                                          const char* pattern,
                                          spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  // Several engines in one test process reuse the same names.
  spdlog::drop(name);
  spdlog::register_logger(logger);
  return logger;
}

Sinks& sinks() {
  std::lock_guard lg(g_sinks_mutex);
  if(!g_sinks) {
    auto s = std::make_unique<Sinks>();
    for(int i = 0; i < 2; ++i) {
      bool console = (i == static_cast<int>(LogStream::Console));
      const char* pattern = console ? kConsolePattern : kDiagnosticPattern;
      std::string prefix = console ? "woxxy.console" : "woxxy.log";
      s->out[i] = make_sink(prefix + ".out", std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                            pattern, console ? spdlog::level::info : spdlog::level::warn);
      s->err[i] = make_sink(prefix + ".err", std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                            pattern, spdlog::level::err);
    }
    g_sinks = std::move(s);
  }
  return *g_sinks;
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose) {
  auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.out[static_cast<int>(LogStream::Diagnostic)]->set_level(level);
  s.err[static_cast<int>(LogStream::Diagnostic)]->set_level(spdlog::level::info);
  s.out[static_cast<int>(LogStream::Console)]->set_level(spdlog::level::info);
  s.err[static_cast<int>(LogStream::Console)]->set_level(spdlog::level::info);

  spdlog::set_default_logger(s.out[static_cast<int>(LogStream::Diagnostic)]);
  spdlog::set_level(level);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard lg(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lg(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::has_listeners() const {
  std::lock_guard lg(listener_mutex_);
  return !listeners_.empty();
}

void Logger::write(spdlog::level::level_enum level, std::string message) {
  LogRecord record{name_, level, std::move(message)};

  // Listeners run without the lock so they may detach themselves.
  std::vector<Listener> listeners;
  {
    std::lock_guard lg(listener_mutex_);
    listeners.reserve(listeners_.size());
    for(const auto& entry : listeners_) listeners.push_back(entry.second);
  }
  bool consumed = false;
  for(auto& listener : listeners) {
    try {
      if(listener(record)) consumed = true;
    } catch(const std::exception& e) {
      detail::emit(LogStream::Diagnostic,
                   LogRecord{"log-listener", spdlog::level::err, fmt::format("listener threw: {}", e.what())});
    }
  }
  if(!consumed) detail::emit(LogStream::Diagnostic, record);
}

namespace detail {

void emit(LogStream stream, const LogRecord& record) {
  auto& s = sinks();
  if(!log_passthrough()) return;

  int index = static_cast<int>(stream);
  auto& sink = record.level >= spdlog::level::err ? s.err[index] : s.out[index];
  if(record.source.empty()) {
    sink->log(record.level, record.message);
  } else {
    sink->log(record.level, fmt::format("[{}] {}", record.source, record.message));
  }
}

} // namespace detail
