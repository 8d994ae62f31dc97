#include <atomic>
#include <format>
#include <iostream>
#include <mutex>
#include <xrayopt_core/logging.hpp>

namespace xrayopt {

  namespace {

    std::atomic<LogLevel> g_level{LogLevel::Warning};

    std::mutex& sink_mutex() {
      static std::mutex mutex;
      return mutex;
    }

    Logger::Sink& sink_slot() {
      static Logger::Sink sink;
      return sink;
    }

    void write_stderr(LogLevel level, std::string_view message) {
      std::cerr << std::format("[xrayopt] [{}] {}\n", to_string(level), message);
    }

  }  // namespace

  std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
      case LogLevel::Quiet:
        return "QUIET";
      case LogLevel::Error:
        return "ERROR";
      case LogLevel::Warning:
        return "WARN";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Debug:
        return "DEBUG";
    }
    return "UNKNOWN";
  }

  void Logger::set_level(LogLevel level) noexcept { g_level.store(level); }

  LogLevel Logger::level() noexcept { return g_level.load(); }

  void Logger::set_sink(Sink sink) {
    std::lock_guard lock(sink_mutex());
    sink_slot() = std::move(sink);
  }

  void Logger::log(LogLevel level, std::string_view message) {
    if (level == LogLevel::Quiet || static_cast<int>(level) > static_cast<int>(g_level.load())) {
      return;
    }

    std::lock_guard lock(sink_mutex());
    if (sink_slot()) {
      sink_slot()(level, message);
    } else {
      write_stderr(level, message);
    }
  }

  void Logger::error(std::string_view message) { log(LogLevel::Error, message); }
  void Logger::warn(std::string_view message) { log(LogLevel::Warning, message); }
  void Logger::info(std::string_view message) { log(LogLevel::Info, message); }
  void Logger::debug(std::string_view message) { log(LogLevel::Debug, message); }

}  // namespace xrayopt
