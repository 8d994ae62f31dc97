#pragma once
#include <functional>
#include <string>
#include <string_view>

namespace xrayopt {

  enum class LogLevel : int { Quiet = 0, Error = 1, Warning = 2, Info = 3, Debug = 4 };

  [[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

  /// Process-wide diagnostic logger. Messages above the current level are dropped;
  /// the rest go to the sink (stderr unless replaced).
  class Logger {
  public:
    using Sink = std::function<void(LogLevel, std::string_view)>;

    static void set_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    // Passing an empty sink restores the stderr sink
    static void set_sink(Sink sink);

    static void error(std::string_view message);
    static void warn(std::string_view message);
    static void info(std::string_view message);
    static void debug(std::string_view message);

    static void log(LogLevel level, std::string_view message);
  };

}  // namespace xrayopt
