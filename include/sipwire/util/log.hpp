#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <thread>

namespace sipwire::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error,
  Off
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info",
                                        "warn",  "error", "off"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m",  // error: red
      "",
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_from_name(std::string_view name) noexcept
    -> std::optional<Level> {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "info")
    return Level::Info;
  if (name == "warn")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  if (name == "off")
    return Level::Off;
  return std::nullopt;
}

/// Unknown names fall back to Info.
[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  return level_from_name(name).value_or(Level::Info);
}

// Diagnostics go to stderr so tool output on stdout stays clean.
class Logger {
  std::atomic<Level> level_{Level::Info};
  std::mutex write_mutex_;

public:
  Logger() = default;

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level != Level::Off &&
           level >= level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (!enabled(level))
      return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    auto line = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                            level_color(level), level_name(level), "\033[0m",
                            tid, std::format(fmt, std::forward<Args>(args)...));

    std::lock_guard lock(write_mutex_);
    std::print(stderr, "{}", line);
  }
};

// Global logger instance
inline Logger& logger() {
  static Logger instance;
  return instance;
}

// Public API
inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace sipwire::log
