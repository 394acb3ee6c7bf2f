#pragma once

/**
 * @file logging.hpp
 * @brief Process-wide stderr logger for the embedcache engine.
 *
 * Messages use std::format syntax, checked at compile time:
 *
 *   EMBEDCACHE_LOG_INFO("opened {} dim={}", path.string(), dim);
 *
 * The minimum level comes from EMBEDCACHE_LOG_LEVEL
 * (DEBUG | INFO | WARN | ERROR | OFF, default WARN) and can be changed at
 * runtime. Nothing is formatted below the threshold.
 */

#include <atomic>
#include <format>
#include <mutex>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace embedcache::log {

enum class Level : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// Parses "DEBUG", "info", "Warn", ... Returns nullopt for anything else.
std::optional<Level> parse_level(std::string_view text) noexcept;

class Logger {
public:
  static Logger &instance();

  void set_level(Level level) noexcept {
    level_.store(level, std::memory_order_relaxed);
  }
  Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

  bool enabled(Level level) const noexcept {
    return level != Level::Off && level >= this->level();
  }

  template <typename... Args>
  void log(Level level, std::source_location loc,
           std::format_string<Args...> fmt, Args &&...args) {
    if (!enabled(level))
      return;
    write(level, loc, std::format(fmt, std::forward<Args>(args)...));
  }

private:
  Logger();
  void write(Level level, std::source_location loc, const std::string &message);

  std::atomic<Level> level_;
  std::mutex write_mutex_;
};

} // namespace embedcache::log

#define EMBEDCACHE_LOG_AT(lvl, fmt, ...)                                       \
  ::embedcache::log::Logger::instance().log(                                   \
      lvl, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define EMBEDCACHE_LOG_DEBUG(...)                                              \
  EMBEDCACHE_LOG_AT(::embedcache::log::Level::Debug, __VA_ARGS__)
#define EMBEDCACHE_LOG_INFO(...)                                               \
  EMBEDCACHE_LOG_AT(::embedcache::log::Level::Info, __VA_ARGS__)
#define EMBEDCACHE_LOG_WARN(...)                                               \
  EMBEDCACHE_LOG_AT(::embedcache::log::Level::Warn, __VA_ARGS__)
#define EMBEDCACHE_LOG_ERROR(...)                                              \
  EMBEDCACHE_LOG_AT(::embedcache::log::Level::Error, __VA_ARGS__)
