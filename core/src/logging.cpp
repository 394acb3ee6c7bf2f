#include "embedcache/logging.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>

namespace embedcache::log {

std::optional<Level> parse_level(std::string_view text) noexcept {
  auto equals = [text](std::string_view name) {
    if (text.size() != name.size())
      return false;
    for (size_t i = 0; i < text.size(); ++i) {
      char c = text[i];
      if (c >= 'a' && c <= 'z')
        c = static_cast<char>(c - 'a' + 'A');
      if (c != name[i])
        return false;
    }
    return true;
  };

  if (equals("DEBUG"))
    return Level::Debug;
  if (equals("INFO"))
    return Level::Info;
  if (equals("WARN") || equals("WARNING"))
    return Level::Warn;
  if (equals("ERROR"))
    return Level::Error;
  if (equals("OFF") || equals("NONE"))
    return Level::Off;
  return std::nullopt;
}

Logger::Logger() : level_(Level::Warn) {
  if (const char *env = std::getenv("EMBEDCACHE_LOG_LEVEL")) {
    if (auto parsed = parse_level(env))
      level_.store(*parsed, std::memory_order_relaxed);
  }
}

Logger &Logger::instance() {
  static Logger logger;
  return logger;
}

void Logger::write(Level level, std::source_location loc,
                   const std::string &message) {
  const char *tag = "?";
  switch (level) {
  case Level::Debug:
    tag = "DEBUG";
    break;
  case Level::Info:
    tag = "INFO ";
    break;
  case Level::Warn:
    tag = "WARN ";
    break;
  case Level::Error:
    tag = "ERROR";
    break;
  case Level::Off:
    return;
  }

  auto now = std::chrono::system_clock::now();
  std::time_t secs = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count() %
            1000;
  std::tm tm_buf{};
#if defined(_WIN32)
  localtime_s(&tm_buf, &secs);
#else
  localtime_r(&secs, &tm_buf);
#endif
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

  std::string file = std::filesystem::path(loc.file_name()).filename().string();

  std::lock_guard lock(write_mutex_);
  std::fprintf(stderr, "[%s.%03d] %s [embedcache] [%s:%u] %s\n", stamp,
               static_cast<int>(ms), tag, file.c_str(),
               static_cast<unsigned>(loc.line()), message.c_str());
  std::fflush(stderr);
}

} // namespace embedcache::log
