#pragma once

/**
 * @file log.hpp
 * @brief Lightweight, header-only logging utility used by hotkey-io.
 *
 * Usage:
 *   @code{.cpp}
 *   #include <hotkey-io/log.hpp>
 *   HOTKEY_IO_LOG_DEBUG("layout: %zu glyphs", count);
 *   HOTKEY_IO_LOG_INFO("ready");
 *   @endcode
 *
 * Runtime configuration is controlled by environment variables:
 *  - HOTKEY_IO_LOG_LEVEL: one of "debug", "info", "warn", "error" (or the
 *    numeric forms 0-3). Unset or unrecognized -> info.
 *  - HOTKEY_IO_FORCE_COLORS: non-empty -> force ANSI colors on.
 *  - HOTKEY_IO_NO_COLOR: non-empty -> disable ANSI colors.
 */

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>
#include <optional>
#include <string>
#if defined(_WIN32) || defined(_WIN64)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace hotkey {
namespace io {
namespace log {

/**
 * @enum Level
 * @brief Logging severity levels used by the internal logging facility.
 *
 * Lower enum values are more verbose (Debug is the most verbose).
 */
enum class Level : int {
  Debug = 0,
  Info = 1,
  Warn = 2,
  Error = 3,
};

inline const char *levelToString(Level l) {
  switch (l) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warn:
    return "WARN";
  case Level::Error:
    return "ERROR";
  }
  return "UNKNOWN";
}

/**
 * @brief Parse a textual level ("debug", "w", "3", ...).
 * @param text Level name, case-insensitive.
 * @return std::optional<Level> The level, or nullopt if @p text is not a
 * level name.
 */
inline std::optional<Level> levelFromString(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (text == "debug" || text == "d" || text == "0")
    return Level::Debug;
  if (text == "info" || text == "i" || text == "1")
    return Level::Info;
  if (text == "warn" || text == "warning" || text == "w" || text == "2")
    return Level::Warn;
  if (text == "error" || text == "e" || text == "3")
    return Level::Error;
  return std::nullopt;
}

/**
 * @brief Determine the default log level from HOTKEY_IO_LOG_LEVEL.
 * @return Level The configured level, Info when unset or unrecognized.
 */
inline Level parseLevelFromEnv() {
  const char *lvlEnv = std::getenv("HOTKEY_IO_LOG_LEVEL");
  if (lvlEnv && lvlEnv[0] != '\0') {
    return levelFromString(lvlEnv).value_or(Level::Info);
  }
  return Level::Info;
}

/**
 * @brief Accessor for the global log level used by the library.
 *
 * The log level is stored in an atomic so it can be changed safely at runtime.
 * @return std::atomic<Level>& Reference to the global atomic log level.
 */
inline std::atomic<Level> &globalLevel() {
  static std::atomic<Level> lvl(parseLevelFromEnv());
  return lvl;
}

inline void setLevel(Level l) { globalLevel().store(l); }
inline Level getLevel() { return globalLevel().load(); }

inline bool isEnabled(Level level) {
  return static_cast<int>(level) >= static_cast<int>(getLevel());
}

/**
 * @internal
 * @brief Internal mutex used to serialize access to stderr.
 */
inline std::mutex &outputMutex() {
  static std::mutex m;
  return m;
}

/**
 * @internal
 * @brief Return an ANSI color escape sequence for the given log level.
 */
inline const char *levelColor(Level l) {
  switch (l) {
  case Level::Debug:
    return "\x1b[33m"; // Yellow
  case Level::Info:
    return "\x1b[34m"; // Blue
  case Level::Warn:
    return "\x1b[38;5;208m"; // Orange (256-color)
  case Level::Error:
    return "\x1b[31m"; // Red
  }
  return "\x1b[0m";
}

/**
 * @internal
 * @brief Determine whether ANSI colors should be emitted.
 *
 * Colors can be forced via HOTKEY_IO_FORCE_COLORS or disabled with
 * HOTKEY_IO_NO_COLOR. Otherwise colors are enabled when stderr is a TTY.
 */
inline bool colorsEnabled() {
  const char *force = std::getenv("HOTKEY_IO_FORCE_COLORS");
  if (force && force[0] != '\0')
    return true;
  const char *no = std::getenv("HOTKEY_IO_NO_COLOR");
  if (no && no[0] != '\0')
    return false;
#if defined(_WIN32) || defined(_WIN64)
  return _isatty(_fileno(stderr));
#else
  return isatty(fileno(stderr));
#endif
}

/**
 * @internal
 * @brief Trim a file path so it starts at the last "hotkey-io" component,
 * or at the basename when the project directory is not part of the path.
 */
inline const char *trimPathToProject(const char *path) {
  if (!path)
    return path;
  const char *needle = "hotkey-io";
  const size_t needle_len = std::strlen(needle);
  const char *last = nullptr;
  const char *p = path;
  while (true) {
    const char *found = std::strstr(p, needle);
    if (!found)
      break;
    const char *after = found + needle_len;
    if (*after == '/' || *after == '\\' || *after == '\0')
      last = found;
    p = found + 1;
  }
  if (last)
    return last;
  const char *last_slash = std::strrchr(path, '/');
  const char *last_backslash = std::strrchr(path, '\\');
  const char *base = path;
  if (last_slash && last_backslash)
    base = (last_slash > last_backslash) ? last_slash + 1 : last_backslash + 1;
  else if (last_slash)
    base = last_slash + 1;
  else if (last_backslash)
    base = last_backslash + 1;
  return base;
}

/**
 * @internal
 * @brief Emit a formatted log message using a va_list (thread-safe).
 *
 * Output format: `[hotkey-io] YYYY-mm-dd HH:MM:SS.mmm [LEVEL] file:line: msg`
 *
 * @param level Log level for the message.
 * @param file Source file name (typically `__FILE__`).
 * @param line Source line number (typically `__LINE__`).
 * @param fmt printf-style format string.
 * @param ap Preinitialized va_list of arguments for `fmt`.
 */
inline void vlog(Level level, const char *file, int line, const char *fmt,
                 va_list ap) {
  if (!isEnabled(level))
    return;

  using namespace std::chrono;
  auto now = system_clock::now();
  auto ms =
      duration_cast<milliseconds>(now.time_since_epoch()) % milliseconds(1000);
  std::time_t t = system_clock::to_time_t(now);

  std::tm tmbuf;
#if defined(_MSC_VER) || defined(_WIN32)
  localtime_s(&tmbuf, &t);
#else
  localtime_r(&t, &tmbuf);
#endif

  char timebuf[64];
  if (std::strftime(timebuf, sizeof(timebuf), "%Y-%m-%d %H:%M:%S", &tmbuf) ==
      0) {
    std::snprintf(timebuf, sizeof(timebuf), "%lld", static_cast<long long>(t));
  }

  std::lock_guard<std::mutex> lk(outputMutex());

  const bool use_colors = colorsEnabled();
  const char *reset = use_colors ? "\x1b[0m" : "";
  const char *file_color = use_colors ? "\x1b[90m" : "";
  const char *lvl_color = use_colors ? levelColor(level) : "";

  std::fprintf(stderr, "[hotkey-io] %s.%03d [%s%s%s] %s%s:%d:%s ", timebuf,
               static_cast<int>(ms.count()), lvl_color, levelToString(level),
               reset, file_color, trimPathToProject(file), line, reset);
  std::vfprintf(stderr, fmt, ap);
  std::fprintf(stderr, "\n");
  std::fflush(stderr);
}

/**
 * @brief Log a message with printf-style varargs.
 *
 * Checks the log level before formatting.
 */
inline void log(Level level, const char *file, int line, const char *fmt, ...) {
  if (!isEnabled(level))
    return;
  va_list ap;
  va_start(ap, fmt);
  vlog(level, file, line, fmt, ap);
  va_end(ap);
}

inline bool debugEnabled() { return isEnabled(Level::Debug); }

} // namespace log
} // namespace io
} // namespace hotkey

/**
 * @defgroup LoggingMacros Helper logging macros
 * @brief Convenience macros that include file and line automatically.
 *
 * These macros wrap `::hotkey::io::log::log` and automatically supply
 * `__FILE__` and `__LINE__`.
 * @{
 */
#define HOTKEY_IO_LOG_DEBUG(fmt, ...)                                          \
  ::hotkey::io::log::log(::hotkey::io::log::Level::Debug, __FILE__, __LINE__,  \
                         fmt, ##__VA_ARGS__)
#define HOTKEY_IO_LOG_INFO(fmt, ...)                                           \
  ::hotkey::io::log::log(::hotkey::io::log::Level::Info, __FILE__, __LINE__,   \
                         fmt, ##__VA_ARGS__)
#define HOTKEY_IO_LOG_WARN(fmt, ...)                                           \
  ::hotkey::io::log::log(::hotkey::io::log::Level::Warn, __FILE__, __LINE__,   \
                         fmt, ##__VA_ARGS__)
#define HOTKEY_IO_LOG_ERROR(fmt, ...)                                          \
  ::hotkey::io::log::log(::hotkey::io::log::Level::Error, __FILE__, __LINE__,  \
                         fmt, ##__VA_ARGS__)
/** @} */ /* end of LoggingMacros */
