/**
 * @file log.hpp
 * @brief Lightweight printf-style logger writing to stderr.
 *
 * Two gates filter a log call:
 *   - compile time: AUTHPOOL_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL)
 *   - run time:     SetLevel()
 *
 * Each line is formatted into a stack buffer and emitted with a single
 * fwrite so that lines from concurrent threads never interleave.
 *
 * Usage:
 * @code
 *   AUTHPOOL_LOG_INFO("Pool", "started %u workers", n);
 * @endcode
 */

#ifndef AUTHPOOL_LOG_HPP_
#define AUTHPOOL_LOG_HPP_

#include "authpool/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>

#if defined(AUTHPOOL_PLATFORM_LINUX) || defined(AUTHPOOL_PLATFORM_MACOS)
#include <time.h>
#endif

#ifndef AUTHPOOL_LOG_MIN_LEVEL
#ifdef NDEBUG
#define AUTHPOOL_LOG_MIN_LEVEL 1
#else
#define AUTHPOOL_LOG_MIN_LEVEL 0
#endif
#endif

namespace authpool {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "?";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/// @brief Format the wall clock as "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
#if defined(AUTHPOOL_PLATFORM_LINUX) || defined(AUTHPOOL_PLATFORM_MACOS)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  localtime_r(&ts.tv_sec, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec, ts.tv_nsec / 1000000L);
#else
  std::time_t t = std::time(nullptr);
  std::tm* tm_local = std::localtime(&t);
  if (tm_local == nullptr) {
    (void)std::snprintf(buf, bufsz, "0000-00-00 00:00:00.000");
    return;
  }
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.000",
                      tm_local->tm_year + 1900, tm_local->tm_mon + 1,
                      tm_local->tm_mday, tm_local->tm_hour, tm_local->tm_min,
                      tm_local->tm_sec);
#endif
}

}  // namespace detail

// ============================================================================
// Public API
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/** @brief Mark the logger initialized. Idempotent. */
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/** @brief Flush stderr and mark the logger uninitialized. */
inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }

  char ts[32];
  detail::FormatTimestamp(ts, sizeof(ts));

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char out[768];
  int n = 0;
#ifdef NDEBUG
  (void)file;
  (void)line;
  n = std::snprintf(out, sizeof(out), "[%s] [%s] [%s] %s\n", ts,
                    detail::LevelTag(level), category, msg);
#else
  n = std::snprintf(out, sizeof(out), "[%s] [%s] [%s] %s (%s:%d)\n", ts,
                    detail::LevelTag(level), category, msg,
                    detail::Basename(file), line);
#endif
  if (n <= 0) return;
  size_t len = (static_cast<size_t>(n) < sizeof(out))
                   ? static_cast<size_t>(n)
                   : sizeof(out) - 1U;
  (void)std::fwrite(out, 1, len, stderr);
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace authpool

// ============================================================================
// Macros
// ============================================================================

#define AUTHPOOL_LOG_DEBUG(cat, fmt, ...)                                   \
  do {                                                                      \
    if (AUTHPOOL_LOG_MIN_LEVEL <= 0) {                                      \
      ::authpool::log::LogWrite(::authpool::log::Level::kDebug, cat,        \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                       \
  } while (0)

#define AUTHPOOL_LOG_INFO(cat, fmt, ...)                                    \
  do {                                                                      \
    if (AUTHPOOL_LOG_MIN_LEVEL <= 1) {                                      \
      ::authpool::log::LogWrite(::authpool::log::Level::kInfo, cat,         \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                       \
  } while (0)

#define AUTHPOOL_LOG_WARN(cat, fmt, ...)                                    \
  do {                                                                      \
    if (AUTHPOOL_LOG_MIN_LEVEL <= 2) {                                      \
      ::authpool::log::LogWrite(::authpool::log::Level::kWarn, cat,         \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                       \
  } while (0)

#define AUTHPOOL_LOG_ERROR(cat, fmt, ...)                                   \
  do {                                                                      \
    if (AUTHPOOL_LOG_MIN_LEVEL <= 3) {                                      \
      ::authpool::log::LogWrite(::authpool::log::Level::kError, cat,        \
                                __FILE__, __LINE__, fmt, ##__VA_ARGS__);    \
    }                                                                       \
  } while (0)

#define AUTHPOOL_LOG_FATAL(cat, fmt, ...)                                   \
  do {                                                                      \
    ::authpool::log::LogWrite(::authpool::log::Level::kFatal, cat,          \
                              __FILE__, __LINE__, fmt, ##__VA_ARGS__);      \
    std::abort();                                                           \
  } while (0)

#endif  // AUTHPOOL_LOG_HPP_
