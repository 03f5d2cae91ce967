/**
 * @file log.hpp
 * @brief Lightweight printf-style logging with runtime and compile-time
 *        level filtering.
 *
 * Output format (stderr):
 *   [2026-01-01 12:00:00.123] [INFO] [BoundedStore] sealed 12 units (store.hpp:88)
 *
 * The file:line suffix is omitted in release builds (NDEBUG).
 *
 * Compile-time configuration:
 *   SHUFFLE_LOG_MIN_LEVEL -- lowest level compiled in (0=DEBUG .. 4=FATAL).
 *                            Defaults to 0 in debug builds, 1 with NDEBUG.
 *
 * Header-only, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef SHUFFLE_LOG_HPP_
#define SHUFFLE_LOG_HPP_

#include "shuffle/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include <time.h>

#ifndef SHUFFLE_LOG_MIN_LEVEL
#ifdef NDEBUG
#define SHUFFLE_LOG_MIN_LEVEL 1
#else
#define SHUFFLE_LOG_MIN_LEVEL 0
#endif
#endif

namespace shuffle {
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
  kOff = 5
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
    default:            return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void FormatTimestamp(char* buf, size_t bufsz) noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_local;
  time_t t = ts.tv_sec;
  localtime_r(&t, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03ld",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec, ts.tv_nsec / 1000000L);
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/// @brief Parse "debug" / "info" / "warn" / "error" / "fatal" / "off".
/// @return true and sets @p out on a recognised name.
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  struct Entry {
    const char* name;
    Level level;
  };
  static constexpr Entry kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"error", Level::kError},
      {"fatal", Level::kFatal}, {"off", Level::kOff},
  };
  for (const auto& e : kNames) {
    const char* a = name;
    const char* b = e.name;
    while (*a != '\0' && *b != '\0') {
      char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
      if (la != *b) break;
      ++a;
      ++b;
    }
    if (*a == '\0' && *b == '\0') {
      out = e.level;
      return true;
    }
  }
  return false;
}

/// @brief Mark the logger initialized. Idempotent.
inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

/// @brief Flush stderr and mark the logger uninitialized.
inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

// ============================================================================
// Write
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      static_cast<uint8_t>(detail::LogLevelRef().load(
          std::memory_order_relaxed))) {
    return;
  }

  char msg[512];
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);

  char ts_buf[32];
  detail::FormatTimestamp(ts_buf, sizeof(ts_buf));

#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf,
                     detail::LevelTag(level), category, msg);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                     detail::LevelTag(level), category, msg,
                     detail::Basename(file), line);
#endif

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
}  // namespace shuffle

// ============================================================================
// Macros
// ============================================================================

#define SHUFFLE_LOG_DEBUG(cat, fmt, ...)                                    \
  do {                                                                      \
    if (SHUFFLE_LOG_MIN_LEVEL <= 0) {                                       \
      ::shuffle::log::LogWrite(::shuffle::log::Level::kDebug, cat,          \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                       \
  } while (0)

#define SHUFFLE_LOG_INFO(cat, fmt, ...)                                     \
  do {                                                                      \
    if (SHUFFLE_LOG_MIN_LEVEL <= 1) {                                       \
      ::shuffle::log::LogWrite(::shuffle::log::Level::kInfo, cat,           \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                       \
  } while (0)

#define SHUFFLE_LOG_WARN(cat, fmt, ...)                                     \
  do {                                                                      \
    if (SHUFFLE_LOG_MIN_LEVEL <= 2) {                                       \
      ::shuffle::log::LogWrite(::shuffle::log::Level::kWarn, cat,           \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);     \
    }                                                                       \
  } while (0)

#define SHUFFLE_LOG_ERROR(cat, fmt, ...)                                    \
  do {                                                                      \
    ::shuffle::log::LogWrite(::shuffle::log::Level::kError, cat, __FILE__,  \
                             __LINE__, fmt, ##__VA_ARGS__);                 \
  } while (0)

#define SHUFFLE_LOG_FATAL(cat, fmt, ...)                                    \
  do {                                                                      \
    ::shuffle::log::LogWrite(::shuffle::log::Level::kFatal, cat, __FILE__,  \
                             __LINE__, fmt, ##__VA_ARGS__);                 \
    std::abort();                                                           \
  } while (0)

#endif  // SHUFFLE_LOG_HPP_
