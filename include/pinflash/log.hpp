/**
 * @file log.hpp
 * @brief Leveled, tagged printf-style logging to stderr.
 *
 * Usage:
 * @code
 *   PINFLASH_LOG_INFO("CATALOG", "loaded %u keys from %s", n, dir);
 * @endcode
 *
 * Output format:
 *   [2026-10-19 14:03:27.412] [INFO] [CATALOG] loaded 7 keys from /home/...
 *
 * Two filters apply: PINFLASH_LOG_MIN_LEVEL removes calls below it at compile
 * time, log::SetLevel() filters the rest at runtime.
 */

#ifndef PINFLASH_LOG_HPP_
#define PINFLASH_LOG_HPP_

#include "pinflash/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

#include <sys/time.h>

namespace pinflash {
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

#ifndef PINFLASH_LOG_MIN_LEVEL
#define PINFLASH_LOG_MIN_LEVEL 0
#endif

namespace detail {

#ifdef NDEBUG
static constexpr Level kDefaultLevel = Level::kInfo;
#else
static constexpr Level kDefaultLevel = Level::kDebug;
#endif

inline std::atomic<uint8_t>& LevelStorage() noexcept {
  static std::atomic<uint8_t> level{static_cast<uint8_t>(kDefaultLevel)};
  return level;
}

inline std::atomic<bool>& InitFlag() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelName(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    case Level::kOff:
      return "OFF";
  }
  return "?";
}

inline bool NameEquals(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Runtime control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LevelStorage().store(static_cast<uint8_t>(level),
                               std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(
      detail::LevelStorage().load(std::memory_order_relaxed));
}

/// @brief Mark the logger ready. Line-buffers stderr so records are atomic.
inline void Init() noexcept {
  (void)std::setvbuf(stderr, nullptr, _IOLBF, 0);
  detail::InitFlag().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitFlag().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitFlag().load(std::memory_order_acquire);
}

/**
 * @brief Parse a level name ("debug", "info", "warn"/"warning", "error",
 *        "fatal", "off"), case-insensitive.
 * @return true and sets @p out on success; false leaves @p out untouched.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  static const struct {
    const char* name;
    Level level;
  } kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"warning", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal},
      {"off", Level::kOff},
  };
  for (const auto& entry : kNames) {
    if (detail::NameEquals(name, entry.name)) {
      out = entry.level;
      return true;
    }
  }
  return false;
}

// ============================================================================
// Writer
// ============================================================================

inline void LogWrite(Level level, const char* tag, const char* fmt, ...)
    PINFLASH_PRINTF_FORMAT(3, 4);

inline void LogWrite(Level level, const char* tag, const char* fmt, ...) {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) return;

  struct timeval tv;
  ::gettimeofday(&tv, nullptr);
  struct tm tm_buf;
  time_t secs = tv.tv_sec;
  ::localtime_r(&secs, &tm_buf);

  char msg[512];
  va_list args;
  va_start(args, fmt);
  (void)std::vsnprintf(msg, sizeof(msg), fmt, args);
  va_end(args);

  (void)std::fprintf(stderr,
                     "[%04d-%02d-%02d %02d:%02d:%02d.%03ld] [%s] [%s] %s\n",
                     tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                     tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                     static_cast<long>(tv.tv_usec / 1000),
                     detail::LevelName(level), tag, msg);

  if (level == Level::kFatal) {
    (void)std::fflush(stderr);
    std::abort();
  }
}

}  // namespace log
}  // namespace pinflash

// ============================================================================
// Macros
// ============================================================================

#if PINFLASH_LOG_MIN_LEVEL <= 0
#define PINFLASH_LOG_DEBUG(tag, ...) \
  ::pinflash::log::LogWrite(::pinflash::log::Level::kDebug, tag, __VA_ARGS__)
#else
#define PINFLASH_LOG_DEBUG(tag, ...) ((void)0)
#endif

#if PINFLASH_LOG_MIN_LEVEL <= 1
#define PINFLASH_LOG_INFO(tag, ...) \
  ::pinflash::log::LogWrite(::pinflash::log::Level::kInfo, tag, __VA_ARGS__)
#else
#define PINFLASH_LOG_INFO(tag, ...) ((void)0)
#endif

#if PINFLASH_LOG_MIN_LEVEL <= 2
#define PINFLASH_LOG_WARN(tag, ...) \
  ::pinflash::log::LogWrite(::pinflash::log::Level::kWarn, tag, __VA_ARGS__)
#else
#define PINFLASH_LOG_WARN(tag, ...) ((void)0)
#endif

#if PINFLASH_LOG_MIN_LEVEL <= 3
#define PINFLASH_LOG_ERROR(tag, ...) \
  ::pinflash::log::LogWrite(::pinflash::log::Level::kError, tag, __VA_ARGS__)
#else
#define PINFLASH_LOG_ERROR(tag, ...) ((void)0)
#endif

#define PINFLASH_LOG_FATAL(tag, ...) \
  ::pinflash::log::LogWrite(::pinflash::log::Level::kFatal, tag, __VA_ARGS__)

#endif  // PINFLASH_LOG_HPP_
