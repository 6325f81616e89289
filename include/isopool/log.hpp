/**
 * @file log.hpp
 * @brief Category-tagged synchronous logging to stderr.
 *
 * Each line is formatted into a stack buffer and emitted with one write(2)
 * call, so concurrent writers (threads or worker processes sharing stderr)
 * never interleave within a line and no lock is held on the write path.
 * That keeps logging usable in a child between fork() and exec().
 *
 * Line format:
 *   2026-01-02T03:04:05.678Z [INFO ] [1234] [supervisor] message (file.hpp:42)
 *
 * Compile-time floor: ISOPOOL_LOG_MIN_LEVEL (0=debug ... 5=off).
 * Runtime level: SetLevel(), or ISOPOOL_LOG_LEVEL=debug|info|warn|error|off
 * read by Init().
 */

#ifndef ISOPOOL_LOG_HPP_
#define ISOPOOL_LOG_HPP_

#include "isopool/platform.hpp"

#include <atomic>
#include <cerrno>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <time.h>
#include <unistd.h>

#ifndef ISOPOOL_LOG_MIN_LEVEL
#define ISOPOOL_LOG_MIN_LEVEL 0
#endif

#ifndef ISOPOOL_LOG_LINE_MAX
#define ISOPOOL_LOG_LINE_MAX 1024U
#endif

namespace isopool {
namespace log {

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<uint8_t>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kInfo)};
#else
  static std::atomic<uint8_t> level{static_cast<uint8_t>(Level::kDebug)};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO ";
    case Level::kWarn:
      return "WARN ";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    case Level::kOff:
      return "OFF  ";
  }
  return "?????";
}

inline const char* Basename(const char* path) noexcept {
  const char* base = path;
  for (const char* p = path; *p != '\0'; ++p) {
    if (*p == '/') base = p + 1;
  }
  return base;
}

inline bool StrEqualNoCase(const char* a, const char* b) noexcept {
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
// Level Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return static_cast<Level>(detail::LogLevelRef().load(std::memory_order_relaxed));
}

/**
 * @brief Parse a level name ("debug", "info", "warn"/"warning", "error",
 * "fatal", "off"), case-insensitive.
 * @return false if @p name is not a known level; @p out is untouched.
 */
inline bool ParseLevel(const char* name, Level* out) noexcept {
  if (name == nullptr || out == nullptr) return false;
  struct Named {
    const char* name;
    Level level;
  };
  static constexpr Named kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},   {"warn", Level::kWarn},
      {"warning", Level::kWarn}, {"error", Level::kError}, {"fatal", Level::kFatal},
      {"off", Level::kOff},
  };
  for (const auto& n : kNames) {
    if (detail::StrEqualNoCase(name, n.name)) {
      *out = n.level;
      return true;
    }
  }
  return false;
}

/** @brief Mark logging initialized and seed the level from ISOPOOL_LOG_LEVEL. */
inline void Init() noexcept {
  const char* env = std::getenv("ISOPOOL_LOG_LEVEL");
  Level level;
  if (env != nullptr && ParseLevel(env, &level)) {
    SetLevel(level);
  }
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept { detail::InitializedRef().store(false, std::memory_order_release); }

inline bool IsInitialized() noexcept { return detail::InitializedRef().load(std::memory_order_acquire); }

// ============================================================================
// Formatting and Output
// ============================================================================

/**
 * @brief Format one complete log line (newline-terminated) into @p buf.
 * @return Number of bytes written, excluding the terminator.
 */
inline uint32_t FormatLine(char* buf, uint32_t buf_size, Level level, const char* category,
                           const char* file, int line, const char* fmt, va_list args) noexcept {
  if (buf_size < 2U) return 0U;

  struct timespec ts;
  ::clock_gettime(CLOCK_REALTIME, &ts);
  struct tm tm_utc;
  ::gmtime_r(&ts.tv_sec, &tm_utc);

  int n = std::snprintf(buf, buf_size, "%04d-%02d-%02dT%02d:%02d:%02d.%03ldZ [%s] [%d] [%s] ",
                        tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday, tm_utc.tm_hour,
                        tm_utc.tm_min, tm_utc.tm_sec, static_cast<long>(ts.tv_nsec / 1000000L),
                        detail::LevelTag(level), static_cast<int>(::getpid()),
                        (category != nullptr) ? category : "-");
  uint32_t pos = (n < 0) ? 0U : static_cast<uint32_t>(n);
  if (pos >= buf_size - 1U) pos = buf_size - 2U;

  n = std::vsnprintf(buf + pos, buf_size - pos, fmt, args);
  if (n > 0) pos += static_cast<uint32_t>(n);
  if (pos >= buf_size - 1U) pos = buf_size - 2U;

  if (file != nullptr) {
    n = std::snprintf(buf + pos, buf_size - pos, " (%s:%d)", detail::Basename(file), line);
    if (n > 0) pos += static_cast<uint32_t>(n);
    if (pos >= buf_size - 1U) pos = buf_size - 2U;
  }

  buf[pos++] = '\n';
  buf[pos] = '\0';
  return pos;
}

inline void LogWriteVa(Level level, const char* category, const char* file, int line,
                       const char* fmt, va_list args) noexcept {
  if (level != Level::kFatal) {
    Level current = GetLevel();
    if (current == Level::kOff || static_cast<uint8_t>(level) < static_cast<uint8_t>(current)) return;
  }

  char buf[ISOPOOL_LOG_LINE_MAX];
  uint32_t len = FormatLine(buf, sizeof(buf), level, category, file, line, fmt, args);

  const char* p = buf;
  while (len > 0U) {
    ssize_t w = ::write(STDERR_FILENO, p, len);
    if (w < 0) {
      if (errno == EINTR) continue;
      break;
    }
    p += w;
    len -= static_cast<uint32_t>(w);
  }

  if (level == Level::kFatal) {
    std::abort();
  }
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 5, 6)))
#endif
inline void LogWrite(Level level, const char* category, const char* file, int line,
                     const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace isopool

// ============================================================================
// Macros
// ============================================================================

#if ISOPOOL_LOG_MIN_LEVEL <= 0
#define ISOPOOL_LOG_DEBUG(cat, fmt, ...) \
  ::isopool::log::LogWrite(::isopool::log::Level::kDebug, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#else
#define ISOPOOL_LOG_DEBUG(cat, fmt, ...) ((void)0)
#endif

#if ISOPOOL_LOG_MIN_LEVEL <= 1
#define ISOPOOL_LOG_INFO(cat, fmt, ...) \
  ::isopool::log::LogWrite(::isopool::log::Level::kInfo, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#else
#define ISOPOOL_LOG_INFO(cat, fmt, ...) ((void)0)
#endif

#if ISOPOOL_LOG_MIN_LEVEL <= 2
#define ISOPOOL_LOG_WARN(cat, fmt, ...) \
  ::isopool::log::LogWrite(::isopool::log::Level::kWarn, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#else
#define ISOPOOL_LOG_WARN(cat, fmt, ...) ((void)0)
#endif

#if ISOPOOL_LOG_MIN_LEVEL <= 3
#define ISOPOOL_LOG_ERROR(cat, fmt, ...) \
  ::isopool::log::LogWrite(::isopool::log::Level::kError, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#else
#define ISOPOOL_LOG_ERROR(cat, fmt, ...) ((void)0)
#endif

// FATAL is never compiled out: it aborts.
#define ISOPOOL_LOG_FATAL(cat, fmt, ...) \
  ::isopool::log::LogWrite(::isopool::log::Level::kFatal, cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#endif  // ISOPOOL_LOG_HPP_
