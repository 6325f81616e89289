/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, assertion macros and clocks.
 */

#ifndef ISOPOOL_PLATFORM_HPP_
#define ISOPOOL_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace isopool {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define ISOPOOL_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define ISOPOOL_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define ISOPOOL_PLATFORM_WINDOWS 1
#endif

#if !defined(ISOPOOL_PLATFORM_LINUX)
#error "isopool requires Linux (fork/exec, /proc, poll)"
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define ISOPOOL_LIKELY(x) __builtin_expect(!!(x), 1)
#define ISOPOOL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define ISOPOOL_UNUSED __attribute__((unused))
#else
#define ISOPOOL_LIKELY(x) (x)
#define ISOPOOL_UNLIKELY(x) (x)
#define ISOPOOL_UNUSED
#endif

#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define ISOPOOL_HAS_EXCEPTIONS 1
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an internal invariant fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "ISOPOOL_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define ISOPOOL_ASSERT(cond) ((void)0)
#else
#define ISOPOOL_ASSERT(cond) \
  ((cond) ? ((void)0) : ::isopool::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Monotonic Clock
// ============================================================================

inline uint64_t SteadyNowUs() noexcept {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
                                   std::chrono::steady_clock::now().time_since_epoch())
                                   .count());
}

inline uint64_t SteadyNowMs() noexcept { return SteadyNowUs() / 1000U; }

}  // namespace isopool

#endif  // ISOPOOL_PLATFORM_HPP_
