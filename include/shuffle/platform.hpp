/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, clocks and assertion macros.
 */

#ifndef SHUFFLE_PLATFORM_HPP_
#define SHUFFLE_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <chrono>

namespace shuffle {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define SHUFFLE_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define SHUFFLE_PLATFORM_MACOS 1
#endif

#if !defined(SHUFFLE_PLATFORM_LINUX) && !defined(SHUFFLE_PLATFORM_MACOS)
#error "shuffle requires a POSIX platform (pread/fstat based file channels)"
#endif

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define SHUFFLE_LIKELY(x) __builtin_expect(!!(x), 1)
#define SHUFFLE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define SHUFFLE_UNUSED __attribute__((unused))
#else
#define SHUFFLE_LIKELY(x) (x)
#define SHUFFLE_UNLIKELY(x) (x)
#define SHUFFLE_UNUSED
#endif

// ============================================================================
// Monotonic Clock Helpers
// ============================================================================

/// @brief Nanoseconds on the steady clock.
inline uint64_t SteadyNowNs() noexcept {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::steady_clock::now().time_since_epoch())
          .count());
}

/// @brief Microseconds on the steady clock.
inline uint64_t SteadyNowUs() noexcept { return SteadyNowNs() / 1000U; }

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "SHUFFLE_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define SHUFFLE_ASSERT(cond) ((void)0)
#else
#define SHUFFLE_ASSERT(cond)                                                \
  ((cond) ? ((void)0)                                                       \
          : ::shuffle::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace shuffle

#endif  // SHUFFLE_PLATFORM_HPP_
