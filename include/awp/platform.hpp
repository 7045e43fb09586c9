/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, monotonic clock and assertion macros.
 */

#ifndef AWP_PLATFORM_HPP_
#define AWP_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace awp {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define AWP_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define AWP_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define AWP_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define AWP_LIKELY(x) __builtin_expect(!!(x), 1)
#define AWP_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define AWP_LIKELY(x) (x)
#define AWP_UNLIKELY(x) (x)
#endif

// ============================================================================
// Monotonic Clock
// ============================================================================

inline uint64_t SteadyNowNs() noexcept {
  const auto dur = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count());
}

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
  (void)std::fprintf(stderr, "AWP_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define AWP_ASSERT(cond) ((void)0)
#else
#define AWP_ASSERT(cond) \
  ((cond) ? ((void)0) : ::awp::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace awp

#endif  // AWP_PLATFORM_HPP_
