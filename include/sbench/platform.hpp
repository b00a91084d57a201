/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, clock helpers and assertion macros.
 */

#ifndef SBENCH_PLATFORM_HPP_
#define SBENCH_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace sbench {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define SBENCH_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define SBENCH_PLATFORM_MACOS 1
#endif

#if defined(SBENCH_PLATFORM_LINUX) || defined(SBENCH_PLATFORM_MACOS)
#define SBENCH_HAS_NETWORK 1
#else
#define SBENCH_HAS_NETWORK 0
#endif

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define SBENCH_LIKELY(x) __builtin_expect(!!(x), 1)
#define SBENCH_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define SBENCH_UNUSED __attribute__((unused))
#else
#define SBENCH_LIKELY(x) (x)
#define SBENCH_UNLIKELY(x) (x)
#define SBENCH_UNUSED
#endif

// ============================================================================
// Monotonic Clock Helpers
// ============================================================================

inline uint64_t SteadyNowNs() noexcept {
  const auto dur = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(dur).count());
}

inline uint64_t SteadyNowUs() noexcept { return SteadyNowNs() / 1000ULL; }

inline uint64_t SteadyNowMs() noexcept { return SteadyNowNs() / 1000000ULL; }

// ============================================================================
// Assert Macros
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion or check fails.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
[[noreturn]] inline void AssertFail(const char* kind, const char* cond,
                                    const char* file, int line) {
  (void)std::fprintf(stderr, "%s failed: %s at %s:%d\n", kind, cond, file,
                     line);
  std::abort();
}

}  // namespace detail

/// Debug-only assertion, compiled out with NDEBUG.
#ifdef NDEBUG
#define SBENCH_ASSERT(cond) ((void)0)
#else
#define SBENCH_ASSERT(cond)                                                  \
  ((cond) ? ((void)0)                                                        \
          : ::sbench::detail::AssertFail("SBENCH_ASSERT", #cond, __FILE__,   \
                                         __LINE__))
#endif

/// Always-on invariant check. A failure is a programming error and aborts.
#define SBENCH_CHECK(cond)                                                   \
  ((cond) ? ((void)0)                                                        \
          : ::sbench::detail::AssertFail("SBENCH_CHECK", #cond, __FILE__,    \
                                         __LINE__))

// ============================================================================
// Macro Helpers
// ============================================================================

#define SBENCH_CONCAT_IMPL(a, b) a##b
#define SBENCH_CONCAT(a, b) SBENCH_CONCAT_IMPL(a, b)

}  // namespace sbench

#endif  // SBENCH_PLATFORM_HPP_
