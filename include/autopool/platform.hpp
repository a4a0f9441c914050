/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros.
 */

#ifndef AUTOPOOL_PLATFORM_HPP_
#define AUTOPOOL_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace autopool {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define AUTOPOOL_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define AUTOPOOL_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define AUTOPOOL_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define AUTOPOOL_LIKELY(x) __builtin_expect(!!(x), 1)
#define AUTOPOOL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define AUTOPOOL_PRINTF_FORMAT(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define AUTOPOOL_LIKELY(x) (x)
#define AUTOPOOL_UNLIKELY(x) (x)
#define AUTOPOOL_PRINTF_FORMAT(fmt_idx, arg_idx)
#endif

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
  (void)std::fprintf(stderr, "AUTOPOOL_ASSERT failed: %s at %s:%d\n", cond, file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define AUTOPOOL_ASSERT(cond) ((void)0)
#else
#define AUTOPOOL_ASSERT(cond) \
  ((cond) ? ((void)0) : ::autopool::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace autopool

#endif  // AUTOPOOL_PLATFORM_HPP_
