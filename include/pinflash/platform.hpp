/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, and assertion macros.
 */

#ifndef PINFLASH_PLATFORM_HPP_
#define PINFLASH_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace pinflash {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define PINFLASH_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define PINFLASH_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define PINFLASH_PLATFORM_WINDOWS 1
#endif

#if defined(PINFLASH_PLATFORM_LINUX) || defined(PINFLASH_PLATFORM_MACOS)
#define PINFLASH_PLATFORM_POSIX 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define PINFLASH_LIKELY(x) __builtin_expect(!!(x), 1)
#define PINFLASH_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define PINFLASH_PRINTF_FORMAT(fmt_idx, arg_idx) \
  __attribute__((format(printf, fmt_idx, arg_idx)))
#else
#define PINFLASH_LIKELY(x) (x)
#define PINFLASH_UNLIKELY(x) (x)
#define PINFLASH_PRINTF_FORMAT(fmt_idx, arg_idx)
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
  (void)std::fprintf(stderr, "PINFLASH_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define PINFLASH_ASSERT(cond) ((void)0)
#else
#define PINFLASH_ASSERT(cond) \
  ((cond) ? ((void)0)         \
          : ::pinflash::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Macro Helpers
// ============================================================================

#define PINFLASH_CONCAT_IMPL(a, b) a##b
#define PINFLASH_CONCAT(a, b) PINFLASH_CONCAT_IMPL(a, b)

}  // namespace pinflash

#endif  // PINFLASH_PLATFORM_HPP_
