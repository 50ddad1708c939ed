/**
 * @file platform.hpp
 * @brief Platform detection, cache line size and assertion macro.
 */

#ifndef AUTHPOOL_PLATFORM_HPP_
#define AUTHPOOL_PLATFORM_HPP_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace authpool {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define AUTHPOOL_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define AUTHPOOL_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define AUTHPOOL_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Cache Line Size
// ============================================================================

static constexpr size_t kCacheLineSize = 64;

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
  (void)std::fprintf(stderr, "AUTHPOOL_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define AUTHPOOL_ASSERT(cond) ((void)0)
#else
#define AUTHPOOL_ASSERT(cond) \
  ((cond) ? ((void)0)         \
          : ::authpool::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace authpool

#endif  // AUTHPOOL_PLATFORM_HPP_
