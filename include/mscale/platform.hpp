/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, assertion macros, and small
 *        portable string helpers.
 */

#ifndef MSCALE_PLATFORM_HPP_
#define MSCALE_PLATFORM_HPP_

#include <cstdio>
#include <cstdlib>

namespace mscale {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define MSCALE_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define MSCALE_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define MSCALE_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define MSCALE_PRINTF_FMT(a, b) __attribute__((format(printf, a, b)))
#else
#define MSCALE_PRINTF_FMT(a, b)
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
  (void)std::fprintf(stderr, "MSCALE_ASSERT failed: %s at %s:%d\n", cond,
                     file, line);
  std::abort();
}

/** ASCII case-insensitive equality; both arguments must be non-null. */
inline bool AsciiCaseEqual(const char* a, const char* b) noexcept {
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

#ifdef NDEBUG
#define MSCALE_ASSERT(cond) ((void)0)
#else
#define MSCALE_ASSERT(cond)                                                  \
  ((cond) ? ((void)0)                                                        \
          : ::mscale::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

}  // namespace mscale

#endif  // MSCALE_PLATFORM_HPP_
