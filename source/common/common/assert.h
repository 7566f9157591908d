#pragma once

#include <cstdlib>
#include <string>

#include "source/common/common/logger.h"

namespace Unseal {
namespace Assert {

// CONDITION_STR is needed to prevent macros in condition from being expected, which obfuscates
// the logged failure, e.g., "EAGAIN" vs "11".
#define _ASSERT_IMPL(CONDITION, CONDITION_STR, ACTION, DETAILS)                                    \
  do {                                                                                             \
    if (!(CONDITION)) {                                                                            \
      const std::string& details = (DETAILS);                                                      \
      UNSEAL_LOG_TO_LOGGER(Unseal::Logger::Registry::getLog(Unseal::Logger::Id::assert), critical, \
                           "assert failure: {}.{}{}", CONDITION_STR,                               \
                           details.empty() ? "" : " Details: ", details);                          \
      ACTION;                                                                                      \
    }                                                                                              \
  } while (false)

// This non-implementation ensures that its argument is a valid expression that can be statically
// casted to a bool, but the expression is never evaluated and will be compiled away.
#define _NULL_ASSERT_IMPL(X, ...)                                                                  \
  do {                                                                                             \
    constexpr bool __assert_dummy_variable = false && static_cast<bool>(X);                        \
    (void)__assert_dummy_variable;                                                                 \
  } while (false)

/**
 * assert macro that uses our builtin logging so the failure reaches the same sink as every other
 * log line.
 *
 * RELEASE_ASSERT(foo == bar, "reason foo should actually be bar");
 */
#define RELEASE_ASSERT(X, DETAILS) _ASSERT_IMPL(X, #X, ::abort(), DETAILS)

#if !defined(NDEBUG)
#define _ASSERT_ORIGINAL(X) _ASSERT_IMPL(X, #X, ::abort(), "")
#define _ASSERT_VERBOSE(X, Y) _ASSERT_IMPL(X, #X, ::abort(), Y)
#define _ASSERT_SELECTOR(_1, _2, ASSERT_MACRO, ...) ASSERT_MACRO

// This is needed to work around MSVC's behavior of expanding __VA_ARGS__
#define EXPAND(X) X

// If ASSERT is called with one argument, the ASSERT_SELECTOR will return
// _ASSERT_ORIGINAL and this will call _ASSERT_ORIGINAL(__VA_ARGS__).
// If ASSERT is called with two arguments, ASSERT_SELECTOR will return
// _ASSERT_VERBOSE, and this will call _ASSERT_VERBOSE,(__VA_ARGS__)
#define ASSERT(...)                                                                                \
  EXPAND(_ASSERT_SELECTOR(__VA_ARGS__, _ASSERT_VERBOSE, _ASSERT_ORIGINAL)(__VA_ARGS__))
#else
#define ASSERT _NULL_ASSERT_IMPL
#endif // !defined(NDEBUG)

/**
 * Indicate a panic situation and exit.
 */
#define PANIC(X)                                                                                   \
  do {                                                                                             \
    UNSEAL_LOG_TO_LOGGER(Unseal::Logger::Registry::getLog(Unseal::Logger::Id::assert), critical,   \
                         "panic: {}", X);                                                          \
    ::abort();                                                                                     \
  } while (false)

#define PANIC_DUE_TO_CORRUPT_ENUM PANIC("corrupted enum");

} // namespace Assert
} // namespace Unseal
