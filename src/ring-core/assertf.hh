#pragma once

#include <ring-core/assert.hh>

#include <format>

// =========================================================================================================
// RC_ASSERTF - Runtime assertion with std::format message
//
// Same semantics as RC_ASSERT, but the message is a std::format string with arguments.
// Arguments are only evaluated when the assertion fails.
//
// Usage:
//   RC_ASSERTF(0 <= idx && idx < size(), "index {} out of range for size {}", idx, size());
//
#define RC_ASSERTF(cond, msg, ...) RC_IMPL_ASSERTF(cond, msg, ##__VA_ARGS__)

// =========================================================================================================
// RC_ASSERTF_ALWAYS - RC_ASSERTF that stays active in every build configuration
//
#define RC_ASSERTF_ALWAYS(cond, msg, ...) RC_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)


// =========================================================================================================
// Implementation details
// =========================================================================================================

#define RC_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                                            \
    do                                                                                                    \
    {                                                                                                     \
        if (!(cond)) [[unlikely]]                                                                         \
        {                                                                                                 \
            ::rc::impl::handle_assert_failure(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                              ::rc::source_location::current());                          \
            RC_BREAK_AND_ABORT();                                                                         \
        }                                                                                                 \
    } while (false)

#if RC_ASSERT_ENABLED

#define RC_IMPL_ASSERTF(cond, msg, ...) RC_IMPL_ASSERTF_ALWAYS(cond, msg, ##__VA_ARGS__)

#else

// stripped, but the format string must still compile
#define RC_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                          \
    {                                                           \
        RC_UNUSED(cond);                                        \
        RC_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)

#endif
