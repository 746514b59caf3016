#pragma once

// Lean header, safe to include from every container header.
// For messages with runtime values, use <ring-core/assertf.hh>.
#include <ring-core/macros.hh>
#include <ring-core/source_location.hh>

// =========================================================================================================
// RC_ASSERT - Runtime assertion with string literal message
//
// Checks a precondition, postcondition or invariant. On failure the active assertion handler is called
// (see <ring-core/assert-handler.hh>), then the debugger is triggered if attached and the process aborts.
//
// Active when RC_ASSERT_ENABLED is 1 (Debug and RelWithDebInfo, or RC_ENABLE_ASSERT_IN_RELEASE).
//
// Error handling strategy in ring-core:
//   - Assertions      -> programmer errors (e.g. operator[] out of range, pop_front() on an empty array)
//   - result<T, E>    -> expected failures (try_pop_front(), try_get(), fold without initial value)
//   - Exceptions      -> never thrown by ring-core itself, only propagated from element types
//
// Never trigger assertions based on user input or external conditions.
// Use the try_ variants of the circular_array API for that.
//
// Usage:
//   RC_ASSERT(!empty(), "cannot pop from empty circular_array");
//   RC_ASSERT(min_capacity >= 0, "capacity must be non-negative");
//
#define RC_ASSERT(cond, msg) RC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// RC_ASSERT_ALWAYS - Assertion that stays active in every build configuration
//
// Usage:
//   RC_ASSERT_ALWAYS(new_capacity > 0, "capacity must never be zero");
//
#define RC_ASSERT_ALWAYS(cond, msg) RC_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// RC_DEBUG_BREAK - Break into the debugger if one is attached, otherwise no-op
//
#define RC_DEBUG_BREAK() RC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// RC_BREAK_AND_ABORT - Debug break (if attached) followed by program termination
//
#define RC_BREAK_AND_ABORT() (RC_DEBUG_BREAK(), ::rc::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace rc::impl
{
// Called when an assertion fails, dispatches to the topmost assertion handler
// Does not abort, caller must follow with RC_BREAK_AND_ABORT()
RC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, rc::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace rc::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef RC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define RC_IMPL_DEBUG_BREAK() (::rc::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(RC_COMPILER_POSIX)

// SIGTRAP is 5, see https://man7.org/linux/man-pages/man7/signal.7.html
// declared here to avoid pulling <csignal> into every container header
extern "C" int raise(int) noexcept;
#define RC_IMPL_DEBUG_BREAK() (::rc::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define RC_IMPL_DEBUG_BREAK() void(0)

#endif

#define RC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::rc::impl::handle_assert_failure(#cond, msg, ::rc::source_location::current()); \
            RC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if RC_ASSERT_ENABLED

#define RC_IMPL_ASSERT(cond, msg) RC_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but cond and msg must still compile
#define RC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        RC_UNUSED(cond);          \
        RC_UNUSED(msg);           \
    } while (false)

#endif
