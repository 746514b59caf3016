#pragma once

#include <ring-core/macros.hh>
#include <ring-core/source_location.hh>

#include <functional>
#include <string>

namespace rc::impl
{
// Customizable assertion handler stack
// The stack is process-wide and guarded by a recursive mutex; the topmost handler wins.
//
// Tests use a throwing handler to observe precondition violations without aborting:
//   auto handler = rc::impl::scoped_assertion_handler([](rc::impl::assertion_info const& info) {
//       throw info;
//   });
//   (void)arr.pop_front(); // empty -> handler throws instead of aborting

struct assertion_info
{
    std::string expression;
    std::string message;
    rc::source_location location;
};

// Push a custom handler, active until popped
// Handlers may throw to unwind to a recovery point
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost handler (no-op if none is installed)
void pop_assertion_handler();

// RAII wrapper for push/pop
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace rc::impl
