#include "assert.hh"

#include <ring-core/assert-handler.hh>
#include <ring-core/stacktrace.hh>

#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <print>
#include <vector>

#ifdef RC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef RC_COMPILER_POSIX
#include <cstring>
#endif

namespace
{
using handler_fn = std::move_only_function<void(rc::impl::assertion_info const&)>;

// recursive: a handler may itself trip an assertion
struct handler_registry
{
    std::recursive_mutex mutex;
    std::vector<handler_fn> stack;
};

handler_registry& registry()
{
    static handler_registry r;
    return r;
}

void print_assertion(rc::impl::assertion_info const& info)
{
    std::println(stderr, "[ring-core] assertion failed: {}", info.expression);
    std::println(stderr, "  message:  {}", info.message);
    std::println(stderr, "  location: {}:{}:{} ({})", info.location.file_name(), info.location.line(),
                 info.location.column(), info.location.function_name());
    std::println(stderr, "\nstacktrace:\n{}", std::to_string(rc::stacktrace::current()));
}
} // namespace

void rc::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    auto& r = registry();
    auto lock = std::lock_guard(r.mutex);
    r.stack.push_back(std::move(handler));
}

void rc::impl::pop_assertion_handler()
{
    auto& r = registry();
    auto lock = std::lock_guard(r.mutex);
    if (!r.stack.empty())
        r.stack.pop_back();
}

rc::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

rc::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

RC_COLD_FUNC void rc::impl::handle_assert_failure(char const* expression, char const* message, rc::source_location location)
{
    auto const info = assertion_info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& r = registry();
    auto lock = std::lock_guard(r.mutex);
    if (r.stack.empty())
        print_assertion(info);
    else
        r.stack.back()(info); // may throw, the lock is released on unwind

    // RC_BREAK_AND_ABORT follows at the call site
}

bool rc::impl::is_debugger_connected() noexcept
{
#ifdef RC_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(RC_OS_LINUX)
    auto* const status = std::fopen("/proc/self/status", "r");
    if (!status)
        return false;

    auto tracer = 0;
    char line[256];
    while (std::fgets(line, sizeof(line), status))
        if (std::strncmp(line, "TracerPid:", 10) == 0)
        {
            tracer = std::atoi(line + 10);
            break;
        }

    std::fclose(status);
    return tracer != 0;
#else
    return false;
#endif
}

[[noreturn]] void rc::impl::perform_abort() noexcept
{
    std::abort();
}
