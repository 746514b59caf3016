#include <ring-core/assert-handler.hh>
#include <ring-core/assertf.hh>
#include <ring-core/circular_array.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>

namespace
{
// runs f with a handler that records the failure and throws to prevent the abort
template <class F>
std::optional<rc::impl::assertion_info> capture_assertion(F&& f)
{
    std::optional<rc::impl::assertion_info> captured;
    auto handler = rc::impl::scoped_assertion_handler(
        [&](rc::impl::assertion_info const& info)
        {
            captured = info;
            throw 0;
        });

    try
    {
        f();
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }
    return captured;
}
} // namespace

TEST("assertions - failing assertion reports expression, message and location")
{
    int const expected_line = __LINE__ + 1;
    auto const info = capture_assertion([] { RC_ASSERTF_ALWAYS(1 + 1 == 3, "sum is {}", 1 + 1); });

    REQUIRE(info.has_value());
    CHECK(info->expression.find("1 + 1 == 3") != std::string::npos);
    CHECK(info->message == "sum is 2");
    CHECK(std::string(info->location.file_name()).ends_with("assert-test.cc"));
    CHECK(info->location.line() == expected_line);
}

TEST("assertions - passing assertion neither calls handler nor formats")
{
    auto handler_called = false;
    auto format_calls = 0;
    auto const expensive = [&]
    {
        ++format_calls;
        return 7;
    };

    {
        auto handler = rc::impl::scoped_assertion_handler([&](rc::impl::assertion_info const&) { handler_called = true; });
        RC_ASSERTF_ALWAYS(true, "never shown {}", expensive());
        RC_ASSERT_ALWAYS(2 > 1, "never shown");
    }

    CHECK(!handler_called);
    CHECK(format_calls == 0);
}

TEST("assertions - handlers nest and unwind in LIFO order")
{
    std::vector<char> events;

    auto outer = rc::impl::scoped_assertion_handler(
        [&](rc::impl::assertion_info const&)
        {
            events.push_back('o');
            throw 0;
        });

    struct inner_failure
    {
    };

    try
    {
        auto inner = rc::impl::scoped_assertion_handler(
            [&](rc::impl::assertion_info const&)
            {
                events.push_back('i');
                throw inner_failure{};
            });

        RC_ASSERT_ALWAYS(false, "handled by inner");
        CHECK(false); // unreachable
    }
    catch (inner_failure const&) // NOLINT(bugprone-empty-catch)
    {
    }

    try
    {
        RC_ASSERT_ALWAYS(false, "handled by outer");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    auto const expected = std::vector<char>{'i', 'o'};
    CHECK(events == expected);
}

TEST("assertions - container preconditions")
{
    if constexpr (RC_ASSERT_ENABLED)
    {
        SECTION("pop from empty")
        {
            rc::circular_array<int> arr;
            auto const info = capture_assertion([&] { (void)arr.pop_front(); });
            REQUIRE(info.has_value());
            CHECK(info->message == "pop_front() called on empty circular_array");
        }

        SECTION("index out of range")
        {
            auto arr = rc::circular_array_of(1, 2, 3);
            auto const info = capture_assertion([&] { (void)arr[-7]; });
            REQUIRE(info.has_value());
            CHECK(info->message == "index -7 out of range for circular_array of size 3");
        }

        SECTION("negative capacity")
        {
            auto const info = capture_assertion([] { (void)rc::circular_array<int>::create_with_capacity(-1); });
            REQUIRE(info.has_value());
            CHECK(info->message == "capacity must be non-negative, got -1");
        }

        SECTION("zero slice step")
        {
            auto const info = capture_assertion([] { (void)rc::slice{.step = 0}.resolve(3); });
            REQUIRE(info.has_value());
            CHECK(info->message == "slice step cannot be zero");
        }
    }
}
