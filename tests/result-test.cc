#include <ring-core/assert-handler.hh>
#include <ring-core/error.hh>
#include <ring-core/result.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>

// result stays trivial when T and E are trivial
static_assert(std::is_constructible_v<rc::result<int, int>>);
static_assert(std::is_constructible_v<rc::result<int, int>, int>);
static_assert(std::is_constructible_v<rc::result<int, int>, rc::as_error_t<int>>);
static_assert(std::is_trivially_copyable_v<rc::result<int, int>>);
static_assert(std::is_trivially_destructible_v<rc::result<int, int>>);

static_assert(!std::is_trivially_destructible_v<rc::result<int, rc::circular_array_error>>);
static_assert(!std::is_copy_constructible_v<rc::result<std::unique_ptr<int>, rc::circular_array_error>>);

namespace
{
using pop_result = rc::result<std::string, rc::circular_array_error>;

pop_result pop_name(bool available)
{
    if (!available)
        return rc::error(rc::circular_array_error::empty_container("pop_name"));
    return std::string("front");
}

// counts live instances on both sides of the union
struct Lifetime
{
    static inline int live_count = 0;

    Lifetime() { ++live_count; }
    Lifetime(Lifetime const&) { ++live_count; }
    Lifetime(Lifetime&&) noexcept { ++live_count; }
    Lifetime& operator=(Lifetime const&) = default;
    Lifetime& operator=(Lifetime&&) noexcept = default;
    ~Lifetime() { --live_count; }
};
} // namespace

TEST("result - value and error alternatives")
{
    auto const ok = pop_name(true);
    REQUIRE(ok.has_value());
    CHECK(!ok.has_error());
    CHECK(ok.value() == "front");

    auto const failed = pop_name(false);
    REQUIRE(failed.has_error());
    CHECK(failed.error().kind == rc::error_kind::empty_container);
    CHECK(failed.error().message == "pop_name called on an empty circular_array");
}

TEST("result - default holds a default error")
{
    rc::result<int, std::string> r;
    CHECK(r.has_error());
    CHECK(r.error().empty());
}

TEST("result - value_or and error_or")
{
    CHECK(pop_name(true).value_or("fallback") == "front");
    CHECK(pop_name(false).value_or("fallback") == "fallback");

    auto const ok = pop_name(true);
    CHECK(ok.value_or("fallback") == "front");
    CHECK(ok.error_or(rc::circular_array_error::index_out_of_range(0, 0)).kind == rc::error_kind::index_out_of_range);

    auto const failed = pop_name(false);
    CHECK(failed.error_or(rc::circular_array_error{}).kind == rc::error_kind::empty_container);
}

TEST("result - emplace switches alternatives")
{
    Lifetime::live_count = 0;
    {
        rc::result<Lifetime, Lifetime> r = Lifetime();
        CHECK(r.has_value());
        CHECK(Lifetime::live_count == 1);

        r.emplace_error();
        CHECK(r.has_error());
        CHECK(Lifetime::live_count == 1);

        r.emplace_value();
        CHECK(r.has_value());
        CHECK(Lifetime::live_count == 1);

        auto copy = r;
        CHECK(Lifetime::live_count == 2);

        auto moved = rc::move(copy);
        CHECK(moved.has_value());
    }
    CHECK(Lifetime::live_count == 0);
}

TEST("result - emplace may alias the current content")
{
    rc::result<std::string, std::string> r = std::string("value");
    r.emplace_error(r.value());
    REQUIRE(r.has_error());
    CHECK(r.error() == "value");
}

TEST("result - move-only values")
{
    rc::result<std::unique_ptr<int>, rc::circular_array_error> r = std::make_unique<int>(4);
    auto ptr = rc::move(r).value();
    CHECK(*ptr == 4);
}

TEST("result - accessing the wrong alternative asserts")
{
    if constexpr (RC_ASSERT_ENABLED)
    {
        auto handler = rc::impl::scoped_assertion_handler([](rc::impl::assertion_info const&) { throw 0; });

        auto const failed = pop_name(false);
        auto threw = false;
        try
        {
            (void)failed.value();
        }
        catch (int)
        {
            threw = true;
        }
        CHECK(threw);

        auto const ok = pop_name(true);
        threw = false;
        try
        {
            (void)ok.error();
        }
        catch (int)
        {
            threw = true;
        }
        CHECK(threw);
    }
}
