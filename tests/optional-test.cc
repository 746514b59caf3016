#include <ring-core/assert-handler.hh>
#include <ring-core/optional.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>

// slot type of circular_array<int> stays trivial
static_assert(std::is_constructible_v<rc::optional<int>>);
static_assert(std::is_constructible_v<rc::optional<int>, int>);
static_assert(std::is_constructible_v<rc::optional<int>, rc::nullopt_t>);
static_assert(std::is_trivially_copyable_v<rc::optional<int>>);
static_assert(std::is_trivially_destructible_v<rc::optional<int>>);

static_assert(!std::is_trivially_destructible_v<rc::optional<std::string>>);
static_assert(!std::is_copy_constructible_v<rc::optional<std::unique_ptr<int>>>);
static_assert(std::is_move_constructible_v<rc::optional<std::unique_ptr<int>>>);

namespace
{
// counts live instances to verify the manual lifetime handling
struct Lifetime
{
    int value = 0;
    static inline int live_count = 0;

    explicit Lifetime(int v) : value(v) { ++live_count; }
    Lifetime(Lifetime const& rhs) : value(rhs.value) { ++live_count; }
    Lifetime(Lifetime&& rhs) noexcept : value(rhs.value) { ++live_count; }
    Lifetime& operator=(Lifetime const&) = default;
    Lifetime& operator=(Lifetime&&) noexcept = default;
    ~Lifetime() { --live_count; }

    friend bool operator==(Lifetime const&, Lifetime const&) = default;
};
} // namespace

TEST("optional - empty and engaged states")
{
    rc::optional<int> empty;
    CHECK(!empty.has_value());

    rc::optional<int> none = rc::nullopt;
    CHECK(!none.has_value());

    rc::optional<int> engaged = 5;
    REQUIRE(engaged.has_value());
    CHECK(engaged.value() == 5);

    engaged.value() = 6;
    CHECK(engaged.value() == 6);
}

TEST("optional - null-like values are engaged")
{
    rc::optional<int*> ptr = nullptr;
    CHECK(ptr.has_value());
    CHECK(ptr.value() == nullptr);

    rc::optional<std::string> text = std::string();
    CHECK(text.has_value());
    CHECK(text.value().empty());

    rc::optional<int> zero = 0;
    CHECK(zero.has_value());
}

TEST("optional - emplace, reset and take")
{
    Lifetime::live_count = 0;
    {
        rc::optional<Lifetime> slot;

        slot.emplace(1);
        CHECK(Lifetime::live_count == 1);

        slot.emplace(2);
        CHECK(Lifetime::live_count == 1);
        CHECK(slot.value().value == 2);

        auto taken = slot.take();
        CHECK(!slot.has_value());
        CHECK(taken.value == 2);
        CHECK(Lifetime::live_count == 1);

        slot.emplace(3);
        slot.reset();
        CHECK(!slot.has_value());
        CHECK(Lifetime::live_count == 1);

        slot.reset();
        CHECK(Lifetime::live_count == 1);
    }
    CHECK(Lifetime::live_count == 0);
}

TEST("optional - take from empty asserts")
{
    if constexpr (RC_ASSERT_ENABLED)
    {
        auto handler = rc::impl::scoped_assertion_handler([](rc::impl::assertion_info const&) { throw 0; });

        rc::optional<std::string> slot;
        auto threw = false;
        try
        {
            (void)slot.take();
        }
        catch (int)
        {
            threw = true;
        }
        CHECK(threw);
    }
}

TEST("optional - copy and move of non-trivial values")
{
    Lifetime::live_count = 0;
    {
        rc::optional<Lifetime> a = Lifetime(7);
        CHECK(Lifetime::live_count == 1);

        auto b = a;
        CHECK(Lifetime::live_count == 2);
        CHECK(b == a);

        auto c = rc::move(a);
        CHECK(!a.has_value()); // NOLINT(bugprone-use-after-move)
        CHECK(c.value().value == 7);
        CHECK(Lifetime::live_count == 2);

        rc::optional<Lifetime> d;
        d = c;
        CHECK(Lifetime::live_count == 3);

        d = rc::optional<Lifetime>();
        CHECK(!d.has_value());
        CHECK(Lifetime::live_count == 2);
    }
    CHECK(Lifetime::live_count == 0);
}

TEST("optional - move-only values")
{
    rc::optional<std::unique_ptr<int>> slot = std::make_unique<int>(3);
    auto moved = rc::move(slot);
    REQUIRE(moved.has_value());
    CHECK(*moved.value() == 3);

    auto ptr = moved.take();
    CHECK(*ptr == 3);
    CHECK(!moved.has_value());
}

TEST("optional - value_or")
{
    rc::optional<std::string> empty;
    CHECK(empty.value_or("fallback") == "fallback");

    rc::optional<std::string> engaged = std::string("value");
    CHECK(engaged.value_or("fallback") == "value");
}

TEST("optional - equality")
{
    rc::optional<int> a = 1;
    rc::optional<int> b = 1;
    rc::optional<int> c = 2;
    rc::optional<int> none;

    CHECK(a == b);
    CHECK(a != c);
    CHECK(a != none);
    CHECK(none == rc::optional<int>());

    CHECK(a == 1);
    CHECK(a != 2);
    CHECK(none != 1);
}
