#include <ring-core/snapshot.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>
#include <vector>

namespace
{
struct Counted
{
    int value = 0;
    static inline int live_count = 0;

    explicit Counted(int v) : value(v) { ++live_count; }
    Counted(Counted const& rhs) : value(rhs.value) { ++live_count; }
    ~Counted() { --live_count; }
};

// throws on the copy of a given value
struct ThrowingCopy
{
    int value = 0;
    static inline int live_count = 0;
    static inline int throw_on = -1;

    explicit ThrowingCopy(int v) : value(v) { ++live_count; }
    ThrowingCopy(ThrowingCopy const& rhs) : value(rhs.value)
    {
        if (value == throw_on)
            throw 42;
        ++live_count;
    }
    ~ThrowingCopy() { --live_count; }
};
} // namespace

TEST("snapshot - default is empty")
{
    rc::snapshot<int> s;
    CHECK(s.empty());
    CHECK(s.size() == 0);
    CHECK(s.begin() == s.end());
    CHECK(s.as_span().empty());
}

TEST("snapshot - create_generated copies in order")
{
    auto const source = std::vector<std::string>{"a", "b", "c"};
    auto const s = rc::snapshot<std::string>::create_generated(3, [&](rc::isize i) -> std::string const& { return source[i]; });

    REQUIRE(s.size() == 3);
    CHECK(s[0] == "a");
    CHECK(s[2] == "c");

    std::string joined;
    for (auto const& v : s)
        joined += v;
    CHECK(joined == "abc");

    CHECK(s.as_span().size() == 3);
    CHECK(s.data() == s.begin());
}

TEST("snapshot - lifetime of elements")
{
    Counted::live_count = 0;
    auto const source = std::vector<Counted>{Counted(1), Counted(2)};
    auto const make = [&] { return rc::snapshot<Counted>::create_generated(2, [&](rc::isize i) -> Counted const& { return source[i]; }); };
    REQUIRE(Counted::live_count == 2);

    SECTION("copy")
    {
        {
            auto const s = make();
            CHECK(Counted::live_count == 4);

            auto const copy = s;
            CHECK(Counted::live_count == 6);
            CHECK(copy[1].value == 2);
        }
        CHECK(Counted::live_count == 2);
    }

    SECTION("move leaves source empty")
    {
        {
            auto s = make();
            auto moved = rc::move(s);
            CHECK(Counted::live_count == 4);
            CHECK(moved.size() == 2);
            CHECK(s.empty()); // NOLINT(bugprone-use-after-move)
        }
        CHECK(Counted::live_count == 2);
    }

    SECTION("copy assignment replaces contents")
    {
        {
            auto const s = make();
            auto other = rc::snapshot<Counted>::create_generated(1, [&](rc::isize) -> Counted const& { return source[0]; });
            CHECK(Counted::live_count == 5);

            other = s;
            CHECK(Counted::live_count == 6);
            CHECK(other.size() == 2);
        }
        CHECK(Counted::live_count == 2);
    }
}

TEST("snapshot - throwing copy cleans up")
{
    ThrowingCopy::live_count = 0;
    auto const source = std::vector<ThrowingCopy>{ThrowingCopy(0), ThrowingCopy(1), ThrowingCopy(2)};
    ThrowingCopy::throw_on = 2;

    auto threw = false;
    try
    {
        auto const s = rc::snapshot<ThrowingCopy>::create_generated(3, [&](rc::isize i) -> ThrowingCopy const& { return source[i]; });
    }
    catch (int)
    {
        threw = true;
    }
    ThrowingCopy::throw_on = -1;

    CHECK(threw);
    CHECK(ThrowingCopy::live_count == 3);
}

TEST("snapshot - elements are copies")
{
    auto const values = std::vector<std::shared_ptr<int>>{std::make_shared<int>(1), std::make_shared<int>(2)};
    auto const s = rc::snapshot<std::shared_ptr<int>>::create_generated(2, [&](rc::isize i) -> std::shared_ptr<int> const& { return values[i]; });

    CHECK(s[0] == values[0]);
    CHECK(values[0].use_count() == 2);
}
