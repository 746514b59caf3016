#include <ring-core/circular_array.hh>
#include <ring-core/to_debug_string.hh>

#include <nexus/test.hh>

#include <format>
#include <string>
#include <tuple>
#include <vector>

namespace
{
// member to_debug_string wins over member to_string
struct Point
{
    int x = 0;
    int y = 0;

    std::string to_string() const { return std::format("{}/{}", x, y); }
    std::string to_debug_string() const { return std::format("Point({}, {})", x, y); }
};

// only a member to_string
struct Label
{
    std::string to_string() const { return "label"; }
};

struct Opaque
{
    uint32_t a;
    uint16_t b;
};
} // namespace

TEST("to_debug_string - element types in the constructor form")
{
    auto const points = rc::circular_array_of(Point{1, 2}, Point{3, 4});
    CHECK(rc::to_debug_string(points) == "circular_array_of(Point(1, 2), Point(3, 4))");
    CHECK(points.to_string() == "(|1/2, 3/4|)");

    auto const labels = rc::circular_array_of(Label{}, Label{});
    CHECK(labels.to_debug_string() == "circular_array_of(label, label)");

    auto const strs = rc::circular_array_of(std::string("a b"), std::string());
    CHECK(strs.to_debug_string() == "circular_array_of(\"a b\", \"\")");
    CHECK(strs.to_string() == "(|a b, |)");

    auto const chars = rc::circular_array_of('a', '\n', '\'');
    CHECK(chars.to_debug_string() == "circular_array_of('a', '\\n', '\\'')");

    auto const nums = rc::circular_array_of(-7, 42);
    CHECK(nums.to_debug_string() == "circular_array_of(-7, 42)");

    CHECK(rc::circular_array<bool>().to_debug_string() == "circular_array_of()");
}

TEST("to_debug_string - nested element values")
{
    auto const lists = rc::circular_array_of(std::vector<int>{1, 2}, std::vector<int>());
    CHECK(lists.to_debug_string() == "circular_array_of([1, 2], [])");

    auto const pairs = rc::circular_array_of(std::make_tuple(1, std::string("x")));
    CHECK(pairs.to_debug_string() == "circular_array_of((1, \"x\"))");

    auto nested = rc::circular_array_of(rc::circular_array_of(1, 2));
    nested.push_back(rc::circular_array_of<int>());
    CHECK(nested.to_debug_string() == "circular_array_of(circular_array_of(1, 2), circular_array_of())");
}

TEST("to_debug_string - long element collections are truncated")
{
    std::vector<int> large;
    for (auto i = 0; i < 1000; ++i)
        large.push_back(i);

    auto const result = rc::to_debug_string(large, rc::debug_string_config{.max_length = 50});
    CHECK(result.ends_with(", ...]"));
    CHECK(result.size() < 100);
}

TEST("to_debug_string - opaque element types are dumped as hex")
{
    auto const result = rc::to_debug_string(Opaque{0x12345678, 0xABCD});
    CHECK(result.starts_with("0x"));
    CHECK(result.find('_') != std::string::npos);
}
