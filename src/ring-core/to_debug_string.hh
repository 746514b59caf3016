#pragma once

#include <ring-core/fwd.hh>
#include <ring-core/to_string.hh>

#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility> // for tuple_size

namespace rc
{
struct debug_string_config
{
    // soft limit on the output of a collection, checked before each element
    isize max_length = 100;
};

// Developer-facing rendering of a value, used for diagnostics and for
// the constructor form of circular_array ("circular_array_of(1, 2)").
//
// First match wins:
//   - string-likes are double-quoted
//   - char is single-quoted and escaped
//   - v.to_debug_string(), then to_string(v), then v.to_string()
//   - ranges render as [a, b, ...], tuple-likes as (a, b, ...)
//   - anything else is dumped as hex bytes
//
// The output format is not stable.
template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg = {});

namespace impl
{
// 'a', '\n', '\x01'
[[nodiscard]] std::string quoted_char(char c);

// 0x0A0B0C0D_0E0F, '_' between alignment units
[[nodiscard]] std::string hex_dump(void const* data, isize size, isize align);

// appends ", elem" (or "elem" first), returns false once the limit was hit
template <class T>
bool append_debug_element(std::string& out, T const& v, debug_string_config const& cfg)
{
    if (isize(out.size()) >= cfg.max_length)
    {
        out += ", ...";
        return false;
    }

    if (out.size() > 1)
        out += ", ";
    out += rc::to_debug_string(v, cfg);
    return true;
}
} // namespace impl

template <class T>
[[nodiscard]] std::string to_debug_string(T const& v, debug_string_config const& cfg)
{
    if constexpr (requires { std::string_view(v); })
    {
        return std::string("\"").append(std::string_view(v)).append("\"");
    }
    else if constexpr (std::is_same_v<T, char>)
    {
        return impl::quoted_char(v);
    }
    else if constexpr (requires { v.to_debug_string(); })
    {
        return std::string(v.to_debug_string());
    }
    else if constexpr (requires { to_string(v); })
    {
        return std::string(to_string(v));
    }
    else if constexpr (requires { v.to_string(); })
    {
        return std::string(v.to_string());
    }
    else if constexpr (requires {
                           std::begin(v);
                           std::end(v);
                       })
    {
        auto out = std::string("[");
        for (auto const& e : v)
            if (!impl::append_debug_element(out, e, cfg))
                break;
        return out += "]";
    }
    else if constexpr (requires { std::tuple_size<T>::value; })
    {
        auto out = std::string("(");
        auto const append_all = [&]<std::size_t... I>(std::index_sequence<I...>)
        { (void)(impl::append_debug_element(out, std::get<I>(v), cfg) && ...); };
        append_all(std::make_index_sequence<std::tuple_size_v<T>>{});
        return out += ")";
    }
    else
    {
        return impl::hex_dump(&v, sizeof(T), alignof(T));
    }
}
} // namespace rc
