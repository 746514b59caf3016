#include "to_string.hh"
#include "to_debug_string.hh"

#include <format>

namespace
{
template <class T>
std::string format_number(T v)
{
    return std::format("{}", v);
}
} // namespace

std::string rc::to_string(void const* ptr) { return std::format("{}", ptr); }
std::string rc::to_string(bool b) { return b ? "true" : "false"; }
std::string rc::to_string(byte b) { return std::format("0x{:02X}", static_cast<unsigned char>(b)); }
std::string rc::to_string(char c) { return std::string(1, c); }

std::string rc::to_string(signed char i) { return format_number(i); }
std::string rc::to_string(unsigned char i) { return format_number(i); }
std::string rc::to_string(signed short i) { return format_number(i); }
std::string rc::to_string(unsigned short i) { return format_number(i); }
std::string rc::to_string(signed int i) { return format_number(i); }
std::string rc::to_string(unsigned int i) { return format_number(i); }
std::string rc::to_string(signed long i) { return format_number(i); }
std::string rc::to_string(unsigned long i) { return format_number(i); }
std::string rc::to_string(signed long long i) { return format_number(i); }
std::string rc::to_string(unsigned long long i) { return format_number(i); }

// std::format picks the shortest representation that parses back to the same value
std::string rc::to_string(float f) { return format_number(f); }
std::string rc::to_string(double f) { return format_number(f); }

std::string rc::to_string(char const* s) { return s; }
std::string rc::to_string(std::string s) { return s; }
std::string rc::to_string(std::string_view s) { return std::string(s); }

std::string rc::impl::quoted_char(char c)
{
    auto escaped = [c]() -> std::string
    {
        switch (c)
        {
        case '\0': return "\\0";
        case '\n': return "\\n";
        case '\r': return "\\r";
        case '\t': return "\\t";
        case '\\': return "\\\\";
        case '\'': return "\\'";
        default: break;
        }

        auto const u = static_cast<unsigned char>(c);
        if (u < 32 || u == 127)
            return std::format("\\x{:02X}", u);
        return std::string(1, c);
    }();

    return "'" + escaped + "'";
}

std::string rc::impl::hex_dump(void const* data, isize size, isize align)
{
    auto const bytes = static_cast<unsigned char const*>(data);

    auto out = std::string("0x");
    out.reserve(2 + size * 3);
    for (isize i = 0; i < size; ++i)
    {
        if (i > 0 && i % align == 0)
            out += '_';
        out += std::format("{:02X}", bytes[i]);
    }
    return out;
}
