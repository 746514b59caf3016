#include "error.hh"

#include <format>

std::string_view rc::to_string(error_kind kind)
{
    switch (kind)
    {
    case error_kind::empty_container:
        return "empty_container";
    case error_kind::index_out_of_range:
        return "index_out_of_range";
    case error_kind::length_mismatch:
        return "length_mismatch";
    }
    return "<invalid rc::error_kind>";
}

rc::circular_array_error rc::circular_array_error::empty_container(std::string_view operation)
{
    return {
        .kind = error_kind::empty_container,
        .message = std::format("{} called on an empty circular_array", operation),
    };
}

rc::circular_array_error rc::circular_array_error::index_out_of_range(isize index, isize size)
{
    if (size == 0)
        return {
            .kind = error_kind::index_out_of_range,
            .message = std::format("index {} out of range for an empty circular_array", index),
        };

    return {
        .kind = error_kind::index_out_of_range,
        .message = std::format("index {} out of range for circular_array of size {} (valid: {} to {})", index, size,
                               -size, size - 1),
    };
}

rc::circular_array_error rc::circular_array_error::length_mismatch(isize selected, isize provided)
{
    return {
        .kind = error_kind::length_mismatch,
        .message = std::format("cannot assign {} values to an extended slice of {} elements", provided, selected),
    };
}

std::string rc::circular_array_error::to_string() const
{
    return std::format("{}: {}", rc::to_string(kind), message);
}
