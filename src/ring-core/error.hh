#pragma once

#include <ring-core/fwd.hh>

#include <string>
#include <string_view>

namespace rc
{
/// The expected failure modes of circular_array operations.
/// Everything else (pushes, compaction, equality, snapshots, formatting) cannot fail.
enum class error_kind : u8
{
    /// pop or fold without a fallback/initial value on an empty array
    empty_container,
    /// single-element access whose (negative-resolved) index is outside [0, size)
    index_out_of_range,
    /// extended-slice assignment with a different number of values than selected positions
    length_mismatch,
};

[[nodiscard]] std::string_view to_string(error_kind kind);
} // namespace rc

/// Error payload of the try_ operations of circular_array, used as E in rc::result<T, E>.
struct rc::circular_array_error
{
    error_kind kind = error_kind::empty_container;

    /// human-readable description, e.g. "index 7 out of range for circular_array of size 3"
    std::string message;

    [[nodiscard]] static circular_array_error empty_container(std::string_view operation);
    [[nodiscard]] static circular_array_error index_out_of_range(isize index, isize size);
    [[nodiscard]] static circular_array_error length_mismatch(isize selected, isize provided);

    /// "<kind>: <message>"
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(circular_array_error const&, circular_array_error const&) = default;
};
