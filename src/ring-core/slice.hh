#pragma once

#include <ring-core/fwd.hh>
#include <ring-core/optional.hh>

/// Python-style slice [start:stop:step] over a logical sequence of a given size.
///
/// Unset fields take their usual defaults (whole sequence, step 1).
/// Negative start/stop count from the back; out-of-range bounds are clamped, never an error.
/// A step of zero is a precondition violation.
///
/// Usage:
///   arr.slice({.start = 2, .stop = 5});   // [2:5]
///   arr.slice({.step = -1});              // [::-1], full reverse
///   arr.slice({.start = -3});             // [-3:], last three elements
struct rc::slice
{
    /// Concrete index sequence start, start + step, ... with exactly `count` elements
    /// (step is capped to +-size, which selects the same elements),
    /// all of them valid logical indices in [0, size).
    struct resolved
    {
        isize start = 0;
        isize step = 1;
        isize count = 0;

        /// The k-th selected logical index, 0 <= k < count.
        [[nodiscard]] constexpr isize index_at(isize k) const { return start + k * step; }

        /// True if logical index i is part of the selection.
        [[nodiscard]] bool contains(isize i) const;
    };

    rc::optional<isize> start;
    rc::optional<isize> stop;
    rc::optional<isize> step;

    /// Resolves this slice against a sequence of `size` elements (mirrors Python's slice.indices).
    [[nodiscard]] resolved resolve(isize size) const;
};

namespace rc::impl
{
/// Maps a possibly negative logical index to its non-negative form (-1 is the last element).
/// The result still has to be bounds-checked against [0, size).
[[nodiscard]] constexpr isize normalize_index(isize i, isize size)
{
    return i < 0 ? i + size : i;
}

/// Normalizes and bounds-checks in one step; shared by all single-element accessors.
[[nodiscard]] constexpr bool is_valid_index(isize i, isize size)
{
    auto const idx = normalize_index(i, size);
    return 0 <= idx && idx < size;
}
} // namespace rc::impl
