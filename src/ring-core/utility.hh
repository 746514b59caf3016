#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>

#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison and clamping:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//   min(a, b)                   - returns the smaller of two values (requires operator<)
//   clamp(v, lo, hi)            - clamps value v to range [lo, hi] (requires operator<)
//
// Wrapping arithmetic (ring indices):
//   wrapped_increment(pos, max) - increment with wrap-around to 0 at max
//   wrapped_decrement(pos, max) - decrement with wrap-around to max-1 at 0
//   wrapped_add(pos, offset, max) - (pos + offset) mod max for 0 <= pos, offset < max
//
// Object storage:
//   placement_new               - tag for placement new without <new>
//   storage_for<T>              - uninitialized, correctly aligned storage for one T
//


// =========================================================================================================
// Placement new
// =========================================================================================================

namespace rc
{
/// Tag type selecting the ring-core placement new overload
/// Usage:
///   new (rc::placement_new, ptr) T(args...);
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new{};
} // namespace rc

// does not depend on <new>, so container headers stay light
[[nodiscard]] inline void* operator new(std::size_t, rc::placement_new_t, void* ptr) noexcept
{
    return ptr;
}
// only called if a constructor throws during placement new
inline void operator delete(void*, rc::placement_new_t, void*) noexcept {}

namespace rc
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   arr.push_back(rc::move(obj));
template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] RC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto old = rc::exchange(slot, new_value);
template <class T, class U = T>
[[nodiscard]] RC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison and clamping
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (consistent with min returning a)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
/// When a == b, min returns a (consistent with max returning b)
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Clamps a value to the range [lo, hi]
/// Precondition: lo <= hi (expressed as !(hi < lo))
/// Usage:
///   auto start = rc::clamp(start, isize(0), size);
template <class T>
[[nodiscard]] constexpr T const& clamp(T const& v, T const& lo, T const& hi)
{
    static_assert(requires { v < lo; }, "T must support operator<");
    RC_ASSERT(!(hi < lo), "clamp: hi must be >= lo");
    return (v < lo) ? lo : (hi < v) ? hi : v; // NOLINT
}

// =========================================================================================================
// Wrapping arithmetic
// =========================================================================================================

/// Increment with wrap-around: (pos + 1) % max, without a division
/// Precondition: max > 0
/// Usage:
///   // wrapped_increment(0, 3) == 1
///   // wrapped_increment(2, 3) == 0
template <class T>
[[nodiscard]] constexpr T wrapped_increment(T pos, T max)
{
    RC_ASSERT(max > 0, "wrapped_increment: max must be positive");
    ++pos;
    return pos == max ? T(0) : pos;
}

/// Decrement with wrap-around: (pos - 1 + max) % max, without a division
/// Precondition: max > 0
/// Usage:
///   // wrapped_decrement(1, 3) == 0
///   // wrapped_decrement(0, 3) == 2
template <class T>
[[nodiscard]] constexpr T wrapped_decrement(T pos, T max)
{
    RC_ASSERT(max > 0, "wrapped_decrement: max must be positive");
    return pos == 0 ? max - 1 : pos - 1;
}

/// Offset with wrap-around: (pos + offset) % max, without a division
/// Precondition: 0 <= pos < max and 0 <= offset < max
/// Usage:
///   // wrapped_add(2, 2, 3) == 1
template <class T>
[[nodiscard]] constexpr T wrapped_add(T pos, T offset, T max)
{
    RC_ASSERT(0 <= pos && pos < max && 0 <= offset && offset < max, "wrapped_add: arguments out of range");
    auto const sum = pos + offset;
    return sum >= max ? sum - max : sum;
}

// =========================================================================================================
// Object storage
// =========================================================================================================

/// Uninitialized storage for a single T with correct size and alignment
/// The lifetime of `value` is managed manually by the owner (placement new + explicit destructor call).
/// Trivially copyable and trivially destructible whenever T is.
template <class T>
union storage_for
{
    storage_for() {} // NOLINT: intentionally leaves value uninitialized

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }

    storage_for(storage_for const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    storage_for& operator=(storage_for const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    T value;
};

} // namespace rc
