#pragma once

#include <ring-core/fwd.hh>
#include <ring-core/utility.hh>

#include <cstring>
#include <type_traits>

// Low-level helpers for manually managed object ranges in raw memory.
// Used by rc::allocation and rc::snapshot.

namespace rc::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges (start == end) and nullptr are valid and result in a no-op.
/// Trivially destructible types are optimized out at compile time.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Value-initializes `count` objects at dest_end, incrementing dest_end per object.
/// IMPORTANT: the target range must be uninitialized memory.
template <class T>
constexpr void default_create_objects_to(T*& dest_end, isize count)
{
    static_assert(std::is_default_constructible_v<T>, "T must be default constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (rc::placement_new, dest_end) T();
        ++dest_end;
    }
}

/// Copy-constructs one object at dest_end and increments dest_end.
/// IMPORTANT: *dest_end must be uninitialized memory.
/// If the copy throws, dest_end is unchanged, so [obj_start, dest_end) stays exactly the constructed range.
///
/// Usage pattern (gathering from a non-contiguous source, e.g. a wrapped ring):
///   auto obj_end = obj_start;
///   for (...)
///       copy_create_object_to(obj_end, ring_element(i));
///   // [obj_start, obj_end) is now the constructed live range
template <class T>
constexpr void copy_create_object_to(T*& dest_end, T const& src)
{
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    new (rc::placement_new, dest_end) T(src);
    ++dest_end; // _after_ construction so a throwing copy leaves dest_end at the constructed range
}

/// Copy-constructs objects from [src_start, src_end) using placement new.
/// dest_end is incremented for each successfully constructed object.
/// IMPORTANT: [*dest_end, *dest_end + (src_end - src_start)) must be uninitialized memory.
/// Trivially copyable types are copied with a single memcpy.
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
            copy_create_object_to(dest_end, *src_start++);
    }
}
} // namespace rc::impl
