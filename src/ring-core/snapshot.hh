#pragma once

#include <ring-core/allocation.hh>
#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/impl/object_lifetime_util.hh>
#include <ring-core/span.hh>
#include <ring-core/utility.hh>

#include <type_traits>

/// Owning, immutable, contiguous copy of a sequence, taken at a single point in time.
///
/// This is how circular_array is iterated: circular_array::snapshot() copies the logical contents once,
/// then iteration is a plain pointer walk over the copy. The circular_array can be pushed, popped,
/// compacted or destroyed while a snapshot is being consumed; the snapshot never observes it.
///
/// Usage:
///   for (auto const& v : arr.snapshot())
///       arr.push_back(v); // fine, iterates over the state before the loop
///
/// Deep-copy value semantics. Moved-from snapshots are empty.
template <class T>
struct rc::snapshot
{
    // factories
public:
    /// Creates a snapshot of `size` elements, copy-constructing element i from `element_at(i)`.
    /// `element_at` must return something T is copy-constructible from (typically T const&).
    /// If a copy throws, the already-copied elements are destroyed and the exception propagates.
    template <class F>
    [[nodiscard]] static snapshot create_generated(isize size, F&& element_at)
    {
        RC_ASSERT(size >= 0, "snapshot size must be non-negative");

        snapshot s;
        s._alloc = allocation<T>::create_empty(size);
        for (isize i = 0; i < size; ++i)
            impl::copy_create_object_to(s._alloc.obj_end, element_at(i));
        return s;
    }

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] T const& operator[](isize i) const
    {
        RC_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _alloc.obj_start[i];
    }

    [[nodiscard]] T const* data() const { return _alloc.obj_start; }

    [[nodiscard]] span<T const> as_span() const { return span<T const>(_alloc.obj_start, size()); }

    // iterators
public:
    [[nodiscard]] T const* begin() const { return _alloc.obj_start; }
    [[nodiscard]] T const* end() const { return _alloc.obj_end; }

    // queries
public:
    [[nodiscard]] isize size() const { return _alloc.obj_count(); }
    [[nodiscard]] bool empty() const { return _alloc.obj_start == _alloc.obj_end; }

    // ctors
public:
    snapshot() = default;

    snapshot(snapshot&&) noexcept = default;
    snapshot& operator=(snapshot&&) noexcept = default;

    snapshot(snapshot const& rhs) : _alloc(allocation<T>::create_empty(rhs.size()))
    {
        impl::copy_create_objects_to(_alloc.obj_end, rhs.data(), rhs.data() + rhs.size());
    }
    snapshot& operator=(snapshot const& rhs)
    {
        if (this != &rhs)
        {
            auto copy = snapshot(rhs);
            *this = rc::move(copy);
        }
        return *this;
    }

private:
    // [obj_start, obj_end) are live, the allocation has exactly the final size
    allocation<T> _alloc;
};
