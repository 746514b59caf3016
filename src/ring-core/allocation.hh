#pragma once

#include <ring-core/assert.hh>
#include <ring-core/fwd.hh>
#include <ring-core/impl/object_lifetime_util.hh>
#include <ring-core/span.hh>
#include <ring-core/utility.hh>

// rc::allocation<T> is the owning "storage + liveness" handle under circular_array's slot ring
// and rc::snapshot.
//
// It tracks two things:
// 1) which bytes are owned (obtained from an rc::memory_resource),
// 2) which objects inside those bytes are alive ([obj_start, obj_end)).
//
// The ring itself never wraps inside an allocation: circular_array keeps every slot alive as an
// rc::optional<T> and does its wrap-around arithmetic on top of the full live window.
//
// Invariants:
// - [alloc_start, alloc_end) is the owned byte range.
// - alloc_start <= obj_start <= obj_end <= alloc_end, all aligned to alignof(T).
// - custom_resource == nullptr means rc::default_memory_resource.

namespace rc
{
/// System allocator (posix_memalign / _aligned_malloc), valid during static initialization.
extern memory_resource const* const default_memory_resource;
} // namespace rc

/// Pluggable byte allocator, a POD of function pointers.
struct rc::memory_resource
{
    /// Returns `bytes` bytes aligned to `alignment`. bytes == 0 returns nullptr.
    /// Failure is fatal.
    byte* (*allocate_bytes)(isize bytes, isize alignment, void* userdata) = nullptr;

    /// Frees a block from allocate_bytes with the same size and alignment.
    void (*deallocate_bytes)(byte* p, isize bytes, isize alignment, void* userdata) = nullptr;

    void* userdata = nullptr;
};

template <class T>
struct rc::allocation
{
    /// First live object.
    T* obj_start = nullptr;

    /// One past the last live object.
    T* obj_end = nullptr;

    /// Owned bytes, passed back to the resource on destruction.
    byte* alloc_start = nullptr;
    byte* alloc_end = nullptr;

    isize alignment = 0;

    /// Owning resource, nullptr for the global default.
    memory_resource const* custom_resource = nullptr;

public:
    [[nodiscard]] memory_resource const& resource() const
    {
        return custom_resource ? *custom_resource : *default_memory_resource;
    }

    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    [[nodiscard]] span<T> obj_span() const { return span<T>(obj_start, obj_end - obj_start); }

    [[nodiscard]] isize obj_count() const { return obj_end - obj_start; }

    /// Number of T that fit into the owned bytes.
    [[nodiscard]] isize capacity() const { return (alloc_end - alloc_start) / isize(sizeof(T)); }

    // factories
public:
    /// Room for `size` objects, none alive. size == 0 allocates nothing.
    [[nodiscard]] static allocation create_empty(isize size, memory_resource const* resource = nullptr)
    {
        RC_ASSERT(size >= 0, "allocation size must be non-negative");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignof(T);

        auto const& res = result.resource();
        auto const bytes = size * isize(sizeof(T));
        result.alloc_start = res.allocate_bytes(bytes, result.alignment, res.userdata);
        result.alloc_end = result.alloc_start + bytes;

        result.obj_start = reinterpret_cast<T*>(result.alloc_start);
        result.obj_end = result.obj_start;
        return result;
    }

    /// `size` value-initialized objects, tight.
    [[nodiscard]] static allocation create_defaulted(isize size, memory_resource const* resource = nullptr)
    {
        auto result = allocation::create_empty(size, resource);
        impl::default_create_objects_to(result.obj_end, size);
        return result;
    }

    // lifecycle
public:
    allocation() = default;

    // containers decide how to copy
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : obj_start(rc::exchange(rhs.obj_start, nullptr)),
        obj_end(rc::exchange(rhs.obj_end, nullptr)),
        alloc_start(rc::exchange(rhs.alloc_start, nullptr)),
        alloc_end(rc::exchange(rhs.alloc_end, nullptr)),
        alignment(rc::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource)
    {
    }

    // rhs may live inside one of our objects: take it over before destroying anything
    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            auto tmp = rc::move(rhs);
            release();

            obj_start = rc::exchange(tmp.obj_start, nullptr);
            obj_end = rc::exchange(tmp.obj_end, nullptr);
            alloc_start = rc::exchange(tmp.alloc_start, nullptr);
            alloc_end = rc::exchange(tmp.alloc_end, nullptr);
            alignment = rc::exchange(tmp.alignment, 0);
            custom_resource = tmp.custom_resource;
        }
        return *this;
    }

    ~allocation() { release(); }

private:
    void release()
    {
        impl::destroy_objects_in_reverse(obj_start, obj_end);
        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
        }
        obj_start = nullptr;
        obj_end = nullptr;
        alloc_start = nullptr;
        alloc_end = nullptr;
    }
};
