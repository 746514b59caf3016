#include "allocation.hh"

#include <ring-core/assertf.hh>
#include <ring-core/macros.hh>

#include <cstdlib>

#ifdef RC_OS_WINDOWS
#include <malloc.h>
#endif

namespace
{
rc::byte* system_allocate_bytes(rc::isize bytes, rc::isize alignment, void* userdata)
{
    RC_UNUSED(userdata);
    RC_ASSERT(alignment > 0 && (alignment & (alignment - 1)) == 0, "alignment must be a power of 2");

    if (bytes == 0)
        return nullptr;

#ifdef RC_OS_WINDOWS
    auto const p = static_cast<rc::byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign has no bytes % alignment requirement, but wants at least pointer alignment
    void* raw = nullptr;
    auto const effective_alignment = rc::max(alignment, rc::isize(sizeof(void*)));
    auto const p = posix_memalign(&raw, effective_alignment, bytes) == 0 ? static_cast<rc::byte*>(raw) : nullptr;
#endif

    RC_ASSERTF_ALWAYS(p != nullptr, "allocation failed: requested {} bytes with alignment {}", bytes, alignment);
    return p;
}

void system_deallocate_bytes(rc::byte* p, rc::isize bytes, rc::isize alignment, void* userdata)
{
    RC_UNUSED(bytes);
    RC_UNUSED(alignment);
    RC_UNUSED(userdata);

#ifdef RC_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

constinit rc::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .userdata = nullptr,
};
} // namespace

constinit rc::memory_resource const* const rc::default_memory_resource = &system_memory_resource;
