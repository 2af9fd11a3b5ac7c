#include "memory_resource.hh"

#include <thin-node/assert.hh>
#include <thin-node/macros.hh>
#include <thin-node/utility.hh>

#include <cstdlib>

#ifdef TN_OS_WINDOWS
#include <malloc.h>
#endif

namespace
{
// The system allocator is stateless, userdata is ignored.

tn::byte* system_try_allocate_bytes(tn::isize bytes, tn::isize alignment, void* userdata)
{
    TN_UNUSED(userdata);

    TN_ASSERT(alignment > 0 && tn::is_power_of_two(alignment), "alignment must be a power of 2");
    TN_ASSERT(bytes >= 0, "byte count must be non-negative");

    if (bytes == 0)
        return nullptr;

#ifdef TN_OS_WINDOWS
    return static_cast<tn::byte*>(_aligned_malloc(size_t(bytes), size_t(alignment)));
#else
    // posix_memalign instead of std::aligned_alloc avoids the bytes % alignment == 0 requirement.
    // posix_memalign requires alignment >= sizeof(void*), so we clamp to that minimum.
    void* raw_ptr = nullptr;
    tn::isize const effective_alignment = alignment < tn::isize(sizeof(void*)) ? tn::isize(sizeof(void*)) : alignment;
    int const result = posix_memalign(&raw_ptr, size_t(effective_alignment), size_t(bytes));
    return result == 0 ? static_cast<tn::byte*>(raw_ptr) : nullptr;
#endif
}

tn::byte* system_allocate_bytes(tn::isize bytes, tn::isize alignment, void* userdata)
{
    if (bytes == 0)
        return nullptr;

    tn::byte* p = system_try_allocate_bytes(bytes, alignment, userdata);
    TN_ASSERT_ALWAYS(p != nullptr, "system allocator exhausted");
    return p;
}

void system_deallocate_bytes(tn::byte* p, tn::isize bytes, tn::isize alignment, void* userdata)
{
    TN_UNUSED(bytes);
    TN_UNUSED(alignment);
    TN_UNUSED(userdata);

    // _aligned_malloc requires _aligned_free, posix_memalign pairs with free
#ifdef TN_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

constinit tn::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .try_allocate_bytes = system_try_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .userdata = nullptr,
};

} // namespace

constinit tn::memory_resource const* const tn::default_memory_resource = &system_memory_resource;
