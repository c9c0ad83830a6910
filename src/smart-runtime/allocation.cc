#include "allocation.hh"

#include <smart-runtime/assert.hh>
#include <smart-runtime/macros.hh>
#include <smart-runtime/utility.hh>

#include <cstdlib>

namespace
{
/// Static function implementations for the system memory resource.
/// These ignore the userdata parameter as the system allocator is stateless.

sr::isize system_try_allocate_bytes(sr::byte** out_ptr, sr::isize bytes, sr::isize alignment, void* userdata)
{
    SR_UNUSED(userdata);

    SR_ASSERT(out_ptr != nullptr, "out_ptr must not be null");
    SR_ASSERT(bytes >= 0, "cannot allocate a negative number of bytes");
    SR_ASSERT(sr::is_power_of_two(alignment), "alignment must be a power of 2");

    *out_ptr = nullptr;

    // Contract: bytes == 0 always returns nullptr
    if (bytes == 0)
        return 0;

#ifdef SR_OS_WINDOWS
    *out_ptr = static_cast<sr::byte*>(_aligned_malloc(bytes, alignment));
#else
    // posix_memalign does not require bytes % alignment == 0 (unlike std::aligned_alloc)
    // but requires alignment >= sizeof(void*), so we clamp to that minimum.
    void* raw_ptr = nullptr;
    sr::isize const effective_alignment = alignment < sr::isize(sizeof(void*)) ? sr::isize(sizeof(void*)) : alignment;
    if (posix_memalign(&raw_ptr, effective_alignment, bytes) == 0)
        *out_ptr = static_cast<sr::byte*>(raw_ptr);
#endif

    return *out_ptr != nullptr ? bytes : -1;
}

sr::isize system_allocate_bytes(sr::byte** out_ptr, sr::isize bytes, sr::isize alignment, void* userdata)
{
    auto const allocated = system_try_allocate_bytes(out_ptr, bytes, alignment, userdata);
    SR_ASSERT_ALWAYS(allocated >= 0, "system allocation failed");
    return allocated;
}

void system_deallocate_bytes(sr::byte* p, sr::isize bytes, sr::isize alignment, void* userdata)
{
    SR_UNUSED(bytes);
    SR_UNUSED(alignment);
    SR_UNUSED(userdata);

    // _aligned_malloc requires _aligned_free, posix_memalign pairs with std::free
#ifdef SR_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

constinit sr::memory_resource const system_memory_resource = {
    .allocate_bytes = system_allocate_bytes,
    .try_allocate_bytes = system_try_allocate_bytes,
    .deallocate_bytes = system_deallocate_bytes,
    .userdata = nullptr,
};

} // namespace

constinit sr::memory_resource const* const sr::default_memory_resource = &system_memory_resource;

sr::allocation sr::allocation::create_bytes(isize bytes, isize alignment, memory_resource const* resource)
{
    SR_ASSERT(bytes >= 0, "cannot allocate a negative number of bytes");

    allocation result;
    result.custom_resource = resource;
    result.alignment = alignment;

    auto const& res = result.resource();
    auto const actual_bytes = res.allocate_bytes(&result.alloc_start, bytes, alignment, res.userdata);
    result.alloc_end = result.alloc_start + actual_bytes;
    return result;
}

sr::allocation sr::allocation::try_create_bytes(isize bytes, isize alignment, memory_resource const* resource)
{
    SR_ASSERT(bytes >= 0, "cannot allocate a negative number of bytes");

    allocation result;
    result.custom_resource = resource;
    result.alignment = alignment;

    auto const& res = result.resource();
    auto const actual_bytes = res.try_allocate_bytes(&result.alloc_start, bytes, alignment, res.userdata);
    if (actual_bytes < 0 || result.alloc_start == nullptr)
    {
        result.alloc_start = nullptr;
        result.alloc_end = nullptr;
        return result;
    }

    result.alloc_end = result.alloc_start + actual_bytes;
    return result;
}
