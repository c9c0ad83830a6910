#pragma once

#include <smart-runtime/fwd.hh>
#include <smart-runtime/span.hh>
#include <smart-runtime/utility.hh>

// sr::allocation is the owning byte-block handle underneath all runtime containers.
//
// Memory is obtained from a polymorphic sr::memory_resource (POD, function-pointer based, static-init safe).
// The resource pointer is stored *in the allocation*, not as a template argument. A null resource
// means "use sr::default_memory_resource". The embedding runtime can route container storage through
// its own heap (e.g. the linear memory of a WASM instance) by seeding containers with a custom resource.
//
// Unlike typed containers, the runtime containers are stride-addressed: an allocation is a plain
// [alloc_start, alloc_end) byte range and never constructs or destroys objects inside it.
//
// Core invariants:
// - [alloc_start, alloc_end) is the owned byte range (exclusive end).
// - alloc_start == nullptr iff no bytes are owned.
// - custom_resource == nullptr implies use of sr::default_memory_resource.

namespace sr
{
/// Default memory resource used when allocation::custom_resource == nullptr.
/// Stored in the data segment, so the pointer is valid even during static initialization.
extern memory_resource const* const default_memory_resource;
} // namespace sr

/// Polymorphic memory resource interface powering sr::allocation.
/// This is a POD struct using function pointers to avoid virtual dispatch and non-trivial constructors.
struct sr::memory_resource
{
    /// Allocate exactly `bytes` bytes with at least `alignment` alignment.
    /// bytes == 0 always sets *out_ptr to nullptr and returns 0.
    /// bytes > 0 always sets *out_ptr to non-null; failure is fatal.
    isize (*allocate_bytes)(byte** out_ptr, isize bytes, isize alignment, void* userdata) = nullptr;

    /// Attempt to allocate `bytes` bytes with at least `alignment` alignment.
    /// Returns the allocated size on success, or -1 on failure (and sets *out_ptr to nullptr).
    /// bytes == 0 always sets *out_ptr to nullptr and returns 0.
    /// Runtime containers only use this entry point: running out of memory inside a contract
    /// must surface as vector_error::allocation_failure, never as a host abort.
    isize (*try_allocate_bytes)(byte** out_ptr, isize bytes, isize alignment, void* userdata) = nullptr;

    /// Deallocate a block previously obtained from this resource with matching bytes and alignment.
    void (*deallocate_bytes)(byte* p, isize bytes, isize alignment, void* userdata) = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};

/// Owning handle for a contiguous byte block.
/// Move-only; the destructor returns the block to the resource it came from.
struct sr::allocation
{
    /// Start of the owned byte block, nullptr if nothing is owned.
    byte* alloc_start = nullptr;

    /// End of the owned byte block (exclusive).
    byte* alloc_end = nullptr;

    /// Alignment used when the block was requested, needed again for deallocation.
    isize alignment = 0;

    /// Memory resource that owns the block, or nullptr for the global default.
    memory_resource const* custom_resource = nullptr;

    // minimal helper api
public:
    [[nodiscard]] memory_resource const& resource() const
    {
        return custom_resource ? *custom_resource : *default_memory_resource;
    }

    /// True iff this owns a non-empty block
    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }

    [[nodiscard]] isize size_bytes() const { return alloc_end - alloc_start; }

    /// Note: proper mutability ("const correctness") is user responsibility
    [[nodiscard]] span<byte> bytes() const { return span<byte>(alloc_start, alloc_end); }

    // factories
public:
    /// Allocates `bytes` bytes, fatal on exhaustion.
    /// bytes == 0 results in an empty (invalid) allocation with no real allocation call.
    [[nodiscard]] static allocation create_bytes(isize bytes, isize alignment, memory_resource const* resource);

    /// Attempts to allocate `bytes` bytes.
    /// On exhaustion the result is an empty allocation, i.e. `bytes > 0 && !is_valid()` signals failure.
    [[nodiscard]] static allocation try_create_bytes(isize bytes, isize alignment, memory_resource const* resource);

    // lifecycle
public:
    allocation() = default;

    // no implicit copies for allocations
    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept
      : alloc_start(sr::exchange(rhs.alloc_start, nullptr)),
        alloc_end(sr::exchange(rhs.alloc_end, nullptr)),
        alignment(sr::exchange(rhs.alignment, 0)),
        custom_resource(rhs.custom_resource) // rhs resource stays
    {
    }

    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            // move rhs out first so that releasing our block cannot affect it
            auto rhs_tmp = sr::move(rhs);

            impl_deallocate();

            alloc_start = sr::exchange(rhs_tmp.alloc_start, nullptr);
            alloc_end = sr::exchange(rhs_tmp.alloc_end, nullptr);
            alignment = sr::exchange(rhs_tmp.alignment, 0);
            custom_resource = rhs_tmp.custom_resource;
        }

        return *this;
    }

    ~allocation() { impl_deallocate(); }

private:
    void impl_deallocate()
    {
        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
        }
    }
};
