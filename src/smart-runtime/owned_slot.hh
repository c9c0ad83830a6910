#pragma once

#include <smart-runtime/allocation.hh>
#include <smart-runtime/fwd.hh>
#include <smart-runtime/span.hh>
#include <smart-runtime/utility.hh>

#include <type_traits>

/// One element value whose ownership has been handed to the caller.
/// Produced by materializing reads, pops, cursors and slices of sr::strided_vector.
///
/// The slot owns `stride` bytes and, for managed values, the runtime reference stored in them:
/// destroying a valid slot releases that reference through the context it was materialized with.
/// Plain-value slots just free their bytes.
///
/// Move-only. A moved-from slot is invalid and releases nothing.
///
/// Usage:
///   auto r = vec.materialize_at(3);
///   if (r.has_value())
///       auto v = r.value().as<sr::i64>();
struct sr::owned_slot
{
    // queries
public:
    /// True iff this slot holds a value
    [[nodiscard]] bool is_valid() const { return _storage.is_valid(); }

    /// Size of the value in bytes (the stride of the container it came from)
    [[nodiscard]] isize size() const { return _storage.size_bytes(); }

    [[nodiscard]] span<byte const> bytes() const { return span<byte const>(_storage.alloc_start, _storage.alloc_end); }
    [[nodiscard]] span<byte> bytes() { return _storage.bytes(); }

    /// Context that will release the value, never null for valid slots
    [[nodiscard]] runtime_context const* context() const { return _context; }

    /// Reads the value as a trivially copyable T
    /// Precondition: size() == sizeof(T)
    template <class T>
        requires std::is_trivially_copyable_v<T> && std::is_default_constructible_v<T>
    [[nodiscard]] T as() const
    {
        return sr::from_bytes<T>(bytes());
    }

    // ownership
public:
    /// Gives up the value reference without releasing it
    /// The caller becomes responsible for the reference stored in the returned bytes
    [[nodiscard]] allocation detach() &&;

    /// Takes ownership of `storage` whose bytes hold a value owned by `context`
    /// A null context means plain values
    [[nodiscard]] static owned_slot adopt(allocation storage, runtime_context const* context);

    // lifecycle
public:
    owned_slot() = default;

    owned_slot(owned_slot&& rhs) noexcept;
    owned_slot& operator=(owned_slot&& rhs) noexcept;
    owned_slot(owned_slot const&) = delete;
    owned_slot& operator=(owned_slot const&) = delete;
    ~owned_slot();

private:
    void impl_release();

    allocation _storage;
    runtime_context const* _context = nullptr;
};
