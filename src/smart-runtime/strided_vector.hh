#pragma once

#include <smart-runtime/allocation.hh>
#include <smart-runtime/fwd.hh>
#include <smart-runtime/growth_policy.hh>
#include <smart-runtime/guard.hh>
#include <smart-runtime/owned_slot.hh>
#include <smart-runtime/result.hh>
#include <smart-runtime/span.hh>
#include <smart-runtime/vector_error.hh>

// sr::strided_vector is the list/array container of the contract runtime.
//
// Elements are opaque fixed-size byte slots ("stride" bytes each), stored contiguously in logical order.
// The container never interprets slot bytes itself: copying, releasing and rendering go through the
// sr::runtime_context it was created with (see runtime_context.hh).
//
// Reading comes in two flavors:
//   borrow_*      -> span<byte> into the internal storage, valid until the next mutating call
//   materialize_* -> sr::owned_slot with an independent value (byte copy or context materialize)
//
// Ownership of managed values:
//   - add_* and set_* take over the reference stored in the passed bytes
//   - set_*, remove_* and clear release the references they drop
//   - pop_* hands the stored reference to the caller (no extra materialize/release pair)
//
// Thread safety (vector_options::thread_safe):
//   every call locks the container's guard for its own duration;
//   lock()/unlock() or locked(f) turn a sequence of calls into one critical section:
//
//     vec.locked([&] {
//         if (!vec.empty())
//             (void)vec.remove_last();
//     });
//
// Failures coming from contract-controlled input (indices, capacities, memory exhaustion) are reported
// through sr::result. A failed call never modifies the container.

/// Construction options of sr::strided_vector (use designated initializers)
struct sr::vector_options
{
    /// Element size in bytes, must be positive
    isize stride = 0;

    /// Elements allocated at construction; also the increment of growth_policy::linear
    isize initial_capacity = 0;

    growth_policy policy = growth_policy::double_size;

    /// Allocates a guard and serializes every call
    bool thread_safe = false;

    /// Object model of the stored values, nullptr for plain values
    runtime_context const* context = nullptr;

    /// Source of the element storage, nullptr for sr::default_memory_resource
    memory_resource const* resource = nullptr;
};

/// Double-ended dynamic array of stride-sized element slots.
/// Move-only; explicit copies are made with slice().
struct sr::strided_vector
{
    struct cursor;

    // factories
public:
    /// Creates an empty container with capacity for options.initial_capacity elements
    /// Fails with:
    ///   zero_stride        - options.stride <= 0
    ///   invalid_resize     - options.initial_capacity < 0
    ///   allocation_failure - the initial storage could not be allocated
    [[nodiscard]] static result<strided_vector, vector_error> create(vector_options const& options);

    // queries
public:
    [[nodiscard]] isize size() const;
    [[nodiscard]] bool empty() const;

    /// Number of elements that fit without reallocation
    [[nodiscard]] isize capacity() const;
    [[nodiscard]] isize capacity_bytes() const;

    [[nodiscard]] isize stride() const { return _options.stride; }

    /// Configuration this container was created with (context and resource are never null)
    [[nodiscard]] vector_options const& options() const { return _options; }
    [[nodiscard]] runtime_context const* context() const { return _options.context; }

    [[nodiscard]] bool is_thread_safe() const { return _guard.is_enabled(); }

    /// True iff slots hold runtime-managed values (i.e. a context other than sr::plain_value_context)
    [[nodiscard]] bool is_managed() const;

    /// Raw bytes of all elements in logical order (size() * stride() bytes)
    /// Same lifetime rules as borrowed slots
    [[nodiscard]] span<byte> data();
    [[nodiscard]] span<byte const> data() const;

    // capacity
public:
    /// Sets the capacity to exactly new_capacity elements
    /// Fails with invalid_resize if new_capacity < size(), allocation_failure if memory is exhausted
    [[nodiscard]] result<void, vector_error> resize(isize new_capacity);

    // insertion
    // value.size() must equal stride()
    // valid positions are [0, size()], growing according to the growth policy first if needed
public:
    [[nodiscard]] result<void, vector_error> add_first(span<byte const> value);
    [[nodiscard]] result<void, vector_error> add_last(span<byte const> value);
    [[nodiscard]] result<void, vector_error> add_at(isize index, span<byte const> value);

    // borrowing reads
    // empty_container on an empty container, invalid_index outside [0, size())
public:
    [[nodiscard]] result<span<byte>, vector_error> borrow_first();
    [[nodiscard]] result<span<byte>, vector_error> borrow_last();
    [[nodiscard]] result<span<byte>, vector_error> borrow_at(isize index);

    [[nodiscard]] result<span<byte const>, vector_error> borrow_first() const;
    [[nodiscard]] result<span<byte const>, vector_error> borrow_last() const;
    [[nodiscard]] result<span<byte const>, vector_error> borrow_at(isize index) const;

    // materializing reads
    // same failures as borrowing reads, plus allocation_failure for the copy
public:
    [[nodiscard]] result<owned_slot, vector_error> materialize_first() const;
    [[nodiscard]] result<owned_slot, vector_error> materialize_last() const;
    [[nodiscard]] result<owned_slot, vector_error> materialize_at(isize index) const;

    // overwriting
    // releases the previous value of the slot before storing the new one
public:
    [[nodiscard]] result<void, vector_error> set_first(span<byte const> value);
    [[nodiscard]] result<void, vector_error> set_last(span<byte const> value);
    [[nodiscard]] result<void, vector_error> set_at(isize index, span<byte const> value);

    /// Replaces the whole content with bytes.size() / stride() elements copied from bytes
    /// Skips per-element release and the growth policy (storage grows to exactly the new size if needed)
    /// Plain-value containers only, bytes.size() must be a multiple of stride() (checked in all builds)
    [[nodiscard]] result<void, vector_error> set_data(span<byte const> bytes);

    // removal
    // pop_* returns the removed value, remove_* releases it
    // capacity never shrinks
public:
    [[nodiscard]] result<owned_slot, vector_error> pop_first();
    [[nodiscard]] result<owned_slot, vector_error> pop_last();
    [[nodiscard]] result<owned_slot, vector_error> pop_at(isize index);

    [[nodiscard]] result<void, vector_error> remove_first();
    [[nodiscard]] result<void, vector_error> remove_last();
    [[nodiscard]] result<void, vector_error> remove_at(isize index);

    // whole-container operations
public:
    /// Reverses the element order in place
    void reverse();

    /// Releases all values, size becomes 0, capacity is kept
    void clear();

    // copies
public:
    /// New container with materialized copies of the elements [begin, end)
    /// The copy uses this container's options unchanged; its storage is grown to hold end - begin elements
    /// Fails with invalid_index unless 0 <= begin <= end <= size()
    [[nodiscard]] result<strided_vector, vector_error> slice(isize begin, isize end) const;

    /// Same as slice(begin, end) but with explicit options for the new container
    /// options.stride is ignored, the copy always has this container's stride
    [[nodiscard]] result<strided_vector, vector_error> slice(isize begin, isize end, vector_options options) const;

    /// Flat copy of all elements (materialized) in a new allocation of size() * stride() bytes
    /// An empty container yields an empty allocation
    [[nodiscard]] result<allocation, vector_error> to_array() const;

    // iteration
public:
    /// Restartable forward cursor over the elements, invalidated by mutation
    [[nodiscard]] cursor make_cursor();

    // locking
public:
    /// Explicit critical section spanning several calls (re-entrant, no-op when not thread-safe)
    /// Every lock() must be paired with an unlock() on the same thread
    void lock() const { _guard.lock(); }
    void unlock() const { _guard.unlock(); }

    /// Invokes f while holding the guard and returns its result
    template <class F>
    auto locked(F&& f) const
    {
        return _guard.lock(sr::forward<F>(f));
    }

    // lifecycle
public:
    strided_vector(strided_vector&& rhs) noexcept;
    strided_vector& operator=(strided_vector&& rhs) noexcept;
    strided_vector(strided_vector const&) = delete;
    strided_vector& operator=(strided_vector const&) = delete;

    /// Releases all values, then frees storage and guard
    ~strided_vector();

private:
    strided_vector() = default;

    // all impl_ functions expect the guard to be held
    [[nodiscard]] byte* impl_slot(isize index) const { return _storage.alloc_start + index * _options.stride; }
    [[nodiscard]] result<void, vector_error> impl_check_index(isize index) const;
    [[nodiscard]] bool impl_aliases_storage(span<byte const> value) const;
    [[nodiscard]] bool impl_reallocate(isize new_capacity);
    [[nodiscard]] bool impl_grow_for(isize required);
    void impl_materialize_into(byte* dst, isize index) const;
    [[nodiscard]] result<allocation, vector_error> impl_allocate_copy_buffer(isize bytes) const;

    result<owned_slot, vector_error> impl_materialize(isize index) const;
    result<void, vector_error> impl_add(isize index, span<byte const> value);
    result<void, vector_error> impl_set(isize index, span<byte const> value);
    result<owned_slot, vector_error> impl_pop(isize index);
    result<void, vector_error> impl_remove(isize index);
    void impl_erase_slot(isize index);
    void impl_release_all();

    guard _guard;
    allocation _storage;
    isize _size = 0;
    isize _capacity = 0;
    vector_options _options;
};

/// Forward cursor over a strided_vector
///
/// Usage:
///   auto c = vec.make_cursor();
///   while (c.has_next())
///       consume(c.next_borrowed());
///
/// Each step locks the container for its own duration only. Mutating the container during iteration
/// invalidates the cursor; bracket the loop with lock()/unlock() when other threads may mutate.
struct sr::strided_vector::cursor
{
    [[nodiscard]] bool has_next() const;

    /// Borrows the next slot, empty span when exhausted
    [[nodiscard]] span<byte> next_borrowed();

    /// Materializes the next slot, invalid_index when exhausted
    [[nodiscard]] result<owned_slot, vector_error> next_materialized();

    /// Restarts at the first element
    void reset() { _next = 0; }

    /// Index of the slot yielded last, -1 before the first step
    [[nodiscard]] isize index() const { return _next - 1; }

private:
    explicit cursor(strided_vector& vec) : _vector(&vec) {}

    strided_vector* _vector;
    isize _next = 0;

    friend strided_vector;
};
