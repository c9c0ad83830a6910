#include "strided_vector.hh"

#include <smart-runtime/assert.hh>
#include <smart-runtime/runtime_context.hh>
#include <smart-runtime/utility.hh>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <functional>

namespace
{
// slots are handed out as raw bytes, callers may reinterpret them as any scalar
constexpr sr::isize slot_alignment = alignof(std::max_align_t);
} // namespace

//
// factories
//

sr::result<sr::strided_vector, sr::vector_error> sr::strided_vector::create(vector_options const& options)
{
    if (options.stride <= 0)
        return sr::error(vector_error::zero_stride);

    if (options.initial_capacity < 0)
        return sr::error(vector_error::invalid_resize);

    strided_vector vec;
    vec._options = options;
    if (vec._options.context == nullptr)
        vec._options.context = sr::plain_value_context;
    if (vec._options.resource == nullptr)
        vec._options.resource = sr::default_memory_resource;

    if (!vec.impl_reallocate(options.initial_capacity))
        return sr::error(vector_error::allocation_failure);

    // guard last so that a failed allocation does not create one
    vec._guard = guard(options.thread_safe);

    return sr::move(vec);
}

//
// queries
//

sr::isize sr::strided_vector::size() const
{
    return locked([&] { return _size; });
}

bool sr::strided_vector::empty() const
{
    return locked([&] { return _size == 0; });
}

sr::isize sr::strided_vector::capacity() const
{
    return locked([&] { return _capacity; });
}

sr::isize sr::strided_vector::capacity_bytes() const
{
    // capacity * stride never overflows, it was checked when the storage was allocated
    return locked([&] { return _capacity * _options.stride; });
}

bool sr::strided_vector::is_managed() const
{
    return _options.context != sr::plain_value_context;
}

sr::span<sr::byte> sr::strided_vector::data()
{
    return locked([&] { return span<byte>(_storage.alloc_start, _size * _options.stride); });
}

sr::span<sr::byte const> sr::strided_vector::data() const
{
    return locked([&] { return span<byte const>(_storage.alloc_start, _size * _options.stride); });
}

//
// capacity
//

sr::result<void, sr::vector_error> sr::strided_vector::resize(isize new_capacity)
{
    auto const lock = _guard.scoped();

    if (new_capacity < _size)
        return sr::error(vector_error::invalid_resize);

    if (new_capacity == _capacity)
        return sr::success;

    if (!impl_reallocate(new_capacity))
        return sr::error(vector_error::allocation_failure);

    return sr::success;
}

//
// insertion
//

sr::result<void, sr::vector_error> sr::strided_vector::add_first(span<byte const> value)
{
    auto const lock = _guard.scoped();
    return impl_add(0, value);
}

sr::result<void, sr::vector_error> sr::strided_vector::add_last(span<byte const> value)
{
    auto const lock = _guard.scoped();
    return impl_add(_size, value);
}

sr::result<void, sr::vector_error> sr::strided_vector::add_at(isize index, span<byte const> value)
{
    auto const lock = _guard.scoped();
    return impl_add(index, value);
}

//
// borrowing reads
//

sr::result<sr::span<sr::byte>, sr::vector_error> sr::strided_vector::borrow_first()
{
    auto const lock = _guard.scoped();
    return borrow_at(0);
}

sr::result<sr::span<sr::byte>, sr::vector_error> sr::strided_vector::borrow_last()
{
    auto const lock = _guard.scoped();
    return borrow_at(_size - 1);
}

sr::result<sr::span<sr::byte>, sr::vector_error> sr::strided_vector::borrow_at(isize index)
{
    auto const lock = _guard.scoped();

    if (auto const r = impl_check_index(index); r.has_error())
        return sr::error(r.error());

    return span<byte>(impl_slot(index), _options.stride);
}

sr::result<sr::span<sr::byte const>, sr::vector_error> sr::strided_vector::borrow_first() const
{
    auto const lock = _guard.scoped();
    return borrow_at(0);
}

sr::result<sr::span<sr::byte const>, sr::vector_error> sr::strided_vector::borrow_last() const
{
    auto const lock = _guard.scoped();
    return borrow_at(_size - 1);
}

sr::result<sr::span<sr::byte const>, sr::vector_error> sr::strided_vector::borrow_at(isize index) const
{
    auto const lock = _guard.scoped();

    if (auto const r = impl_check_index(index); r.has_error())
        return sr::error(r.error());

    return span<byte const>(impl_slot(index), _options.stride);
}

//
// materializing reads
//

sr::result<sr::owned_slot, sr::vector_error> sr::strided_vector::materialize_first() const
{
    auto const lock = _guard.scoped();
    return impl_materialize(0);
}

sr::result<sr::owned_slot, sr::vector_error> sr::strided_vector::materialize_last() const
{
    auto const lock = _guard.scoped();
    return impl_materialize(_size - 1);
}

sr::result<sr::owned_slot, sr::vector_error> sr::strided_vector::materialize_at(isize index) const
{
    auto const lock = _guard.scoped();
    return impl_materialize(index);
}

//
// overwriting
//

sr::result<void, sr::vector_error> sr::strided_vector::set_first(span<byte const> value)
{
    auto const lock = _guard.scoped();
    return impl_set(0, value);
}

sr::result<void, sr::vector_error> sr::strided_vector::set_last(span<byte const> value)
{
    auto const lock = _guard.scoped();
    return impl_set(_size - 1, value);
}

sr::result<void, sr::vector_error> sr::strided_vector::set_at(isize index, span<byte const> value)
{
    auto const lock = _guard.scoped();
    return impl_set(index, value);
}

sr::result<void, sr::vector_error> sr::strided_vector::set_data(span<byte const> bytes)
{
    SR_ASSERT(!is_managed(), "set_data bypasses value release and is only allowed for plain values");
    SR_ASSERT_ALWAYS(bytes.size() % _options.stride == 0, "set_data needs a whole number of elements");

    auto const lock = _guard.scoped();

    auto const count = bytes.size() / _options.stride;
    auto const count_bytes = count * _options.stride;
    if (count > _capacity)
    {
        // the new block is filled before the old one is freed, so bytes may alias the current storage
        auto storage = allocation::try_create_bytes(count_bytes, slot_alignment, _options.resource);
        if (!storage.is_valid())
            return sr::error(vector_error::allocation_failure);

        std::memcpy(storage.alloc_start, bytes.data(), count_bytes);
        _storage = sr::move(storage);
        _capacity = count;
    }
    else if (count > 0)
    {
        std::memmove(_storage.alloc_start, bytes.data(), count_bytes);
    }

    _size = count;
    return sr::success;
}

//
// removal
//

sr::result<sr::owned_slot, sr::vector_error> sr::strided_vector::pop_first()
{
    auto const lock = _guard.scoped();
    return impl_pop(0);
}

sr::result<sr::owned_slot, sr::vector_error> sr::strided_vector::pop_last()
{
    auto const lock = _guard.scoped();
    return impl_pop(_size - 1);
}

sr::result<sr::owned_slot, sr::vector_error> sr::strided_vector::pop_at(isize index)
{
    auto const lock = _guard.scoped();
    return impl_pop(index);
}

sr::result<void, sr::vector_error> sr::strided_vector::remove_first()
{
    auto const lock = _guard.scoped();
    return impl_remove(0);
}

sr::result<void, sr::vector_error> sr::strided_vector::remove_last()
{
    auto const lock = _guard.scoped();
    return impl_remove(_size - 1);
}

sr::result<void, sr::vector_error> sr::strided_vector::remove_at(isize index)
{
    auto const lock = _guard.scoped();
    return impl_remove(index);
}

//
// whole-container operations
//

void sr::strided_vector::reverse()
{
    auto const lock = _guard.scoped();

    auto const stride = _options.stride;
    for (isize lo = 0, hi = _size - 1; lo < hi; ++lo, --hi)
    {
        auto const a = impl_slot(lo);
        std::swap_ranges(a, a + stride, impl_slot(hi));
    }
}

void sr::strided_vector::clear()
{
    auto const lock = _guard.scoped();
    impl_release_all();
}

//
// copies
//

sr::result<sr::strided_vector, sr::vector_error> sr::strided_vector::slice(isize begin, isize end) const
{
    return slice(begin, end, _options);
}

sr::result<sr::strided_vector, sr::vector_error> sr::strided_vector::slice(isize begin, isize end, vector_options options) const
{
    auto const lock = _guard.scoped();

    if (begin < 0 || end < begin || end > _size)
        return sr::error(vector_error::invalid_index);

    auto const count = end - begin;
    options.stride = _options.stride;

    auto res = create(options);
    if (res.has_error())
        return res;

    // initial_capacity doubles as the linear increment, so the copy grows its storage instead
    auto& copy = res.value();
    if (count > copy._capacity && !copy.impl_reallocate(count))
        return sr::error(vector_error::allocation_failure);

    for (isize i = begin; i < end; ++i)
        impl_materialize_into(copy.impl_slot(i - begin), i);
    copy._size = count;

    return res;
}

sr::result<sr::allocation, sr::vector_error> sr::strided_vector::to_array() const
{
    auto const lock = _guard.scoped();

    auto res = impl_allocate_copy_buffer(_size * _options.stride);
    if (res.has_error())
        return res;

    auto const dst = res.value().alloc_start;
    for (isize i = 0; i < _size; ++i)
        impl_materialize_into(dst + i * _options.stride, i);

    return res;
}

//
// iteration
//

sr::strided_vector::cursor sr::strided_vector::make_cursor()
{
    return cursor(*this);
}

bool sr::strided_vector::cursor::has_next() const
{
    return _next < _vector->size();
}

sr::span<sr::byte> sr::strided_vector::cursor::next_borrowed()
{
    auto const res = _vector->borrow_at(_next);
    if (res.has_error())
        return {};

    ++_next;
    return res.value();
}

sr::result<sr::owned_slot, sr::vector_error> sr::strided_vector::cursor::next_materialized()
{
    auto res = _vector->materialize_at(_next);
    if (res.has_error())
        return sr::error(_next >= _vector->size() ? vector_error::invalid_index : res.error());

    ++_next;
    return res;
}

//
// lifecycle
//

sr::strided_vector::strided_vector(strided_vector&& rhs) noexcept
  : _guard(sr::move(rhs._guard)),
    _storage(sr::move(rhs._storage)),
    _size(sr::exchange(rhs._size, 0)),
    _capacity(sr::exchange(rhs._capacity, 0)),
    _options(rhs._options)
{
}

sr::strided_vector& sr::strided_vector::operator=(strided_vector&& rhs) noexcept
{
    if (this != &rhs)
    {
        {
            auto const lock = _guard.scoped();
            impl_release_all();
        }

        _guard = sr::move(rhs._guard);
        _storage = sr::move(rhs._storage);
        _size = sr::exchange(rhs._size, 0);
        _capacity = sr::exchange(rhs._capacity, 0);
        _options = rhs._options;
    }
    return *this;
}

sr::strided_vector::~strided_vector()
{
    auto const lock = _guard.scoped();
    impl_release_all();
}

//
// implementation
//

sr::result<void, sr::vector_error> sr::strided_vector::impl_check_index(isize index) const
{
    if (_size == 0)
        return sr::error(vector_error::empty_container);

    if (index < 0 || index >= _size)
        return sr::error(vector_error::invalid_index);

    return sr::success;
}

bool sr::strided_vector::impl_aliases_storage(span<byte const> value) const
{
    if (!_storage.is_valid() || value.empty())
        return false;

    // std::less gives a total order even for unrelated pointers
    auto const less = std::less<byte const*>();
    return !less(value.data(), _storage.alloc_start) && less(value.data(), _storage.alloc_end);
}

bool sr::strided_vector::impl_reallocate(isize new_capacity)
{
    SR_ASSERT(new_capacity >= _size, "reallocation would drop elements");

    isize bytes = 0;
    if (!sr::checked_mul(new_capacity, _options.stride, bytes))
        return false;

    auto storage = allocation::try_create_bytes(bytes, slot_alignment, _options.resource);
    if (bytes > 0 && !storage.is_valid())
        return false;

    if (_size > 0)
        std::memcpy(storage.alloc_start, _storage.alloc_start, _size * _options.stride);

    _storage = sr::move(storage);
    _capacity = new_capacity;
    return true;
}

bool sr::strided_vector::impl_grow_for(isize required)
{
    if (required <= _capacity)
        return true;

    auto const new_capacity = sr::next_capacity(_options.policy, _capacity, _options.initial_capacity, required);
    return impl_reallocate(new_capacity);
}

void sr::strided_vector::impl_materialize_into(byte* dst, isize index) const
{
    auto const& ctx = *_options.context;
    ctx.materialize(dst, impl_slot(index), _options.stride, ctx.userdata);
}

sr::result<sr::allocation, sr::vector_error> sr::strided_vector::impl_allocate_copy_buffer(isize bytes) const
{
    auto storage = allocation::try_create_bytes(bytes, slot_alignment, _options.resource);
    if (bytes > 0 && !storage.is_valid())
        return sr::error(vector_error::allocation_failure);

    return sr::move(storage);
}

sr::result<sr::owned_slot, sr::vector_error> sr::strided_vector::impl_materialize(isize index) const
{
    if (auto const r = impl_check_index(index); r.has_error())
        return sr::error(r.error());

    auto buffer = impl_allocate_copy_buffer(_options.stride);
    if (buffer.has_error())
        return sr::error(buffer.error());

    impl_materialize_into(buffer.value().alloc_start, index);
    return owned_slot::adopt(sr::move(buffer).value(), _options.context);
}

sr::result<void, sr::vector_error> sr::strided_vector::impl_add(isize index, span<byte const> value)
{
    SR_ASSERT(value.size() == _options.stride, "value size must match the element stride");

    if (index < 0 || index > _size)
        return sr::error(vector_error::invalid_index);

    // growing frees the current storage, so a value that lives inside it is copied out first
    allocation value_copy;
    if (_size == _capacity && impl_aliases_storage(value))
    {
        auto buffer = impl_allocate_copy_buffer(value.size());
        if (buffer.has_error())
            return sr::error(buffer.error());

        value_copy = sr::move(buffer).value();
        std::memcpy(value_copy.alloc_start, value.data(), value.size());
        value = span<byte const>(value_copy.alloc_start, value_copy.alloc_end);
    }

    if (!impl_grow_for(_size + 1))
        return sr::error(vector_error::allocation_failure);

    auto const stride = _options.stride;
    auto const slot = impl_slot(index);

    // a value inside the shifted tail moves up by one slot
    auto src = value.data();
    if (impl_aliases_storage(value) && src >= slot)
        src += stride;

    std::memmove(slot + stride, slot, (_size - index) * stride);
    std::memmove(slot, src, stride);
    ++_size;

    return sr::success;
}

sr::result<void, sr::vector_error> sr::strided_vector::impl_set(isize index, span<byte const> value)
{
    SR_ASSERT(value.size() == _options.stride, "value size must match the element stride");

    if (auto const r = impl_check_index(index); r.has_error())
        return sr::error(r.error());

    auto const slot = impl_slot(index);
    if (value.data() == slot)
        return sr::success; // storing the value that is already there must not release it

    auto const& ctx = *_options.context;
    ctx.release(slot, _options.stride, ctx.userdata);
    std::memmove(slot, value.data(), _options.stride);

    return sr::success;
}

sr::result<sr::owned_slot, sr::vector_error> sr::strided_vector::impl_pop(isize index)
{
    if (auto const r = impl_check_index(index); r.has_error())
        return sr::error(r.error());

    auto buffer = impl_allocate_copy_buffer(_options.stride);
    if (buffer.has_error())
        return sr::error(buffer.error());

    // the stored reference moves to the caller unchanged
    auto storage = sr::move(buffer).value();
    std::memcpy(storage.alloc_start, impl_slot(index), _options.stride);
    impl_erase_slot(index);

    return owned_slot::adopt(sr::move(storage), _options.context);
}

sr::result<void, sr::vector_error> sr::strided_vector::impl_remove(isize index)
{
    if (auto const r = impl_check_index(index); r.has_error())
        return sr::error(r.error());

    auto const& ctx = *_options.context;
    ctx.release(impl_slot(index), _options.stride, ctx.userdata);
    impl_erase_slot(index);

    return sr::success;
}

void sr::strided_vector::impl_erase_slot(isize index)
{
    auto const stride = _options.stride;
    auto const slot = impl_slot(index);
    std::memmove(slot, slot + stride, (_size - index - 1) * stride);
    --_size;
}

void sr::strided_vector::impl_release_all()
{
    if (_size > 0 && is_managed())
    {
        auto const& ctx = *_options.context;
        for (isize i = 0; i < _size; ++i)
            ctx.release(impl_slot(i), _options.stride, ctx.userdata);
    }
    _size = 0;
}
