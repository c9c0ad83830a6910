#pragma once

#include <smart-runtime/assert.hh>
#include <smart-runtime/fwd.hh>

#include <cstring>
#include <type_traits>

/// Non-owning view over a contiguous sequence of T, similar to std::span.
/// Stores a pointer and runtime size.
/// The runtime containers hand out span<byte> for borrowed element slots: such a view is only valid
/// until the next mutating call on the container it was borrowed from.
template <class T>
struct sr::span
{
    // construction
public:
    /// Default span is empty: data() == nullptr, size() == 0.
    constexpr span() = default;

    // keep triviality
    constexpr span(span const&) = default;
    constexpr span(span&&) = default;
    constexpr span& operator=(span const&) = default;
    constexpr span& operator=(span&&) = default;
    constexpr ~span() = default;

    /// Creates a span viewing [ptr, ptr+size).
    /// Precondition: size >= 0.
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        SR_ASSERT(size >= 0, "span size must be non-negative");
    }

    /// Creates a span viewing [begin, end).
    /// Precondition: begin <= end.
    constexpr explicit span(T* begin, T* end) : _data(begin), _size(end - begin)
    {
        SR_ASSERT(begin <= end, "invalid pointer range");
    }

    /// Mutable-to-const conversion, e.g. span<byte> -> span<byte const>
    template <class U>
        requires(!std::is_same_v<U, T> && std::is_convertible_v<U (*)[], T (*)[]>)
    constexpr span(span<U> rhs) : _data(rhs.data()), _size(rhs.size())
    {
    }

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        SR_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // subviews
public:
    /// Returns the view [offset, offset + count).
    /// Precondition: the range lies within this span.
    [[nodiscard]] constexpr span subspan(isize offset, isize count) const
    {
        SR_ASSERT(0 <= offset && 0 <= count && offset + count <= _size, "subspan out of bounds");
        return span(_data + offset, count);
    }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
};

namespace sr
{
/// Views the object representation of a trivially copyable value.
/// This is how plain values are handed to the runtime containers:
///   vec.add_last(sr::as_bytes(i64(42)));
/// NOTE: the returned span references `value`, so temporaries are only safe within the full expression.
template <class T>
    requires std::is_trivially_copyable_v<T>
[[nodiscard]] span<byte const> as_bytes(T const& value)
{
    return span<byte const>(reinterpret_cast<byte const*>(&value), isize(sizeof(T)));
}

/// Reads a trivially copyable value back from a byte view (e.g. a borrowed slot).
/// Precondition: bytes.size() == sizeof(T).
/// Uses memcpy because slots of odd strides are not necessarily aligned for T.
template <class T>
    requires std::is_trivially_copyable_v<T> && std::is_default_constructible_v<T>
[[nodiscard]] T from_bytes(span<byte const> bytes)
{
    SR_ASSERT(bytes.size() == isize(sizeof(T)), "byte view size does not match the requested type");
    T value;
    std::memcpy(&value, bytes.data(), sizeof(T));
    return value;
}
} // namespace sr
