#pragma once

#include <smart-runtime/assert.hh>
#include <smart-runtime/fwd.hh>
#include <smart-runtime/utility.hh>

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

// sr::result<T, E> is how the runtime library reports expected failures (see assert.hh for the split
// between assertions and results).
//
// Usage:
//   sr::result<sr::owned_slot, sr::vector_error> r = vec.pop_first();
//   if (r.has_error())
//       return sr::error(r.error());
//   use(r.value());
//
//   sr::result<void, sr::vector_error> f() { ...; return sr::success; }
//
// A default-constructed result holds a default-constructed error.
// Accessing value() of an error result (or error() of a value result) is an assertion failure.

/// Tag wrapper marking a value as the error alternative of a result.
/// Created via sr::error(e).
template <class E>
struct sr::as_error_t
{
    E value;
};

namespace sr
{
/// Wraps `e` so that it constructs the error alternative of any compatible result
template <class E>
[[nodiscard]] constexpr as_error_t<std::decay_t<E>> error(E&& e)
{
    return as_error_t<std::decay_t<E>>{sr::forward<E>(e)};
}

/// Tag for successful result<void, E>
struct success_t
{
};
inline constexpr success_t success = {};

namespace impl
{
template <class T>
struct is_result : std::false_type
{
};
template <class T, class E>
struct is_result<result<T, E>> : std::true_type
{
};

template <class T>
struct is_as_error : std::false_type
{
};
template <class E>
struct is_as_error<as_error_t<E>> : std::true_type
{
};
} // namespace impl
} // namespace sr

/// Sum type representing either a success value T or an error value E.
/// Stays trivially copyable when T and E are.
template <class T, class E>
struct sr::result
{
    static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not support references");

    // construction
public:
    /// Default result holds a default error
    constexpr result()
        requires std::is_default_constructible_v<E>
      : _data(std::in_place_index<1>)
    {
    }

    /// Constructs the value alternative
    template <class U = T>
        requires(std::is_constructible_v<T, U &&> && !impl::is_as_error<std::remove_cvref_t<U>>::value
                 && !impl::is_result<std::remove_cvref_t<U>>::value)
    constexpr result(U&& value) : _data(std::in_place_index<0>, sr::forward<U>(value))
    {
    }

    /// Constructs the error alternative from sr::error(...)
    template <class G>
        requires std::is_constructible_v<E, G&&>
    constexpr result(as_error_t<G>&& e) : _data(std::in_place_index<1>, sr::move(e.value))
    {
    }

    template <class G>
        requires std::is_constructible_v<E, G const&>
    constexpr result(as_error_t<G> const& e) : _data(std::in_place_index<1>, e.value)
    {
    }

    /// Converting constructor from a result with compatible value and error types
    template <class T2, class E2>
        requires(!std::is_same_v<result<T2, E2>, result> && std::is_constructible_v<T, T2 &&> && std::is_constructible_v<E, E2 &&>)
    constexpr explicit result(result<T2, E2>&& rhs)
      : _data(rhs.has_value() ? variant_t(std::in_place_index<0>, sr::move(rhs).value())
                              : variant_t(std::in_place_index<1>, sr::move(rhs).error()))
    {
    }

    // observers
public:
    [[nodiscard]] constexpr bool has_value() const { return _data.index() == 0; }
    [[nodiscard]] constexpr bool has_error() const { return _data.index() == 1; }

    [[nodiscard]] constexpr T& value() &
    {
        SR_ASSERT(has_value(), "result holds an error");
        return *std::get_if<0>(&_data);
    }
    [[nodiscard]] constexpr T const& value() const&
    {
        SR_ASSERT(has_value(), "result holds an error");
        return *std::get_if<0>(&_data);
    }
    [[nodiscard]] constexpr T&& value() &&
    {
        SR_ASSERT(has_value(), "result holds an error");
        return sr::move(*std::get_if<0>(&_data));
    }

    [[nodiscard]] constexpr E& error() &
    {
        SR_ASSERT(has_error(), "result holds a value");
        return *std::get_if<1>(&_data);
    }
    [[nodiscard]] constexpr E const& error() const&
    {
        SR_ASSERT(has_error(), "result holds a value");
        return *std::get_if<1>(&_data);
    }
    [[nodiscard]] constexpr E&& error() &&
    {
        SR_ASSERT(has_error(), "result holds a value");
        return sr::move(*std::get_if<1>(&_data));
    }

    template <class U>
    [[nodiscard]] constexpr T value_or(U&& fallback) const&
    {
        return has_value() ? value() : static_cast<T>(sr::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] constexpr T value_or(U&& fallback) &&
    {
        return has_value() ? sr::move(*this).value() : static_cast<T>(sr::forward<U>(fallback));
    }

    template <class U>
    [[nodiscard]] constexpr E error_or(U&& fallback) const&
    {
        return has_error() ? error() : static_cast<E>(sr::forward<U>(fallback));
    }
    template <class U>
    [[nodiscard]] constexpr E error_or(U&& fallback) &&
    {
        return has_error() ? sr::move(*this).error() : static_cast<E>(sr::forward<U>(fallback));
    }

    // modifiers
public:
    /// Destroys the current alternative and constructs a value in place
    template <class... Args>
    constexpr T& emplace_value(Args&&... args)
    {
        return _data.template emplace<0>(sr::forward<Args>(args)...);
    }

    /// Destroys the current alternative and constructs an error in place
    template <class... Args>
    constexpr E& emplace_error(Args&&... args)
    {
        return _data.template emplace<1>(sr::forward<Args>(args)...);
    }

private:
    using variant_t = std::variant<T, E>;
    variant_t _data;
};

/// Result of an operation without a success payload.
template <class E>
struct sr::result<void, E>
{
    // construction
public:
    /// Default result holds a default error
    constexpr result()
        requires std::is_default_constructible_v<E>
      : _error(std::in_place)
    {
    }

    constexpr result(success_t) {}

    template <class G>
        requires std::is_constructible_v<E, G&&>
    constexpr result(as_error_t<G>&& e) : _error(std::in_place, sr::move(e.value))
    {
    }

    template <class G>
        requires std::is_constructible_v<E, G const&>
    constexpr result(as_error_t<G> const& e) : _error(std::in_place, e.value)
    {
    }

    // observers
public:
    [[nodiscard]] constexpr bool has_value() const { return !_error.has_value(); }
    [[nodiscard]] constexpr bool has_error() const { return _error.has_value(); }

    /// Asserts success, mirrors result<T, E>::value()
    constexpr void value() const { SR_ASSERT(has_value(), "result holds an error"); }

    [[nodiscard]] constexpr E& error() &
    {
        SR_ASSERT(has_error(), "result holds a value");
        return *_error;
    }
    [[nodiscard]] constexpr E const& error() const&
    {
        SR_ASSERT(has_error(), "result holds a value");
        return *_error;
    }
    [[nodiscard]] constexpr E&& error() &&
    {
        SR_ASSERT(has_error(), "result holds a value");
        return sr::move(*_error);
    }

    template <class U>
    [[nodiscard]] constexpr E error_or(U&& fallback) const&
    {
        return has_error() ? *_error : static_cast<E>(sr::forward<U>(fallback));
    }

    // modifiers
public:
    constexpr void emplace_value() { _error.reset(); }

    template <class... Args>
    constexpr E& emplace_error(Args&&... args)
    {
        return _error.emplace(sr::forward<Args>(args)...);
    }

private:
    std::optional<E> _error;
};
