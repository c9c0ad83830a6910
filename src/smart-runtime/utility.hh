#pragma once

#include <smart-runtime/assert.hh>
#include <smart-runtime/fwd.hh>

#include <limits>
#include <type_traits>

// =========================================================================================================
// Utility functions
// =========================================================================================================
//
// Value category:
//   move(value)                 - cast to rvalue reference
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace value and return old value
//
// Comparison:
//   max(a, b) / min(a, b)       - larger / smaller of two values
//
// Integer arithmetic:
//   is_power_of_two(v)          - true iff v is a positive power of two
//   checked_mul(a, b, out)      - multiplication that reports overflow instead of wrapping
//

namespace sr
{
template <class T>
[[nodiscard]] SR_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

template <class T>
[[nodiscard]] SR_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] SR_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto ptr = sr::exchange(p, nullptr);     // take ownership of p, set p to null
template <class T, class U = T>
[[nodiscard]] SR_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = sr::move(obj);
    obj = sr::forward<U>(new_val);
    return old_val;
}

/// Returns the larger of two values using operator<
/// When a == b, max returns b
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return (b < a) ? a : b;
}

/// Returns the smaller of two values using operator<
/// When a == b, min returns a
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return (b < a) ? b : a;
}

/// True iff v is a positive power of two (1, 2, 4, ...)
[[nodiscard]] constexpr bool is_power_of_two(isize v)
{
    return v > 0 && (v & (v - 1)) == 0;
}

/// Computes a * b for non-negative operands
/// Returns false (and leaves out untouched) if the product does not fit into isize
/// Used for stride * count byte sizes that come from contract-controlled values
[[nodiscard]] constexpr bool checked_mul(isize a, isize b, isize& out)
{
    SR_ASSERT(a >= 0 && b >= 0, "checked_mul expects non-negative operands");
    if (a != 0 && b > std::numeric_limits<isize>::max() / a)
        return false;
    out = a * b;
    return true;
}
} // namespace sr
