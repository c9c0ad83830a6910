#pragma once

#include <smart-runtime/fwd.hh>

/// Rule for the new capacity when an insert would exceed the current capacity.
/// Selected once at construction and immutable for the container's lifetime.
enum class sr::growth_policy : sr::u8
{
    /// max(capacity * 2, capacity + 1)
    double_size,

    /// capacity + increment, where the increment is the initial capacity chosen at construction
    linear,

    /// capacity + shortfall, i.e. exactly as much as needed without slack
    exact,
};

namespace sr
{
/// Computes the element capacity after growth so that at least `required` elements fit.
/// Returns `current_capacity` unchanged if `required` already fits.
///
/// One growth step is usually enough (a single insert has a shortfall of one), but bulk requests
/// apply the policy repeatedly until `required` fits. A linear increment of zero grows by one.
///
/// Examples:
///   next_capacity(growth_policy::double_size, 2, 2, 3) == 4
///   next_capacity(growth_policy::double_size, 0, 0, 1) == 1
///   next_capacity(growth_policy::linear, 4, 3, 5) == 7
///   next_capacity(growth_policy::exact, 4, 4, 9) == 9
[[nodiscard]] isize next_capacity(growth_policy policy, isize current_capacity, isize increment, isize required);
} // namespace sr
