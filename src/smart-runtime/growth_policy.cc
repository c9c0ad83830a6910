#include "growth_policy.hh"

#include <smart-runtime/assert.hh>
#include <smart-runtime/utility.hh>

sr::isize sr::next_capacity(growth_policy policy, isize current_capacity, isize increment, isize required)
{
    SR_ASSERT(current_capacity >= 0, "capacity must be non-negative");
    SR_ASSERT(increment >= 0, "increment must be non-negative");

    auto capacity = current_capacity;
    while (capacity < required)
    {
        switch (policy)
        {
        case growth_policy::double_size:
            capacity = sr::max(capacity * 2, capacity + 1);
            break;
        case growth_policy::linear:
            capacity += sr::max(increment, isize(1));
            break;
        case growth_policy::exact:
            capacity = required;
            break;
        default:
            SR_BUILTIN_UNREACHABLE;
        }
    }

    return capacity;
}
