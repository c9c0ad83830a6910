#pragma once

#include <smart-runtime/fwd.hh>

/// Failure kinds reported by sr::strided_vector operations.
/// All of them are returned synchronously through sr::result; none is retried internally.
enum class sr::vector_error : sr::u8
{
    /// position outside the valid range of the requested operation
    /// ([0, size] for insertion, [0, size) otherwise, begin <= end <= size for slices)
    invalid_index,

    /// read, pop or remove on a container without elements
    empty_container,

    /// growth, construction or a materialized copy could not obtain memory
    /// the container is left in its prior state
    allocation_failure,

    /// explicit resize below the current element count
    invalid_resize,

    /// construction with a stride of zero bytes
    zero_stride,
};
