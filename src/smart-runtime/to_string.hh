#pragma once

#include <smart-runtime/fwd.hh>

#include <string>

namespace sr
{
// e.g. "invalid_index"
[[nodiscard]] std::string to_string(vector_error e);

// e.g. "double_size"
[[nodiscard]] std::string to_string(growth_policy p);

// "[e0, e1, ...]", elements rendered by the container's runtime context
// the container is locked for the whole rendering
[[nodiscard]] std::string to_string(strided_vector const& vec);
} // namespace sr
