#include "to_string.hh"

#include <smart-runtime/growth_policy.hh>
#include <smart-runtime/runtime_context.hh>
#include <smart-runtime/strided_vector.hh>
#include <smart-runtime/vector_error.hh>

std::string sr::to_string(vector_error e)
{
    switch (e)
    {
    case vector_error::invalid_index:
        return "invalid_index";
    case vector_error::empty_container:
        return "empty_container";
    case vector_error::allocation_failure:
        return "allocation_failure";
    case vector_error::invalid_resize:
        return "invalid_resize";
    case vector_error::zero_stride:
        return "zero_stride";
    }
    return "vector_error(" + std::to_string(int(e)) + ")";
}

std::string sr::to_string(growth_policy p)
{
    switch (p)
    {
    case growth_policy::double_size:
        return "double_size";
    case growth_policy::linear:
        return "linear";
    case growth_policy::exact:
        return "exact";
    }
    return "growth_policy(" + std::to_string(int(p)) + ")";
}

std::string sr::to_string(strided_vector const& vec)
{
    return vec.locked(
        [&]
        {
            auto const bytes = vec.data();
            auto const stride = vec.stride();
            auto const& ctx = *vec.context();

            std::string text = "[";
            for (isize offset = 0; offset < bytes.size(); offset += stride)
            {
                if (offset > 0)
                    text += ", ";
                text += ctx.format(bytes.data() + offset, stride, ctx.userdata);
            }
            text += ']';
            return text;
        });
}
