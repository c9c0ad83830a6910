#include "runtime_context.hh"

#include <smart-runtime/macros.hh>
#include <smart-runtime/span.hh>

#include <cstring>

namespace
{
void plain_materialize(sr::byte* dst, sr::byte const* src, sr::isize stride, void* userdata)
{
    SR_UNUSED(userdata);
    std::memcpy(dst, src, stride);
}

void plain_release(sr::byte* slot, sr::isize stride, void* userdata)
{
    SR_UNUSED(slot);
    SR_UNUSED(stride);
    SR_UNUSED(userdata);
}

std::string plain_format(sr::byte const* slot, sr::isize stride, void* userdata)
{
    SR_UNUSED(userdata);

    auto const bytes = sr::span<sr::byte const>(slot, stride);
    switch (stride)
    {
    case 1:
        return std::to_string(sr::from_bytes<sr::i8>(bytes));
    case 2:
        return std::to_string(sr::from_bytes<sr::i16>(bytes));
    case 4:
        return std::to_string(sr::from_bytes<sr::i32>(bytes));
    case 8:
        return std::to_string(sr::from_bytes<sr::i64>(bytes));
    default:
        break;
    }

    // 0x followed by the bytes in memory order
    constexpr char digits[] = "0123456789ABCDEF";
    std::string text = "0x";
    text.reserve(2 + 2 * stride);
    for (auto const b : bytes)
    {
        auto const v = static_cast<unsigned char>(b);
        text += digits[v >> 4];
        text += digits[v & 0xF];
    }
    return text;
}

constinit sr::runtime_context const plain_context = {
    .materialize = plain_materialize,
    .release = plain_release,
    .format = plain_format,
    .userdata = nullptr,
};
} // namespace

constinit sr::runtime_context const* const sr::plain_value_context = &plain_context;
