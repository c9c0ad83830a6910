#pragma once

#include <cstddef>
#include <cstdint>


namespace sr
{

//
// Primitives
//

// Explicitly-sized primitive types.
// Element strides, counts and indices are expressed in these types throughout the runtime library
// because compiled contracts exchange them across the ABI boundary with fixed widths.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// floating point
using f32 = float;
using f64 = double;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes, strides and indices are signed: "size - 1" on an empty container must not wrap around,
// and a negative index is an ordinary invalid index instead of a huge positive one.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
struct allocation;

//
// Views
//

template <class T>
struct span;

//
// Error handling
//

template <class E>
struct as_error_t;
template <class T, class E>
struct result;

enum class vector_error : u8;

//
// Runtime containers
//

enum class growth_policy : u8;

struct runtime_context;
struct guard;
struct owned_slot;
struct vector_options;
struct strided_vector;

} // namespace sr
