#pragma once

#include <cstddef>
#include <cstdint>


namespace rc
{

//
// Primitives
//

// Explicitly-sized primitive types
// We use these wherever the range matters for correctness or memory layout
// and happily fall back to "int" for small counts and loop counters.

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
// Sizes and indices are signed i64 throughout ring-core.
// Circular index arithmetic subtracts and wraps a lot ("front - 1", "size + i" for negative indices),
// which is exactly where unsigned sizes silently underflow into huge positive numbers.
// Negative logical indices are part of the public API (-1 is the back element), so a signed type
// is the only honest choice here.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Views
//

template <class T>
struct span;

//
// Memory
//

struct memory_resource;
template <class T>
struct allocation;

//
// Vocabulary types
//

struct nullopt_t;
template <class T>
struct optional;

template <class E>
struct as_error_t;
template <class T, class E>
struct result;

//
// Errors
//

enum class error_kind : u8;
struct circular_array_error;

//
// Container
//

struct slice;

template <class T>
struct snapshot;

template <class T>
struct circular_array;

} // namespace rc
