#pragma once

#include <cstddef>
#include <cstdint>


namespace tn
{

//
// Primitives
//

// Explicitly-sized primitive types
// Used wherever the range matters for correctness or memory layout.
// Plain "int" is fine for small counts and loop counters.

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
// Sizes, offsets and element counts are signed:
// * layout arithmetic subtracts offsets and "size - 1" must not underflow into a huge value
// * overflow checks against the maximum allocation size are easier to state on a signed range
// * mixed signed/unsigned arithmetic is a classic source of subtle layout bugs
// * we only target 64-bit platforms, so i64 is plenty (the largest block is limited to isize max anyway)
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Memory
//

struct memory_resource;
struct memory_layout;
struct node_layout;
struct allocate_error;

//
// Views
//

template <class T>
struct span;

//
// Vocabulary
//

struct nullopt_t;
template <class T>
struct optional;
template <class T, class E>
struct result;

//
// Nodes
//

template <class Caps>
struct dyn;
struct debug_printable;
template <class Caps>
struct dyn_metadata;
template <class Caps>
struct dyn_ref;
template <class U>
struct payload_traits;

template <class Header, class U>
struct node_ptr;
template <class U>
struct header_opaque_node_ptr;
template <class U, class Structure>
struct maybe_uninit_node;

//
// Structures
//

template <class U>
struct thin_box;
template <class U>
struct linked_list;

} // namespace tn
