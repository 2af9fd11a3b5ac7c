#pragma once

#include <thin-node/assert.hh>
#include <thin-node/fwd.hh>

#include <cstring>
#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Comparison:
//   max(a, b)                   - returns the larger of two values (requires operator<)
//   min(a, b)                   - returns the smaller of two values (requires operator<)
//
// Alignment (value or pointer):
//   is_power_of_two(value)           - check if value is a power of 2
//   align_up(value, alignment)       - increment to next aligned boundary (power of 2)
//   align_up_masked(value, mask)     - increment using pre-computed mask
//   is_aligned(value, alignment)     - check if aligned at boundary (power of 2)
//
// Raw memory:
//   memcpy(dest, src, bytes)         - byte copy with signed size, no-op for bytes == 0
//   placement_new                    - tag for constructing objects in raw node storage
//   storage_for<T>                   - uninitialized storage with size and alignment of T
//
// Template metaprogramming:
//   always_false_t<T...>             - always false for static_assert with type parameters
//   function_ptr<Signature>          - convert function signature to function pointer type
//
// Scope utilities:
//   TN_DEFER { code }                - execute code at scope-exit (RAII cleanup)
//

namespace tn
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
template <class T>
[[nodiscard]] TN_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
template <class T>
[[nodiscard]] TN_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] TN_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto next = tn::exchange(node.next, nullptr);  // detach and take the link
template <class T, class U = T>
[[nodiscard]] TN_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// Returns the larger of two values using operator<
/// When a == b, max returns b (consistent with min returning a)
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Returns the smaller of two values using operator<
template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Alignment (for values or pointers)
// =========================================================================================================

/// Check if a positive value is a power of two
/// Preconditions:
///   value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    TN_ASSERT(value > 0, "is_power_of_two: value must be positive");
    return (value & (value - 1)) == 0;
}

/// Increment value to align at the given pre-computed mask
/// mask should be (alignment - 1) where alignment is a power of 2
template <class T>
[[nodiscard]] constexpr T align_up_masked(T value, isize mask)
{
    return (T)(((isize)value + mask) & ~mask);
}

/// Increment value to align at the given boundary
/// Usage:
///   int val = tn::align_up(300, 16);             // = 304 (next multiple of 16)
/// Corner cases:
///   value already aligned: returns value unchanged
///   alignment == 1: returns value unchanged
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
template <class T>
[[nodiscard]] constexpr T align_up(T value, isize alignment)
{
    TN_ASSERT(alignment > 0 && is_power_of_two(alignment), "align_up: alignment must be a power of 2");
    return align_up_masked(value, alignment - 1);
}

/// Check if value is aligned at the given boundary
/// Preconditions:
///   alignment > 0 and alignment must be a power of 2
template <class T>
[[nodiscard]] constexpr bool is_aligned(T value, isize alignment)
{
    TN_ASSERT(alignment > 0 && is_power_of_two(alignment), "is_aligned: alignment must be a power of 2");
    return 0 == ((isize)value & (alignment - 1));
}

// =========================================================================================================
// Raw memory
// =========================================================================================================

/// Copies `bytes` bytes from src to dest (regions must not overlap)
/// bytes == 0 is a no-op and allows null pointers
inline void memcpy(void* dest, void const* src, isize bytes)
{
    TN_ASSERT(bytes >= 0, "memcpy: byte count must be non-negative");
    if (bytes > 0)
        std::memcpy(dest, src, size_t(bytes));
}

/// Tag type selecting the placement operator new declared below
/// Usage:
///   new (tn::placement_new, node.value_ptr()) T(args...);
struct placement_new_t
{
};
constexpr placement_new_t placement_new{};

/// Uninitialized storage with proper size and alignment for T
/// The member is not constructed or destroyed automatically; the owner manages its lifetime
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}
    constexpr ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    constexpr ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

// =========================================================================================================
// Template metaprogramming utilities
// =========================================================================================================

/// Helper for indicating errors in static_asserts with dependent types
template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr should only be used with function signatures");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
template <class R, class... Args>
struct function_ptr_t<R(Args...) noexcept>
{
    using type = R (*)(Args...) noexcept;
};
} // namespace impl

/// Type alias for readable function pointer types
/// Usage:
///   tn::function_ptr<void(void* value)>           -> void (*)(void*)
///   tn::function_ptr<void() noexcept>             -> void (*)() noexcept
template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;

// =========================================================================================================
// Scope utilities
// =========================================================================================================

namespace impl
{
template <class F>
struct deferred
{
    F f;
    explicit deferred(F func) : f(static_cast<F&&>(func)) {}
    ~deferred() noexcept(false) { f(); }

    deferred(deferred const&) = delete;
    deferred& operator=(deferred const&) = delete;
    deferred(deferred&&) = delete;
    deferred& operator=(deferred&&) = delete;
};

struct deferred_tag
{
};

template <class F>
deferred<F> operator+(deferred_tag, F&& f)
{
    return deferred<F>(tn::forward<F>(f));
}
} // namespace impl

/// Execute code at scope-exit (RAII-style cleanup), including exits by exception
/// Captures by reference - be careful with lifetime
/// Usage:
///   TN_DEFER { node.deallocate(resource); };
///   destroy_value(node); // may throw, node is released either way
#define TN_DEFER auto const TN_MACRO_JOIN(_tn_deferred_, __COUNTER__) = ::tn::impl::deferred_tag{} + [&]

} // namespace tn

[[nodiscard]] inline void* operator new(std::size_t, tn::placement_new_t, void* ptr) noexcept
{
    return ptr;
}
inline void operator delete(void*, tn::placement_new_t, void*) noexcept {}
