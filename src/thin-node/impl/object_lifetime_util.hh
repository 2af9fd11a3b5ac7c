#pragma once

#include <thin-node/fwd.hh>
#include <thin-node/utility.hh>

#include <type_traits>

// Object lifetime helpers for array payloads.
// Node storage starts out uninitialized; these helpers begin and end object lifetimes inside it.
// All helpers that construct report progress through a T*& cursor so callers can roll back on exceptions.

namespace tn::impl
{
/// Calls destructors on [start, end) in reverse order.
/// Empty ranges (start == end) and nullptr are valid and result in a no-op.
/// Trivially destructible types are optimized out at compile time.
/// If a destructor throws, the remaining elements (those before it) are still destroyed
/// before the exception propagates.
template <class T>
void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        // continue with the rest if one element misbehaves
        TN_DEFER
        {
            while (end != start)
            {
                --end;
                end->~T();
            }
        };

        while (end != start)
        {
            --end;
            end->~T();
        }
    }
}

/// Copy-constructs objects from [src_start, src_end) using placement new.
/// dest_end is incremented for each successfully constructed object.
/// IMPORTANT: Assumes [*dest_end, *dest_end + (src_end - src_start)) is uninitialized memory.
/// If copy construction throws, dest_end points to the element that threw (not yet constructed).
/// Trivially copyable types are optimized to use memcpy at compile time.
///
/// Usage pattern:
///   auto obj_start = (T*)node.value_ptr();
///   auto obj_end = obj_start;
///   copy_create_objects_to(obj_end, src, src + count);
///   // [obj_start, obj_end) is now the constructed live range
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            tn::memcpy(dest_end, src_start, size * isize(sizeof(T)));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (tn::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs objects from [src_start, src_end) using placement new.
/// Same cursor protocol as copy_create_objects_to.
/// Trivially copyable types are optimized to use memcpy at compile time.
template <class T>
constexpr void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            tn::memcpy(dest_end, src_start, size * isize(sizeof(T)));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (tn::placement_new, dest_end) T(tn::move(*src_start));
            ++dest_end;
            ++src_start;
        }
    }
}

/// Copy-constructs [src_start, src_end) into uninitialized dest.
/// Either all elements are constructed, or (if a copy throws) every element constructed so far
/// is destroyed again before the exception propagates.
template <class T>
void copy_create_objects_or_rollback(T* dest, T const* src_start, T const* src_end)
{
    auto dest_end = dest;
    if constexpr (std::is_nothrow_copy_constructible_v<T>)
    {
        copy_create_objects_to(dest_end, src_start, src_end);
    }
    else
    {
        try
        {
            copy_create_objects_to(dest_end, src_start, src_end);
        }
        catch (...)
        {
            destroy_objects_in_reverse(dest, dest_end);
            throw;
        }
    }
}

/// Move-constructs [src_start, src_end) into uninitialized dest, with the same all-or-nothing guarantee
/// as copy_create_objects_or_rollback. Sources that were already moved from stay moved from.
template <class T>
void move_create_objects_or_rollback(T* dest, T* src_start, T* src_end)
{
    auto dest_end = dest;
    if constexpr (std::is_nothrow_move_constructible_v<T>)
    {
        move_create_objects_to(dest_end, src_start, src_end);
    }
    else
    {
        try
        {
            move_create_objects_to(dest_end, src_start, src_end);
        }
        catch (...)
        {
            destroy_objects_in_reverse(dest, dest_end);
            throw;
        }
    }
}

/// Moves [src, src + count) into uninitialized dest and ends the lifetime of the sources.
/// The source storage is uninitialized afterwards.
/// If a move throws, dest is left uninitialized and all sources stay alive.
template <class T>
void relocate_objects_to(T* dest, T* src, isize count)
{
    move_create_objects_or_rollback(dest, src, src + count);
    destroy_objects_in_reverse(src, src + count);
}
} // namespace tn::impl
