#pragma once

#include <thin-node/allocate_error.hh>
#include <thin-node/fwd.hh>
#include <thin-node/impl/object_lifetime_util.hh>
#include <thin-node/memory_layout.hh>
#include <thin-node/node_layout.hh>
#include <thin-node/result.hh>
#include <thin-node/span.hh>
#include <thin-node/utility.hh>

#include <concepts>
#include <type_traits>

// =========================================================================================================
// Payload shapes
// =========================================================================================================
//
// A node payload U is one of:
//
//   T            fixed       no metadata stored                 view: T&
//   T[]          array       element count (isize) stored       view: tn::span<T>
//   dyn<Caps>    open-ended  dyn_metadata<Caps> const* stored   view: tn::dyn_ref<Caps>
//
// Metadata is written into the node at allocation time and read back whenever the node needs its
// size (deallocation, views). Handles never carry it, which is what keeps them a single address.
//
// Open-ended payloads erase a concrete type T behind a capability table Caps:
// a POD of function pointers (the same style as tn::memory_resource) with a factory
//
//   template <class T> static constexpr Caps make_for();
//
// tn::widen<Caps, T>() returns the static descriptor {size, alignment, destroy, relocate, caps}
// for T. There is exactly one descriptor per (Caps, T) pair, so descriptor identity doubles as a
// type check for downcasts.

namespace tn
{
enum class payload_shape : u8
{
    fixed,
    array,
    open_ended,
};

/// Capability table without any capabilities.
/// dyn<no_capabilities> can still be destroyed, relocated and downcast.
struct no_capabilities
{
    template <class T>
    static constexpr no_capabilities make_for()
    {
        return {};
    }
};

/// Caps can describe values of type T in an open-ended payload.
template <class Caps, class T>
concept capabilities_for = std::is_trivially_copyable_v<Caps> && std::is_object_v<T> && !std::is_array_v<T>
                        && requires {
                               { Caps::template make_for<T>() } -> std::same_as<Caps>;
                           };
} // namespace tn

/// Descriptor of a concrete type widened into dyn<Caps>.
/// Instances are static (see tn::widen); nodes store a pointer to one.
template <class Caps>
struct tn::dyn_metadata
{
    isize size = 0;
    isize alignment = 1;

    /// Ends the lifetime of the value. nullptr for trivially destructible types.
    tn::function_ptr<void(void* value)> destroy = nullptr;

    /// Move-constructs into uninitialized `dest`, then destroys `src`.
    /// nullptr for types that are not move constructible.
    tn::function_ptr<void(void* dest, void* src)> relocate = nullptr;

    Caps caps = {};

    [[nodiscard]] constexpr memory_layout layout() const { return {size, alignment}; }
};

namespace tn::impl
{
template <class T>
void dyn_destroy(void* value)
{
    static_cast<T*>(value)->~T();
}

template <class T>
void dyn_relocate(void* dest, void* src)
{
    auto& src_value = *static_cast<T*>(src);
    new (tn::placement_new, dest) T(tn::move(src_value));
    src_value.~T();
}

template <class Caps, class T>
constexpr dyn_metadata<Caps> make_dyn_metadata()
{
    dyn_metadata<Caps> m;
    m.size = isize(sizeof(T));
    m.alignment = isize(alignof(T));
    if constexpr (!std::is_trivially_destructible_v<T>)
        m.destroy = &dyn_destroy<T>;
    if constexpr (std::is_move_constructible_v<T>)
        m.relocate = &dyn_relocate<T>;
    m.caps = Caps::template make_for<T>();
    return m;
}

template <class Caps, class T>
inline constexpr dyn_metadata<Caps> dyn_metadata_for = make_dyn_metadata<Caps, T>();
} // namespace tn::impl

namespace tn
{
/// Widening conversion: the static descriptor of T as an open-ended dyn<Caps> payload.
/// Usage:
///   auto meta = tn::widen<tn::debug_printable, int>();
///   auto node = tn::node_ptr<header, tn::dyn<tn::debug_printable>>::allocate_with_metadata(meta, nullptr);
template <class Caps, class T>
    requires capabilities_for<Caps, T>
[[nodiscard]] constexpr dyn_metadata<Caps> const* widen()
{
    return &impl::dyn_metadata_for<Caps, T>;
}
} // namespace tn

/// View of an open-ended payload: the value address plus its descriptor.
/// dyn_ref<Caps const> is the read-only flavor.
/// Only valid while the owning node is alive and unmodified.
template <class Caps>
struct tn::dyn_ref
{
    using caps_type = std::remove_const_t<Caps>;
    using pointer = std::conditional_t<std::is_const_v<Caps>, void const*, void*>;

public:
    dyn_ref(pointer value, dyn_metadata<caps_type> const* metadata) : _value(value), _metadata(metadata)
    {
        TN_ASSERT(value != nullptr && metadata != nullptr, "dyn_ref requires a value and a descriptor");
    }

    /// mutable views convert to read-only views
    operator dyn_ref<caps_type const>() const // NOLINT
        requires(!std::is_const_v<Caps>)
    {
        return {_value, _metadata};
    }

    // access
public:
    [[nodiscard]] pointer ptr() const { return _value; }
    [[nodiscard]] dyn_metadata<caps_type> const& metadata() const { return *_metadata; }
    [[nodiscard]] caps_type const& caps() const { return _metadata->caps; }
    [[nodiscard]] memory_layout layout() const { return _metadata->layout(); }

    // downcasting
public:
    /// True iff the payload was widened from exactly T.
    template <class T>
    [[nodiscard]] bool is() const
    {
        return _metadata == tn::widen<caps_type, T>();
    }

    /// Typed pointer to the payload if it was widened from T, nullptr otherwise.
    template <class T>
    [[nodiscard]] auto try_as() const
    {
        using result_t = std::conditional_t<std::is_const_v<Caps>, T const*, T*>;
        return is<T>() ? static_cast<result_t>(_value) : result_t(nullptr);
    }

    /// Precondition: is<T>().
    template <class T>
    [[nodiscard]] auto& as() const
    {
        TN_ASSERT(is<T>(), "payload was widened from a different type");
        return *try_as<T>();
    }

private:
    pointer _value;
    dyn_metadata<caps_type> const* _metadata;
};

// =========================================================================================================
// Payload traits
// =========================================================================================================
//
// Uniform interface over the three shapes, consumed by node_ptr, maybe_uninit_node and the structures:
//
//   shape                              payload_shape
//   metadata_type                      what the node stores in its metadata slot
//   metadata_layout()                  {0, 1} when nothing is stored
//   value_layout(meta)                 checked payload layout
//   value_alignment(meta)              alignment of the payload
//   pointer / const_pointer            raw typed payload address
//   reference / const_reference        view types
//   make_reference(ptr, meta)          build a view
//   destroy(ptr, meta)                 end payload lifetime
//   relocate(dest, src, meta)          move payload into uninitialized storage, destroying the source

/// Fixed payload: a single T.
template <class T>
struct tn::payload_traits
{
    static_assert(std::is_object_v<T> && !std::is_array_v<T>, "payload must be an object type, T[] or tn::dyn<Caps>");
    static_assert(!std::is_const_v<T>, "const payloads are not supported");

    static constexpr payload_shape shape = payload_shape::fixed;

    struct metadata_type
    {
    };

    using pointer = T*;
    using const_pointer = T const*;
    using reference = T&;
    using const_reference = T const&;

    static constexpr bool has_stored_metadata = false;

    [[nodiscard]] static constexpr memory_layout metadata_layout() { return {0, 1}; }
    [[nodiscard]] static result<memory_layout, allocate_error> value_layout(metadata_type)
    {
        return memory_layout::of<T>();
    }
    [[nodiscard]] static constexpr isize value_alignment(metadata_type = {}) { return isize(alignof(T)); }

    [[nodiscard]] static pointer make_pointer(byte* value, metadata_type) { return reinterpret_cast<T*>(value); }
    [[nodiscard]] static reference make_reference(byte* value, metadata_type) { return *reinterpret_cast<T*>(value); }
    [[nodiscard]] static const_reference make_const_reference(byte const* value, metadata_type)
    {
        return *reinterpret_cast<T const*>(value);
    }

    static void destroy(byte* value, metadata_type) { reinterpret_cast<T*>(value)->~T(); }

    static void relocate(byte* dest, byte* src, metadata_type)
    {
        static_assert(std::is_move_constructible_v<T>, "relocating a payload requires a move constructor");
        impl::dyn_relocate<T>(dest, src);
    }
};

/// Array payload: a runtime number of contiguous T.
template <class T>
struct tn::payload_traits<T[]>
{
    static_assert(std::is_object_v<T> && !std::is_array_v<T>, "array payload elements must be object types");
    static_assert(!std::is_const_v<T>, "const payloads are not supported");

    static constexpr payload_shape shape = payload_shape::array;

    /// element count
    using metadata_type = isize;

    using element_type = T;
    using pointer = T*;
    using const_pointer = T const*;
    using reference = tn::span<T>;
    using const_reference = tn::span<T const>;

    static constexpr bool has_stored_metadata = true;

    [[nodiscard]] static constexpr memory_layout metadata_layout() { return memory_layout::of<isize>(); }
    [[nodiscard]] static result<memory_layout, allocate_error> value_layout(isize length)
    {
        return tn::array_layout(memory_layout::of<T>(), length);
    }
    [[nodiscard]] static constexpr isize value_alignment(isize = 0) { return isize(alignof(T)); }

    [[nodiscard]] static pointer make_pointer(byte* value, isize) { return reinterpret_cast<T*>(value); }
    [[nodiscard]] static reference make_reference(byte* value, isize length)
    {
        return reference(reinterpret_cast<T*>(value), length);
    }
    [[nodiscard]] static const_reference make_const_reference(byte const* value, isize length)
    {
        return const_reference(reinterpret_cast<T const*>(value), length);
    }

    static void destroy(byte* value, isize length)
    {
        auto const start = reinterpret_cast<T*>(value);
        impl::destroy_objects_in_reverse(start, start + length);
    }

    static void relocate(byte* dest, byte* src, isize length)
    {
        impl::relocate_objects_to(reinterpret_cast<T*>(dest), reinterpret_cast<T*>(src), length);
    }
};

/// Open-ended payload: a concrete type erased behind Caps.
template <class Caps>
struct tn::payload_traits<tn::dyn<Caps>>
{
    static_assert(std::is_trivially_copyable_v<Caps>, "capability tables must be PODs of function pointers");

    static constexpr payload_shape shape = payload_shape::open_ended;

    using metadata_type = dyn_metadata<Caps> const*;

    using capabilities = Caps;
    using pointer = void*;
    using const_pointer = void const*;
    using reference = tn::dyn_ref<Caps>;
    using const_reference = tn::dyn_ref<Caps const>;

    static constexpr bool has_stored_metadata = true;

    [[nodiscard]] static constexpr memory_layout metadata_layout() { return memory_layout::of<metadata_type>(); }
    [[nodiscard]] static result<memory_layout, allocate_error> value_layout(metadata_type meta)
    {
        TN_ASSERT(meta != nullptr, "open-ended payload requires a descriptor");
        return meta->layout();
    }
    [[nodiscard]] static isize value_alignment(metadata_type meta) { return meta->alignment; }

    [[nodiscard]] static pointer make_pointer(byte* value, metadata_type) { return value; }
    [[nodiscard]] static reference make_reference(byte* value, metadata_type meta) { return reference(value, meta); }
    [[nodiscard]] static const_reference make_const_reference(byte const* value, metadata_type meta)
    {
        return const_reference(value, meta);
    }

    static void destroy(byte* value, metadata_type meta)
    {
        if (meta->destroy)
            meta->destroy(value);
    }

    static void relocate(byte* dest, byte* src, metadata_type meta)
    {
        TN_ASSERT(meta->relocate != nullptr, "payload type is not move constructible");
        meta->relocate(dest, src);
    }
};
