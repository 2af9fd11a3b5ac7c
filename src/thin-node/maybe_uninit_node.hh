#pragma once

#include <thin-node/assert.hh>
#include <thin-node/fwd.hh>
#include <thin-node/header_opaque_node_ptr.hh>
#include <thin-node/impl/object_lifetime_util.hh>
#include <thin-node/memory_resource.hh>
#include <thin-node/payload.hh>
#include <thin-node/span.hh>
#include <thin-node/utility.hh>

#include <concepts>
#include <type_traits>

namespace tn
{
/// Capability implemented by every structure that owns nodes (list, box, user-defined containers).
///
///   s.insert(node)      takes ownership of a node whose payload is initialized
///   s.allocator()       the memory resource the structure's nodes come from
///   s.deallocate(node)  releases a node that is NOT part of the structure (payload already destroyed)
///
/// Nodes are passed header-opaque, so the structure's header type stays private to it.
template <class S, class U>
concept structure_handle = requires(S& s, header_opaque_node_ptr<U> node) {
    s.insert(node);
    { s.allocator() } -> std::convertible_to<memory_resource const*>;
    s.deallocate(node);
};
} // namespace tn

/// Builder over an allocated node whose payload may not be initialized yet.
///
/// Owns the node until it is inserted into its structure:
///   - insert() hands it over (the payload must be initialized)
///   - otherwise the destructor releases it: the payload is destroyed first if it was initialized,
///     then the node goes back to the structure's deallocate
///
/// Structures hand out builders from allocate_uninit_* and pop_*_node.
/// The builder refers back to its structure, so the structure must outlive it and must not be moved
/// while the builder exists.
///
/// Usage:
///   auto b = list.allocate_uninit_back(3);   // int[] list, 3 elements
///   b.copy_from(tn::span<int const>{1, 2, 3});
///   tn::move(b).insert();
template <class U, class Structure>
struct tn::maybe_uninit_node
{
    static_assert(structure_handle<Structure, U>, "Structure must implement insert, allocator and deallocate");

    using traits = payload_traits<U>;
    using metadata_type = typename traits::metadata_type;
    using pointer = typename traits::pointer;
    using reference = typename traits::reference;

    // construction
public:
    maybe_uninit_node(Structure structure, header_opaque_node_ptr<U> node, bool initialized)
      : _structure(tn::move(structure)), _node(node), _has_value(initialized)
    {
        TN_ASSERT(node.is_valid(), "builder requires an allocated node");
    }

    maybe_uninit_node(maybe_uninit_node&& rhs) noexcept
      : _structure(tn::move(rhs._structure)), _node(tn::exchange(rhs._node, nullptr)), _has_value(tn::exchange(rhs._has_value, false))
    {
    }
    maybe_uninit_node& operator=(maybe_uninit_node&&) = delete;
    maybe_uninit_node(maybe_uninit_node const&) = delete;
    maybe_uninit_node& operator=(maybe_uninit_node const&) = delete;

    /// may propagate an exception from the payload destructor (the node is still released)
    ~maybe_uninit_node() noexcept(false) { _release(); }

    // initialization
public:
    /// Constructs a fixed payload in place.
    template <class... Args>
    reference emplace(Args&&... args)
        requires(traits::shape == payload_shape::fixed)
    {
        using T = std::remove_reference_t<reference>;
        TN_ASSERT(!_has_value, "payload is already initialized");
        auto p = new (tn::placement_new, _node.value_ptr()) T(tn::forward<Args>(args)...);
        _has_value = true;
        return *p;
    }

    /// Constructs the concrete type of an open-ended payload in place.
    /// T must be the type the node was allocated for (see allocate_unsize<T>).
    template <class T, class... Args>
    T& emplace_as(Args&&... args)
        requires(traits::shape == payload_shape::open_ended)
    {
        TN_ASSERT(!_has_value, "payload is already initialized");
        TN_ASSERT((_node.metadata() == tn::widen<typename traits::capabilities, T>()),
                  "node was allocated for a different concrete type");
        auto p = new (tn::placement_new, _node.value_ptr()) T(tn::forward<Args>(args)...);
        _has_value = true;
        return *p;
    }

    /// Copies exactly length() elements into an array payload.
    /// If a copy throws, the already copied elements are destroyed and the payload stays uninitialized.
    template <class E = std::remove_extent_t<U>>
    void copy_from(tn::span<E const> source)
        requires(traits::shape == payload_shape::array && std::is_same_v<E, std::remove_extent_t<U>>)
    {
        TN_ASSERT(!_has_value, "payload is already initialized");
        TN_ASSERT(source.size() == _node.metadata(), "source length does not match the node");
        impl::copy_create_objects_or_rollback(_node.data_ptr(), source.begin(), source.end());
        _has_value = true;
    }

    /// Like copy_from, but move-constructs the elements.
    template <class E = std::remove_extent_t<U>>
    void move_from(tn::span<E> source)
        requires(traits::shape == payload_shape::array && std::is_same_v<E, std::remove_extent_t<U>>)
    {
        TN_ASSERT(!_has_value, "payload is already initialized");
        TN_ASSERT(source.size() == _node.metadata(), "source length does not match the node");
        impl::move_create_objects_or_rollback(_node.data_ptr(), source.begin(), source.end());
        _has_value = true;
    }

    /// Moves a live payload of the same shape and metadata from `source` into this node.
    /// The source storage is uninitialized afterwards.
    void relocate_from(byte* source)
    {
        TN_ASSERT(!_has_value, "payload is already initialized");
        traits::relocate(_node.value_ptr(), source, _node.metadata());
        _has_value = true;
    }

    /// Declares a payload initialized that was written through data_ptr() directly.
    void assume_init()
    {
        TN_ASSERT(!_has_value, "payload is already initialized");
        _has_value = true;
    }

    // consumption
public:
    /// Hands the node over to the structure. The builder is empty afterwards.
    header_opaque_node_ptr<U> insert() &&
    {
        TN_ASSERT(_has_value, "cannot insert a node with an uninitialized payload");
        _structure.insert(_node);
        _has_value = false;
        return tn::exchange(_node, nullptr);
    }

    /// Ends the payload lifetime and keeps the node allocated (and owned by the builder).
    void destroy_value()
    {
        TN_ASSERT(_has_value, "payload is not initialized");
        _has_value = false;
        traits::destroy(_node.value_ptr(), _node.metadata());
    }

    /// Moves a fixed payload out and releases the node.
    /// If the move constructor throws, the payload is still destroyed and the node released: the value is
    /// lost, nothing leaks.
    [[nodiscard]] auto take() &&
        requires(traits::shape == payload_shape::fixed)
    {
        using T = std::remove_reference_t<reference>;
        TN_ASSERT(_has_value, "payload is not initialized");
        T value = tn::move(*_node.data_ptr());
        _release();
        return value;
    }

    // access
public:
    [[nodiscard]] header_opaque_node_ptr<U> node() const { return _node; }
    [[nodiscard]] metadata_type metadata() const { return _node.metadata(); }
    [[nodiscard]] byte* value_ptr() const { return _node.value_ptr(); }
    [[nodiscard]] pointer data_ptr() const { return _node.data_ptr(); }

    /// Element count of an array payload.
    [[nodiscard]] isize length() const
        requires(traits::shape == payload_shape::array)
    {
        return _node.metadata();
    }

    /// View of the payload. Precondition: is_initialized().
    [[nodiscard]] reference get() const
    {
        TN_ASSERT(_has_value, "payload is not initialized");
        return _node.get();
    }

    [[nodiscard]] Structure const& structure() const { return _structure; }
    [[nodiscard]] memory_resource const* allocator() const { return _structure.allocator(); }

    [[nodiscard]] bool is_valid() const { return _node.is_valid(); }
    [[nodiscard]] bool is_initialized() const { return _has_value; }

    // helper
private:
    void _release()
    {
        if (!_node.is_valid())
            return;

        auto const node = tn::exchange(_node, nullptr);
        TN_DEFER { _structure.deallocate(node); };

        if (tn::exchange(_has_value, false))
            traits::destroy(node.value_ptr(), node.metadata());
    }

    // members
private:
    Structure _structure;
    header_opaque_node_ptr<U> _node;
    bool _has_value = false;
};
