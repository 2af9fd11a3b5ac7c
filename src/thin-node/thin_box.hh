#pragma once

#include <thin-node/allocate_error.hh>
#include <thin-node/assert.hh>
#include <thin-node/fwd.hh>
#include <thin-node/maybe_uninit_node.hh>
#include <thin-node/memory_resource.hh>
#include <thin-node/node_ptr.hh>
#include <thin-node/payload.hh>
#include <thin-node/result.hh>
#include <thin-node/span.hh>
#include <thin-node/utility.hh>

#include <type_traits>

namespace tn::impl
{
/// The box remembers its memory resource inside the node, so the handle stays one address.
struct thin_box_header
{
    memory_resource const* resource = nullptr;
};
} // namespace tn::impl

/// Single-owner heap box for any payload shape.
///
///   tn::thin_box<int>                        one int
///   tn::thin_box<float[]>                    runtime-sized float array (length stored in the node)
///   tn::thin_box<tn::dyn<debug_printable>>   type-erased value (descriptor stored in the node)
///
/// sizeof(thin_box<U>) == sizeof(void*) for all of them.
/// The destructor destroys the payload, then returns the node to the resource it was created with.
///
/// Usage:
///   auto b = tn::thin_box<std::string>::create("hello");
///   auto a = tn::thin_box<int[]>::create_copy({1, 2, 3});
///   auto d = tn::thin_box<tn::dyn<tn::debug_printable>>::create_unsize(42);
template <class U>
struct tn::thin_box
{
    using traits = payload_traits<U>;
    using header = impl::thin_box_header;
    using node = node_ptr<header, U>;
    using metadata_type = typename traits::metadata_type;
    using reference = typename traits::reference;
    using const_reference = typename traits::const_reference;

    /// structure handle handed to builders: fills the target box on insert
    struct structure
    {
        thin_box* target = nullptr;
        memory_resource const* resource = nullptr;

        void insert(header_opaque_node_ptr<U> n) const
        {
            TN_ASSERT(!target->_node.is_valid(), "target box already holds a node");
            target->_node = n.template to_transparent<header>();
        }
        [[nodiscard]] memory_resource const* allocator() const { return resource; }
        void deallocate(header_opaque_node_ptr<U> n) const { n.template to_transparent<header>().deallocate(resource); }
    };

    using builder = maybe_uninit_node<U, structure>;

    // construction
public:
    /// empty box
    thin_box() = default;

    thin_box(thin_box&& rhs) noexcept : _node(tn::exchange(rhs._node, nullptr)) {}
    thin_box& operator=(thin_box&& rhs) noexcept(false)
    {
        if (this != &rhs)
        {
            reset();
            _node = tn::exchange(rhs._node, nullptr);
        }
        return *this;
    }
    thin_box(thin_box const&) = delete;
    thin_box& operator=(thin_box const&) = delete;

    ~thin_box() noexcept(false) { reset(); }

    template <class... Args>
    [[nodiscard]] static thin_box create(Args&&... args)
        requires(traits::shape == payload_shape::fixed)
    {
        return create_in(nullptr, tn::forward<Args>(args)...);
    }

    template <class... Args>
    [[nodiscard]] static thin_box create_in(memory_resource const* resource, Args&&... args)
        requires(traits::shape == payload_shape::fixed)
    {
        thin_box box;
        {
            auto b = allocate_uninit(box, {}, resource);
            b.emplace(tn::forward<Args>(args)...);
            tn::move(b).insert();
        }
        return box;
    }

    /// Array payload copied from `source`.
    template <class E = std::remove_extent_t<U>>
    [[nodiscard]] static thin_box create_copy(tn::span<E const> source, memory_resource const* resource = nullptr)
        requires(traits::shape == payload_shape::array)
    {
        thin_box box;
        {
            auto b = allocate_uninit(box, source.size(), resource);
            b.copy_from(source);
            tn::move(b).insert();
        }
        return box;
    }

    /// Open-ended payload holding `value` widened to the box's capability table.
    template <class T>
    [[nodiscard]] static thin_box create_unsize(T&& value, memory_resource const* resource = nullptr)
        requires(traits::shape == payload_shape::open_ended)
    {
        using V = std::remove_cvref_t<T>;
        thin_box box;
        {
            auto b = allocate_uninit(box, tn::widen<typename traits::capabilities, V>(), resource);
            b.template emplace_as<V>(tn::forward<T>(value));
            tn::move(b).insert();
        }
        return box;
    }

    /// Allocates a node for `target` (which must be empty) and returns a builder for its payload.
    /// insert() on the builder stores the node in `target`; `target` must outlive the builder.
    [[nodiscard]] static result<builder, allocate_error> try_allocate_uninit(thin_box& target,
                                                                            metadata_type metadata,
                                                                            memory_resource const* resource = nullptr)
    {
        auto n = node::try_allocate_with_metadata(metadata, resource);
        if (n.has_error())
            return n.error();
        return _make_builder(target, n.value(), resource);
    }

    [[nodiscard]] static builder allocate_uninit(thin_box& target, metadata_type metadata, memory_resource const* resource = nullptr)
    {
        return _make_builder(target, node::allocate_with_metadata(metadata, resource), resource);
    }

    // access
public:
    [[nodiscard]] reference get()
    {
        TN_ASSERT(is_valid(), "empty box");
        return _node.get();
    }
    [[nodiscard]] const_reference get() const
    {
        TN_ASSERT(is_valid(), "empty box");
        return _node.get_const();
    }

    [[nodiscard]] auto* operator->() const
        requires(traits::shape == payload_shape::fixed)
    {
        TN_ASSERT(is_valid(), "empty box");
        return _node.data_ptr();
    }

    [[nodiscard]] metadata_type metadata() const { return _node.metadata(); }

    [[nodiscard]] isize length() const
        requires(traits::shape == payload_shape::array)
    {
        return _node.length();
    }

    [[nodiscard]] node handle() const { return _node; }

    [[nodiscard]] memory_resource const* resource() const
    {
        TN_ASSERT(is_valid(), "empty box");
        return _node.header_ptr()->resource;
    }

    [[nodiscard]] bool is_valid() const { return _node.is_valid(); }

    // modification
public:
    /// Destroys the payload and releases the node. The box is empty afterwards.
    void reset()
    {
        if (!_node.is_valid())
            return;

        auto const n = tn::exchange(_node, nullptr);
        TN_DEFER { n.deallocate(n.header_ptr()->resource); };
        traits::destroy(n.value_ptr(), n.metadata());
    }

    // helper
private:
    static builder _make_builder(thin_box& target, node n, memory_resource const* resource)
    {
        TN_ASSERT(!target.is_valid(), "target box must be empty");
        new (tn::placement_new, n.header_ptr()) header{resource};
        return builder(structure{&target, resource}, n.to_header_opaque(), false);
    }

    // members
private:
    node _node;
};
