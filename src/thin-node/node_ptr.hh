#pragma once

#include <thin-node/allocate_error.hh>
#include <thin-node/assert.hh>
#include <thin-node/fwd.hh>
#include <thin-node/header_opaque_node_ptr.hh>
#include <thin-node/memory_layout.hh>
#include <thin-node/memory_resource.hh>
#include <thin-node/node_layout.hh>
#include <thin-node/payload.hh>
#include <thin-node/result.hh>
#include <thin-node/utility.hh>

// =========================================================================================================
// node_ptr<Header, U> - thin handle to a {header, metadata, payload} allocation
// =========================================================================================================
//
// The handle is a single address: the start of the block (where the header lives).
// Payload metadata (array length, dyn descriptor) is stored inside the block at a statically known
// offset, so sizeof(node_ptr) == sizeof(void*) for every payload shape.
//
// Lifecycle:
//   allocate_*      reserves the block and writes the metadata; header and payload are uninitialized
//   (caller)        constructs header and payload in place
//   (caller)        destroys header and payload when done
//   deallocate      releases the block; never runs destructors
//
// node_ptr is a plain copyable value with no ownership semantics. Ownership lives in the structure
// that links the node. Using a handle after deallocate, or deallocating twice, is a caller contract
// violation and is not guarded at runtime.
//
// Allocation entry points come in pairs:
//   try_allocate_*  -> tn::result<node_ptr, allocate_error>; layout_overflow or out_of_memory
//   allocate_*      -> node_ptr; overflow is fatal (allocate_error::handle), exhaustion is fatal
//                      per the memory resource's allocate_bytes contract
//
// Usage:
//   using node = tn::node_ptr<my_header, int[]>;
//   auto n = node::allocate_array(3, resource);
//   new (tn::placement_new, n.header_ptr()) my_header{};
//   ... construct 3 ints at n.data_ptr() ...
//   n.deallocate(resource);

template <class Header, class U>
struct tn::node_ptr
{
    using header_type = Header;
    using payload_type = U;
    using traits = payload_traits<U>;
    using metadata_type = typename traits::metadata_type;
    using pointer = typename traits::pointer;
    using reference = typename traits::reference;
    using const_reference = typename traits::const_reference;

    // static layout
public:
    [[nodiscard]] static constexpr memory_layout header_layout() { return memory_layout::of<Header>(); }

    /// Offset of the metadata slot (for fixed payloads: the end of the header).
    [[nodiscard]] static constexpr isize metadata_offset()
    {
        return tn::metadata_offset_after(header_layout(), traits::metadata_layout());
    }

    /// Offset of the payload. Fixed and array payloads have a static offset.
    [[nodiscard]] static constexpr isize static_value_offset()
        requires(traits::shape != payload_shape::open_ended)
    {
        return tn::value_offset_after(header_layout(), traits::metadata_layout(), traits::value_alignment());
    }

    /// Checked combined layout for a node with the given metadata.
    [[nodiscard]] static result<node_layout, allocate_error> compute_layout(metadata_type metadata)
    {
        auto value = traits::value_layout(metadata);
        if (value.has_error())
            return value.error();

        return tn::compute_node_layout(header_layout(), traits::metadata_layout(), value.value());
    }

    // construction
public:
    /// null handle
    node_ptr() = default;
    node_ptr(nullptr_t) {}

    /// adopts a block base address, e.g. one obtained from base_ptr()
    [[nodiscard]] static node_ptr from_base_ptr(byte* base)
    {
        node_ptr p;
        p._base = base;
        return p;
    }

    [[nodiscard]] static node_ptr from_header_opaque(header_opaque_node_ptr<U> node)
    {
        if (!node.is_valid())
            return {};
        return from_base_ptr(node.metadata_slot() - metadata_offset());
    }

    // allocation
public:
    /// Allocates a block for the payload described by `metadata` and writes the metadata into it.
    /// A null resource selects tn::default_memory_resource.
    [[nodiscard]] static result<node_ptr, allocate_error> try_allocate_with_metadata(metadata_type metadata,
                                                                                     memory_resource const* resource = nullptr)
    {
        auto layout = compute_layout(metadata);
        if (layout.has_error())
            return layout.error();

        auto const block = layout.value().block;
        auto const& res = tn::resolve_memory_resource(resource);
        byte* const p = res.try_allocate_bytes(block.size, block.alignment, res.userdata);
        if (p == nullptr)
            return allocate_error::out_of_memory(block);

        auto node = from_base_ptr(p);
        node._write_metadata(metadata);
        return node;
    }

    [[nodiscard]] static node_ptr allocate_with_metadata(metadata_type metadata, memory_resource const* resource = nullptr)
    {
        auto layout = compute_layout(metadata);
        if (layout.has_error())
            layout.error().handle();

        auto const block = layout.value().block;
        auto const& res = tn::resolve_memory_resource(resource);
        byte* const p = res.allocate_bytes(block.size, block.alignment, res.userdata);
        TN_ASSERT_ALWAYS(p != nullptr, "memory resource violated the allocate_bytes contract");

        auto node = from_base_ptr(p);
        node._write_metadata(metadata);
        return node;
    }

    /// Fixed payload.
    [[nodiscard]] static result<node_ptr, allocate_error> try_allocate_sized(memory_resource const* resource = nullptr)
        requires(traits::shape == payload_shape::fixed)
    {
        return try_allocate_with_metadata({}, resource);
    }
    [[nodiscard]] static node_ptr allocate_sized(memory_resource const* resource = nullptr)
        requires(traits::shape == payload_shape::fixed)
    {
        return allocate_with_metadata({}, resource);
    }

    /// Array payload of `length` elements; length 0 is valid.
    [[nodiscard]] static result<node_ptr, allocate_error> try_allocate_array(isize length, memory_resource const* resource = nullptr)
        requires(traits::shape == payload_shape::array)
    {
        return try_allocate_with_metadata(length, resource);
    }
    [[nodiscard]] static node_ptr allocate_array(isize length, memory_resource const* resource = nullptr)
        requires(traits::shape == payload_shape::array)
    {
        return allocate_with_metadata(length, resource);
    }

    /// Open-ended payload that will hold a T widened to the node's capability table.
    template <class T>
    [[nodiscard]] static result<node_ptr, allocate_error> try_allocate_unsize(memory_resource const* resource = nullptr)
        requires(traits::shape == payload_shape::open_ended)
    {
        return try_allocate_with_metadata(tn::widen<typename traits::capabilities, T>(), resource);
    }
    template <class T>
    [[nodiscard]] static node_ptr allocate_unsize(memory_resource const* resource = nullptr)
        requires(traits::shape == payload_shape::open_ended)
    {
        return allocate_with_metadata(tn::widen<typename traits::capabilities, T>(), resource);
    }

    /// Releases the block to `resource`, which must be the resource it was allocated from.
    /// Runs no destructors: header and payload must already be destroyed (or never initialized).
    /// The handle (and all copies of it) dangle afterwards.
    void deallocate(memory_resource const* resource = nullptr) const
    {
        TN_ASSERT(is_valid(), "cannot deallocate a null node");

        auto const block = layout().block;
        auto const& res = tn::resolve_memory_resource(resource);
        res.deallocate_bytes(_base, block.size, block.alignment, res.userdata);
    }

    // navigation
public:
    [[nodiscard]] byte* base_ptr() const { return _base; }

    /// Header location. Pure address computation, never touches the block.
    [[nodiscard]] Header* header_ptr() const
    {
        TN_ASSERT(is_valid(), "null node handle");
        return reinterpret_cast<Header*>(_base);
    }

    [[nodiscard]] metadata_type* metadata_ptr() const
        requires traits::has_stored_metadata
    {
        TN_ASSERT(is_valid(), "null node handle");
        return reinterpret_cast<metadata_type*>(_base + metadata_offset());
    }

    /// Reads the stored metadata (element count, dyn descriptor). Fixed payloads store none.
    [[nodiscard]] metadata_type metadata() const
    {
        if constexpr (traits::has_stored_metadata)
            return *metadata_ptr();
        else
            return {};
    }

    /// Raw payload location.
    /// Pure address computation for fixed and array payloads. Open-ended payloads place the value
    /// at the widened type's alignment, which is read from the stored descriptor.
    [[nodiscard]] byte* value_ptr() const
    {
        TN_ASSERT(is_valid(), "null node handle");
        if constexpr (traits::shape == payload_shape::open_ended)
            return _base
                 + tn::value_offset_after(header_layout(), traits::metadata_layout(), traits::value_alignment(metadata()));
        else
            return _base + static_value_offset();
    }

    /// Typed payload pointer: T* for fixed, T* to the first element for arrays, void* for open-ended.
    [[nodiscard]] pointer data_ptr() const { return reinterpret_cast<pointer>(value_ptr()); }

    /// Element count of an array payload.
    [[nodiscard]] isize length() const
        requires(traits::shape == payload_shape::array)
    {
        return metadata();
    }

    /// Payload views. Only valid once the payload is initialized.
    [[nodiscard]] reference get() const { return traits::make_reference(value_ptr(), metadata()); }
    [[nodiscard]] const_reference get_const() const { return traits::make_const_reference(value_ptr(), metadata()); }

    /// Combined layout recomputed from the stored metadata.
    [[nodiscard]] node_layout layout() const
    {
        auto layout = compute_layout(metadata());
        TN_ASSERT(layout.has_value(), "stored metadata does not describe a valid layout");
        return layout.value();
    }

    // conversion
public:
    [[nodiscard]] header_opaque_node_ptr<U> to_header_opaque() const
    {
        if (!is_valid())
            return {};
        return header_opaque_node_ptr<U>::from_metadata_slot(_base + metadata_offset());
    }

    // queries
public:
    [[nodiscard]] bool is_valid() const { return _base != nullptr; }

    friend bool operator==(node_ptr const&, node_ptr const&) = default;

    // helper
private:
    void _write_metadata(metadata_type metadata)
    {
        if constexpr (traits::has_stored_metadata)
            new (tn::placement_new, _base + metadata_offset()) metadata_type(metadata);
    }

    // members
private:
    byte* _base = nullptr;
};
