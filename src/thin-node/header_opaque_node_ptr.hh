#pragma once

#include <thin-node/fwd.hh>
#include <thin-node/payload.hh>
#include <thin-node/utility.hh>

/// Node handle without static knowledge of the header type.
///
/// Generic code (tn::maybe_uninit_node and anything that implements the structure handle capability)
/// uses this to reach metadata and payload of a node whose header layout is private to the owning
/// structure. It stores one address: the end of the header, i.e. the start of the metadata slot.
/// From there everything except the header is reachable, because the metadata directly follows the
/// header region and the payload follows the metadata at the payload's alignment.
///
/// to_transparent<Header>() re-attaches the header type (zero-cost, pure pointer arithmetic).
/// Supplying a different Header than the node was allocated with is a contract violation that is not
/// detected at runtime. to_transparent requires <thin-node/node_ptr.hh>.
template <class U>
struct tn::header_opaque_node_ptr
{
    using payload_type = U;
    using traits = payload_traits<U>;
    using metadata_type = typename traits::metadata_type;
    using pointer = typename traits::pointer;
    using reference = typename traits::reference;

    // construction
public:
    /// null handle
    header_opaque_node_ptr() = default;
    header_opaque_node_ptr(nullptr_t) {}

    /// adopts the address of a metadata slot (see class comment)
    [[nodiscard]] static header_opaque_node_ptr from_metadata_slot(byte* slot)
    {
        header_opaque_node_ptr p;
        p._slot = slot;
        return p;
    }

    // conversion
public:
    template <class Header>
    [[nodiscard]] node_ptr<Header, U> to_transparent() const
    {
        return node_ptr<Header, U>::from_header_opaque(*this);
    }

    // navigation
public:
    [[nodiscard]] byte* metadata_slot() const { return _slot; }

    [[nodiscard]] metadata_type* metadata_ptr() const
        requires traits::has_stored_metadata
    {
        TN_ASSERT(is_valid(), "null node handle");
        return reinterpret_cast<metadata_type*>(_slot);
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
    /// Pure address arithmetic for fixed and array payloads; open-ended payloads read their alignment
    /// from the stored descriptor.
    [[nodiscard]] byte* value_ptr() const
    {
        TN_ASSERT(is_valid(), "null node handle");
        auto const metadata_end = _slot + traits::metadata_layout().size;
        if constexpr (traits::shape == payload_shape::open_ended)
            return tn::align_up(metadata_end, traits::value_alignment(metadata()));
        else
            return tn::align_up(metadata_end, traits::value_alignment());
    }

    [[nodiscard]] pointer data_ptr() const { return reinterpret_cast<pointer>(value_ptr()); }

    /// View of the payload. Only valid once the payload is initialized.
    [[nodiscard]] reference get() const { return traits::make_reference(value_ptr(), metadata()); }

    // queries
public:
    [[nodiscard]] bool is_valid() const { return _slot != nullptr; }

    friend bool operator==(header_opaque_node_ptr const&, header_opaque_node_ptr const&) = default;

    // members
private:
    byte* _slot = nullptr;
};
