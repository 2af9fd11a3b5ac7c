#pragma once

#include <thin-node/allocate_error.hh>
#include <thin-node/fwd.hh>
#include <thin-node/memory_layout.hh>
#include <thin-node/result.hh>
#include <thin-node/utility.hh>

#include <limits>

// =========================================================================================================
// Layout calculator
// =========================================================================================================
//
// A node is one allocation packing {header, metadata, value}:
//
//   offset 0                 metadata_offset          value_offset                  block.size
//   | header | padding        | metadata | padding     | value | trailing padding    |
//
// - the header starts at offset 0
// - metadata_offset is the smallest offset >= header size aligned to the metadata alignment
// - value_offset is the smallest offset >= metadata end aligned to the value alignment
// - block.alignment is the maximum of all three alignments
// - block.size is rounded up to block.alignment
//
// Shapes without metadata pass an empty layout {0, 1}; the metadata offset then equals the header size.
// Every addition and rounding step is checked against max_allocation_size.
// Overflow yields allocate_error::layout_overflow and never a truncated layout.

/// Placement of header, metadata and value inside one node allocation.
struct tn::node_layout
{
    /// size and alignment to request from the memory resource
    memory_layout block;
    isize metadata_offset = 0;
    isize value_offset = 0;

    friend bool operator==(node_layout const&, node_layout const&) = default;
};

namespace tn
{
/// Largest block size (after rounding to the block alignment) a node may have.
constexpr isize max_allocation_size = std::numeric_limits<isize>::max();

/// Layout of `count` contiguous elements.
/// count < 0 or a size beyond max_allocation_size is reported as layout_overflow.
[[nodiscard]] tn::result<memory_layout, allocate_error> array_layout(memory_layout element, isize count);

/// Combined layout of {header, metadata, value} as described above.
/// Preconditions: all sizes >= 0, all alignments are powers of two.
[[nodiscard]] tn::result<node_layout, allocate_error> compute_node_layout(memory_layout header,
                                                                          memory_layout metadata,
                                                                          memory_layout value);

/// Unchecked offset of the metadata slot, for statically known header and metadata types.
[[nodiscard]] constexpr isize metadata_offset_after(memory_layout header, memory_layout metadata)
{
    return tn::align_up(header.size, metadata.alignment);
}

/// Unchecked offset of the value, for statically known header, metadata and value alignment.
[[nodiscard]] constexpr isize value_offset_after(memory_layout header, memory_layout metadata, isize value_alignment)
{
    return tn::align_up(metadata_offset_after(header, metadata) + metadata.size, value_alignment);
}
} // namespace tn
