#include "node_layout.hh"

#include <thin-node/assert.hh>

namespace
{
bool checked_add(tn::isize a, tn::isize b, tn::isize& out)
{
    if (a > tn::max_allocation_size - b)
        return false;
    out = a + b;
    return true;
}

bool checked_align_up(tn::isize value, tn::isize alignment, tn::isize& out)
{
    if (value > tn::max_allocation_size - (alignment - 1))
        return false;
    out = tn::align_up(value, alignment);
    return true;
}

void check_layout(tn::memory_layout layout)
{
    TN_ASSERT(layout.size >= 0, "layout size must be non-negative");
    TN_ASSERT(layout.alignment > 0 && tn::is_power_of_two(layout.alignment), "layout alignment must be a power of 2");
}
} // namespace

tn::result<tn::memory_layout, tn::allocate_error> tn::array_layout(memory_layout element, isize count)
{
    check_layout(element);

    if (count < 0)
        return allocate_error::layout_overflow();

    if (element.size > 0 && count > max_allocation_size / element.size)
        return allocate_error::layout_overflow();

    return memory_layout{element.size * count, element.alignment};
}

tn::result<tn::node_layout, tn::allocate_error> tn::compute_node_layout(memory_layout header,
                                                                        memory_layout metadata,
                                                                        memory_layout value)
{
    check_layout(header);
    check_layout(metadata);
    check_layout(value);

    node_layout layout;
    isize metadata_end = 0;
    isize value_end = 0;

    if (!checked_align_up(header.size, metadata.alignment, layout.metadata_offset))
        return allocate_error::layout_overflow();

    if (!checked_add(layout.metadata_offset, metadata.size, metadata_end))
        return allocate_error::layout_overflow();

    if (!checked_align_up(metadata_end, value.alignment, layout.value_offset))
        return allocate_error::layout_overflow();

    if (!checked_add(layout.value_offset, value.size, value_end))
        return allocate_error::layout_overflow();

    layout.block.alignment = tn::max(header.alignment, tn::max(metadata.alignment, value.alignment));

    if (!checked_align_up(value_end, layout.block.alignment, layout.block.size))
        return allocate_error::layout_overflow();

    return layout;
}
