#pragma once

#include <thin-node/fwd.hh>

/// Size and alignment of a memory region, the unit the layout calculator works in.
/// Invariants for valid layouts: size >= 0, alignment is a positive power of two.
struct tn::memory_layout
{
    isize size = 0;
    isize alignment = 1;

    /// Layout of a complete object type.
    template <class T>
    [[nodiscard]] static constexpr memory_layout of()
    {
        return {isize(sizeof(T)), isize(alignof(T))};
    }

    friend bool operator==(memory_layout const&, memory_layout const&) = default;
};
