#pragma once

#include <thin-node/fwd.hh>
#include <thin-node/macros.hh>
#include <thin-node/memory_layout.hh>
#include <thin-node/source_location.hh>

#include <string>

namespace tn
{
enum class allocate_error_kind : u8
{
    /// The combined node layout exceeds the maximum allocation size; nothing was allocated.
    layout_overflow,
    /// The memory resource could not satisfy the request.
    out_of_memory,
};
}

/// Expected failure of a try_* node allocation.
/// Returned inside tn::result; never thrown.
/// Non-try entry points call handle() instead, which reports through the assertion handler and aborts.
struct tn::allocate_error
{
    allocate_error_kind kind = allocate_error_kind::layout_overflow;

    /// The block that was requested; only meaningful for out_of_memory.
    memory_layout requested = {};

    // factories
public:
    [[nodiscard]] static allocate_error layout_overflow() { return {allocate_error_kind::layout_overflow, {}}; }
    [[nodiscard]] static allocate_error out_of_memory(memory_layout requested)
    {
        return {allocate_error_kind::out_of_memory, requested};
    }

    // queries
public:
    [[nodiscard]] bool is_layout_overflow() const { return kind == allocate_error_kind::layout_overflow; }
    [[nodiscard]] bool is_out_of_memory() const { return kind == allocate_error_kind::out_of_memory; }

    /// e.g. "out of memory (requested 48 bytes, alignment 8)"
    [[nodiscard]] std::string to_string() const;

    /// Treats the error as fatal: dispatches to the assertion handler stack, then aborts.
    /// A throwing assertion handler unwinds out of here instead.
    [[noreturn]] TN_COLD_FUNC void handle(tn::source_location location = tn::source_location::current()) const;

    friend bool operator==(allocate_error const&, allocate_error const&) = default;
};
