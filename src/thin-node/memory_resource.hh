#pragma once

#include <thin-node/fwd.hh>
#include <thin-node/utility.hh>

// Node storage is obtained from a polymorphic tn::memory_resource (POD, function-pointer based, static-init safe).
//
// Every allocating entry point takes a `tn::memory_resource const*`. A null resource means
// "use tn::default_memory_resource". Structures store the pointer they were created with and use it for
// every node they allocate and release, so a node is always returned to the resource it came from.
//
// Failure contract per entry point:
// - allocate_bytes treats exhaustion as unrecoverable: it never returns null for a positive size
//   (the system resource reports through TN_ASSERT_ALWAYS and aborts).
// - try_allocate_bytes returns nullptr on exhaustion; node allocation turns that into
//   tn::allocate_error::out_of_memory.

namespace tn
{
/// Default memory resource used when a null resource is passed.
/// System allocator stored in the data segment, valid even during static initialization.
extern tn::memory_resource const* const default_memory_resource;

/// Returns *resource, or the default resource if resource is null.
[[nodiscard]] inline tn::memory_resource const& resolve_memory_resource(tn::memory_resource const* resource)
{
    return resource ? *resource : *default_memory_resource;
}
} // namespace tn

/// Pluggable allocator interface used for all node blocks.
/// This is a POD struct using function pointers to avoid virtual dispatch and non-trivial constructors.
struct tn::memory_resource
{
    /// Allocate `bytes` with at least `alignment` alignment.
    /// bytes == 0 returns nullptr.
    /// bytes > 0 always returns non-null; failure is fatal (assert/terminate).
    tn::function_ptr<tn::byte*(isize bytes, isize alignment, void* userdata)> allocate_bytes = nullptr;

    /// Attempt to allocate `bytes` with at least `alignment` alignment.
    /// bytes == 0 returns nullptr.
    /// bytes > 0 returns nullptr if the request cannot be satisfied.
    tn::function_ptr<tn::byte*(isize bytes, isize alignment, void* userdata)> try_allocate_bytes = nullptr;

    /// Deallocate a block previously obtained from this resource with matching bytes and alignment.
    /// Only programmer bugs (e.g. mismatched size) may terminate; exhaustion never occurs here.
    tn::function_ptr<void(tn::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// User-defined data for custom allocators. Can be nullptr for stateless allocators.
    void* userdata = nullptr;
};
