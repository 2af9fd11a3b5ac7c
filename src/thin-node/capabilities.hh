#pragma once

#include <thin-node/fwd.hh>
#include <thin-node/payload.hh>
#include <thin-node/to_debug_string.hh>
#include <thin-node/utility.hh>

#include <string>

/// Capability table for open-ended payloads that can render themselves as debug text.
/// Usage:
///   tn::linked_list<tn::dyn<tn::debug_printable>> list;
///   list.push_back_unsize(42);
///   list.push_back_unsize(std::string("hello"));
///   tn::to_debug_string(list); // [42, "hello"]
struct tn::debug_printable
{
    tn::function_ptr<std::string(void const* value)> to_debug_string = nullptr;

    template <class T>
    static constexpr debug_printable make_for()
    {
        debug_printable caps;
        caps.to_debug_string = [](void const* value) -> std::string
        { return tn::to_debug_string(*static_cast<T const*>(value)); };
        return caps;
    }
};

namespace tn
{
// found via ADL by tn::to_debug_string
[[nodiscard]] inline std::string to_string(dyn_ref<debug_printable const> value)
{
    return value.caps().to_debug_string(value.ptr());
}
[[nodiscard]] inline std::string to_string(dyn_ref<debug_printable> value)
{
    return value.caps().to_debug_string(value.ptr());
}
} // namespace tn
