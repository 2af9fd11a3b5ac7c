#pragma once

#include <thin-node/macros.hh>
#include <thin-node/source_location.hh>

#include <functional>
#include <string>

namespace tn::impl
{
// Customizable assertion handler system
// NOTE: Handler functions are global state and must be externally synchronized
//
// Usage example:
//   {
//       auto handler = tn::impl::scoped_assertion_handler([](tn::impl::assertion_info const& info) {
//           report(info);
//           throw recoverable_failure{info.message};
//       });
//
//       // Any assertions in this scope will use the custom handler
//       list.pop_front_node();
//   } // handler is automatically popped here

struct assertion_info
{
    std::string expression;
    std::string message;
    tn::source_location location;
};

// Push a custom assertion handler onto the handler stack
// Handlers are allowed to throw exceptions to unwind to a recovery point
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Pop the topmost assertion handler from the stack
// Prefer scoped_assertion_handler, which also pops when a throwing handler unwinds
void pop_assertion_handler();

// RAII wrapper for pushing/popping assertion handlers
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace tn::impl
