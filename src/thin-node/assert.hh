#pragma once

// Lean header with minimal dependencies, included by every thin-node header.
#include <thin-node/macros.hh>
#include <thin-node/source_location.hh>

// =========================================================================================================
// TN_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// When assertions are active:
//   Assertions are enabled in TN_DEBUG and TN_RELWITHDEBINFO builds.
//   In TN_RELEASE builds, assertions are disabled unless TN_ENABLE_ASSERT_IN_RELEASE is defined.
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS.
//   In thin-node that means: accessing the front of an empty list, using an iterator after the list
//   was modified, deallocating a null node handle, feeding a non-power-of-two alignment into a layout.
//
// What assertions are NOT for:
//   - NOT for allocation failure (try_* entry points return tn::result<T, tn::allocate_error>)
//   - NOT for payload misbehavior (throwing constructors/destructors propagate as exceptions)
//
// Error handling strategy:
//   - Assertions      -> programmer errors, violated invariants/preconditions/postconditions
//   - Exceptions      -> payload code that throws, propagated after node invariants are restored
//   - result<T, E>    -> expected errors (layout overflow, out of memory)
//
// Usage:
//   TN_ASSERT(node.is_valid(), "cannot deallocate a null node");
//   TN_ASSERT(!list.is_empty(), "front() called on an empty list");
//
#define TN_ASSERT(cond, msg) TN_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// TN_ASSERT_ALWAYS - Always-active assertion
//
// Like TN_ASSERT but remains active in all build configurations, including release builds.
// Used for conditions that must never be silently skipped, e.g. fatal allocation failure.
//
#define TN_ASSERT_ALWAYS(cond, msg) TN_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// TN_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define TN_DEBUG_BREAK() TN_IMPL_DEBUG_BREAK()

// =========================================================================================================
// TN_BREAK_AND_ABORT - Debug break followed by program termination
//
#define TN_BREAK_AND_ABORT() (TN_DEBUG_BREAK(), ::tn::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace tn::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (or prints diagnostics to stderr)
// Note: does not abort, caller must follow with TN_BREAK_AND_ABORT()
TN_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, tn::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace tn::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef TN_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define TN_IMPL_DEBUG_BREAK() (::tn::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(TN_COMPILER_POSIX)

// SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
// declared here to avoid pulling in a posix header
extern "C" int raise(int) noexcept;
#define TN_IMPL_DEBUG_BREAK() (::tn::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define TN_IMPL_DEBUG_BREAK() void(0)

#endif

#define TN_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::tn::impl::handle_assert_failure(#cond, msg, ::tn::source_location::current()); \
            TN_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if TN_ASSERT_ENABLED

#define TN_IMPL_ASSERT(cond, msg) TN_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message still have to compile
#define TN_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        TN_UNUSED(cond);          \
        TN_UNUSED(msg);           \
    } while (false)

#endif
