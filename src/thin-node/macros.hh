#pragma once

// =========================================================================================================
// Compiler detection
// =========================================================================================================
// Conditionally defined: TN_COMPILER_MSVC, TN_COMPILER_CLANG, TN_COMPILER_GCC, TN_COMPILER_MINGW, TN_COMPILER_POSIX

#if defined(_MSC_VER)
#define TN_COMPILER_MSVC
#elif defined(__clang__)
#define TN_COMPILER_CLANG
#elif defined(__GNUC__)
#define TN_COMPILER_GCC
#elif defined(__MINGW32__) || defined(__MINGW64__)
#define TN_COMPILER_MINGW
#else
#error "Unknown compiler"
#endif

#if defined(TN_COMPILER_CLANG) || defined(TN_COMPILER_GCC) || defined(TN_COMPILER_MINGW)
#define TN_COMPILER_POSIX
#endif

// =========================================================================================================
// Compilation modes
// =========================================================================================================
// Conditionally defined: TN_HAS_CPP_EXCEPTIONS
// From CMake: TN_DEBUG, TN_RELEASE, TN_RELWITHDEBINFO, TN_ENABLE_ASSERT_IN_RELEASE
// Always defined: TN_ASSERT_ENABLED (0 or 1)

#ifdef TN_COMPILER_MSVC
#ifdef _CPPUNWIND
#define TN_HAS_CPP_EXCEPTIONS
#endif
#elif defined(TN_COMPILER_CLANG)
#if __EXCEPTIONS && __has_feature(cxx_exceptions)
#define TN_HAS_CPP_EXCEPTIONS
#endif
#elif defined(TN_COMPILER_GCC)
#if __EXCEPTIONS
#define TN_HAS_CPP_EXCEPTIONS
#endif
#endif

// list teardown relies on unwinding through payload destructors
#ifndef TN_HAS_CPP_EXCEPTIONS
#error "thin-node requires C++ exceptions to be enabled"
#endif

#ifndef TN_ASSERT_ENABLED
#if defined(TN_RELEASE) && !defined(TN_ENABLE_ASSERT_IN_RELEASE)
#define TN_ASSERT_ENABLED 0
#else
#define TN_ASSERT_ENABLED 1
#endif
#endif

// =========================================================================================================
// Operating system detection
// =========================================================================================================
// Conditionally defined: TN_OS_WINDOWS, TN_OS_LINUX, TN_OS_APPLE, TN_OS_BSD

#if defined(WIN32) || defined(_WIN32) || defined(__WIN32)
#define TN_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__) || defined(macintosh)
#define TN_OS_APPLE
#elif defined(__linux__) || defined(linux)
#define TN_OS_LINUX
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
#define TN_OS_BSD
#else
#error "Unknown platform"
#endif

// =========================================================================================================
// Public macros
// =========================================================================================================

// TN_FORCE_INLINE - Force function to be inlined
#define TN_FORCE_INLINE TN_IMPL_FORCE_INLINE

// TN_COLD_FUNC - Mark function as rarely executed (error paths, assertions)
// Usage: TN_COLD_FUNC void handle_error() { ... }
#define TN_COLD_FUNC TN_IMPL_COLD_FUNC

// TN_MACRO_JOIN(a, b) - Concatenate two tokens at preprocessing time
// Usage: TN_MACRO_JOIN(foo_, bar) -> foo_bar
// Note: Indirection ensures arguments are expanded before concatenation
#define TN_MACRO_JOIN(arg1, arg2) TN_IMPL_MACRO_JOIN(arg1, arg2)

// TN_UNUSED(expr) - Suppress unused variable/expression warnings (forces semicolon)
// Usage: TN_UNUSED(result);
// Note: Expression is NOT evaluated, only its type is checked (sizeof is unevaluated context)
#define TN_UNUSED(expr) (void)(sizeof((expr)))


// =========================================================================================================
// Implementation details
// =========================================================================================================

#if defined(TN_COMPILER_MSVC)

#define TN_IMPL_FORCE_INLINE __forceinline
#define TN_IMPL_COLD_FUNC

#elif defined(TN_COMPILER_POSIX)

// additional 'inline' is required on gcc and makes no difference on clang
#define TN_IMPL_FORCE_INLINE __attribute__((always_inline)) inline
#define TN_IMPL_COLD_FUNC __attribute__((cold))

#else
#error "Unknown compiler"
#endif

#define TN_IMPL_MACRO_JOIN(arg1, arg2) arg1##arg2
