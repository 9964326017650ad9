#pragma once

// =========================================================================================================
// Toolchain and platform
// =========================================================================================================
//
// Exactly one of AC_COMPILER_MSVC, AC_COMPILER_CLANG, AC_COMPILER_GCC is defined.
// AC_COMPILER_POSIX is defined for the compilers that understand GNU attributes and builtins.
// AC_OS_LINUX and AC_OS_WINDOWS are defined where the assertion machinery has platform code,
// every other platform falls back to portable behavior.

#if defined(_MSC_VER)
#define AC_COMPILER_MSVC
#elif defined(__clang__)
#define AC_COMPILER_CLANG
#define AC_COMPILER_POSIX
#elif defined(__GNUC__)
#define AC_COMPILER_GCC
#define AC_COMPILER_POSIX
#else
#error "assoc-core supports MSVC, Clang and GCC"
#endif

#if defined(_WIN32)
#define AC_OS_WINDOWS
#elif defined(__linux__)
#define AC_OS_LINUX
#endif

// =========================================================================================================
// Assertion switch
// =========================================================================================================
//
// The build defines one of AC_DEBUG, AC_RELWITHDEBINFO, AC_RELEASE.
//
//   AC_DEBUG, AC_RELWITHDEBINFO      -> AC_ASSERT checks preconditions (capacity, load factor, bounds, ...)
//   AC_RELEASE                       -> AC_ASSERT compiles away
//   AC_ENABLE_ASSERT_IN_RELEASE      -> keeps AC_ASSERT in AC_RELEASE too (the test build sets it)
//
// AC_ASSERT_ALWAYS guards internal invariants of the maps and ignores this switch.

#if defined(AC_DEBUG) || defined(AC_RELWITHDEBINFO) || defined(AC_ENABLE_ASSERT_IN_RELEASE)
#define AC_ASSERT_ENABLED 1
#else
#define AC_ASSERT_ENABLED 0
#endif

// =========================================================================================================
// Function and expression annotations
// =========================================================================================================

// AC_FORCE_INLINE - for move/forward style one-liners that must vanish in debug builds too
// AC_COLD_FUNC - failure paths, keeps them out of the hot code of put/get/remove
// AC_BUILTIN_UNREACHABLE - after a switch that covers every enumerator
// AC_UNUSED(expr) - type-checks expr without evaluating it

#if defined(AC_COMPILER_MSVC)
#define AC_FORCE_INLINE __forceinline
#define AC_COLD_FUNC
#define AC_BUILTIN_UNREACHABLE __assume(0)
#else
// gcc wants the extra inline next to always_inline
#define AC_FORCE_INLINE __attribute__((always_inline)) inline
#define AC_COLD_FUNC __attribute__((cold))
#define AC_BUILTIN_UNREACHABLE __builtin_unreachable()
#endif

#define AC_UNUSED(expr) (void)(sizeof((expr)))
