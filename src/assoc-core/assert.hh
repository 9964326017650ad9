#pragma once

// Included by every map header, so it only pulls in fwd, macros and <source_location>.
#include <assoc-core/fwd.hh>
#include <assoc-core/macros.hh>

#include <source_location>

// =========================================================================================================
// Assertions
// =========================================================================================================
//
// The maps report failures in three ways:
//   AC_ASSERT(cond, msg)          - precondition of the caller: non-positive capacity, load factor outside
//                                   (0.25, 1], invalid deepcopy function, optional/result/vector misuse.
//                                   Active unless AC_ASSERT_ENABLED is 0 (see macros.hh).
//   AC_ASSERT_ALWAYS(cond, msg)   - internal invariant of a map, e.g. a probe sequence that found no free
//                                   slot. Active in every build.
//   ac::result<T, ac::map_error>  - expected outcomes: a missing key, min() of an empty map, select()
//                                   out of range. These are never assertions.
//
// A failed assertion calls the topmost handler of assert-handler.hh (default: print to stderr),
// then breaks into an attached debugger and aborts.
//
//   AC_ASSERT(capacity > 0, "capacity must be positive");
//   AC_ASSERT_ALWAYS(false, "probing visited every slot without a free one");

#define AC_ASSERT(cond, msg) AC_IMPL_ASSERT(cond, msg)
#define AC_ASSERT_ALWAYS(cond, msg) AC_IMPL_CHECK(::ac::impl::assertion_kind::invariant, cond, msg)

// AC_DEBUG_BREAK() - stops in the debugger if one is attached, does nothing otherwise
#define AC_DEBUG_BREAK() AC_IMPL_DEBUG_BREAK()

namespace ac::impl
{
enum class assertion_kind : u8
{
    /// AC_ASSERT: the caller broke a documented precondition (capacity, load factor, bounds, ...)
    precondition,

    /// AC_ASSERT_ALWAYS: a map's internal invariant does not hold
    invariant,
};

/// Dispatches to the topmost handler. Returns if the handler returns, the macro aborts afterwards.
AC_COLD_FUNC void handle_assert_failure(assertion_kind kind,
                                        char const* expression,
                                        char const* message,
                                        std::source_location location);

[[nodiscard]] bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace ac::impl

// the break has to happen in the macro so the debugger stops at the failing line

#if defined(AC_COMPILER_MSVC)
#define AC_IMPL_DEBUG_BREAK() (::ac::impl::is_debugger_connected() ? __debugbreak() : void(0))
#elif defined(AC_OS_LINUX)
// SIGTRAP, declared by hand to keep <csignal> out of every header
extern "C" int raise(int) noexcept;
#define AC_IMPL_DEBUG_BREAK() (::ac::impl::is_debugger_connected() ? (void)::raise(5) : void(0))
#else
#define AC_IMPL_DEBUG_BREAK() void(0)
#endif

#define AC_IMPL_CHECK(kind, cond, msg)                                                             \
    do                                                                                             \
    {                                                                                              \
        if (!(cond)) [[unlikely]]                                                                  \
        {                                                                                          \
            ::ac::impl::handle_assert_failure(kind, #cond, msg, ::std::source_location::current()); \
            AC_DEBUG_BREAK();                                                                      \
            ::ac::impl::perform_abort();                                                           \
        }                                                                                          \
    } while (false)

#if AC_ASSERT_ENABLED
#define AC_IMPL_ASSERT(cond, msg) AC_IMPL_CHECK(::ac::impl::assertion_kind::precondition, cond, msg)
#else
#define AC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        AC_UNUSED(cond);          \
        AC_UNUSED(msg);           \
    } while (false)
#endif
