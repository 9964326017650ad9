#pragma once

#include <assoc-core/assert.hh>
#include <assoc-core/fwd.hh>
#include <source_location>

#include <functional>
#include <string>

// Assertion failures are routed through a stack of handlers.
// Without a handler, the failure is printed to stderr and the program aborts.
// A handler may throw to unwind to a recovery point (the tests do this), if it returns the program aborts anyway.
//
//   {
//       auto handler = ac::impl::scoped_assertion_handler([](ac::impl::assertion_info const& info) {
//           if (info.kind == ac::impl::assertion_kind::precondition)
//               throw bad_map_argument{info.message};
//       });
//
//       auto m = ac::probing_hash_map<int, int>(8, 1.5); // throws bad_map_argument
//   }
//
// NOTE: the handler stack is global and not synchronized

namespace ac::impl
{
/// "precondition" or "invariant"
[[nodiscard]] char const* to_string(assertion_kind kind);

struct assertion_info
{
    assertion_kind kind;
    std::string expression;
    std::string message;
    std::source_location location;
};

using assertion_handler = std::move_only_function<void(assertion_info const&)>;

void push_assertion_handler(assertion_handler handler);

/// No-op on an empty stack
void pop_assertion_handler();

[[nodiscard]] isize assertion_handler_count();

/// Pushes on construction, pops on destruction, including during unwinding out of its own handler
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(assertion_handler handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace ac::impl
