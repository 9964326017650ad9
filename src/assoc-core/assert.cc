#include "assert.hh"

#include <assoc-core/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <utility>
#include <vector>

#ifdef AC_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
std::vector<ac::impl::assertion_handler>& handler_stack()
{
    static std::vector<ac::impl::assertion_handler> handlers;
    return handlers;
}

void print_to_stderr(ac::impl::assertion_info const& info)
{
    auto const& loc = info.location;
    std::cerr << "assoc-core: " << ac::impl::to_string(info.kind) << " violated\n"
              << "  check:    " << info.expression << '\n'
              << "  message:  " << info.message << '\n'
              << "  at:       " << loc.file_name() << ':' << loc.line() << ':' << loc.column() << '\n'
              << "  function: " << loc.function_name() << std::endl;
}

#ifdef AC_OS_LINUX
// TracerPid line of /proc/self/status, 0 if there is none
int read_tracer_pid()
{
    auto* const status = std::fopen("/proc/self/status", "r");
    if (status == nullptr)
        return 0;

    int pid = 0;
    char line[256];
    while (std::fgets(line, sizeof(line), status) != nullptr)
    {
        constexpr char key[] = "TracerPid:";
        if (std::strncmp(line, key, sizeof(key) - 1) != 0)
            continue;

        if (std::sscanf(line + sizeof(key) - 1, "%d", &pid) != 1)
            pid = 0;
        break;
    }

    std::fclose(status);
    return pid;
}
#endif
} // namespace

char const* ac::impl::to_string(assertion_kind kind)
{
    switch (kind)
    {
    case assertion_kind::precondition:
        return "precondition";
    case assertion_kind::invariant:
        return "invariant";
    }
    return "unknown assertion";
}

void ac::impl::push_assertion_handler(assertion_handler handler)
{
    handler_stack().push_back(std::move(handler));
}

void ac::impl::pop_assertion_handler()
{
    auto& handlers = handler_stack();
    if (!handlers.empty())
        handlers.pop_back();
}

ac::isize ac::impl::assertion_handler_count()
{
    return isize(handler_stack().size());
}

ac::impl::scoped_assertion_handler::scoped_assertion_handler(assertion_handler handler)
{
    push_assertion_handler(std::move(handler));
}

ac::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

void ac::impl::handle_assert_failure(assertion_kind kind, char const* expression, char const* message, std::source_location location)
{
    auto const info = assertion_info{
        .kind = kind,
        .expression = expression,
        .message = message,
        .location = location,
    };

    auto& handlers = handler_stack();
    if (handlers.empty())
        print_to_stderr(info);
    else
        handlers.back()(info); // may throw
}

bool ac::impl::is_debugger_connected() noexcept
{
#if defined(AC_COMPILER_MSVC)
    return ::IsDebuggerPresent() != 0;
#elif defined(AC_OS_LINUX)
    return read_tracer_pid() != 0;
#else
    return false;
#endif
}

void ac::impl::perform_abort() noexcept
{
    std::abort();
}
