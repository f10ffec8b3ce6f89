#include "assert.hh"

#include <clean-parse/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <utility>

#ifdef _MSC_VER
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

namespace
{
// innermost live handler, nullptr if none is installed
cp::impl::scoped_assertion_handler* g_top_handler = nullptr;

void report_to_stderr(cp::impl::assertion_info const& info)
{
    std::cerr << "clean-parse precondition violated: " << info.expression << '\n';
    std::cerr << "  Message: " << info.message << '\n';
    std::cerr << "  Location: " << info.location.file_name() << ':' << info.location.line() << ':'
              << info.location.column() << " (" << info.location.function_name() << ")\n";
    std::cerr.flush();
}
} // namespace

cp::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
  : _handler(std::move(handler)), _previous(g_top_handler)
{
    g_top_handler = this;
}

cp::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    g_top_handler = _previous;
}

CP_COLD_FUNC void cp::impl::handle_assert_failure(char const* expression, char const* message, cp::source_location location)
{
    assertion_info const info{
        .expression = expression,
        .message = message,
        .location = location,
    };

    if (g_top_handler != nullptr)
        g_top_handler->_handler(info);
    else
        report_to_stderr(info);
}

bool cp::impl::is_debugger_connected() noexcept
{
#ifdef _MSC_VER
    return ::IsDebuggerPresent() != 0;
#elif defined(__linux__)
    auto* f = std::fopen("/proc/self/status", "r");
    if (f == nullptr)
        return false;

    int tracer_pid = 0;
    char line[256];
    while (std::fgets(line, sizeof(line), f))
    {
        if (std::strncmp(line, "TracerPid:", 10) == 0)
        {
            tracer_pid = std::atoi(line + 10);
            break;
        }
    }
    std::fclose(f);
    return tracer_pid != 0;
#else
    return false;
#endif
}

[[noreturn]] void cp::impl::perform_abort() noexcept
{
    std::abort();
}
