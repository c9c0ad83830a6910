#include "assert.hh"

#include <smart-runtime/assert-handler.hh>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#ifdef SR_COMPILER_MSVC
extern "C" __declspec(dllimport) int __stdcall IsDebuggerPresent() noexcept;
#endif

#ifdef SR_OS_LINUX
#include <cstring>
#endif

namespace
{
std::vector<std::move_only_function<void(sr::impl::assertion_info const&)>> g_assertion_handlers;

void default_assert_handler(sr::impl::assertion_info const& info)
{
    // single write so that reports of concurrent failures do not interleave
    std::cerr << (sr::impl::describe(info) + '\n') << std::flush;
}
} // namespace

std::string sr::impl::describe(assertion_info const& info)
{
    auto text = std::string("smart-runtime: ");
    text += info.message.empty() ? "assertion failed" : info.message;
    text += " [";
    text += info.expression;
    text += "] at ";
    text += info.location.file_name();
    text += ':';
    text += std::to_string(info.location.line());
    text += " in ";
    text += info.location.function_name();
    return text;
}

void sr::impl::push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    g_assertion_handlers.push_back(std::move(handler));
}

void sr::impl::pop_assertion_handler()
{
    if (!g_assertion_handlers.empty())
        g_assertion_handlers.pop_back();
}

sr::impl::scoped_assertion_handler::scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler)
{
    push_assertion_handler(std::move(handler));
}

sr::impl::scoped_assertion_handler::~scoped_assertion_handler()
{
    pop_assertion_handler();
}

SR_COLD_FUNC void sr::impl::handle_assert_failure(char const* expression, char const* message, sr::source_location location)
{
    assertion_info const info{
        .expression = std::string(expression),
        .message = std::string(message),
        .location = location,
    };

    if (!g_assertion_handlers.empty())
        g_assertion_handlers.back()(info);
    else
        default_assert_handler(info);

    // no abort here, it's outside
}

bool sr::impl::is_debugger_connected() noexcept
{
#ifdef SR_COMPILER_MSVC
    return ::IsDebuggerPresent() != 0;
#elif defined(SR_OS_LINUX)
    // TracerPid in /proc/self/status is non-zero while a debugger is attached
    if (auto* f = std::fopen("/proc/self/status", "r"))
    {
        char buf[1024];
        while (std::fgets(buf, sizeof(buf), f))
        {
            if (std::strncmp(buf, "TracerPid:", 10) == 0)
            {
                int pid = 0;
                if (std::sscanf(buf + 10, "%d", &pid) != 1)
                    pid = 0;
                std::fclose(f);
                return pid != 0;
            }
        }
        std::fclose(f);
    }
    return false;
#else
    return false;
#endif
}

[[noreturn]] void sr::impl::perform_abort() noexcept
{
    std::abort();
}
