#pragma once

// Lean header with minimal dependencies, included by every runtime container header.
#include <smart-runtime/macros.hh>

#include <source_location>

// =========================================================================================================
// SR_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
// Active in debug and release-with-debug-info builds, and in release builds configured with
// SR_ENABLE_ASSERT_IN_RELEASE.
//
// Error handling strategy of the runtime library:
//   - Assertions      -> programmer errors, e.g. a value span whose size differs from the stride
//   - result<T, E>    -> expected failures, e.g. an out-of-range index coming from contract code
//
// NEVER assert on values that originate from a running contract: those are reported through
// sr::result so the embedding runtime can trap the contract instead of the whole process.
//
// Usage:
//   SR_ASSERT(value.size() == stride, "value size must match the element stride");
//
#define SR_ASSERT(cond, msg) SR_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// SR_ASSERT_ALWAYS - Always-active assertion
//
// Like SR_ASSERT but also active in release builds.
// Used where continuing would corrupt state instead of merely misbehaving (e.g. unlocking a guard
// that the calling thread does not hold).
//
#define SR_ASSERT_ALWAYS(cond, msg) SR_IMPL_ASSERT_ALWAYS(cond, msg)

// =========================================================================================================
// SR_DEBUG_BREAK - Breaks into the debugger if one is attached, otherwise does nothing
// SR_BREAK_AND_ABORT - Debug break followed by program termination
// =========================================================================================================
#define SR_DEBUG_BREAK() SR_IMPL_DEBUG_BREAK()
#define SR_BREAK_AND_ABORT() (SR_DEBUG_BREAK(), ::sr::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace sr
{
using source_location = std::source_location;
}

namespace sr::impl
{
// Called when an assertion fails
// Dispatches to the topmost assertion handler (or prints to stderr if there is none)
// Note: does not abort, caller must follow with SR_BREAK_AND_ABORT()
SR_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, sr::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace sr::impl

#ifdef SR_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define SR_IMPL_DEBUG_BREAK() (::sr::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(SR_COMPILER_POSIX)

// SIGTRAP is 5, see https://man7.org/linux/man-pages/man7/signal.7.html
// raise is declared manually so that this header does not pull in any posix header
extern "C" int raise(int) noexcept;
#define SR_IMPL_DEBUG_BREAK() (::sr::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define SR_IMPL_DEBUG_BREAK() void(0)

#endif

#define SR_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::sr::impl::handle_assert_failure(#cond, msg, ::sr::source_location::current()); \
            SR_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if SR_ASSERT_ENABLED

#define SR_IMPL_ASSERT(cond, msg) SR_IMPL_ASSERT_ALWAYS(cond, msg)

#else

// stripped, but the condition and message still have to compile
#define SR_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        SR_UNUSED(cond);          \
        SR_UNUSED(msg);           \
    } while (false)

#endif
