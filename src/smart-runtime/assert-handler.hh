#pragma once

#include <smart-runtime/assert.hh>

#include <functional>
#include <string>

// Assertion failures inside the runtime are reported to the topmost handler of a global stack.
// Without any handler the report goes to stderr and the process aborts.
//
// An embedding runtime traps the executing contract instead of terminating the host:
//
//   auto trap = sr::impl::scoped_assertion_handler([](sr::impl::assertion_info const& info) {
//       throw contract_trap{sr::impl::describe(info)};
//   });
//   execute_contract();
//
// NOTE: the stack is global state, push and pop must be externally synchronized.
// Handlers themselves may run on any thread that trips an assertion (e.g. a foreign guard unlock).

namespace sr::impl
{
struct assertion_info
{
    std::string expression;
    std::string message;
    sr::source_location location;
};

/// One-line report: "smart-runtime: <message> [<expression>] at <file>:<line> in <function>"
[[nodiscard]] std::string describe(assertion_info const& info);

void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

/// Prefer scoped_assertion_handler so that pops stay matched when a handler throws
void pop_assertion_handler();

struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace sr::impl
