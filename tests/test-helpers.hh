#pragma once

#include <smart-runtime/assert-handler.hh>
#include <smart-runtime/result.hh>

#include <utility>

// shared helpers for the runtime tests

namespace sr::test
{
/// True iff invoking f fails an SR_ASSERT / SR_ASSERT_ALWAYS
/// The failing call is unwound by a throwing handler instead of aborting
template <class F>
bool asserts(F&& f)
{
    struct assertion_failed
    {
    };

    auto handler = sr::impl::scoped_assertion_handler([](sr::impl::assertion_info const&) { throw assertion_failed{}; });
    try
    {
        std::forward<F>(f)();
    }
    catch (assertion_failed const&)
    {
        return true;
    }
    return false;
}

/// True iff r holds exactly the error e
template <class T, class E>
bool fails_with(result<T, E> const& r, E e)
{
    return r.has_error() && r.error() == e;
}
} // namespace sr::test
