#include "guard.hh"

#include <smart-runtime/assert.hh>

#include <atomic>
#include <mutex>
#include <thread>

struct sr::guard::state
{
    std::recursive_mutex mutex;

    // owner is read by other threads to validate unlock(), depth only by the owner
    std::atomic<std::thread::id> owner;
    isize depth = 0;
};

sr::guard::guard(bool enabled)
{
    if (enabled)
        _state = std::make_unique<state>();
}

// must be defined here because state is only fwd declared in the header
sr::guard::guard() = default;
sr::guard::guard(guard&&) noexcept = default;
sr::guard& sr::guard::operator=(guard&&) noexcept = default;

sr::guard::~guard()
{
    SR_ASSERT(_state == nullptr || _state->depth == 0, "guard destroyed while still locked");
}

void sr::guard::lock() const
{
    if (!_state)
        return;

    _state->mutex.lock();
    if (_state->depth == 0)
        _state->owner.store(std::this_thread::get_id(), std::memory_order_relaxed);
    ++_state->depth;
}

void sr::guard::unlock() const
{
    if (!_state)
        return;

    SR_ASSERT_ALWAYS(is_held_by_current_thread(), "unlock() called by a thread that does not hold the guard");

    if (--_state->depth == 0)
        _state->owner.store(std::thread::id(), std::memory_order_relaxed);
    _state->mutex.unlock();
}

bool sr::guard::try_lock() const
{
    if (!_state)
        return true;

    if (!_state->mutex.try_lock())
        return false;

    if (_state->depth == 0)
        _state->owner.store(std::this_thread::get_id(), std::memory_order_relaxed);
    ++_state->depth;
    return true;
}

bool sr::guard::is_held_by_current_thread() const
{
    return _state != nullptr && _state->owner.load(std::memory_order_relaxed) == std::this_thread::get_id();
}
