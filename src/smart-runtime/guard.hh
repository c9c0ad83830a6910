#pragma once

#include <smart-runtime/fwd.hh>
#include <smart-runtime/utility.hh>

#include <functional>
#include <memory>

/// Optional, re-entrant mutual exclusion for runtime containers.
///
/// A disabled guard (default) turns every operation into a no-op, so single-threaded containers pay
/// nothing but a null check. An enabled guard owns a recursive mutex:
/// - containers take it implicitly around each single operation
/// - callers take it explicitly (lock/unlock or lock(f)) to turn several operations into one
///   critical section; the implicit per-operation locking inside that section re-enters the
///   mutex held by the same thread instead of deadlocking
///
/// Usage:
///   auto g = sr::guard(true);
///   g.lock([&] { read_modify_write(); });  // released on all exit paths
///
///   g.lock();
///   step_one();
///   step_two();
///   g.unlock();
///
/// Locking blocks indefinitely and makes no fairness guarantee.
/// Unlocking a guard that the calling thread does not hold is always an assertion failure.
struct sr::guard
{
    /// RAII lock for one scope; a no-op for disabled guards
    struct [[nodiscard]] scoped_lock
    {
        explicit scoped_lock(guard const& g) : _guard(&g) { _guard->lock(); }
        ~scoped_lock() { _guard->unlock(); }

        scoped_lock(scoped_lock const&) = delete;
        scoped_lock& operator=(scoped_lock const&) = delete;
        scoped_lock(scoped_lock&&) = delete;
        scoped_lock& operator=(scoped_lock&&) = delete;

    private:
        guard const* _guard;
    };

    /// Blocks until the calling thread holds the guard
    /// Re-entrant: the holding thread may lock again and has to unlock as often
    void lock() const;

    /// Releases one level of the calling thread's hold on the guard
    void unlock() const;

    /// Acquires the guard if that is possible without blocking
    [[nodiscard]] bool try_lock() const;

    /// Acquire lock, invoke function, and return result
    /// The guard is held for the duration of the function call and released on all exit paths
    template <class F>
    auto lock(F&& f) const
    {
        scoped_lock const lock(*this);
        return std::invoke(sr::forward<F>(f));
    }

    [[nodiscard]] scoped_lock scoped() const { return scoped_lock(*this); }

    /// True iff this guard actually synchronizes
    [[nodiscard]] bool is_enabled() const { return _state != nullptr; }

    /// True iff the calling thread currently holds the guard (always false when disabled)
    [[nodiscard]] bool is_held_by_current_thread() const;

    // lifecycle
public:
    guard();
    explicit guard(bool enabled);

    guard(guard&&) noexcept;
    guard& operator=(guard&&) noexcept;
    guard(guard const&) = delete;
    guard& operator=(guard const&) = delete;
    ~guard();

private:
    struct state;
    std::unique_ptr<state> _state;
};
