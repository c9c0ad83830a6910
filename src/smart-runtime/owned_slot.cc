#include "owned_slot.hh"

#include <smart-runtime/runtime_context.hh>

sr::owned_slot sr::owned_slot::adopt(allocation storage, runtime_context const* context)
{
    owned_slot slot;
    slot._storage = sr::move(storage);
    slot._context = context ? context : sr::plain_value_context;
    return slot;
}

sr::allocation sr::owned_slot::detach() &&
{
    _context = nullptr;
    return sr::move(_storage);
}

sr::owned_slot::owned_slot(owned_slot&& rhs) noexcept
  : _storage(sr::move(rhs._storage)), _context(sr::exchange(rhs._context, nullptr))
{
}

sr::owned_slot& sr::owned_slot::operator=(owned_slot&& rhs) noexcept
{
    if (this != &rhs)
    {
        impl_release();
        _storage = sr::move(rhs._storage);
        _context = sr::exchange(rhs._context, nullptr);
    }
    return *this;
}

sr::owned_slot::~owned_slot() { impl_release(); }

void sr::owned_slot::impl_release()
{
    if (_storage.is_valid() && _context != nullptr)
    {
        auto const& ctx = *_context;
        ctx.release(_storage.alloc_start, _storage.size_bytes(), ctx.userdata);
    }
    _context = nullptr;
}
