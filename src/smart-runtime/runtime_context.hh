#pragma once

#include <smart-runtime/fwd.hh>

#include <string>

// The runtime context is the boundary between runtime containers and the embedding runtime's object
// model. Containers never interpret the bytes of a slot themselves; whenever a slot's value needs to
// be copied with an independent lifetime, released, or rendered as text, they call out to the context.
//
// A container constructed without a context holds plain values and uses sr::plain_value_context.
// A container constructed with any other context treats every slot as a handle to a runtime-managed
// value (a reference-counted object, a GC root, ...):
// - the container owns the reference handed to it on insert and releases it on overwrite,
//   removal, clear and destruction
// - materializing reads call `materialize` to obtain an additional, caller-owned reference
//
// When a container is thread-safe, the context is only ever called while the container's guard is held.

namespace sr
{
/// Context for plain (non-managed) values:
/// - materialize is a byte copy
/// - release does nothing
/// - format renders strides 1/2/4/8 as signed integers and everything else as hex bytes
extern runtime_context const* const plain_value_context;
} // namespace sr

/// Capability table of the embedding runtime.
/// POD struct of function pointers (same shape as sr::memory_resource) so that contexts can live in
/// the data segment of the runtime and be shared with generated code.
struct sr::runtime_context
{
    /// Writes an independently-owned copy of the value stored at `src` into `dst`.
    /// For reference-counted values this typically copies the handle and increments the count,
    /// for deep-copied values it allocates a new object and writes its handle.
    /// Both ranges are `stride` bytes and never overlap.
    void (*materialize)(byte* dst, byte const* src, isize stride, void* userdata) = nullptr;

    /// Releases the value reference stored in `slot` (`stride` bytes).
    /// The slot bytes are dead afterwards and will be overwritten or dropped by the container.
    void (*release)(byte* slot, isize stride, void* userdata) = nullptr;

    /// Renders the value stored in `slot` as text (used by sr::to_string of containers).
    std::string (*format)(byte const* slot, isize stride, void* userdata) = nullptr;

    /// User-defined data, e.g. the runtime instance owning the managed heap.
    void* userdata = nullptr;
};
