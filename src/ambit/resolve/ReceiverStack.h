// ReceiverStack.h created on 2026-09-16 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_RECEIVER_STACK_H
#define AMBIT_RESOLVE_RECEIVER_STACK_H

#include "Type.h"
#include <ambit/core/NonCopyable.h>

#include <fmt/ostream.h>

#include <span>
#include <vector>
#include <string>
#include <cstdint>

namespace ambit::resolve {


/// Opaque reference to the runtime value occupying a context.
/// The label is used in diagnostics and dumps, the object pointer is not
/// dereferenced by the engine.
struct ValueRef {
    std::string label;
    const void* object = nullptr;

    bool operator==(const ValueRef&) const = default;
};

std::ostream& operator<<(std::ostream& os, const ValueRef& v);


/// One implicit receiver: its static type and the value.
struct ContextFrame {
    Type type;
    ValueRef value;

    bool operator==(const ContextFrame&) const = default;
};

std::ostream& operator<<(std::ostream& os, const ContextFrame& v);

using ContextFrames = std::span<const ContextFrame>;


/// Identifies a pushed frame, returned by ReceiverStack::push
struct FrameHandle {
    size_t depth = 0;       // index of the frame
    uint64_t serial = 0;    // unique per push in the process, detects stale and foreign handles

    bool operator==(const FrameHandle&) const = default;
};


/// Ordered sequence of implicit receivers, outermost first.
///
/// Global frames (file-level context) sit at the bottom and are never popped.
/// Frames pushed by enclosing scopes are popped in strict reverse order,
/// any other pop is a StackDisciplineViolation.
class ReceiverStack {
public:
    ReceiverStack() = default;
    explicit ReceiverStack(std::vector<ContextFrame> globals);

    FrameHandle push(Type type, ValueRef value);
    void pop(FrameHandle handle);

    /// Current frames, outermost first. Invalidated by push/pop.
    ContextFrames frames() const { return m_frames; }

    /// Copy of current frames, to be handed to another thread.
    std::vector<ContextFrame> snapshot() const { return m_frames; }

    size_t size() const { return m_frames.size(); }
    size_t global_count() const { return m_globals; }
    bool has_pushed() const { return m_frames.size() > m_globals; }

private:
    std::vector<ContextFrame> m_frames;
    std::vector<uint64_t> m_serials;    // for pushed frames only
    size_t m_globals = 0;
};


/// Push the receiver for the lifetime of this object, pop it on any exit path.
class ScopedReceiver : private core::NonCopyable {
public:
    ScopedReceiver(ReceiverStack& stack, Type type, ValueRef value)
        : m_stack(stack), m_handle(stack.push(std::move(type), std::move(value))) {}
    ~ScopedReceiver() noexcept(false);

    const FrameHandle& handle() const { return m_handle; }

private:
    ReceiverStack& m_stack;
    FrameHandle m_handle;
};


} // namespace ambit::resolve

template <> struct fmt::formatter<ambit::resolve::ValueRef> : ostream_formatter {};
template <> struct fmt::formatter<ambit::resolve::ContextFrame> : ostream_formatter {};

#endif // include guard
