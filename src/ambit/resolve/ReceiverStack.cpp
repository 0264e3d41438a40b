// ReceiverStack.cpp created on 2026-09-16 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "ReceiverStack.h"
#include "Error.h"
#include <ambit/core/log.h>

#include <exception>
#include <atomic>

namespace ambit::resolve {

using namespace ambit::core;


// shared by all stacks, so a handle never matches a frame of another stack
static std::atomic<uint64_t> s_next_serial {1};


std::ostream& operator<<(std::ostream& os, const ValueRef& v)
{
    if (v.label.empty())
        return os << "<value>";
    return os << v.label;
}


std::ostream& operator<<(std::ostream& os, const ContextFrame& v)
{
    return os << v.value << ": " << v.type;
}


ReceiverStack::ReceiverStack(std::vector<ContextFrame> globals)
    : m_frames(std::move(globals)), m_globals(m_frames.size())
{}


FrameHandle ReceiverStack::push(Type type, ValueRef value)
{
    FrameHandle handle{m_frames.size(), s_next_serial.fetch_add(1)};
    TRACE("push #{} {}: {}", handle.depth, value, type);
    m_frames.push_back({std::move(type), std::move(value)});
    m_serials.push_back(handle.serial);
    return handle;
}


void ReceiverStack::pop(FrameHandle handle)
{
    if (!has_pushed())
        throw stack_discipline_violation(
                fmt::format("pop #{} from receiver stack with no pushed frame", handle.depth));
    const size_t top = m_frames.size() - 1;
    if (handle.depth != top || handle.serial != m_serials.back())
        throw stack_discipline_violation(
                fmt::format("pop #{} (serial {}) out of order, top is #{} {}",
                            handle.depth, handle.serial, top, m_frames.back()));
    TRACE("pop #{} {}", top, m_frames.back());
    m_frames.pop_back();
    m_serials.pop_back();
}


ScopedReceiver::~ScopedReceiver() noexcept(false)
{
    if (std::uncaught_exceptions() != 0) {
        // already unwinding, a second exception would terminate
        try {
            m_stack.pop(m_handle);
        } catch (const ContractViolation& e) {
            log::error("{}", e.what());
        }
        return;
    }
    m_stack.pop(m_handle);
}


} // namespace ambit::resolve
