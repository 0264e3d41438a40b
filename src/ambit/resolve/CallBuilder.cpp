// CallBuilder.cpp created on 2026-09-19 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "CallBuilder.h"
#include "Error.h"

namespace ambit::resolve {


const ValueRef& ThisScope::this_at(std::string_view label) const
{
    for (const auto& [name, value] : m_labels) {
        if (name == label)
            return value;
    }
    throw undefined_receiver_label(label, m_decl_name);
}


static const BoundReceiver& default_receiver(const Binding& binding)
{
    if (binding.decl->mode == ResolutionMode::Ordered)
        return binding.receivers.back();

    const BoundReceiver* res = &binding.receivers.front();
    for (const auto& r : binding.receivers) {
        if (r.is_explicit)
            return r;
        if (r.context_index >= res->context_index)
            res = &r;
    }
    return *res;
}


BoundCall build_call(Binding binding)
{
    BoundCall call;
    call.decl = binding.decl;
    call.args.reserve(binding.receivers.size());
    for (const auto& r : binding.receivers)
        call.args.push_back(r.value);

    call.this_scope = ThisScope(binding.decl->name, default_receiver(binding).value);
    for (const auto& r : binding.receivers)
        call.this_scope.add_label(std::string(binding.decl->receivers[r.receiver_index].simple_name()), r.value);

    call.binding = std::move(binding);
    return call;
}


std::ostream& operator<<(std::ostream& os, const BoundCall& v)
{
    os << v.decl->name << '(';
    for (size_t i = 0; i != v.args.size(); ++i)
        os << (i ? ", " : "") << v.args[i];
    os << ") this=" << v.this_scope.default_this();
    return os;
}


} // namespace ambit::resolve
