// Binding.cpp created on 2026-09-17 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "Binding.h"
#include <ambit/compat/macros.h>

namespace ambit::resolve {


std::vector<size_t> Binding::context_indices() const
{
    std::vector<size_t> res;
    res.reserve(receivers.size());
    for (const auto& r : receivers)
        res.push_back(r.context_index);
    return res;
}


Binding make_binding(const Declaration& decl, ContextFrames frames, const CallSite& call,
                     const std::vector<size_t>& context_indices, TypeArgs type_args)
{
    Binding res;
    res.decl = &decl;
    res.receivers.reserve(context_indices.size());
    for (size_t k = 0; k != context_indices.size(); ++k) {
        const size_t j = context_indices[k];
        const bool is_explicit = (j == frames.size());
        const ContextFrame& ctx = is_explicit ? *call.receiver : frames[j];
        res.receivers.push_back({k, j, decl.receivers[k].substitute(type_args),
                                 ctx.type, ctx.value, is_explicit});
    }
    res.type_args = std::move(type_args);
    return res;
}


std::ostream& operator<<(std::ostream& os, const Binding& v)
{
    os << v.decl->name << '(';
    bool first = true;
    for (const auto& r : v.receivers) {
        if (!first)
            os << ", ";
        first = false;
        os << r.declared_type << '=' << r.value;
        if (r.is_explicit)
            os << '!';
        else
            os << '#' << r.context_index;
    }
    os << ')';
    if (!v.type_args.empty())
        os << ' ' << v.type_args;
    return os;
}


std::ostream& operator<<(std::ostream& os, Verdict::Kind v)
{
    switch (v) {
        case Verdict::Kind::NotApplicable:  return os << "NotApplicable";
        case Verdict::Kind::Resolved:       return os << "Resolved";
        case Verdict::Kind::Ambiguous:      return os << "Ambiguous";
    }
    AMBIT_UNREACHABLE;
}


std::ostream& operator<<(std::ostream& os, const Verdict& v)
{
    os << v.kind();
    switch (v.kind()) {
        case Verdict::Kind::NotApplicable:
            break;
        case Verdict::Kind::Resolved:
            os << ' ' << v.binding();
            break;
        case Verdict::Kind::Ambiguous:
            for (const auto& b : v.competitors())
                os << "\n    " << b << " at " << b.decl->loc;
            break;
    }
    return os;
}


} // namespace ambit::resolve
