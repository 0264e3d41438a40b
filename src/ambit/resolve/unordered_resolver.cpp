// unordered_resolver.cpp created on 2026-09-18 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "unordered_resolver.h"
#include <ambit/core/log.h>

#include <range/v3/view/iota.hpp>
#include <range/v3/view/reverse.hpp>

#include <algorithm>

namespace ambit::resolve {

using ranges::views::iota;
using ranges::views::reverse;


Verdict resolve_unordered(const TypePredicate& pred, const Declaration& decl,
                          ContextFrames frames, const CallSite& call)
{
    const size_t m = frames.size();
    const size_t end = call.receiver ? m + 1 : m;
    auto context_type = [&](size_t j) -> const Type& {
        return j == m ? call.receiver->type : frames[j].type;
    };

    std::vector<size_t> indices;
    indices.reserve(decl.receiver_count());
    TypeArgs type_args;
    for (const Type& declared : decl.receivers) {
        bool found = false;
        for (size_t j : iota(size_t(0), end) | reverse) {
            TypeArgs attempt = type_args;
            if (pred.matches(context_type(j), declared, attempt)) {
                TRACE("{}: receiver {} -> context #{}", decl.name, declared, j);
                indices.push_back(j);
                type_args = std::move(attempt);
                found = true;
                break;
            }
        }
        if (!found) {
            TRACE("{}: receiver {} unbound", decl.name, declared);
            return Verdict::not_applicable();
        }
    }

    if (call.receiver && std::find(indices.begin(), indices.end(), m) == indices.end()) {
        TRACE("{}: explicit {} not consumed", decl.name, *call.receiver);
        return Verdict::not_applicable();
    }

    return Verdict::resolved(make_binding(decl, frames, call, indices, std::move(type_args)));
}


} // namespace ambit::resolve
