// overload_resolver.cpp created on 2026-09-18 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "overload_resolver.h"
#include <ambit/core/log.h>

#include <algorithm>

namespace ambit::resolve {

using namespace ambit::core;


bool is_more_specific(const TypePredicate& pred, const Binding& a, const Binding& b)
{
    if (a.receivers.size() != b.receivers.size())
        return false;
    bool strict = false;
    for (size_t i = 0; i != a.receivers.size(); ++i) {
        const Type& ta = a.receivers[i].declared_type;
        const Type& tb = b.receivers[i].declared_type;
        if (ta == tb)
            continue;
        if (!pred.is_subtype(ta, tb))
            return false;
        if (!pred.is_subtype(tb, ta))
            strict = true;
    }
    return strict;
}


std::pair<const Binding*, std::vector<const Binding*>>
find_most_specific(const TypePredicate& pred, const std::vector<Binding>& candidates)
{
    const Binding* winner = nullptr;
    std::vector<const Binding*> undominated;
    for (const auto& item : candidates) {
        bool dominates_all = true;
        bool dominated = false;
        for (const auto& other : candidates) {
            if (&other == &item)
                continue;
            if (!is_more_specific(pred, item, other))
                dominates_all = false;
            if (is_more_specific(pred, other, item))
                dominated = true;
        }
        if (dominates_all && winner == nullptr)
            winner = &item;
        if (!dominated)
            undominated.push_back(&item);
    }
    return {winner, std::move(undominated)};
}


Verdict select_most_specific(const TypePredicate& pred, std::vector<Binding> candidates)
{
    if (candidates.empty())
        return Verdict::not_applicable();
    if (candidates.size() == 1)
        return Verdict::resolved(std::move(candidates.front()));

    auto [winner, undominated] = find_most_specific(pred, candidates);
    if (winner != nullptr) {
        log::debug("{}: most specific of {} candidates is {}",
                   winner->decl->name, candidates.size(), *winner);
        return Verdict::resolved(*winner);
    }

    // no unique winner, report the candidates nobody beats
    // (all of them when the relation has no minimum at all)
    std::vector<Binding> competitors;
    if (undominated.empty()) {
        competitors = std::move(candidates);
    } else {
        competitors.reserve(undominated.size());
        for (const Binding* b : undominated)
            competitors.push_back(*b);
    }
    return Verdict::ambiguous(std::move(competitors));
}


} // namespace ambit::resolve
