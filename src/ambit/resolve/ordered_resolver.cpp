// ordered_resolver.cpp created on 2026-09-17 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "ordered_resolver.h"
#include <ambit/core/log.h>

#include <range/v3/view/iota.hpp>
#include <range/v3/view/reverse.hpp>

#include <functional>

namespace ambit::resolve {

using ranges::views::iota;
using ranges::views::reverse;


namespace {

class OrderedScan {
public:
    OrderedScan(const TypePredicate& pred, const Declaration& decl, ContextFrames frames)
        : m_pred(pred), m_decl(decl), m_frames(frames), m_indices(decl.receiver_count()) {}

    /// Bind receivers [0..k] to frames below `hi` (exclusive)
    bool scan(size_t k, size_t hi, const TypeArgs& type_args) {
        const Type& declared = m_decl.receivers[k];
        bool plain_failed = false;
        for (size_t j : iota(size_t(0), hi) | reverse) {
            TypeArgs attempt = type_args;
            if (!m_pred.matches(m_frames[j].type, declared, attempt))
                continue;
            // A choice which bound no new type args failed already,
            // any lower frame leaves even less room for the rest.
            const bool bound_new = attempt.size() != type_args.size();
            if (plain_failed && !bound_new)
                continue;
            TRACE("{}: receiver #{} {} -> frame #{} {}", m_decl.name, k, declared, j, m_frames[j]);
            m_indices[k] = j;
            if (k == 0 || scan(k - 1, j, attempt)) {
                if (k == 0)
                    m_type_args = std::move(attempt);
                return true;
            }
            if (!bound_new) {
                plain_failed = true;
                if (!m_decl.is_generic())
                    break;
            }
        }
        return false;
    }

    const std::vector<size_t>& indices() const { return m_indices; }
    TypeArgs& type_args() { return m_type_args; }

private:
    const TypePredicate& m_pred;
    const Declaration& m_decl;
    ContextFrames m_frames;
    std::vector<size_t> m_indices;
    TypeArgs m_type_args;
};


/// Check assignment `indices` (declared order), threading type args
/// from the explicit receiver downwards, in the same order as the scan.
std::optional<TypeArgs> check_assignment(const TypePredicate& pred, const Declaration& decl,
                                         ContextFrames frames, const CallSite& call,
                                         const std::vector<size_t>& indices)
{
    TypeArgs type_args;
    for (size_t k : iota(size_t(0), indices.size()) | reverse) {
        const size_t j = indices[k];
        const Type& context = (j == frames.size()) ? call.receiver->type : frames[j].type;
        if (!pred.matches(context, decl.receivers[k], type_args))
            return std::nullopt;
    }
    return type_args;
}


/// Visit strictly increasing assignments of receivers [0..k] below `hi`,
/// highest indices first. Stop when `visit` returns true.
bool enumerate_below(size_t k, size_t hi, std::vector<size_t>& indices,
                     const std::function<bool(const std::vector<size_t>&)>& visit)
{
    for (size_t j : iota(size_t(0), hi) | reverse) {
        indices[k] = j;
        if (k == 0 ? visit(indices) : enumerate_below(k - 1, j, indices, visit))
            return true;
    }
    return false;
}

} // namespace


Verdict resolve_ordered(const TypePredicate& pred, const Declaration& decl,
                        ContextFrames frames, const CallSite& call)
{
    const size_t n = decl.receiver_count();
    const size_t m = frames.size();
    OrderedScan scan(pred, decl, frames);

    if (call.receiver) {
        // explicit value, just past the innermost frame
        TypeArgs type_args;
        if (!pred.matches(call.receiver->type, decl.explicit_receiver(), type_args)) {
            TRACE("{}: explicit {} does not match {}", decl.name, *call.receiver, decl.explicit_receiver());
            return Verdict::not_applicable();
        }
        if (n == 1)
            return Verdict::resolved(make_binding(decl, frames, call, {m}, std::move(type_args)));
        if (!scan.scan(n - 2, m, type_args))
            return Verdict::not_applicable();
        auto indices = scan.indices();
        indices.back() = m;
        return Verdict::resolved(make_binding(decl, frames, call, indices, std::move(scan.type_args())));
    }

    // implicit call: the explicit receiver is taken from the stack as well
    if (!scan.scan(n - 1, m, {}))
        return Verdict::not_applicable();
    return Verdict::resolved(make_binding(decl, frames, call, scan.indices(), std::move(scan.type_args())));
}


std::optional<Binding> resolve_ordered_exhaustive(const TypePredicate& pred, const Declaration& decl,
                                                  ContextFrames frames, const CallSite& call)
{
    const size_t n = decl.receiver_count();
    const size_t m = frames.size();
    std::vector<size_t> indices(n);
    std::optional<Binding> res;

    // Candidates are visited in descending lexicographic order
    // (compared from the last receiver), so the first valid one is the answer.
    auto visit = [&](const std::vector<size_t>& candidate) {
        auto type_args = check_assignment(pred, decl, frames, call, candidate);
        if (!type_args)
            return false;
        res = make_binding(decl, frames, call, candidate, std::move(*type_args));
        return true;
    };

    if (call.receiver) {
        indices.back() = m;
        if (n == 1)
            visit(indices);
        else
            enumerate_below(n - 2, m, indices, visit);
    } else {
        enumerate_below(n - 1, m, indices, visit);
    }
    return res;
}


} // namespace ambit::resolve
