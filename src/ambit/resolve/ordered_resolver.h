// ordered_resolver.h created on 2026-09-17 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_ORDERED_RESOLVER_H
#define AMBIT_RESOLVE_ORDERED_RESOLVER_H

#include "Binding.h"
#include "TypePredicate.h"

#include <optional>

namespace ambit::resolve {


/// Resolve `decl` against the context stack in ordered mode.
///
/// The explicit receiver is the value given at call site, or the innermost
/// frame matching the last declared receiver. The remaining receivers are
/// bound by a backward scan, each to the innermost matching frame below
/// the previous one, so the context indices strictly increase in declared order.
/// The result is the lexicographically last valid assignment.
///
/// Runs in O(n*m) predicate calls for non-generic declarations.
/// Returns Resolved or NotApplicable, never Ambiguous.
Verdict resolve_ordered(const TypePredicate& pred, const Declaration& decl,
                        ContextFrames frames, const CallSite& call);

/// Same result as `resolve_ordered`, computed by enumerating every strictly
/// increasing assignment and taking the lexicographically last valid one.
/// Exponential, used for verification only.
std::optional<Binding> resolve_ordered_exhaustive(const TypePredicate& pred, const Declaration& decl,
                                                  ContextFrames frames, const CallSite& call);


} // namespace ambit::resolve

#endif // include guard
