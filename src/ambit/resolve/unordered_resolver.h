// unordered_resolver.h created on 2026-09-18 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_UNORDERED_RESOLVER_H
#define AMBIT_RESOLVE_UNORDERED_RESOLVER_H

#include "Binding.h"
#include "TypePredicate.h"

namespace ambit::resolve {


/// Resolve `decl` against the flattened context list in unordered mode.
///
/// The context list is the stack frames (globals first), followed by
/// the explicit value of the call site if there is one.
/// Receivers are processed in declared order, each binds to the innermost
/// matching context. Several receivers may share one context.
/// Type args bound by earlier receivers constrain the later ones, there is no backtracking.
/// An explicit value must be taken by at least one receiver.
///
/// Runs in O(n*m) predicate calls. Returns Resolved or NotApplicable.
Verdict resolve_unordered(const TypePredicate& pred, const Declaration& decl,
                          ContextFrames frames, const CallSite& call);


} // namespace ambit::resolve

#endif // include guard
