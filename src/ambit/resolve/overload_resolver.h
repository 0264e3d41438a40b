// overload_resolver.h created on 2026-09-18 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_OVERLOAD_RESOLVER_H
#define AMBIT_RESOLVE_OVERLOAD_RESOLVER_H

#include "Binding.h"
#include "TypePredicate.h"

#include <vector>
#include <utility>

namespace ambit::resolve {


/// Is `a` more specific than `b`?
///
/// Both must have the same receiver count. Each declared receiver type of `a`
/// (after substitution) is a subtype of or equal to the one of `b` at the same
/// position, and strictly a subtype at least at one position.
bool is_more_specific(const TypePredicate& pred, const Binding& a, const Binding& b);

/// Find the candidate more specific than all others
/// \returns {winner, nullptr if there is none; candidates not dominated by any other}
std::pair<const Binding*, std::vector<const Binding*>>
find_most_specific(const TypePredicate& pred, const std::vector<Binding>& candidates);

/// Pick the verdict for an overload set from bindings of its applicable candidates.
/// Zero -> NotApplicable, one -> Resolved, more -> the most specific or Ambiguous.
Verdict select_most_specific(const TypePredicate& pred, std::vector<Binding> candidates);


} // namespace ambit::resolve

#endif // include guard
