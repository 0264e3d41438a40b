// batch.h created on 2026-09-20 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_BATCH_H
#define AMBIT_RESOLVE_BATCH_H

#include "Resolver.h"

#include <optional>
#include <vector>

namespace ambit::resolve {


/// Independent call site with its own snapshot of the receiver stack
struct BatchJob {
    std::vector<ContextFrame> frames;
    CallSite call;
};

/// Exactly one of the members is set
struct BatchResult {
    std::optional<BoundCall> call;
    std::optional<ResolveError> error;
};


/// Resolve `jobs` on `n_threads` worker threads (0 = number of CPUs).
/// Results are returned in order of jobs.
/// ResolveError is kept in the result. ContractViolation and any other
/// exception is rethrown after all workers finished.
std::vector<BatchResult> resolve_batch(const Resolver& resolver, const DeclarationTable& table,
                                       const std::vector<BatchJob>& jobs, unsigned n_threads = 0);


} // namespace ambit::resolve

#endif // include guard
