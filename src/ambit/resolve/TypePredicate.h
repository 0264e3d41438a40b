// TypePredicate.h created on 2026-09-16 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_TYPE_PREDICATE_H
#define AMBIT_RESOLVE_TYPE_PREDICATE_H

#include "Type.h"

namespace ambit::resolve {


/// Subtyping and unification, as provided by the host type checker.
/// Implementations must be pure and safe to call from multiple threads.
class TypePredicate {
public:
    virtual ~TypePredicate() = default;

    /// True if `sub` is a subtype of `super` or equal to it.
    /// Both types are concrete (no vars).
    virtual bool is_subtype(const Type& sub, const Type& super) const = 0;

    /// Match concrete `type` against `pattern` which may contain vars.
    /// Vars already present in `type_args` must agree, new vars are added.
    /// On failure, returns false and leaves `type_args` unchanged.
    virtual bool unify(const Type& type, const Type& pattern, TypeArgs& type_args) const = 0;

    /// Does the context type fit the declared receiver type?
    /// Non-generic declared types are checked with is_subtype only.
    bool matches(const Type& context, const Type& declared, TypeArgs& type_args) const {
        if (!declared.is_generic())
            return is_subtype(context, declared);
        return unify(context, declared, type_args);
    }
};


} // namespace ambit::resolve

#endif // include guard
