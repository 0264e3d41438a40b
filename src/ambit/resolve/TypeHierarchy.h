// TypeHierarchy.h created on 2026-09-16 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_TYPE_HIERARCHY_H
#define AMBIT_RESOLVE_TYPE_HIERARCHY_H

#include "TypePredicate.h"

#include <unordered_map>
#include <vector>
#include <string>

namespace ambit::resolve {


/// Nominal type registry with declared supertypes.
///
/// Generic types are defined with their params as vars:
///     define(`ArrayList<E>`, {`List<E>`, `Sized`})
/// Type arguments are invariant: `List<Button>` is not a subtype of `List<Widget>`.
/// Types that were never defined are only subtypes of themselves.
///
/// Read-only after construction, shareable between threads.
class TypeHierarchy final : public TypePredicate {
public:
    /// Throws ResolveError(RedefinedType) if the name was already defined.
    void define(const Type& type, std::vector<Type> supertypes = {});

    bool is_defined(const std::string& name) const { return m_types.contains(name); }

    /// Direct supertypes of concrete `type`, with its args substituted.
    std::vector<Type> direct_supertypes(const Type& type) const;

    bool is_subtype(const Type& sub, const Type& super) const override;
    bool unify(const Type& type, const Type& pattern, TypeArgs& type_args) const override;

private:
    bool unify_exact(const Type& type, const Type& pattern, TypeArgs& type_args) const;

    struct Entry {
        std::vector<std::string> params;
        std::vector<Type> supertypes;
    };
    std::unordered_map<std::string, Entry> m_types;
};


} // namespace ambit::resolve

#endif // include guard
