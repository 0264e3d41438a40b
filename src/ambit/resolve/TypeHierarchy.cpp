// TypeHierarchy.cpp created on 2026-09-16 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "TypeHierarchy.h"
#include "Error.h"

#include <deque>
#include <algorithm>

namespace ambit::resolve {


void TypeHierarchy::define(const Type& type, std::vector<Type> supertypes)
{
    Entry entry;
    for (const auto& arg : type.args())
        entry.params.push_back(arg.name());
    entry.supertypes = std::move(supertypes);
    if (!m_types.try_emplace(type.name(), std::move(entry)).second)
        throw redefined_type(type.name());
}


std::vector<Type> TypeHierarchy::direct_supertypes(const Type& type) const
{
    auto it = m_types.find(type.name());
    if (it == m_types.end())
        return {};
    const Entry& entry = it->second;
    TypeArgs type_args;
    const auto n = std::min(entry.params.size(), type.args().size());
    for (size_t i = 0; i != n; ++i)
        type_args.emplace(entry.params[i], type.args()[i]);
    std::vector<Type> res;
    res.reserve(entry.supertypes.size());
    for (const auto& super : entry.supertypes)
        res.push_back(super.substitute(type_args));
    return res;
}


bool TypeHierarchy::is_subtype(const Type& sub, const Type& super) const
{
    TypeArgs unused;
    return unify(sub, super, unused);
}


bool TypeHierarchy::unify(const Type& type, const Type& pattern, TypeArgs& type_args) const
{
    // breadth-first walk up from `type`, nearest supertype wins
    std::deque<Type> queue {type};
    std::vector<Type> visited;
    while (!queue.empty()) {
        Type t = std::move(queue.front());
        queue.pop_front();
        if (std::find(visited.begin(), visited.end(), t) != visited.end())
            continue;
        TypeArgs attempt = type_args;
        if (unify_exact(t, pattern, attempt)) {
            type_args = std::move(attempt);
            return true;
        }
        for (auto& super : direct_supertypes(t))
            queue.push_back(std::move(super));
        visited.push_back(std::move(t));
    }
    return false;
}


bool TypeHierarchy::unify_exact(const Type& type, const Type& pattern, TypeArgs& type_args) const
{
    if (pattern.is_var()) {
        auto [it, inserted] = type_args.try_emplace(pattern.name(), type);
        return inserted || it->second == type;
    }
    if (type.name() != pattern.name() || type.args().size() != pattern.args().size())
        return false;
    for (size_t i = 0; i != type.args().size(); ++i) {
        if (!unify_exact(type.args()[i], pattern.args()[i], type_args))
            return false;
    }
    return true;
}


} // namespace ambit::resolve
