// Declaration.cpp created on 2026-09-16 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "Declaration.h"
#include <ambit/core/log.h>
#include <ambit/compat/macros.h>

#include <set>
#include <algorithm>

namespace ambit::resolve {

using namespace ambit::core;


std::ostream& operator<<(std::ostream& os, ResolutionMode v)
{
    switch (v) {
        case ResolutionMode::Ordered:   return os << "ordered";
        case ResolutionMode::Unordered: return os << "unordered";
    }
    AMBIT_UNREACHABLE;
}


void Declaration::validate() const
{
    if (receivers.empty())
        throw missing_receiver(name, loc);

    // Canonical form: type params replaced by positional placeholders,
    // so `List<T>` and `List<U>` in different declarations compare equal
    // while `Map<K, V>` and `Map<V, K>` differ.
    TypeArgs canonical;
    for (size_t i = 0; i != type_params.size(); ++i)
        canonical.emplace(type_params[i], Type::var(fmt::format("${}", i)));

    std::vector<Type> seen_types;
    std::set<std::string_view> seen_names;
    for (const auto& recv : receivers) {
        Type c = recv.substitute(canonical);
        if (std::find(seen_types.begin(), seen_types.end(), c) != seen_types.end())
            throw duplicate_receiver_type(name, fmt::format("{}", recv), loc);
        seen_types.push_back(std::move(c));
        if (!seen_names.insert(recv.simple_name()).second)
            throw duplicate_receiver_name(name, recv.simple_name(), loc);
    }
}


std::ostream& operator<<(std::ostream& os, const Declaration& v)
{
    os << "fun ";
    if (!v.type_params.empty()) {
        os << '<';
        for (size_t i = 0; i != v.type_params.size(); ++i)
            os << (i ? ", " : "") << v.type_params[i];
        os << "> ";
    }
    const auto n = v.receivers.size();
    if (n > 1) {
        os << "context(";
        for (size_t i = 0; i != n - 1; ++i)
            os << (i ? ", " : "") << v.receivers[i];
        os << ") ";
    }
    if (n != 0)
        os << v.receivers.back() << '.';
    os << v.name;
    if (v.mode == ResolutionMode::Unordered)
        os << " [unordered]";
    return os;
}


const Declaration* DeclarationTable::add(Declaration decl)
{
    try {
        decl.validate();
    } catch (const ResolveError& e) {
        log::error("{}", e);
        m_errors.push_back(e);
        return nullptr;
    }
    const Declaration& stored = m_decls.emplace_back(std::move(decl));
    auto& set = m_sets[stored.name];
    if (set.name.empty())
        set.name = stored.name;
    set.candidates.push_back(&stored);
    log::debug("Declared {} at {}", stored, stored.loc);
    return &stored;
}


const OverloadSet* DeclarationTable::find(const std::string& name) const
{
    auto it = m_sets.find(name);
    if (it == m_sets.end())
        return nullptr;
    return &it->second;
}


} // namespace ambit::resolve
