// Type.cpp created on 2026-09-15 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "Type.h"
#include <algorithm>

namespace ambit::resolve {


bool Type::is_generic() const
{
    return m_is_var || std::any_of(m_args.begin(), m_args.end(),
                                   [](const Type& arg) { return arg.is_generic(); });
}


std::string_view Type::simple_name() const
{
    std::string_view name = m_name;
    auto pos = name.rfind('.');
    if (pos != std::string_view::npos)
        name.remove_prefix(pos + 1);
    return name;
}


Type Type::substitute(const TypeArgs& type_args) const
{
    if (m_is_var) {
        auto it = type_args.find(m_name);
        return it == type_args.end() ? *this : it->second;
    }
    if (m_args.empty())
        return *this;
    std::vector<Type> args;
    args.reserve(m_args.size());
    for (const auto& arg : m_args)
        args.push_back(arg.substitute(type_args));
    return Type(m_name, std::move(args));
}


std::ostream& operator<<(std::ostream& os, const Type& v)
{
    os << v.name();
    if (v.args().empty())
        return os;
    os << '<';
    bool first = true;
    for (const auto& arg : v.args()) {
        if (!first)
            os << ", ";
        first = false;
        os << arg;
    }
    return os << '>';
}


std::ostream& operator<<(std::ostream& os, const TypeArgs& v)
{
    os << '[';
    bool first = true;
    for (const auto& [var, type] : v) {
        if (!first)
            os << ", ";
        first = false;
        os << var << '=' << type;
    }
    return os << ']';
}


} // namespace ambit::resolve
