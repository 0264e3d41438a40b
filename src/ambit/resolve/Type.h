// Type.h created on 2026-09-15 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_TYPE_H
#define AMBIT_RESOLVE_TYPE_H

#include <fmt/ostream.h>

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <ostream>

namespace ambit::resolve {


class Type;

/// Resolved type variables: var name -> type
using TypeArgs = std::map<std::string, Type>;


/// Nominal type, possibly with type arguments: `ui.Map<K, String>`
///
/// A type variable is a Type with `is_var() == true` and no args.
/// Type variables are the type parameters of a generic declaration.
/// Immutable value, safe to share between threads.
class Type {
public:
    Type() = default;
    explicit Type(std::string name, std::vector<Type> args = {})
        : m_name(std::move(name)), m_args(std::move(args)) {}

    static Type var(std::string name) { Type t(std::move(name)); t.m_is_var = true; return t; }

    const std::string& name() const { return m_name; }
    const std::vector<Type>& args() const { return m_args; }
    bool is_var() const { return m_is_var; }
    bool empty() const { return m_name.empty(); }

    /// True if the type is a var or contains a var in its args (recursively)
    bool is_generic() const;

    /// Last '.'-separated segment of the name, without args.
    /// `ui.List<Int>` -> `List`
    std::string_view simple_name() const;

    /// Replace vars bound in `type_args`, keep unbound vars as they are.
    Type substitute(const TypeArgs& type_args) const;

    bool operator==(const Type& rhs) const = default;

private:
    std::string m_name;
    std::vector<Type> m_args;
    bool m_is_var = false;
};


std::ostream& operator<<(std::ostream& os, const Type& v);
std::ostream& operator<<(std::ostream& os, const TypeArgs& v);


} // namespace ambit::resolve

template <> struct fmt::formatter<ambit::resolve::Type> : ostream_formatter {};
template <> struct fmt::formatter<ambit::resolve::TypeArgs> : ostream_formatter {};

#endif // include guard
