// CallBuilder.h created on 2026-09-19 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_CALL_BUILDER_H
#define AMBIT_RESOLVE_CALL_BUILDER_H

#include "Binding.h"

#include <fmt/ostream.h>

#include <string>
#include <string_view>
#include <vector>
#include <utility>

namespace ambit::resolve {


/// Names visible as `this` inside the called body.
class ThisScope {
public:
    ThisScope() = default;
    ThisScope(std::string decl_name, ValueRef default_this)
        : m_decl_name(std::move(decl_name)), m_default(std::move(default_this)) {}

    void add_label(std::string label, ValueRef value) { m_labels.emplace_back(std::move(label), std::move(value)); }

    /// Plain `this`
    const ValueRef& default_this() const { return m_default; }

    /// `this@Label`, label is the simple name of a receiver type.
    /// Throws ResolveError(UndefinedReceiverLabel) if there is no such receiver.
    const ValueRef& this_at(std::string_view label) const;

    const std::vector<std::pair<std::string, ValueRef>>& labels() const { return m_labels; }

private:
    std::string m_decl_name;
    ValueRef m_default;
    std::vector<std::pair<std::string, ValueRef>> m_labels;  // in declared order
};


/// Unambiguous invocation reconstructed from a binding
struct BoundCall {
    const Declaration* decl = nullptr;
    std::vector<ValueRef> args;     // receiver values in declared order
    ThisScope this_scope;
    Binding binding;
};

std::ostream& operator<<(std::ostream& os, const BoundCall& v);


/// Positional receiver args in declared order, default `this` and `this@Name` labels.
///
/// Default `this` is the explicit receiver in ordered mode.
/// In unordered mode, it's the explicit value if the call site has one,
/// otherwise the receiver bound to the innermost context (last declared wins ties).
BoundCall build_call(Binding binding);


} // namespace ambit::resolve

template <> struct fmt::formatter<ambit::resolve::BoundCall> : ostream_formatter {};

#endif // include guard
