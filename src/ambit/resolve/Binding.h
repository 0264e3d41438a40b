// Binding.h created on 2026-09-17 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_BINDING_H
#define AMBIT_RESOLVE_BINDING_H

#include "Declaration.h"
#include "ReceiverStack.h"

#include <fmt/ostream.h>

#include <optional>
#include <vector>
#include <string>

namespace ambit::resolve {


/// Call site: the called name, the explicit receiver value if written
/// before the dot (`recv.name()`), and the source location.
struct CallSite {
    std::string name;
    std::optional<ContextFrame> receiver;
    SourceLoc loc;
};


/// Assignment of one declared receiver to a context.
struct BoundReceiver {
    size_t receiver_index = 0;  // position in Declaration::receivers
    size_t context_index = 0;   // position in context frames, == frames.size() for explicit value
    Type declared_type;         // after substitution of resolved type args
    Type context_type;
    ValueRef value;
    bool is_explicit = false;   // bound to the value written at call site
};


/// Result of successful resolution of a single declaration.
/// Points to the declaration, must not outlive its DeclarationTable.
struct Binding {
    const Declaration* decl = nullptr;
    std::vector<BoundReceiver> receivers;   // in declared order
    TypeArgs type_args;

    /// Context indices in declared order
    std::vector<size_t> context_indices() const;
};

std::ostream& operator<<(std::ostream& os, const Binding& v);


/// Build the binding from resolved context indices (in declared order).
/// Index `frames.size()` stands for the explicit value of the call site.
Binding make_binding(const Declaration& decl, ContextFrames frames, const CallSite& call,
                     const std::vector<size_t>& context_indices, TypeArgs type_args);


/// Outcome of resolving a call site against a declaration or an overload set
class Verdict {
public:
    enum class Kind {
        NotApplicable,
        Resolved,
        Ambiguous,
    };

    static Verdict not_applicable() { return Verdict(Kind::NotApplicable, {}); }
    static Verdict resolved(Binding binding) { return Verdict(Kind::Resolved, {std::move(binding)}); }
    static Verdict ambiguous(std::vector<Binding> competitors) { return Verdict(Kind::Ambiguous, std::move(competitors)); }

    Kind kind() const { return m_kind; }
    bool is_resolved() const { return m_kind == Kind::Resolved; }
    bool is_ambiguous() const { return m_kind == Kind::Ambiguous; }
    bool is_not_applicable() const { return m_kind == Kind::NotApplicable; }

    /// The winning binding. Valid only when resolved.
    const Binding& binding() const { return m_bindings.front(); }
    Binding& binding() { return m_bindings.front(); }

    /// Undominated candidates. Valid only when ambiguous.
    const std::vector<Binding>& competitors() const { return m_bindings; }

private:
    Verdict(Kind kind, std::vector<Binding> bindings) : m_kind(kind), m_bindings(std::move(bindings)) {}

    Kind m_kind;
    std::vector<Binding> m_bindings;
};

std::ostream& operator<<(std::ostream& os, Verdict::Kind v);
std::ostream& operator<<(std::ostream& os, const Verdict& v);


} // namespace ambit::resolve

template <> struct fmt::formatter<ambit::resolve::Binding> : ostream_formatter {};
template <> struct fmt::formatter<ambit::resolve::Verdict::Kind> : ostream_formatter {};
template <> struct fmt::formatter<ambit::resolve::Verdict> : ostream_formatter {};

#endif // include guard
