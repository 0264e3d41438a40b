// Scenario.h created on 2026-09-21 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_SCENARIO_SCENARIO_H
#define AMBIT_SCENARIO_SCENARIO_H

#include <ambit/resolve/Resolver.h>
#include <ambit/resolve/TypeHierarchy.h>
#include <ambit/core/NonCopyable.h>

#include <fmt/ostream.h>

#include <filesystem>
#include <optional>
#include <vector>
#include <string>

namespace ambit::config { class Config; }

namespace ambit::scenario {

namespace fs = std::filesystem;
using resolve::SourceLoc;


/// Resolution result of one call site in the scenario
struct CallOutcome {
    std::string name;
    SourceLoc loc;
    std::optional<resolve::BoundCall> call;
    std::optional<resolve::ResolveError> error;

    bool is_resolved() const { return call.has_value(); }
};

std::ostream& operator<<(std::ostream& os, const CallOutcome& v);


/// Types, declarations and nested receiver scopes with call sites,
/// loaded from a file in config syntax:
/// ```
/// options { verify_greedy true }
/// type { name "Button"; super "Widget" }
/// type { name "ArrayList<E>"; super "List<E>" }
/// global { type "Script"; value "G" }
/// decl { name "render"; receivers "Widget, Session"; mode "ordered" }
/// decl { name "first"; params "T"; receivers "List<T>" }
/// with {
///   type "Widget"; value "w"
///   call { name "render" }
///   call { name "render"; receiver "Session"; value "s" }
/// }
/// ```
class Scenario : private core::NonCopyable {
public:
    Scenario() = default;

    /// Throws ResolveError(ParseError) on invalid syntax or structure.
    /// Invalid declarations are not fatal, see `declarations().errors()`.
    void load_file(const fs::path& path);
    void load_string(const std::string& str, const std::string& source_name = "<buffer>");

    const resolve::TypeHierarchy& types() const { return m_types; }
    const resolve::DeclarationTable& declarations() const { return m_decls; }
    const std::vector<resolve::ContextFrame>& globals() const { return m_globals; }
    resolve::ResolverOptions& options() { return m_options; }
    const resolve::ResolverOptions& options() const { return m_options; }

    /// Walk the scopes, pushing and popping receivers, and resolve every call site.
    /// Call site errors are recorded in the outcomes,
    /// ContractViolation is propagated.
    std::vector<CallOutcome> run() const;

    /// Same outcomes as `run`, but call sites are first collected with snapshots
    /// of the receiver stack and then resolved on `n_threads` workers.
    std::vector<CallOutcome> run_parallel(unsigned n_threads) const;

private:
    struct Node {
        enum class Kind { With, Call };
        Kind kind = Kind::Call;
        std::string name;                               // Call: called name
        std::optional<resolve::ContextFrame> frame;     // With: pushed receiver, Call: explicit receiver
        SourceLoc loc;
        std::vector<Node> body;                         // With: nested items
    };

    void load(const config::Config& cfg, const std::string& source_name);
    void load_type(const config::Config& group, const SourceLoc& loc);
    void load_decl(const config::Config& group, const SourceLoc& loc);
    resolve::ContextFrame load_frame(const config::Config& group, const SourceLoc& loc, bool required) const;
    Node load_with(const config::Config& group, const SourceLoc& loc, const std::string& source_name) const;
    Node load_call(const config::Config& group, const SourceLoc& loc) const;

    template <class F> void walk(const std::vector<Node>& body, resolve::ReceiverStack& stack, F&& visit_call) const;

    resolve::TypeHierarchy m_types;
    resolve::DeclarationTable m_decls;
    resolve::ResolverOptions m_options;
    std::vector<resolve::ContextFrame> m_globals;
    std::vector<Node> m_body;
};


} // namespace ambit::scenario

template <> struct fmt::formatter<ambit::scenario::CallOutcome> : ostream_formatter {};

#endif // include guard
