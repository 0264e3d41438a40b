// Resolver.h created on 2026-09-19 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_RESOLVER_H
#define AMBIT_RESOLVE_RESOLVER_H

#include "CallBuilder.h"
#include "TypePredicate.h"
#include <ambit/core/log.h>

#include <optional>
#include <filesystem>

namespace ambit::config { class Config; }

namespace ambit::resolve {


struct ResolverOptions {
    /// Cross-check each ordered resolution with exhaustive search
    bool verify_greedy = false;

    /// Log level requested by config, applied by the application
    std::optional<core::Logger::Level> log_level;

    /// Override the options with items found in config:
    /// ```
    /// verify_greedy true
    /// log_level "debug"
    /// ```
    /// Unknown items and values of wrong type are reported and ignored.
    void load(const config::Config& cfg);

    /// \returns false if the file couldn't be read or parsed
    bool load_file(const std::filesystem::path& path);
};


/// Entry point of the engine.
///
/// Stateless apart from the options, all methods are const and reentrant.
/// The type predicate must outlive the resolver.
class Resolver {
public:
    explicit Resolver(const TypePredicate& pred, ResolverOptions options = {})
        : m_pred(pred), m_options(std::move(options)) {}

    const TypePredicate& predicate() const { return m_pred; }
    const ResolverOptions& options() const { return m_options; }

    /// Resolve single declaration by its mode
    /// Throws ContractViolation(AmbiguousBinding) if greedy verification fails.
    Verdict resolve(const Declaration& decl, ContextFrames frames, const CallSite& call) const;

    /// Resolve every candidate and pick the most specific one
    Verdict resolve(const OverloadSet& overloads, ContextFrames frames, const CallSite& call) const;

    /// Look up the called name and construct the invocation.
    /// Throws ResolveError: UndefinedName, NoValidBinding, AmbiguousOverload
    BoundCall bind_call(const DeclarationTable& table, ContextFrames frames, const CallSite& call) const;

private:
    const TypePredicate& m_pred;
    ResolverOptions m_options;
};


} // namespace ambit::resolve

#endif // include guard
