// Resolver.cpp created on 2026-09-19 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "Resolver.h"
#include "ordered_resolver.h"
#include "unordered_resolver.h"
#include "overload_resolver.h"
#include <ambit/config/ConfigParser.h>
#include <ambit/compat/macros.h>

#include <fmt/format.h>

namespace ambit::resolve {

using namespace ambit::core;


void ResolverOptions::load(const config::Config& cfg)
{
    for (const auto& item : cfg) {
        if (item.name() == "verify_greedy") {
            if (!item.is_bool()) {
                log::warning("Config: verify_greedy expects bool, got {} on line {}, ignored",
                             item.type_name(), item.line());
                continue;
            }
            verify_greedy = item.as_bool();
        } else if (item.name() == "log_level") {
            auto level = item.is_string() ? parse_log_level(item.as_string()) : std::nullopt;
            if (!level) {
                log::warning("Config: invalid log_level: {}", item.to_string());
                continue;
            }
            log_level = level;
        } else {
            log::warning("Config: unknown option on line {}: {}", item.line(), item.name());
        }
    }
}


bool ResolverOptions::load_file(const std::filesystem::path& path)
{
    try {
        load(config::parse_config_file(path));
    } catch (const config::ConfigError& e) {
        log::error("Config: {}:{}: {}", e.source(), e.line(), e.msg());
        return false;
    }
    return true;
}


static std::string format_binding(const std::optional<Binding>& b)
{
    if (!b)
        return "none";
    std::string res;
    for (size_t j : b->context_indices())
        res += fmt::format("{}{}", res.empty() ? "" : ",", j);
    return res;
}


Verdict Resolver::resolve(const Declaration& decl, ContextFrames frames, const CallSite& call) const
{
    switch (decl.mode) {
        case ResolutionMode::Unordered:
            return resolve_unordered(m_pred, decl, frames, call);
        case ResolutionMode::Ordered: {
            auto verdict = resolve_ordered(m_pred, decl, frames, call);
            if (m_options.verify_greedy) {
                auto expected = resolve_ordered_exhaustive(m_pred, decl, frames, call);
                std::optional<Binding> got;
                if (verdict.is_resolved())
                    got = verdict.binding();
                const bool same = got.has_value() == expected.has_value()
                        && (!got || got->context_indices() == expected->context_indices());
                if (!same)
                    throw ambiguous_binding(decl.name, format_binding(got), format_binding(expected));
            }
            return verdict;
        }
    }
    AMBIT_UNREACHABLE;
}


Verdict Resolver::resolve(const OverloadSet& overloads, ContextFrames frames, const CallSite& call) const
{
    std::vector<Binding> applicable;
    for (const Declaration* decl : overloads.candidates) {
        auto verdict = resolve(*decl, frames, call);
        if (verdict.is_resolved())
            applicable.push_back(std::move(verdict.binding()));
    }
    auto res = select_most_specific(m_pred, std::move(applicable));
    log::debug("{} at {}: {}", call.name, call.loc, res);
    return res;
}


static std::string format_candidates(const std::vector<const Declaration*>& decls)
{
    std::string res = "   Candidates:";
    for (const Declaration* d : decls)
        res += fmt::format("\n      {} at {}", *d, d->loc);
    return res;
}


BoundCall Resolver::bind_call(const DeclarationTable& table, ContextFrames frames, const CallSite& call) const
{
    const OverloadSet* overloads = table.find(call.name);
    if (overloads == nullptr)
        throw undefined_name(call.name, call.loc);

    auto verdict = resolve(*overloads, frames, call);
    switch (verdict.kind()) {
        case Verdict::Kind::NotApplicable:
            throw no_valid_binding(call.name, format_candidates(overloads->candidates), call.loc);
        case Verdict::Kind::Ambiguous: {
            std::vector<const Declaration*> decls;
            for (const auto& b : verdict.competitors())
                decls.push_back(b.decl);
            throw ambiguous_overload(call.name, format_candidates(decls), call.loc);
        }
        case Verdict::Kind::Resolved:
            return build_call(std::move(verdict.binding()));
    }
    AMBIT_UNREACHABLE;
}


} // namespace ambit::resolve
