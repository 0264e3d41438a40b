// Scenario.cpp created on 2026-09-21 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "Scenario.h"
#include <ambit/resolve/TypeParser.h>
#include <ambit/resolve/batch.h>
#include <ambit/config/ConfigParser.h>
#include <ambit/core/log.h>
#include <ambit/core/string.h>

#include <fmt/format.h>

#include <algorithm>

namespace ambit::scenario {

using namespace ambit::core;
using namespace ambit::resolve;
using config::Config;
using config::ConfigItem;


static SourceLoc item_loc(const SourceLoc& parent, const ConfigItem& item)
{
    return SourceLoc{parent.file, item.line(), 0};
}


/// String value of item `name` in the group, nullopt if missing.
/// Throws if present with other type than string.
static std::optional<std::string> get_string(const Config& group, const char* name, const SourceLoc& loc)
{
    const ConfigItem* item = group.find(name);
    if (item == nullptr)
        return std::nullopt;
    if (!item->is_string())
        throw parse_error(fmt::format("expected string value of '{}', got {}", name, item->type_name()),
                          item_loc(loc, *item));
    return item->as_string();
}


static std::string require_string(const Config& group, const char* name, const SourceLoc& loc)
{
    auto res = get_string(group, name, loc);
    if (!res)
        throw parse_error(fmt::format("missing '{}'", name), loc);
    return std::move(*res);
}


static void check_items(const Config& group, std::initializer_list<std::string_view> allowed, const SourceLoc& loc)
{
    for (const auto& item : group) {
        if (std::find(allowed.begin(), allowed.end(), item.name()) == allowed.end())
            throw parse_error(fmt::format("unexpected item '{}'", item.name()), item_loc(loc, item));
    }
}


std::ostream& operator<<(std::ostream& os, const CallOutcome& v)
{
    os << v.loc << ": " << v.name << ": ";
    if (v.call)
        return os << *v.call;
    if (v.error)
        return os << v.error->code() << ": " << v.error->what();
    return os << "(not resolved)";
}


static ResolveError config_error(const config::ConfigError& e)
{
    return parse_error(e.msg(), SourceLoc{e.source(), e.line(), e.column()});
}


void Scenario::load_file(const fs::path& path)
{
    try {
        load(config::parse_config_file(path), path.string());
    } catch (const config::ConfigError& e) {
        throw config_error(e);
    }
}


void Scenario::load_string(const std::string& str, const std::string& source_name)
{
    try {
        load(config::parse_config(str, source_name), source_name);
    } catch (const config::ConfigError& e) {
        throw config_error(e);
    }
}


void Scenario::load(const Config& cfg, const std::string& source_name)
{
    const SourceLoc file_loc{source_name};
    for (const auto& item : cfg) {
        const SourceLoc loc = item_loc(file_loc, item);
        if (!item.is_group())
            throw parse_error(fmt::format("expected group '{} {{...}}'", item.name()), loc);
        const Config& group = item.as_group();
        if (item.name() == "options") {
            m_options.load(group);
        } else if (item.name() == "type") {
            load_type(group, loc);
        } else if (item.name() == "global") {
            check_items(group, {"type", "value"}, loc);
            m_globals.push_back(load_frame(group, loc, true));
        } else if (item.name() == "decl") {
            load_decl(group, loc);
        } else if (item.name() == "with") {
            m_body.push_back(load_with(group, loc, source_name));
        } else if (item.name() == "call") {
            m_body.push_back(load_call(group, loc));
        } else {
            throw parse_error(fmt::format("unexpected item '{}'", item.name()), loc);
        }
    }
    log::debug("Loaded scenario {}: {} declarations, {} globals, {} top-level items",
               source_name, m_decls.size(), m_globals.size(), m_body.size());
}


void Scenario::load_type(const Config& group, const SourceLoc& loc)
{
    check_items(group, {"name", "super"}, loc);
    // `ArrayList<E>`: the args of the defined name are its params
    const auto name_src = require_string(group, "name", loc);
    TypeParams params;
    for (const auto& arg : parse_type(name_src, {}, loc).args())
        params.insert(arg.name());
    const Type type = parse_type(name_src, params, loc);

    std::vector<Type> supers;
    for (const ConfigItem* item : group.find_all("super")) {
        if (!item->is_string())
            throw parse_error(fmt::format("expected string value of 'super', got {}", item->type_name()),
                              item_loc(loc, *item));
        for (auto& super : parse_type_list(item->as_string(), params, item_loc(loc, *item)))
            supers.push_back(std::move(super));
    }
    try {
        m_types.define(type, std::move(supers));
    } catch (const ResolveError& e) {
        throw ResolveError(e.code(), e.what(), loc);
    }
}


void Scenario::load_decl(const Config& group, const SourceLoc& loc)
{
    check_items(group, {"name", "receivers", "mode", "params"}, loc);
    Declaration decl;
    decl.name = require_string(group, "name", loc);
    decl.loc = loc;

    TypeParams params;
    if (auto src = get_string(group, "params", loc)) {
        params = parse_type_params(*src, loc);
        // keep the order as written, TypeParams set is sorted
        for (auto name : split(*src, ',')) {
            name = stripped(name);
            if (!name.empty())
                decl.type_params.emplace_back(name);
        }
    }
    decl.receivers = parse_type_list(get_string(group, "receivers", loc).value_or(""), params, loc);

    const auto mode = get_string(group, "mode", loc).value_or("ordered");
    if (mode == "ordered")
        decl.mode = ResolutionMode::Ordered;
    else if (mode == "unordered")
        decl.mode = ResolutionMode::Unordered;
    else
        throw parse_error(fmt::format("unknown resolution mode: {}", mode), loc);

    m_decls.add(std::move(decl));
}


ContextFrame Scenario::load_frame(const Config& group, const SourceLoc& loc, bool required) const
{
    auto type_src = required ? require_string(group, "type", loc)
                             : get_string(group, "receiver", loc).value_or("");
    auto value = get_string(group, "value", loc).value_or(type_src);
    return ContextFrame{parse_type(type_src, {}, loc), ValueRef{std::move(value), nullptr}};
}


auto Scenario::load_with(const Config& group, const SourceLoc& loc, const std::string& source_name) const -> Node
{
    Node node;
    node.kind = Node::Kind::With;
    node.loc = loc;
    node.frame = load_frame(group, loc, true);
    for (const auto& item : group) {
        const SourceLoc item_l = item_loc(loc, item);
        if (item.name() == "type" || item.name() == "value")
            continue;
        if (!item.is_group())
            throw parse_error(fmt::format("unexpected item '{}'", item.name()), item_l);
        if (item.name() == "with")
            node.body.push_back(load_with(item.as_group(), item_l, source_name));
        else if (item.name() == "call")
            node.body.push_back(load_call(item.as_group(), item_l));
        else
            throw parse_error(fmt::format("unexpected item '{}'", item.name()), item_l);
    }
    return node;
}


auto Scenario::load_call(const Config& group, const SourceLoc& loc) const -> Node
{
    check_items(group, {"name", "receiver", "value"}, loc);
    Node node;
    node.kind = Node::Kind::Call;
    node.loc = loc;
    node.name = require_string(group, "name", loc);
    if (group.find("receiver") != nullptr)
        node.frame = load_frame(group, loc, false);
    else if (group.find("value") != nullptr)
        throw parse_error("'value' of a call requires 'receiver' type", loc);
    return node;
}


template <class F>
void Scenario::walk(const std::vector<Node>& body, ReceiverStack& stack, F&& visit_call) const
{
    for (const Node& node : body) {
        switch (node.kind) {
            case Node::Kind::With: {
                ScopedReceiver scope(stack, node.frame->type, node.frame->value);
                walk(node.body, stack, visit_call);
                break;
            }
            case Node::Kind::Call:
                visit_call(stack, CallSite{node.name, node.frame, node.loc});
                break;
        }
    }
}


std::vector<CallOutcome> Scenario::run() const
{
    const Resolver resolver(m_types, m_options);
    ReceiverStack stack(m_globals);
    std::vector<CallOutcome> res;
    walk(m_body, stack, [&](const ReceiverStack& st, const CallSite& call) {
        CallOutcome outcome {call.name, call.loc, {}, {}};
        try {
            outcome.call = resolver.bind_call(m_decls, st.frames(), call);
        } catch (const ResolveError& e) {
            log::debug("{}", e);
            outcome.error = e;
        }
        res.push_back(std::move(outcome));
    });
    return res;
}


std::vector<CallOutcome> Scenario::run_parallel(unsigned n_threads) const
{
    const Resolver resolver(m_types, m_options);
    ReceiverStack stack(m_globals);
    std::vector<BatchJob> jobs;
    walk(m_body, stack, [&jobs](const ReceiverStack& st, const CallSite& call) {
        jobs.push_back({st.snapshot(), call});
    });

    auto results = resolve_batch(resolver, m_decls, jobs, n_threads);
    std::vector<CallOutcome> res;
    res.reserve(results.size());
    for (size_t i = 0; i != results.size(); ++i) {
        res.push_back({jobs[i].call.name, jobs[i].call.loc,
                       std::move(results[i].call), std::move(results[i].error)});
    }
    return res;
}


} // namespace ambit::scenario
