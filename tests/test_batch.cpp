// test_batch.cpp created on 2026-09-27 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <ambit/resolve/batch.h>
#include <ambit/resolve/TypeHierarchy.h>
#include <ambit/resolve/TypeParser.h>
#include <ambit/core/log.h>

#include <fmt/format.h>

#include <stdexcept>

using namespace ambit::resolve;
using ambit::core::Logger;


TEST_CASE( "Batch resolution equals sequential", "[batch]" )
{
    Logger::default_instance().set_level(Logger::Level::None);

    TypeHierarchy h;
    h.define(Type("Widget"));
    h.define(Type("Button"), {Type("Widget")});
    h.define(Type("Session"));
    h.define(Type("Shape"));

    DeclarationTable table;
    table.add({"render", parse_type_list("Widget, Session"), ResolutionMode::Ordered, {}, {}});
    table.add({"render", parse_type_list("Button, Session"), ResolutionMode::Ordered, {}, {}});
    table.add({"area", parse_type_list("Shape, Widget"), ResolutionMode::Unordered, {}, {}});

    const std::vector<std::string> pool {"Widget", "Button", "Session", "Shape"};
    std::vector<BatchJob> jobs;
    for (unsigned i = 0; i != 400; ++i) {
        BatchJob job;
        for (unsigned j = 0; j != i % 6; ++j)
            job.frames.push_back({Type(pool[(i * 7 + j * 3) % pool.size()]), ValueRef{fmt::format("v{}_{}", i, j)}});
        job.call = CallSite{i % 3 ? "render" : (i % 5 ? "area" : "missing"), std::nullopt, SourceLoc{"batch", i, 0}};
        jobs.push_back(std::move(job));
    }

    const Resolver resolver(h, ResolverOptions{.verify_greedy = true});
    const auto results = resolve_batch(resolver, table, jobs, 4);
    REQUIRE(results.size() == jobs.size());

    size_t resolved = 0;
    for (size_t i = 0; i != jobs.size(); ++i) {
        INFO(i);
        const auto& r = results[i];
        CHECK(r.call.has_value() != r.error.has_value());
        try {
            auto expected = resolver.bind_call(table, jobs[i].frames, jobs[i].call);
            REQUIRE(r.call);
            CHECK(r.call->decl == expected.decl);
            CHECK(r.call->args == expected.args);
            ++resolved;
        } catch (const ResolveError& e) {
            REQUIRE(r.error);
            CHECK(r.error->code() == e.code());
            CHECK(r.error->loc() == jobs[i].call.loc);
        }
    }
    CHECK(resolved > 0);
    CHECK(resolved < jobs.size());

    // default thread count, and more threads than jobs
    CHECK(resolve_batch(resolver, table, jobs, 0).size() == jobs.size());
    CHECK(resolve_batch(resolver, table, {jobs[0], jobs[1]}, 16).size() == 2);
    CHECK(resolve_batch(resolver, table, {}, 2).empty());
}


// Predicate failing with an exception which is not part of the resolver's error model
class FailingPredicate final : public TypePredicate {
public:
    bool is_subtype(const Type& sub, const Type&) const override {
        if (sub.name() == "Broken")
            throw std::runtime_error("predicate failed");
        return true;
    }
    bool unify(const Type& type, const Type& pattern, TypeArgs&) const override {
        return is_subtype(type, pattern);
    }
};


TEST_CASE( "Batch propagates foreign exceptions", "[batch]" )
{
    Logger::default_instance().set_level(Logger::Level::None);

    FailingPredicate pred;
    DeclarationTable table;
    table.add({"render", parse_type_list("Widget"), ResolutionMode::Ordered, {}, {}});
    const Resolver resolver(pred);

    std::vector<BatchJob> jobs;
    for (unsigned i = 0; i != 50; ++i) {
        BatchJob job;
        job.frames.push_back({Type(i == 25 ? "Broken" : "Widget"), ValueRef{"w"}});
        job.call = CallSite{"render", std::nullopt, SourceLoc{"batch", i, 0}};
        jobs.push_back(std::move(job));
    }

    CHECK_THROWS_AS(resolve_batch(resolver, table, jobs, 4), std::runtime_error);

    jobs.erase(jobs.begin() + 25);
    CHECK(resolve_batch(resolver, table, jobs, 4).size() == 49);
}
