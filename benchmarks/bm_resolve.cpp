// bm_resolve.cpp created on 2026-09-29 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include <benchmark/benchmark.h>
#include <ambit/resolve/Resolver.h>
#include <ambit/resolve/ordered_resolver.h>
#include <ambit/resolve/unordered_resolver.h>
#include <ambit/resolve/TypeHierarchy.h>
#include <ambit/core/log.h>

#include <vector>

using namespace ambit::resolve;
using ambit::core::Logger;


// Stack of `n` unrelated frames with the interesting receivers at the bottom,
// so the resolver has to scan through all of them.
static std::vector<ContextFrame> make_frames(int64_t n)
{
    std::vector<ContextFrame> frames;
    frames.push_back({Type("Widget"), {"w"}});
    frames.push_back({Type("Session"), {"s"}});
    for (int64_t i = 0; i < n; ++i)
        frames.push_back({Type("Noise"), {"noise"}});
    return frames;
}


static TypeHierarchy make_hierarchy()
{
    Logger::default_instance().set_level(Logger::Level::None);
    TypeHierarchy h;
    h.define(Type("Widget"));
    h.define(Type("Button"), {Type("Widget")});
    h.define(Type("Session"));
    h.define(Type("Noise"));
    return h;
}


static void bm_resolve_ordered(benchmark::State& state)
{
    const auto h = make_hierarchy();
    const auto frames = make_frames(state.range(0));
    const Declaration decl{"render", {Type("Widget"), Type("Session")}};
    const CallSite call{"render", {}, {}};

    for (auto _ : state) {
        auto verdict = resolve_ordered(h, decl, frames, call);
        benchmark::DoNotOptimize(verdict);
    }
}
BENCHMARK(bm_resolve_ordered)->Range(8, 8<<10);


static void bm_resolve_ordered_exhaustive(benchmark::State& state)
{
    const auto h = make_hierarchy();
    const auto frames = make_frames(state.range(0));
    const Declaration decl{"render", {Type("Widget"), Type("Session")}};
    const CallSite call{"render", {}, {}};

    for (auto _ : state) {
        auto binding = resolve_ordered_exhaustive(h, decl, frames, call);
        benchmark::DoNotOptimize(binding);
    }
}
BENCHMARK(bm_resolve_ordered_exhaustive)->Range(8, 8<<8);


static void bm_resolve_unordered(benchmark::State& state)
{
    const auto h = make_hierarchy();
    const auto frames = make_frames(state.range(0));
    const Declaration decl{"render", {Type("Session"), Type("Widget")}, ResolutionMode::Unordered};
    const CallSite call{"render", {}, {}};

    for (auto _ : state) {
        auto verdict = resolve_unordered(h, decl, frames, call);
        benchmark::DoNotOptimize(verdict);
    }
}
BENCHMARK(bm_resolve_unordered)->Range(8, 8<<10);


static void bm_bind_call_overloads(benchmark::State& state)
{
    const auto h = make_hierarchy();
    auto frames = make_frames(state.range(0));
    frames.push_back({Type("Button"), {"b"}});
    frames.push_back({Type("Session"), {"s2"}});

    DeclarationTable table;
    table.add({"render", {Type("Widget"), Type("Session")}});
    table.add({"render", {Type("Button"), Type("Session")}});
    const Resolver resolver(h);
    const CallSite call{"render", {}, {}};

    for (auto _ : state) {
        auto bound = resolver.bind_call(table, frames, call);
        benchmark::DoNotOptimize(bound);
    }
}
BENCHMARK(bm_bind_call_overloads)->Range(8, 8<<10);


BENCHMARK_MAIN();
