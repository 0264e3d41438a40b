// main.cpp created on 2026-09-22 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "Options.h"
#include <ambit/scenario/Scenario.h>
#include <ambit/core/log.h>

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/view/filter.hpp>
#include <fmt/core.h>

#include <algorithm>

using namespace ambit;
using namespace ambit::core;
using namespace ambit::check_tool;

using ranges::views::filter;


enum ExitStatus {
    Ok = 0,
    Diagnostics = 1,
    Failure = 2,
};


static ExitStatus check_scenario(const char* filename, const Options& opts,
                                 const resolve::ResolverOptions& base_options)
{
    scenario::Scenario sc;
    sc.options() = base_options;
    try {
        sc.load_file(filename);
    } catch (const resolve::ResolveError& e) {
        fmt::print(stderr, "{}\n", e);
        return Failure;
    }
    if (opts.verify)
        sc.options().verify_greedy = true;
    if (sc.options().log_level && !opts.verbose && !opts.quiet)
        Logger::default_instance().set_level(*sc.options().log_level);

    for (const auto& e : sc.declarations().errors())
        fmt::print("{}\n", e);

    std::vector<scenario::CallOutcome> outcomes;
    try {
        outcomes = opts.jobs == 1 ? sc.run() : sc.run_parallel(opts.jobs);
    } catch (const resolve::ContractViolation& e) {
        fmt::print(stderr, "{}: internal error: {}\n", filename, e);
        return Failure;
    }

    auto failed = [](const scenario::CallOutcome& o) { return !o.is_resolved(); };
    if (opts.errors_only) {
        for (const auto& o : outcomes | filter(failed))
            fmt::print("{}\n", o);
    } else {
        for (const auto& o : outcomes)
            fmt::print("{}\n", o);
    }
    for (const auto& o : outcomes | filter(failed)) {
        if (o.error && !o.error->detail().empty())
            log::info("{}: {}\n{}", o.loc, o.name, o.error->detail());
    }

    const auto n_failed = ranges::count_if(outcomes, failed);
    log::info("{}: {} call sites, {} unresolved, {} declaration errors",
              filename, outcomes.size(), n_failed, sc.declarations().errors().size());
    if (n_failed != 0 || !sc.declarations().errors().empty())
        return Diagnostics;
    return Ok;
}


int main(int argc, char* argv[])
{
    Options opts;
    opts.parse(argv);

    Logger::init(opts.verbose ? Logger::Level::Debug :
                 opts.quiet ? Logger::Level::Error : Logger::Level::Warning);

    resolve::ResolverOptions base_options;
    if (!opts.config_file.empty()) {
        if (!base_options.load_file(opts.config_file))
            return Failure;
        if (base_options.log_level && !opts.verbose && !opts.quiet)
            Logger::default_instance().set_level(*base_options.log_level);
    }

    int status = Ok;
    for (const char* filename : opts.scenario_files)
        status = std::max(status, int(check_scenario(filename, opts, base_options)));
    return status;
}
