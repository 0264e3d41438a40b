// Options.cpp created on 2026-09-22 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "Options.h"
#include <ambit/core/ArgParser.h>

namespace ambit::check_tool {

using namespace ambit::core::argparser;


void Options::parse(char* argv[])
{
    ArgParser {
            Option("-h, --help", "Show help", show_help),
            Option("-v, --verbose", "Log resolution of each call site", verbose),
            Option("-q, --quiet", "Log errors only", quiet),
            Option("-e, --errors", "Print only call sites which failed to resolve", errors_only),
            Option("--verify", "Cross-check ordered resolution with exhaustive search", verify),
            Option("-c, --config FILE", "Load resolver options from FILE", config_file),
            Option("-j, --jobs N", "Resolve call sites on N worker threads (0 = number of CPUs)", jobs),
            Option("SCENARIO ...", "Scenario files", scenario_files),
    } (argv);
}


} // namespace ambit::check_tool
