// Options.h created on 2026-09-22 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_CHECK_TOOL_OPTIONS_H
#define AMBIT_CHECK_TOOL_OPTIONS_H

#include <vector>
#include <string>

namespace ambit::check_tool {

struct Options {
    std::vector<const char*> scenario_files;
    std::string config_file;
    unsigned jobs = 1;
    bool verbose = false;
    bool quiet = false;
    bool verify = false;
    bool errors_only = false;

    void parse(char* argv[]);
};

} // namespace ambit::check_tool

#endif // include guard
