// test_argparser.cpp created on 2026-09-28 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <ambit/core/ArgParser.h>
#include <array>

using namespace ambit::core;
using namespace ambit::core::argparser;


TEST_CASE( "Bool value conversion", "[ArgParser][value_from_cstr]" )
{
    bool v = false;
    SECTION("bool supported input") {
        CHECK(value_from_cstr("true", v)); CHECK(v);
        CHECK(value_from_cstr("false", v)); CHECK(!v);
        CHECK(value_from_cstr("yes", v)); CHECK(v);
        CHECK(value_from_cstr("no", v)); CHECK(!v);
        CHECK(value_from_cstr("1", v)); CHECK(v);
        CHECK(value_from_cstr("0", v)); CHECK(!v);
    }
    SECTION("bool unsupported input") {
        v = true;
        CHECK(!value_from_cstr("abc", v));
        CHECK(!value_from_cstr("T", v));
        CHECK(!value_from_cstr("ON", v));
        CHECK(!value_from_cstr("", v));
        CHECK(v);  // untouched
    }
}


TEST_CASE( "Integer value conversion", "[ArgParser][value_from_cstr]" )
{
    unsigned jobs = 0;
    CHECK(value_from_cstr("8", jobs));
    CHECK(jobs == 8);
    CHECK(value_from_cstr("16", jobs));
    CHECK(jobs == 16);
    CHECK(!value_from_cstr("8x", jobs));
    CHECK(!value_from_cstr("0x10", jobs));
    CHECK(!value_from_cstr("-1", jobs));
    CHECK(!value_from_cstr("", jobs));
    CHECK(jobs == 16);

    int8_t small = 0;
    CHECK(!value_from_cstr("300", small));
    CHECK(value_from_cstr("-100", small));
    CHECK(small == -100);
}


TEST_CASE( "String and vector value conversion", "[ArgParser][value_from_cstr]" )
{
    std::string s;
    CHECK(value_from_cstr("render.conf", s));
    CHECK(s == "render.conf");

    std::vector<std::string> files;
    CHECK(value_from_cstr("a.conf", files));
    CHECK(value_from_cstr("b.conf", files));
    CHECK(files == std::vector<std::string>{"a.conf", "b.conf"});

    std::vector<unsigned> numbers;
    CHECK(value_from_cstr("3", numbers));
    CHECK(!value_from_cstr("x", numbers));
    CHECK(numbers == std::vector<unsigned>{3});
}


TEST_CASE( "Option description", "[ArgParser][Option]" )
{
    bool flag = false;
    std::string file;
    std::vector<std::string> inputs;

    SECTION("short and long flag") {
        Option o("-v, --verbose", "", flag);
        CHECK(o.has_short('v'));
        CHECK(o.has_long("verbose"));
        CHECK(!o.has_args());
        CHECK(!o.is_positional());
        CHECK(o.usage() == "[-v]");
    }
    SECTION("long only") {
        Option o("--verify", "", flag);
        CHECK(!o.has_short('v'));
        CHECK(o.has_long("verify"));
        CHECK(o.usage() == "[--verify]");
    }
    SECTION("option with value") {
        Option o("-c, --config FILE", "", file);
        CHECK(o.has_short('c'));
        CHECK(o.has_long("config"));
        CHECK(o.has_args());
        CHECK(!o.can_receive_all_args());
        CHECK(o.usage() == "[-c FILE]");
    }
    SECTION("required positional") {
        Option o("SCENARIO ...", "", inputs);
        CHECK(o.is_positional());
        CHECK(o.can_receive_all_args());
        CHECK(o.missing_args() == 1);
        CHECK(o.usage() == "SCENARIO ...");
    }
    SECTION("optional positional") {
        Option o("[INPUT ...]", "", inputs);
        CHECK(o.is_positional());
        CHECK(o.can_receive_all_args());
        CHECK(o.missing_args() == 0);
        CHECK(o.usage() == "[INPUT ...]");
    }
    SECTION("show help") {
        Option o("-h, --help", "", show_help);
        CHECK(o.is_show_help());
    }
}


TEST_CASE( "Invalid option descriptions", "[ArgParser][Option]" )
{
    CHECK_THROWS_AS(Option("---help", "Too many dashes", show_help), BadOptionDescription);
    CHECK_THROWS_AS(Option("-help", "Too long short option", show_help), BadOptionDescription);
    CHECK_THROWS_AS(Option("-", "Missing short name", show_help), BadOptionDescription);
    CHECK_THROWS_AS(Option("-f, FILE", "Positional after option", show_help), BadOptionDescription);
    CHECK_THROWS_AS(Option("", "Empty", show_help), BadOptionDescription);
    CHECK_THROWS_AS(Option("FILE, -f", "Swapped", show_help), BadOptionDescription);
    CHECK_THROWS_AS(Option("[-f]", "Optional flag", show_help), BadOptionDescription);
}


#define ARGV(...)   std::array{__VA_ARGS__, (const char*)nullptr}.data()


TEST_CASE( "Parse args", "[ArgParser][parse_args]" )
{
    bool verbose = false;
    bool quiet = false;
    unsigned jobs = 1;
    std::string config;
    std::vector<std::string> files;

    ArgParser ap {
            Option("-v, --verbose", "Enable verbosity", verbose),
            Option("-q, --quiet", "Be quiet", quiet),
            Option("-j, --jobs N", "Worker threads", jobs),
            Option("-c, --config FILE", "Config file", config),
            Option("SCENARIO ...", "Input files", files),
    };

    SECTION("grouped flags with attached value") {
        CHECK(ap.parse_args(ARGV("-vqj4", "a.conf", "b.conf")) == ArgParser::Continue);
        CHECK(verbose);
        CHECK(quiet);
        CHECK(jobs == 4);
        CHECK(files == std::vector<std::string>{"a.conf", "b.conf"});
    }

    SECTION("long options with separate values") {
        ap.parse_args(ARGV("--config", "ambit.conf", "--jobs", "2", "a.conf"));
        CHECK(config == "ambit.conf");
        CHECK(jobs == 2);
        CHECK(files == std::vector<std::string>{"a.conf"});
    }

    SECTION("single hyphen is a positional argument") {
        ap.parse_args(ARGV("-v", "-", "b.conf"));
        CHECK(files == std::vector<std::string>{"-", "b.conf"});
    }

    SECTION("unknown options") {
        CHECK_THROWS_AS(ap.parse_args(ARGV("-x", "a.conf")), BadArgument);
        CHECK_THROWS_AS(ap.parse_args(ARGV("--verbosity", "a.conf")), BadArgument);
        CHECK_THROWS_AS(ap.parse_args(ARGV("-vx", "a.conf")), BadArgument);
    }

    SECTION("bad value") {
        CHECK_THROWS_AS(ap.parse_args(ARGV("-j", "many", "a.conf")), BadArgument);
    }

    SECTION("missing value") {
        CHECK_THROWS_AS(ap.parse_args(ARGV("a.conf", "-c")), BadArgument);
    }

    SECTION("missing positional") {
        CHECK_THROWS_AS(ap.parse_args(ARGV("-v")), BadArgument);
    }
}


TEST_CASE( "Callbacks", "[ArgParser][parse_args]" )
{
    char mode = 0;
    int flags = 0;
    ArgParser ap {
        Option("-m MODE", "Mode: o (ordered) or u (unordered)", [&mode](const char* arg) {
            mode = arg[0];
            return (mode == 'o' || mode == 'u') && arg[1] == 0;
        }),
        Option("-f", "Count flags", [&flags] { ++flags; }),
    };

    SECTION("accepted value") {
        ap.parse_args(ARGV("-mu", "-f"));
        CHECK(mode == 'u');
        CHECK(flags == 1);
    }

    SECTION("rejected value") {
        CHECK_THROWS_AS(ap.parse_args(ARGV("-m", "x")), BadArgument);
    }

    SECTION("unexpected positional") {
        CHECK_THROWS_AS(ap.parse_args(ARGV("-f", "file")), BadArgument);
    }
}
