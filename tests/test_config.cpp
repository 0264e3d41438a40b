// test_config.cpp created on 2026-09-13 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <ambit/config/ConfigParser.h>
#include <ambit/config/Config.h>
#include <ambit/resolve/Resolver.h>
#include <ambit/core/log.h>

#include <fmt/format.h>

using namespace ambit::config;
using namespace ambit::core;


// Compact one-line rendering of the tree: `name:type=value`
static std::string flat(const Config& cfg)
{
    std::string res;
    for (const auto& item : cfg) {
        if (!res.empty())
            res += "; ";
        if (item.is_group())
            res += fmt::format("{} {{{}}}", item.name(), flat(item.as_group()));
        else
            res += fmt::format("{}:{}={}", item.name(), item.type_name(), item.to_string());
    }
    return res;
}


static std::string parse_flat(std::string_view text)
{
    try {
        return flat(parse_config(text));
    } catch (const ConfigError& e) {
        return fmt::format("error {}:{}: {}", e.line(), e.column(), e.msg());
    }
}


static ConfigError error_of(std::string_view text)
{
    try {
        (void) parse_config(text);
    } catch (const ConfigError& e) {
        return e;
    }
    FAIL("expected ConfigError");
    return ConfigError("", "");
}


TEST_CASE( "Config syntax", "[ConfigParser]" )
{
    Logger::default_instance().set_level(Logger::Level::None);

    CHECK(parse_flat("") == "");
    CHECK(parse_flat("  // only comment\n\n") == "");
    CHECK(parse_flat("verify_greedy false") == "verify_greedy:bool=false");
    CHECK(parse_flat("jobs 12") == "jobs:int=12");
    CHECK(parse_flat("offset -3") == "offset:int=-3");
    CHECK(parse_flat("ratio 0.5") == "ratio:float=0.5");
    CHECK(parse_flat("name \"render\"") == "name:string=render");
    CHECK(parse_flat("a 1\nb true") == "a:int=1; b:bool=true");
    CHECK(parse_flat("a 1; b true;") == "a:int=1; b:bool=true");
    CHECK(parse_flat("a 1  // comment\n// another\nb true") == "a:int=1; b:bool=true");
    CHECK(parse_flat("with {}") == "with {}");
    CHECK(parse_flat("with { type \"Widget\"; call { name \"render\" } }") ==
          "with {type:string=Widget; call {name:string=render}}");
    CHECK(parse_flat("decl {\n  name \"f\"\n  receivers \"A, B\"\n}\ndecl { name \"g\" }") ==
          "decl {name:string=f; receivers:string=A, B}; decl {name:string=g}");
}


TEST_CASE( "String escapes", "[ConfigParser]" )
{
    Logger::default_instance().set_level(Logger::Level::None);

    const auto cfg = parse_config(R"(s "tab\there\n\"quoted\" back\\slash \x41\x62")");
    REQUIRE(cfg.find("s") != nullptr);
    CHECK(cfg.find("s")->as_string() == "tab\there\n\"quoted\" back\\slash Ab");

    CHECK(parse_config("s \"Zürich\"").find("s")->as_string() == "Zürich");
    CHECK_THROWS_AS(parse_config(R"(s "bad \q escape")"), ConfigError);
    CHECK_THROWS_AS(parse_config(R"(s "\x4")"), ConfigError);
}


TEST_CASE( "Syntax errors", "[ConfigParser]" )
{
    Logger::default_instance().set_level(Logger::Level::None);

    CHECK(parse_flat("item") == "error 1:5: expected space after item name");
    CHECK(error_of("item \"unterminated").msg() == "unterminated string");
    CHECK(error_of("a 1\nb 2 3").msg() == "expected newline or ';' after value");
    CHECK(error_of("a 1\nb 2 3").line() == 2);
    CHECK(parse_flat("a\n1") == "error 1:2: expected space after item name");
    CHECK(parse_flat("a {\n  b 1\n") == "error 3:1: expected item name or '}'");
    CHECK(parse_flat("a maybe") == "error 1:3: expected value: true, false, number, \"string\" or {group}");
    CHECK(parse_flat("a 1\n}") == "error 2:1: expected item name");

    try {
        (void) parse_config("x 1\ny", "broken.conf");
        FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        CHECK(e.source() == "broken.conf");
        CHECK(e.line() == 2);
    }

    try {
        (void) parse_config_file("/nonexistent/ambit.conf");
        FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        CHECK(e.source() == "/nonexistent/ambit.conf");
        CHECK(e.line() == 0);
    }
}


TEST_CASE( "Config lookup", "[Config]" )
{
    const auto cfg = parse_config(
            "type { name \"Circle\"; super \"Shape\"; super \"Drawable\" }\n"
            "flag true\n"
            "count 3\n");
    CHECK(cfg.size() == 3);
    CHECK(!cfg.empty());

    const ConfigItem* type = cfg.find("type");
    REQUIRE(type != nullptr);
    REQUIRE(type->is_group());
    const Config& group = type->as_group();
    auto supers = group.find_all("super");
    REQUIRE(supers.size() == 2);
    CHECK(supers[0]->as_string() == "Shape");
    CHECK(supers[1]->as_string() == "Drawable");
    CHECK(group.find_all("missing").empty());
    CHECK(group.find("name")->as_string() == "Circle");

    CHECK(cfg.find("flag")->as_bool());
    CHECK(cfg.find("count")->as_int() == 3);
    CHECK(cfg.find("count")->to_string() == "3");
    CHECK(type->to_string() == "{...}");
    CHECK(cfg.find("missing") == nullptr);

    // accessing with the wrong type
    CHECK(!cfg.find("count")->is_string());
    CHECK_THROWS_AS(cfg.find("count")->as_string(), std::bad_variant_access);
}


TEST_CASE( "Config source lines", "[Config]" )
{
    const auto cfg = parse_config("a 1\n\nb {\n  c 2\n}\nb { c 3 }");
    CHECK(cfg.find("a")->line() == 1);
    auto bs = cfg.find_all("b");
    REQUIRE(bs.size() == 2);
    CHECK(bs[0]->line() == 3);
    CHECK(bs[0]->as_group().find("c")->line() == 4);
    CHECK(bs[1]->line() == 6);
    CHECK(bs[1]->as_group().find("c")->line() == 6);
}


TEST_CASE( "Resolver options from config", "[Config][ResolverOptions]" )
{
    Logger::default_instance().set_level(Logger::Level::None);
    using ambit::resolve::ResolverOptions;

    ResolverOptions opts;
    opts.load(parse_config("verify_greedy true\nlog_level \"warning\""));
    CHECK(opts.verify_greedy);
    REQUIRE(opts.log_level);
    CHECK(*opts.log_level == Logger::Level::Warning);

    // invalid values are ignored
    ResolverOptions opts2;
    opts2.load(parse_config("verify_greedy 1\nlog_level \"loud\"\nunknown true"));
    CHECK(!opts2.verify_greedy);
    CHECK(!opts2.log_level);

    CHECK(parse_log_level("trace") == Logger::Level::Trace);
    CHECK(parse_log_level("none") == Logger::Level::None);
    CHECK(!parse_log_level("verbose"));

    CHECK(!opts2.load_file("/nonexistent/ambit.conf"));
}
