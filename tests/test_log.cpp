// test_log.cpp created on 2026-10-19 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <ambit/core/log.h>

#include <string>
#include <vector>

using namespace ambit::core;


static std::vector<std::string> captured;

static void capture_handler(Logger::Level lvl, std::string_view msg)
{
    captured.push_back(fmt::format("{} {}", int(lvl), msg));
}


struct CountingArg {
    int* counter;
};

template <> struct fmt::formatter<CountingArg> : fmt::formatter<int> {
    template <typename FormatContext>
    auto format(const CountingArg& v, FormatContext& ctx) const {
        return fmt::formatter<int>::format(++*v.counter, ctx);
    }
};


TEST_CASE( "Level filtering", "[log]" )
{
    Logger& logger = Logger::default_instance();
    logger.set_handler(capture_handler);
    logger.set_level(Logger::Level::Warning);
    captured.clear();

    log::debug("dropped {}", 1);
    log::info("dropped {}", 2);
    log::warning("kept {}", 3);
    log::error("frame {}\ncontinued", "w");
    REQUIRE(captured.size() == 2);
    CHECK(captured[0] == "3 kept 3");
    CHECK(captured[1] == "4 frame w\ncontinued");

    // arguments of filtered messages are not formatted
    int formatted = 0;
    log::debug("{}", CountingArg{&formatted});
    CHECK(formatted == 0);
    log::error("{}", CountingArg{&formatted});
    CHECK(formatted == 1);

    logger.set_level(Logger::Level::None);
    log::error("silenced");
    CHECK(captured.size() == 3);

    logger.set_handler(Logger::default_handler);
}


TEST_CASE( "Level names", "[log]" )
{
    CHECK(parse_log_level("trace") == Logger::Level::Trace);
    CHECK(parse_log_level("debug") == Logger::Level::Debug);
    CHECK(parse_log_level("info") == Logger::Level::Info);
    CHECK(parse_log_level("warning") == Logger::Level::Warning);
    CHECK(parse_log_level("error") == Logger::Level::Error);
    CHECK(parse_log_level("none") == Logger::Level::None);
    CHECK(!parse_log_level("WARNING"));
    CHECK(!parse_log_level("warn"));
    CHECK(!parse_log_level(""));
}
