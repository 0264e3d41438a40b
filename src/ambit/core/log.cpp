// log.cpp created on 2026-09-12 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "log.h"
#include <ambit/core/sys.h>
#include <ambit/core/string.h>  // split

#include <fmt/chrono.h>
#include <ctime>
#include <cstdio>
#include <iterator>

namespace ambit::core {


static constexpr std::string_view c_level_tag[] = {
        "TRACE", "DEBUG", "INFO", "WARN", "ERROR",
};


Logger& Logger::default_instance()
{
    static Logger logger(Level::Trace);
    return logger;
}


void Logger::log(Logger::Level lvl, std::string_view msg)
{
    if (!is_enabled(lvl) || lvl == Level::None)
        return;
    m_handler.load()(lvl, msg);
}


void Logger::default_handler(Logger::Level lvl, std::string_view msg)
{
    const auto tm = localtime(std::time(nullptr));
    const auto tid = get_thread_id() & 0xFFFFFF;  // 6 hex digits
    // continuation lines are aligned under the first one
    bool first = true;
    std::string out;
    for (const auto line : split(msg, '\n')) {
        if (first)
            out += fmt::format("{:%F %T} {:6x}  {:<5}  {}\n", tm, tid, c_level_tag[size_t(lvl)], line);
        else
            out += fmt::format("{:35}{}\n", "", line);
        first = false;
    }
    std::fputs(out.c_str(), stderr);
}


std::optional<Logger::Level> parse_log_level(std::string_view name)
{
    static constexpr std::string_view names[] = {
            "trace", "debug", "info", "warning", "error", "none",
    };
    for (size_t i = 0; i != std::size(names); ++i) {
        if (name == names[i])
            return Logger::Level(i);
    }
    return std::nullopt;
}


} // namespace ambit::core
