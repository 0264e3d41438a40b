// ArgParser.cpp created on 2026-09-14 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "ArgParser.h"
#include "string.h"

#include <fmt/core.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <ranges>
#include <utility>

namespace ambit::core::argparser {

using fmt::format;


Option::Option(std::string desc, std::string help, Callback cb)
    : m_desc(std::move(desc)), m_help(std::move(help)), m_cb(std::move(cb))
{
    parse_desc();
}


void Option::parse_desc()
{
    std::string_view desc = stripped(m_desc);
    if (desc.starts_with('[') && desc.ends_with(']')) {
        m_optional = true;
        desc = stripped(desc.substr(1, desc.size() - 2));
    }

    for (auto part : split(desc, ',')) {
        const auto words = split(stripped(part), ' ');
        const std::string_view name = words.front();
        if (name.empty())
            throw BadOptionDescription("empty option name", m_desc);

        if (name.starts_with("---"))
            throw BadOptionDescription("too many dashes", m_desc);
        if (name.starts_with("--")) {
            m_long.emplace_back(name.substr(2));
        } else if (name.starts_with('-')) {
            if (name.size() != 2)
                throw BadOptionDescription("short option must be a single character", m_desc);
            m_short.push_back(name[1]);
        } else {
            m_positional = true;
            m_takes_value = true;
        }
        if (m_positional && (!m_short.empty() || !m_long.empty()))
            throw BadOptionDescription("positional name mixed with option names", m_desc);

        for (auto word : words | std::views::drop(1)) {
            if (word == "...") {
                m_repeat = true;
            } else if (!word.empty()) {
                m_takes_value = true;
                m_metavar = word;
            }
        }
    }

    if (!m_positional && m_short.empty() && m_long.empty())
        throw BadOptionDescription("missing option name", m_desc);
    if (m_optional && !m_positional)
        throw BadOptionDescription("only positional argument can be optional", m_desc);
}


bool Option::has_short(char name) const
{
    return std::find(m_short.begin(), m_short.end(), name) != m_short.end();
}


bool Option::has_long(std::string_view name) const
{
    return std::find(m_long.begin(), m_long.end(), name) != m_long.end();
}


std::string Option::usage() const
{
    if (m_positional)
        return std::string(stripped(m_desc));
    std::string res = m_short.empty() ? format("--{}", m_long.front()) : format("-{}", m_short.front());
    if (m_takes_value)
        res += ' ' + m_metavar;
    return '[' + res + ']';
}


ArgParser& ArgParser::operator()(const char* argv[])
{
    std::string_view arg0(argv[0]);
    m_progname = arg0.substr(arg0.rfind('/') + 1);  // npos + 1 == 0
    try {
        if (parse_args(&argv[1]) == Exit)
            std::exit(0);
    } catch (const BadArgument& e) {
        fmt::print(stderr, "{}: {}\nTry '{} --help' for more information.\n",
                   m_progname, e.what(), m_progname);
        std::exit(1);
    }
    return *this;
}


auto ArgParser::parse_args(const char* argv[]) -> ParseResult
{
    for (; *argv != nullptr; ++argv) {
        if (parse_arg(*argv) == Exit)
            return Exit;
    }
    if (m_pending != nullptr)
        throw BadArgument(format("Missing value to option: {}", m_pending->desc()));
    for (const auto& opt : m_opts) {
        if (opt.is_positional() && opt.missing_args() > 0)
            throw BadArgument(format("Missing positional argument: {}", opt.desc()));
    }
    return Continue;
}


auto ArgParser::parse_arg(const char* arg) -> ParseResult
{
    if (m_pending != nullptr) {
        Option& opt = *std::exchange(m_pending, nullptr);
        feed(opt, arg, opt.desc());
        return Continue;
    }

    const std::string_view sv(arg);
    if (sv.size() > 2 && sv.starts_with("--"))
        return parse_long(sv.substr(2));
    if (sv.size() > 1 && sv.starts_with('-'))
        return parse_short(arg);

    // a lone "-" is positional too
    Option* opt = find([](const Option& o) { return o.is_positional() && o.can_receive_arg(); });
    if (opt == nullptr)
        throw BadArgument(format("Unexpected positional argument: {}", arg));
    feed(*opt, arg, opt->desc());
    return Continue;
}


auto ArgParser::parse_long(std::string_view name) -> ParseResult
{
    Option* opt = find([name](const Option& o) { return o.has_long(name); });
    if (opt == nullptr)
        throw BadArgument(format("Unknown option: --{}", name));
    return take(*opt, nullptr, format("--{}", name));
}


auto ArgParser::parse_short(const char* arg) -> ParseResult
{
    // flags may be grouped, the first one taking a value ends the group
    for (const char* p = arg + 1; *p != 0; ++p) {
        Option* opt = find([c = *p](const Option& o) { return o.has_short(c); });
        if (opt == nullptr)
            throw BadArgument(format("Unknown option: -{} (in {})", *p, arg));
        if (opt->has_args())
            return take(*opt, p + 1, format("-{}", *p));
        if (take(*opt, nullptr, format("-{}", *p)) == Exit)
            return Exit;
    }
    return Continue;
}


auto ArgParser::take(Option& opt, const char* attached, const std::string& shown) -> ParseResult
{
    if (opt.is_show_help()) {
        print_help();
        return Exit;
    }
    if (!opt.has_args()) {
        feed(opt, "1", shown);
        return Continue;
    }
    if (!opt.can_receive_arg())
        throw BadArgument(format("Too many occurrences of an option: {}", shown));
    if (attached != nullptr && *attached != 0)
        feed(opt, attached, shown);
    else
        m_pending = &opt;
    return Continue;
}


void ArgParser::feed(Option& opt, const char* value, std::string_view shown)
{
    if (!opt(value))
        throw BadArgument(format("Wrong value to option: {}: {}", shown, value));
}


void ArgParser::print_usage() const
{
    std::string line = format("Usage: {}", m_progname);
    for (const auto& opt : m_opts)
        line += ' ' + opt.usage();
    fmt::print("{}\n", line);
}


void ArgParser::print_help() const
{
    print_usage();
    fmt::print("\nOptions:\n");
    size_t width = 0;
    for (const auto& opt : m_opts)
        width = std::max(width, opt.desc().size());
    for (const auto& opt : m_opts)
        fmt::print("  {:<{}}  {}\n", opt.desc(), width, opt.help());
}


} // namespace ambit::core::argparser
