// ConfigParser.cpp created on 2026-09-13 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "ConfigParser.h"
#include <ambit/core/log.h>
#include <ambit/core/sys.h>

#include <tao/pegtl.hpp>
#include <fmt/format.h>

#include <fstream>
#include <sstream>
#include <utility>
#include <cerrno>
#include <cstdlib>

namespace ambit::config {

using namespace ambit::core;


/// Assembles the tree while the grammar is being matched.
/// Groups are completed bottom-up, so the finished Config is moved
/// into its item only once.
struct ConfigBuilder {
    struct OpenGroup {
        std::string name;
        unsigned line = 0;
        Config group;
    };

    ConfigBuilder() : open(1) {}

    void add(ConfigItem::Value value) {
        open.back().group.m_items.emplace_back(std::move(name), line, std::move(value));
    }

    void begin_group() {
        open.push_back({std::move(name), line, {}});
    }

    void end_group() {
        OpenGroup done = std::move(open.back());
        open.pop_back();
        open.back().group.m_items.emplace_back(std::move(done.name), done.line, std::move(done.group));
    }

    Config finish() { return std::move(open.front().group); }

    std::vector<OpenGroup> open;  // the document itself is at the bottom
    std::string name;             // name of the item whose value is being read
    unsigned line = 0;
    std::string text;             // unescaped content of a string value
};


namespace parser {
using namespace tao::pegtl;

// ----------------------------------------------------------------------------
// Grammar

struct Comment: seq< two<'/'>, until<eolf> > {};
struct Blank: star< sor<space, Comment> > {};
struct ItemEnd: seq< star<blank>, sor<one<';'>, eolf, Comment, at<one<'}'>>> > {};

struct True: TAO_PEGTL_KEYWORD("true") {};
struct False: TAO_PEGTL_KEYWORD("false") {};
struct Fraction: seq< one<'.'>, plus<digit> > {};
struct Number: seq< opt<one<'-'>>, plus<digit>, opt<Fraction> > {};

struct EscHex: if_must< one<'x'>, xdigit, xdigit > {};
struct EscChar: one< 'n', 't', 'r', '\\', '"' > {};
struct EscSeq: sor< EscHex, EscChar > {};
struct Escape: if_must< one<'\\'>, EscSeq > {};
struct Plain: utf8::ranges< 0x20, 0x10FFFF, '\t' > {};
struct StringBody: until< one<'"'>, sor<Escape, Plain> > {};
struct String: if_must< one<'"'>, StringBody > {};

struct Items;
struct GroupBegin: one<'{'> {};
struct GroupEnd: one<'}'> {};
struct Group: if_must< GroupBegin, Items, Blank, GroupEnd > {};

struct Name: identifier {};
struct Value: sor< True, False, Number, String, Group > {};
struct Item: seq< Blank, Name, must<plus<blank>, Value, ItemEnd> > {};
struct Items: star<Item> {};
struct Document: must< Items, Blank, eof > {};


// ----------------------------------------------------------------------------
// Actions

template<typename Rule>
struct Action : nothing<Rule> {};

template<>
struct Action<Name> {
    template<typename Input>
    static void apply(const Input& in, ConfigBuilder& b) {
        b.name = in.string();
        b.line = unsigned(in.position().line);
    }
};

template<>
struct Action<True> {
    template<typename Input>
    static void apply(const Input&, ConfigBuilder& b) { b.add(true); }
};

template<>
struct Action<False> {
    template<typename Input>
    static void apply(const Input&, ConfigBuilder& b) { b.add(false); }
};

template<>
struct Action<Number> {
    template<typename Input>
    static void apply(const Input& in, ConfigBuilder& b) {
        const std::string s = in.string();
        if (s.find('.') != std::string::npos) {
            b.add(std::strtod(s.c_str(), nullptr));
            return;
        }
        errno = 0;
        const long long v = std::strtoll(s.c_str(), nullptr, 10);
        if (errno == ERANGE)
            throw parse_error("integer out of range", in);
        b.add(int64_t(v));
    }
};

template<>
struct Action<Plain> {
    template<typename Input>
    static void apply(const Input& in, ConfigBuilder& b) {
        b.text.append(in.begin(), in.end());
    }
};

template<>
struct Action<EscChar> {
    template<typename Input>
    static void apply(const Input& in, ConfigBuilder& b) {
        switch (*in.begin()) {
            case 'n': b.text += '\n'; break;
            case 't': b.text += '\t'; break;
            case 'r': b.text += '\r'; break;
            default: b.text += *in.begin(); break;
        }
    }
};

template<>
struct Action<EscHex> {
    template<typename Input>
    static void apply(const Input& in, ConfigBuilder& b) {
        // "xHH"
        b.text += char(std::stoi(std::string(in.begin() + 1, in.end()), nullptr, 16));
    }
};

template<>
struct Action<String> {
    template<typename Input>
    static void apply(const Input&, ConfigBuilder& b) {
        b.add(std::exchange(b.text, {}));
    }
};

template<>
struct Action<GroupBegin> {
    template<typename Input>
    static void apply(const Input&, ConfigBuilder& b) { b.begin_group(); }
};

template<>
struct Action<GroupEnd> {
    template<typename Input>
    static void apply(const Input&, ConfigBuilder& b) { b.end_group(); }
};


// ----------------------------------------------------------------------------
// Control (error reporting)

template<typename Rule> constexpr const char* error_message = nullptr;
template<> constexpr const char* error_message<plus<blank>> = "expected space after item name";
template<> constexpr const char* error_message<Value> = "expected value: true, false, number, \"string\" or {group}";
template<> constexpr const char* error_message<ItemEnd> = "expected newline or ';' after value";
template<> constexpr const char* error_message<StringBody> = "unterminated string";
template<> constexpr const char* error_message<EscSeq> = "invalid escape sequence";
template<> constexpr const char* error_message<xdigit> = "expected two hex digits after \\x";
template<> constexpr const char* error_message<GroupEnd> = "expected item name or '}'";
template<> constexpr const char* error_message<eof> = "expected item name";

template< typename Rule >
struct Control : normal< Rule >
{
    template< typename Input, typename... States >
    static void raise( const Input& in, States&&... /*unused*/ ) {
        const char* msg = error_message<Rule>;
        throw parse_error( msg ? msg : "unexpected input", in );
    }
};

} // namespace parser


Config parse_config(std::string_view text, const std::string& source_name)
{
    tao::pegtl::memory_input in(text.data(), text.size(), source_name);
    ConfigBuilder builder;
    try {
        tao::pegtl::parse< parser::Document, parser::Action, parser::Control >( in, builder );
    } catch (const tao::pegtl::parse_error& e) {
        const auto& p = e.positions().front();
        log::debug("{}:{}:{}: {}\n{}\n{:>{}}", source_name, p.line, p.column,
                   e.message(), in.line_at(p), '^', p.column);
        throw ConfigError(std::string(e.message()), source_name, unsigned(p.line), unsigned(p.column));
    }
    return builder.finish();
}


Config parse_config_file(const fs::path& path)
{
    std::ifstream f(path);
    if (!f)
        throw ConfigError(fmt::format("cannot open file: {}", error_str()), path.string());
    std::stringstream content;
    content << f.rdbuf();
    return parse_config(content.str(), path.string());
}


}  // namespace ambit::config
