// ArgParser.h created on 2026-09-14 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_CORE_ARG_PARSER_H
#define AMBIT_CORE_ARG_PARSER_H

#include <ambit/core/error.h>
#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <initializer_list>
#include <type_traits>
#include <charconv>
#include <cstring>

namespace ambit::core::argparser {


class BadOptionDescription: public ambit::core::Error {
public:
    BadOptionDescription(std::string_view detail, std::string_view desc)
            : Error(std::string(detail) + ": " + std::string(desc)) {}
};

class BadArgument: public ambit::core::Error {
public:
    explicit BadArgument(std::string detail) : Error(std::move(detail)) {}
};


/// Store command-line argument `s` into `value`.
/// Accepts "true", "yes", "1" / "false", "no", "0" for bool
/// and decimal numbers for integers. Strings are stored as is.
/// \returns false if the argument is not valid for the type,
///          `value` is left untouched in that case
template <class T>
bool value_from_cstr(const char* s, T& value)
{
    if constexpr (std::is_same_v<T, bool>) {
        const std::string_view sv(s);
        if (sv == "true" || sv == "yes" || sv == "1")
            value = true;
        else if (sv == "false" || sv == "no" || sv == "0")
            value = false;
        else
            return false;
        return true;
    } else if constexpr (std::is_integral_v<T>) {
        const char* end = s + std::strlen(s);
        T v {};
        const auto [ptr, ec] = std::from_chars(s, end, v);
        if (ec != std::errc{} || ptr != end)
            return false;
        value = v;
        return true;
    } else {
        static_assert(std::is_assignable_v<T&, const char*>, "unsupported type of option value");
        value = s;
        return true;
    }
}

/// Each occurrence of the option appends one item
template <class T>
bool value_from_cstr(const char* s, std::vector<T>& value)
{
    T v {};
    if (!value_from_cstr(s, v))
        return false;
    value.push_back(std::move(v));
    return true;
}


struct ShowHelp {};
constexpr ShowHelp show_help{};

/// Named option or positional argument, as declared for ArgParser
class Option {
public:
    /// Receives the value of each occurrence ("1" for flags).
    /// Returns false to reject the value.
    using Callback = std::function<bool(const char* arg)>;
    using FlagCallback = std::function<void()>;

    /// \param desc     Names and metavar: "-c, --config FILE", "--verify".
    ///                 Positional: "SCENARIO ..." takes one or more args,
    ///                 "[INPUT ...]" takes zero or more.
    /// \param help     The text shown by `--help`.
    /// \param cb       Stores the value. The actual work is done after parsing.
    Option(std::string desc, std::string help, Callback cb);

    Option(std::string desc, std::string help, FlagCallback flag_cb)
            : Option(std::move(desc), std::move(help),
                     Callback([cb = std::move(flag_cb)](const char*) { cb(); return true; })) {}

    /// Print help and stop parsing
    Option(std::string desc, std::string help, ShowHelp)
            : Option(std::move(desc), std::move(help), Callback{}) { m_show_help = true; }

    /// Store into `value`, see `value_from_cstr` for accepted types
    template <class T>
    Option(std::string desc, std::string help, T& value)
            : Option(std::move(desc), std::move(help),
                     Callback([&value](const char* arg) { return value_from_cstr(arg, value); })) {}

    bool has_short(char name) const;
    bool has_long(std::string_view name) const;
    bool has_args() const { return m_takes_value; }
    bool is_positional() const { return m_positional; }
    bool is_show_help() const { return m_show_help; }
    bool can_receive_all_args() const { return m_repeat; }
    bool can_receive_arg() const { return m_repeat || m_received == 0; }
    int missing_args() const { return m_takes_value && !m_optional && m_received == 0 ? 1 : 0; }
    const std::string& desc() const { return m_desc; }
    const std::string& help() const { return m_help; }

    /// Short form for the usage line: "[-c FILE]", "SCENARIO ..."
    std::string usage() const;

    bool operator() (const char* arg) { ++m_received; return m_cb(arg); }

private:
    void parse_desc();

    std::string m_desc;
    std::string m_help;
    Callback m_cb;
    std::vector<char> m_short;
    std::vector<std::string> m_long;
    std::string m_metavar;
    bool m_positional = false;
    bool m_show_help = false;
    bool m_takes_value = false;
    bool m_repeat = false;      // "..."
    bool m_optional = false;    // "[...]"
    int m_received = 0;
};


/// Declarative parser for command-line arguments:
/// ```
/// ArgParser {
///     Option("-h, --help", "Show help", show_help),
///     Option("-j, --jobs N", "Worker threads", jobs),
///     Option("SCENARIO ...", "Scenario files", files),
/// } (argv);
/// ```
/// Short flags may be grouped (`-vq`) and a value attached (`-j4`).
class ArgParser {
public:
    ArgParser(std::initializer_list<Option> options) : m_opts(options) {}

    /// Parse main's argv, including argv[0].
    /// Prints help or an error message and exits the process when parsing doesn't continue.
    ArgParser& operator()(const char* argv[]);
    ArgParser& operator()(char* argv[]) { return operator()(const_cast<const char**>(argv)); }

    enum ParseResult {
        Continue,
        Exit,   // help was shown
    };

    /// Parse NULL-terminated args (without the program name).
    /// Throws BadArgument.
    ParseResult parse_args(const char* argv[]);

    void print_usage() const;
    void print_help() const;

private:
    ParseResult parse_arg(const char* arg);
    ParseResult parse_long(std::string_view name);
    ParseResult parse_short(const char* arg);
    ParseResult take(Option& opt, const char* attached, const std::string& shown);
    static void feed(Option& opt, const char* value, std::string_view shown);

    template <class Pred>
    Option* find(Pred pred) {
        for (auto& opt : m_opts)
            if (pred(opt))
                return &opt;
        return nullptr;
    }

    std::string m_progname;
    std::vector<Option> m_opts;
    Option* m_pending = nullptr;  // option waiting for its value in next arg
};


} // namespace ambit::core::argparser

namespace ambit::core { using argparser::ArgParser; }

#endif // include guard
