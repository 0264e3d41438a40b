// ConfigParser.h created on 2026-09-13 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_CONFIG_PARSER_H
#define AMBIT_CONFIG_PARSER_H

#include "Config.h"
#include <ambit/core/error.h>

#include <string>
#include <string_view>
#include <filesystem>

namespace ambit::config {

namespace fs = std::filesystem;


/// The document is unreadable or has a syntax error.
/// Line and column are 1-based, zero when the file couldn't be read.
class ConfigError : public core::Error {
public:
    ConfigError(std::string msg, std::string source, unsigned line = 0, unsigned column = 0)
        : Error(std::move(msg)), m_source(std::move(source)), m_line(line), m_column(column) {}

    const std::string& source() const noexcept { return m_source; }
    unsigned line() const noexcept { return m_line; }
    unsigned column() const noexcept { return m_column; }

private:
    std::string m_source;
    unsigned m_line;
    unsigned m_column;
};


/// Parse a config document. The syntax, as used by scenarios:
/// ```
/// options { verify_greedy true; log_level "debug" }
/// decl {
///     name "render"                   // string in double quotes
///     receivers "Widget, Session"     // escapes: \n \t \r \\ \" \xHH
/// }
/// ```
/// Values are `true`/`false`, integers (`-12`), floats (`0.5`),
/// strings and `{...}` groups. A value starts on the line of its name,
/// only a group may continue on following lines. Items are separated
/// by newline or `;`, `//` starts a comment.
///
/// Throws ConfigError.
Config parse_config(std::string_view text, const std::string& source_name = "<string>");

/// Read and parse the file, see `parse_config`.
Config parse_config_file(const fs::path& path);


}  // namespace ambit::config

#endif  // AMBIT_CONFIG_PARSER_H
