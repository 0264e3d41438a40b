// Config.h created on 2026-09-13 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_CONFIG_H
#define AMBIT_CONFIG_H

#include <variant>
#include <vector>
#include <string>
#include <string_view>
#include <cstdint>

namespace ambit::config {


struct ConfigItem;
struct ConfigBuilder;

/// Group of items read from a config document, kept in document order.
/// The tree is read-only, it's built by `parse_config` (see ConfigParser.h).
/// A name may repeat in a group (e.g. `decl {...}` in a scenario).
class Config {
public:
    using const_iterator = std::vector<ConfigItem>::const_iterator;

    /// First item of the name, nullptr if there is none.
    const ConfigItem* find(std::string_view name) const;

    /// All items of the name, in document order.
    std::vector<const ConfigItem*> find_all(std::string_view name) const;

    const_iterator begin() const noexcept { return m_items.begin(); }
    const_iterator end() const noexcept { return m_items.end(); }
    size_t size() const noexcept;
    bool empty() const noexcept;

private:
    friend struct ConfigBuilder;
    std::vector<ConfigItem> m_items;
};


struct ConfigItem {
    using Value = std::variant<bool, int64_t, double, std::string, Config>;

    ConfigItem(std::string name, unsigned line, Value value)
        : m_name(std::move(name)), m_line(line), m_value(std::move(value)) {}

    const std::string& name() const { return m_name; }

    /// 1-based line of the item name in the document
    unsigned line() const { return m_line; }

    bool is_bool() const { return std::holds_alternative<bool>(m_value); }
    bool is_int() const { return std::holds_alternative<int64_t>(m_value); }
    bool is_float() const { return std::holds_alternative<double>(m_value); }
    bool is_string() const { return std::holds_alternative<std::string>(m_value); }
    bool is_group() const { return std::holds_alternative<Config>(m_value); }

    // The type must match, otherwise std::bad_variant_access is thrown.
    bool as_bool() const { return std::get<bool>(m_value); }
    int64_t as_int() const { return std::get<int64_t>(m_value); }
    double as_float() const { return std::get<double>(m_value); }
    const std::string& as_string() const { return std::get<std::string>(m_value); }
    const Config& as_group() const { return std::get<Config>(m_value); }

    /// Name of the value type for diagnostics: "bool", "int", "float", "string" or "group"
    const char* type_name() const;

    /// Scalar value as written in the document, without quotes.
    /// A group gives "{...}".
    std::string to_string() const;

private:
    std::string m_name;
    unsigned m_line;
    Value m_value;
};


}  // namespace ambit::config

#endif  // AMBIT_CONFIG_H
