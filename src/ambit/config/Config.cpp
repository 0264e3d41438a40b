// Config.cpp created on 2026-09-13 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "Config.h"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace ambit::config {


const ConfigItem* Config::find(std::string_view name) const
{
    auto it = std::find_if(m_items.begin(), m_items.end(),
            [name](const ConfigItem& item) { return item.name() == name; });
    return it == m_items.end() ? nullptr : &*it;
}


std::vector<const ConfigItem*> Config::find_all(std::string_view name) const
{
    std::vector<const ConfigItem*> res;
    for (const auto& item : m_items) {
        if (item.name() == name)
            res.push_back(&item);
    }
    return res;
}


size_t Config::size() const noexcept { return m_items.size(); }
bool Config::empty() const noexcept { return m_items.empty(); }


const char* ConfigItem::type_name() const
{
    static constexpr const char* names[] = {"bool", "int", "float", "string", "group"};
    static_assert(std::size(names) == std::variant_size_v<Value>);
    return names[m_value.index()];
}


std::string ConfigItem::to_string() const
{
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Config>)
            return "{...}";
        else if constexpr (std::is_same_v<T, std::string>)
            return v;
        else
            return fmt::format("{}", v);
    }, m_value);
}


}  // namespace ambit::config
