// string.cpp created on 2026-09-12 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "string.h"

namespace ambit::core {


std::vector<std::string_view> split(std::string_view str, char delim, int maxsplit)
{
    std::vector<std::string_view> parts;
    for (size_t pos; maxsplit != 0 && (pos = str.find(delim)) != std::string_view::npos; --maxsplit) {
        parts.push_back(str.substr(0, pos));
        str.remove_prefix(pos + 1);
    }
    parts.push_back(str);
    return parts;
}


std::string_view stripped(std::string_view str)
{
    constexpr std::string_view ws = "\t\n\v\f\r ";
    const auto first = str.find_first_not_of(ws);
    if (first == std::string_view::npos)
        return str.substr(str.size());
    return str.substr(first, str.find_last_not_of(ws) - first + 1);
}


} // namespace ambit::core
