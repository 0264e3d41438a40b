// string.h created on 2026-09-12 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_CORE_STRING_H
#define AMBIT_CORE_STRING_H

#include <string_view>
#include <vector>

namespace ambit::core {


/// Split `str` at each `delim`. The result has at least one (possibly empty) part.
/// With `maxsplit` >= 0, the rest after `maxsplit` splits stays in the last part.
std::vector<std::string_view> split(std::string_view str, char delim, int maxsplit = -1);

/// Whitespace removed from both ends
[[nodiscard]] std::string_view stripped(std::string_view str);


} // namespace ambit::core

#endif // AMBIT_CORE_STRING_H
