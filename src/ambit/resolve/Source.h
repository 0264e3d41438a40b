// Source.h created on 2026-09-15 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_SOURCE_H
#define AMBIT_RESOLVE_SOURCE_H

#include <fmt/ostream.h>
#include <string>
#include <ostream>

namespace ambit::resolve {


/// Location of a declaration or a call site in its source file.
/// Line and column are 1-based, zero means unknown.
struct SourceLoc {
    std::string file;
    unsigned line = 0;
    unsigned column = 0;

    explicit operator bool() const { return !file.empty() || line != 0; }
    bool operator==(const SourceLoc&) const = default;
};


inline std::ostream& operator<<(std::ostream& os, const SourceLoc& loc)
{
    os << (loc.file.empty() ? "<input>" : loc.file) << ':' << loc.line;
    if (loc.column != 0)
        os << ':' << loc.column;
    return os;
}


} // namespace ambit::resolve

template <> struct fmt::formatter<ambit::resolve::SourceLoc> : ostream_formatter {};

#endif // include guard
