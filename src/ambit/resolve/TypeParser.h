// TypeParser.h created on 2026-09-15 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_TYPE_PARSER_H
#define AMBIT_RESOLVE_TYPE_PARSER_H

#include "Type.h"
#include "Source.h"

#include <string_view>
#include <vector>
#include <set>

namespace ambit::resolve {


/// Names of type parameters. A bare name found in the set is parsed as a type var.
using TypeParams = std::set<std::string, std::less<>>;


/// Parse single type expression, e.g. `Map<K, ui.Widget>`
/// Throws ResolveError(ParseError) on syntax error.
Type parse_type(std::string_view src, const TypeParams& params = {}, const SourceLoc& loc = {});

/// Parse comma-separated list of type expressions: `Widget, List<T>, Session`
/// Empty (or whitespace only) input gives empty list.
std::vector<Type> parse_type_list(std::string_view src, const TypeParams& params = {}, const SourceLoc& loc = {});

/// Parse comma-separated list of type parameter names: `K, V`
TypeParams parse_type_params(std::string_view src, const SourceLoc& loc = {});


} // namespace ambit::resolve

#endif // include guard
