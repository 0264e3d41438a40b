// macros.h created on 2026-09-12 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_COMPAT_MACROS_H
#define AMBIT_COMPAT_MACROS_H

#include <utility>

// Unreachable
#if defined(__cpp_lib_unreachable) && __cpp_lib_unreachable >= 202202L
#   define AMBIT_UNREACHABLE  std::unreachable()
#else
#   define AMBIT_UNREACHABLE  __builtin_unreachable()
#endif


#endif // include guard
