// NonCopyable.h created on 2026-09-12 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_CORE_NONCOPYABLE_H
#define AMBIT_CORE_NONCOPYABLE_H

namespace ambit::core {


class NonCopyable {
public:
    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator =(const NonCopyable&) = delete;

protected:
    NonCopyable() = default;
};


} // namespace ambit::core

#endif // include guard
