// Error.cpp created on 2026-09-15 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "Error.h"
#include <ambit/compat/macros.h>

namespace ambit::resolve {


std::ostream& operator<<(std::ostream& os, ErrorCode v)
{
    switch (v) {
        case ErrorCode::MissingReceiver:            return os << "MissingReceiver";
        case ErrorCode::DuplicateReceiverType:      return os << "DuplicateReceiverType";
        case ErrorCode::DuplicateReceiverName:      return os << "DuplicateReceiverName";
        case ErrorCode::UndefinedName:              return os << "UndefinedName";
        case ErrorCode::NoValidBinding:             return os << "NoValidBinding";
        case ErrorCode::AmbiguousOverload:          return os << "AmbiguousOverload";
        case ErrorCode::UndefinedReceiverLabel:     return os << "UndefinedReceiverLabel";
        case ErrorCode::ParseError:                 return os << "ParseError";
        case ErrorCode::RedefinedType:              return os << "RedefinedType";
        case ErrorCode::AmbiguousBinding:           return os << "AmbiguousBinding";
        case ErrorCode::StackDisciplineViolation:   return os << "StackDisciplineViolation";
    }
    AMBIT_UNREACHABLE;
}


} // namespace ambit::resolve
