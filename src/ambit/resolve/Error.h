// Error.h created on 2026-09-15 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_ERROR_H
#define AMBIT_RESOLVE_ERROR_H

#include "Source.h"
#include <ambit/core/error.h>

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <string_view>


namespace ambit::resolve {

using std::string_view;


enum class ErrorCode {
    // declaration errors
    MissingReceiver,
    DuplicateReceiverType,
    DuplicateReceiverName,

    // call site errors
    UndefinedName,
    NoValidBinding,
    AmbiguousOverload,
    UndefinedReceiverLabel,

    // input errors
    ParseError,
    RedefinedType,

    // contract violations
    AmbiguousBinding,
    StackDisciplineViolation,
};


std::ostream& operator<<(std::ostream& os, ErrorCode v);


/// User-facing error, reported at a declaration or a call site.
class ResolveError : public core::Error {
public:
    explicit ResolveError(ErrorCode code, std::string msg) : Error(std::move(msg)), m_code(code) {}
    explicit ResolveError(ErrorCode code, std::string msg, SourceLoc loc, std::string detail = {})
        : Error(std::move(msg)), m_loc(std::move(loc)), m_detail(std::move(detail)), m_code(code) {}

    const SourceLoc& loc() const noexcept { return m_loc; }
    const std::string& detail() const noexcept { return m_detail; }
    ErrorCode code() const noexcept { return m_code; }

private:
    SourceLoc m_loc;
    std::string m_detail;  // e.g. list of competing candidates
    ErrorCode m_code;
};


/// Internal error of the engine or its driver.
/// Not recovered per call site, the current pass is aborted.
class ContractViolation : public core::Error {
public:
    explicit ContractViolation(ErrorCode code, std::string msg) : Error(std::move(msg)), m_code(code) {}

    ErrorCode code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};


inline std::ostream& operator<<(std::ostream& os, const ResolveError& e) noexcept
{
    if (e.loc())
        os << e.loc() << ": ";
    os << e.code() << ": " << e.what();
    if (!e.detail().empty())
        os << '\n' << e.detail();
    return os;
}


inline std::ostream& operator<<(std::ostream& os, const ContractViolation& e) noexcept
{
    return os << e.code() << ": " << e.what();
}


inline ResolveError missing_receiver(string_view name, const SourceLoc& loc) {
    return ResolveError(ErrorCode::MissingReceiver,
                        fmt::format("declaration has no receiver: {}", name), loc);
}

inline ResolveError duplicate_receiver_type(string_view name, string_view type, const SourceLoc& loc) {
    return ResolveError(ErrorCode::DuplicateReceiverType,
                        fmt::format("receiver type {} repeated in declaration of {}", type, name), loc);
}

inline ResolveError duplicate_receiver_name(string_view name, string_view simple_name, const SourceLoc& loc) {
    return ResolveError(ErrorCode::DuplicateReceiverName,
                        fmt::format("receivers of {} share simple name {}", name, simple_name), loc);
}

inline ResolveError undefined_name(string_view name, const SourceLoc& loc) {
    return ResolveError(ErrorCode::UndefinedName, fmt::format("undefined name: {}", name), loc);
}

inline ResolveError no_valid_binding(string_view name, std::string candidates, const SourceLoc& loc) {
    return ResolveError(ErrorCode::NoValidBinding,
                        fmt::format("no applicable declaration for {}", name), loc,
                        std::move(candidates));
}

inline ResolveError ambiguous_overload(string_view name, std::string candidates, const SourceLoc& loc) {
    return ResolveError(ErrorCode::AmbiguousOverload,
                        fmt::format("call to {} cannot be uniquely resolved", name), loc,
                        std::move(candidates));
}

inline ResolveError undefined_receiver_label(string_view label, string_view name) {
    return ResolveError(ErrorCode::UndefinedReceiverLabel,
                        fmt::format("no receiver labelled this@{} in {}", label, name));
}

inline ResolveError parse_error(string_view msg, const SourceLoc& loc = {}) {
    return ResolveError(ErrorCode::ParseError, std::string(msg), loc);
}

inline ResolveError redefined_type(string_view name) {
    return ResolveError(ErrorCode::RedefinedType, fmt::format("redefined type: {}", name));
}

inline ContractViolation ambiguous_binding(string_view name, string_view greedy, string_view exhaustive) {
    return ContractViolation(ErrorCode::AmbiguousBinding,
                             fmt::format("greedy binding of {} ({}) differs from exhaustive search ({})",
                                         name, greedy, exhaustive));
}

inline ContractViolation stack_discipline_violation(std::string msg) {
    return ContractViolation(ErrorCode::StackDisciplineViolation, std::move(msg));
}


} // namespace ambit::resolve

template <> struct fmt::formatter<ambit::resolve::ErrorCode> : ostream_formatter {};
template <> struct fmt::formatter<ambit::resolve::ResolveError> : ostream_formatter {};
template <> struct fmt::formatter<ambit::resolve::ContractViolation> : ostream_formatter {};

#endif // include guard
