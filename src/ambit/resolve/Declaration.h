// Declaration.h created on 2026-09-16 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#ifndef AMBIT_RESOLVE_DECLARATION_H
#define AMBIT_RESOLVE_DECLARATION_H

#include "Type.h"
#include "Source.h"
#include "Error.h"

#include <fmt/ostream.h>

#include <string>
#include <vector>
#include <deque>
#include <map>

namespace ambit::resolve {


enum class ResolutionMode {
    Ordered,    // receivers bind to strictly increasing stack depths
    Unordered,  // each receiver binds to the innermost matching context
};

std::ostream& operator<<(std::ostream& os, ResolutionMode v);


/// Callable with one or more receiver types.
/// The last receiver is the explicit one (written before the dot at call site).
struct Declaration {
    std::string name;
    std::vector<Type> receivers;
    ResolutionMode mode = ResolutionMode::Ordered;
    std::vector<std::string> type_params;
    SourceLoc loc;

    size_t receiver_count() const { return receivers.size(); }
    const Type& explicit_receiver() const { return receivers.back(); }
    bool is_generic() const { return !type_params.empty(); }

    /// Check definition-time invariants, throw ResolveError on violation:
    /// - at least one receiver (MissingReceiver)
    /// - no repeated receiver type, type params compared by position (DuplicateReceiverType)
    /// - no two receivers with same simple name (DuplicateReceiverName)
    void validate() const;
};

std::ostream& operator<<(std::ostream& os, const Declaration& v);


/// All declarations of one name, in order of definition
struct OverloadSet {
    std::string name;
    std::vector<const Declaration*> candidates;
};


/// Validated declarations grouped by name
///
/// Declarations which fail validation are reported (logged and kept in `errors()`)
/// and left out, the table stays usable.
class DeclarationTable {
public:
    /// \returns pointer to the stored declaration, or nullptr if it was rejected
    const Declaration* add(Declaration decl);

    /// \returns nullptr if there is no declaration of the name
    const OverloadSet* find(const std::string& name) const;

    const std::vector<ResolveError>& errors() const { return m_errors; }
    size_t size() const { return m_decls.size(); }

private:
    std::deque<Declaration> m_decls;  // stable addresses
    std::map<std::string, OverloadSet, std::less<>> m_sets;
    std::vector<ResolveError> m_errors;
};


} // namespace ambit::resolve

template <> struct fmt::formatter<ambit::resolve::ResolutionMode> : ostream_formatter {};
template <> struct fmt::formatter<ambit::resolve::Declaration> : ostream_formatter {};

#endif // include guard
