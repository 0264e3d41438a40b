// TypeParser.cpp created on 2026-09-15 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#include "TypeParser.h"
#include "Error.h"

#include <tao/pegtl.hpp>

namespace ambit::resolve {

namespace parser {
using namespace tao::pegtl;

// ----------------------------------------------------------------------------
// Grammar

struct SC: star<space> {};
struct QualName: list<identifier, one<'.'>> {};
struct TypeExpr;
struct ArgsBegin: one<'<'> {};
struct TypeArgList: if_must< ArgsBegin, SC, list<TypeExpr, one<','>, space>, SC, one<'>'> > {};
struct TypeExpr: seq< QualName, SC, opt<TypeArgList> > {};

struct SingleType: must< SC, TypeExpr, SC, eof > {};
struct TypeList: must< SC, opt<list<TypeExpr, one<','>, space>>, SC, eof > {};
struct ParamList: must< SC, opt<list<identifier, one<','>, space>>, SC, eof > {};


// ----------------------------------------------------------------------------
// Actions

struct TypeState {
    struct Partial {
        std::string name;
        std::vector<Type> args;
    };

    const TypeParams& params;
    std::vector<Partial> stack;     // types being parsed, innermost on top
    std::vector<Type> result;       // top-level types
};

template<typename Rule>
struct Action : nothing<Rule> {};

template<>
struct Action<QualName> {
    template<typename Input>
    static void apply(const Input& in, TypeState& state) {
        state.stack.push_back({in.string(), {}});
    }
};

template<>
struct Action<TypeExpr> {
    template<typename Input>
    static void apply(const Input& in, TypeState& state) {
        auto partial = std::move(state.stack.back());
        state.stack.pop_back();
        Type type = (partial.args.empty() && state.params.contains(partial.name))
                ? Type::var(std::move(partial.name))
                : Type(std::move(partial.name), std::move(partial.args));
        if (state.stack.empty())
            state.result.push_back(std::move(type));
        else
            state.stack.back().args.push_back(std::move(type));
    }
};


template<typename Rule>
struct ParamAction : nothing<Rule> {};

template<>
struct ParamAction<identifier> {
    template<typename Input>
    static void apply(const Input& in, TypeParams& params) {
        params.insert(in.string());
    }
};


// ----------------------------------------------------------------------------
// Control (error reporting)

template<typename Rule> constexpr const char* error_message = nullptr;
template<> constexpr const char* error_message<eof> = "unexpected input after type";
template<> constexpr const char* error_message<TypeExpr> = "expected type name";
template<> constexpr const char* error_message<list<TypeExpr, one<','>, space>> = "expected type argument";
template<> constexpr const char* error_message<one<'>'>> = "expected '>' or ','";

template< typename Rule >
struct Control : normal< Rule >
{
    template< typename Input, typename... States >
    static void raise( const Input& in, States&&... /*unused*/ ) {
        const char* msg = error_message<Rule>;
        throw tao::pegtl::parse_error( msg ? msg : "unexpected input", in );
    }
};


template<typename Rule, template<typename> class A, typename State>
void parse_or_throw(std::string_view src, const SourceLoc& loc, State& state)
{
    memory_input in(src.data(), src.size(), loc.file.empty() ? "<input>" : loc.file);
    try {
        parse< Rule, A, Control >(in, state);
    } catch (const tao::pegtl::parse_error& e) {
        const auto& p = e.positions().front();
        throw resolve::parse_error(
                fmt::format("{} in \"{}\" at column {}", e.message(), src, p.column), loc);
    }
}

} // namespace parser


Type parse_type(std::string_view src, const TypeParams& params, const SourceLoc& loc)
{
    parser::TypeState state{params, {}, {}};
    parser::parse_or_throw<parser::SingleType, parser::Action>(src, loc, state);
    return std::move(state.result.front());
}


std::vector<Type> parse_type_list(std::string_view src, const TypeParams& params, const SourceLoc& loc)
{
    parser::TypeState state{params, {}, {}};
    parser::parse_or_throw<parser::TypeList, parser::Action>(src, loc, state);
    return std::move(state.result);
}


TypeParams parse_type_params(std::string_view src, const SourceLoc& loc)
{
    TypeParams params;
    parser::parse_or_throw<parser::ParamList, parser::ParamAction>(src, loc, params);
    return params;
}


} // namespace ambit::resolve
