// test_type.cpp created on 2026-09-23 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <ambit/resolve/TypeParser.h>
#include <ambit/resolve/TypeHierarchy.h>
#include <ambit/resolve/Error.h>

#include <fmt/format.h>

using namespace ambit::resolve;


static std::string fmt_type(std::string_view src, const TypeParams& params = {})
{
    return fmt::format("{}", parse_type(src, params));
}


TEST_CASE( "Type expressions", "[Type][TypeParser]" )
{
    CHECK(fmt_type("Int") == "Int");
    CHECK(fmt_type("  ui.Widget ") == "ui.Widget");
    CHECK(fmt_type("Map<K,V>") == "Map<K, V>");
    CHECK(fmt_type("Map< String , List<ui.Widget> >") == "Map<String, List<ui.Widget>>");

    auto t = parse_type("Map<K, List<V>>", {"K", "V"});
    CHECK(t.is_generic());
    CHECK(t.args()[0].is_var());
    CHECK(!t.args()[1].is_var());
    CHECK(t.args()[1].args()[0].is_var());
    CHECK(!parse_type("Map<K, V>").is_generic());

    // param name with args is not a var
    CHECK(!parse_type("T<Int>", {"T"}).is_var());

    auto list = parse_type_list("Widget, List<T>,Session", {"T"});
    REQUIRE(list.size() == 3);
    CHECK(list[0] == Type("Widget"));
    CHECK(list[1] == Type("List", {Type::var("T")}));
    CHECK(list[2] == Type("Session"));
    CHECK(parse_type_list("").empty());
    CHECK(parse_type_list("   ").empty());

    auto params = parse_type_params("K, V");
    CHECK(params.size() == 2);
    CHECK(params.contains("K"));
    CHECK(params.contains("V"));
}


TEST_CASE( "Type expression errors", "[Type][TypeParser]" )
{
    auto code = [](auto&& fn) {
        try {
            fn();
        } catch (const ResolveError& e) {
            return e.code();
        }
        return ErrorCode::MissingReceiver;  // anything else than ParseError
    };
    CHECK(code([]{ parse_type(""); }) == ErrorCode::ParseError);
    CHECK(code([]{ parse_type("List<"); }) == ErrorCode::ParseError);
    CHECK(code([]{ parse_type("List<Int"); }) == ErrorCode::ParseError);
    CHECK(code([]{ parse_type("List<Int>>"); }) == ErrorCode::ParseError);
    CHECK(code([]{ parse_type("A B"); }) == ErrorCode::ParseError);
    CHECK(code([]{ parse_type("1A"); }) == ErrorCode::ParseError);
    CHECK(code([]{ parse_type_list("A,,B"); }) == ErrorCode::ParseError);
    CHECK_THROWS_AS(parse_type_params("K<V>"), ResolveError);
}


TEST_CASE( "Type operations", "[Type]" )
{
    CHECK(parse_type("ui.List<Int>").simple_name() == "List");
    CHECK(parse_type("Widget").simple_name() == "Widget");
    CHECK(parse_type("a.b.C").simple_name() == "C");

    const auto t = parse_type("Map<K, List<V>>", {"K", "V"});
    TypeArgs args {{"K", Type("String")}};
    CHECK(fmt::format("{}", t.substitute(args)) == "Map<String, List<V>>");
    CHECK(t.substitute(args).is_generic());
    args.emplace("V", Type("Int"));
    CHECK(fmt::format("{}", t.substitute(args)) == "Map<String, List<Int>>");
    CHECK(!t.substitute(args).is_generic());
    CHECK(fmt::format("{}", args) == "[K=String, V=Int]");

    CHECK(Type("T") != Type::var("T"));
}


TEST_CASE( "Type hierarchy", "[TypeHierarchy]" )
{
    TypeHierarchy h;
    h.define(Type("Widget"));
    h.define(Type("Button"), {Type("Widget")});
    h.define(Type("ToggleButton"), {Type("Button"), Type("Checkable")});
    h.define(parse_type("List<E>", {"E"}), {parse_type("Collection<E>", {"E"})});
    h.define(parse_type("ArrayList<E>", {"E"}), {parse_type("List<E>", {"E"})});

    SECTION("nominal subtyping") {
        CHECK(h.is_subtype(Type("Button"), Type("Widget")));
        CHECK(h.is_subtype(Type("ToggleButton"), Type("Widget")));
        CHECK(h.is_subtype(Type("ToggleButton"), Type("Checkable")));
        CHECK(h.is_subtype(Type("Widget"), Type("Widget")));
        CHECK(!h.is_subtype(Type("Widget"), Type("Button")));
        CHECK(!h.is_subtype(Type("Checkable"), Type("Widget")));
        // undefined types are only subtypes of themselves
        CHECK(h.is_subtype(Type("Session"), Type("Session")));
        CHECK(!h.is_subtype(Type("Session"), Type("Widget")));
    }

    SECTION("generic args are invariant") {
        CHECK(h.is_subtype(parse_type("ArrayList<Int>"), parse_type("Collection<Int>")));
        CHECK(!h.is_subtype(parse_type("ArrayList<Int>"), parse_type("Collection<String>")));
        CHECK(!h.is_subtype(parse_type("List<Button>"), parse_type("List<Widget>")));
        CHECK(h.direct_supertypes(parse_type("ArrayList<Int>")) == std::vector{parse_type("List<Int>")});
    }

    SECTION("unification") {
        const auto pattern = parse_type("List<T>", {"T"});
        TypeArgs args;
        CHECK(h.unify(parse_type("ArrayList<Int>"), pattern, args));
        CHECK(args == TypeArgs{{"T", Type("Int")}});
        // bound var must agree
        CHECK(!h.unify(parse_type("List<String>"), pattern, args));
        CHECK(args == TypeArgs{{"T", Type("Int")}});
        CHECK(h.unify(parse_type("List<Int>"), pattern, args));

        // bare var binds to the type itself, later uses accept subtypes
        TypeArgs args2;
        CHECK(h.unify(Type("Widget"), Type::var("T"), args2));
        CHECK(h.unify(Type("Button"), Type::var("T"), args2));
        CHECK(!h.unify(Type("Session"), Type::var("T"), args2));
        CHECK(args2 == TypeArgs{{"T", Type("Widget")}});
    }

    SECTION("redefinition") {
        try {
            h.define(Type("Button"));
            FAIL("expected RedefinedType");
        } catch (const ResolveError& e) {
            CHECK(e.code() == ErrorCode::RedefinedType);
        }
    }
}
