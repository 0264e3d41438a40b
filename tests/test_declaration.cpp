// test_declaration.cpp created on 2026-09-24 as part of ambit project
//
// Copyright 2026 Radek Brich
// Licensed under the Apache License, Version 2.0 (see LICENSE file)

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <ambit/resolve/Declaration.h>
#include <ambit/resolve/TypeParser.h>
#include <ambit/core/log.h>

#include <fmt/format.h>

using namespace ambit::resolve;
using ambit::core::Logger;


static Declaration make_decl(std::string name, std::string_view receivers,
                             std::vector<std::string> params = {})
{
    TypeParams tp(params.begin(), params.end());
    return Declaration{std::move(name), parse_type_list(receivers, tp),
                       ResolutionMode::Ordered, std::move(params), SourceLoc{"test", 1, 1}};
}


static std::optional<ErrorCode> validation_error(const Declaration& decl)
{
    try {
        decl.validate();
    } catch (const ResolveError& e) {
        return e.code();
    }
    return std::nullopt;
}


TEST_CASE( "Declaration invariants", "[Declaration]" )
{
    CHECK(!validation_error(make_decl("render", "Widget, Session")));
    CHECK(!validation_error(make_decl("size", "Widget")));
    CHECK(validation_error(make_decl("f", "")) == ErrorCode::MissingReceiver);
    CHECK(validation_error(make_decl("f", "Widget, Widget")) == ErrorCode::DuplicateReceiverType);
    CHECK(validation_error(make_decl("f", "List<Int>, List<Int>")) == ErrorCode::DuplicateReceiverType);

    // same simple name in different packages
    CHECK(validation_error(make_decl("f", "ui.Widget, web.Widget")) == ErrorCode::DuplicateReceiverName);
    // args are erased from simple name
    CHECK(validation_error(make_decl("f", "List<Int>, List<String>")) == ErrorCode::DuplicateReceiverName);

    // type params are compared by position, not by name
    CHECK(validation_error(make_decl("f", "Map<K, V>, Map<K, V>", {"K", "V"})) == ErrorCode::DuplicateReceiverType);
    CHECK(validation_error(make_decl("f", "Map<K, V>, ui.Map<V, K>", {"K", "V"})) == ErrorCode::DuplicateReceiverName);
    CHECK(!validation_error(make_decl("f", "List<T>, Session", {"T"})));
}


TEST_CASE( "Declaration printing", "[Declaration]" )
{
    CHECK(fmt::format("{}", make_decl("render", "Widget, Session")) == "fun context(Widget) Session.render");
    CHECK(fmt::format("{}", make_decl("size", "Widget")) == "fun Widget.size");
    auto decl = make_decl("first", "Scope, List<T>", {"T"});
    decl.mode = ResolutionMode::Unordered;
    CHECK(fmt::format("{}", decl) == "fun <T> context(Scope) List<T>.first [unordered]");
}


TEST_CASE( "Declaration table", "[DeclarationTable]" )
{
    Logger::default_instance().set_level(Logger::Level::None);
    DeclarationTable table;

    const auto* a = table.add(make_decl("render", "Widget, Session"));
    const auto* b = table.add(make_decl("render", "Session"));
    const auto* bad = table.add(make_decl("render", "Widget, Widget"));
    const auto* c = table.add(make_decl("close", "Session"));
    const auto* bad2 = table.add(make_decl("broken", ""));
    CHECK(a != nullptr);
    CHECK(b != nullptr);
    CHECK(c != nullptr);
    CHECK(bad == nullptr);
    CHECK(bad2 == nullptr);
    CHECK(table.size() == 3);

    REQUIRE(table.errors().size() == 2);
    CHECK(table.errors()[0].code() == ErrorCode::DuplicateReceiverType);
    CHECK(table.errors()[0].loc() == SourceLoc{"test", 1, 1});
    CHECK(table.errors()[1].code() == ErrorCode::MissingReceiver);

    const auto* set = table.find("render");
    REQUIRE(set != nullptr);
    CHECK(set->name == "render");
    CHECK(set->candidates == std::vector{a, b});
    CHECK(table.find("broken") == nullptr);
    CHECK(table.find("missing") == nullptr);

    // stored declarations keep their addresses
    for (int i = 0; i != 100; ++i)
        table.add(make_decl(fmt::format("f{}", i), "Widget"));
    CHECK(table.find("render")->candidates[0] == a);
    CHECK(a->name == "render");
}
