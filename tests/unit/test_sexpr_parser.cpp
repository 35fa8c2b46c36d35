// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 OpenFixture Contributors
 *
 * This file is part of OpenFixture, which is free software: you can
 * redistribute it and/or modify it under the terms of the GNU General
 * Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * See <https://www.gnu.org/licenses/>.
 */

#include "sexpr_parser.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <string>

using namespace openfixture;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("SexprParser - nested lists", "[sexpr]") {
    SexprNode root = SexprParser::parse("(kicad_pcb (version 20221018)\n"
                                        "  (gr_line (start 10 5) (end 110 5) (layer \"Edge.Cuts\")))");

    REQUIRE(root.is_list());
    REQUIRE(root.head() == "kicad_pcb");
    REQUIRE(root.size() == 3);

    const SexprNode* version = root.find("version");
    REQUIRE(version != nullptr);
    REQUIRE(version->number_at(1) == 20221018.0);

    const SexprNode* line = root.find("gr_line");
    REQUIRE(line != nullptr);
    REQUIRE(line->line == 2);
    REQUIRE(line->find("start")->number_at(1) == 10.0);
    REQUIRE(line->find("end")->number_at(2) == 5.0);
    REQUIRE(line->find("layer")->atom_at(1) == std::string("Edge.Cuts"));
}

TEST_CASE("SexprParser - quoted strings", "[sexpr]") {
    SexprNode root = SexprParser::parse(R"sx((property "Reference" "TP 1 \"a\"\n(x)"))sx");

    REQUIRE(root.size() == 3);
    REQUIRE(root.atom_at(1) == std::string("Reference"));
    REQUIRE(root.atom_at(2) == std::string("TP 1 \"a\"\n(x)"));

    SECTION("Empty string is an atom") {
        SexprNode node = SexprParser::parse(R"((net 0 ""))");
        REQUIRE(node.size() == 3);
        REQUIRE(node.atom_at(2) == std::string());
    }
}

TEST_CASE("SexprParser - lookups", "[sexpr]") {
    SexprNode root = SexprParser::parse("(pad \"1\" smd rect (at 1 0) (layers F.Cu F.Mask)"
                                        " (at 2 0) (size 1.5e0 abc))");

    SECTION("find returns the first match") {
        REQUIRE(root.find("at")->number_at(1) == 1.0);
        REQUIRE(root.find("drill") == nullptr);
    }

    SECTION("find_all keeps order") {
        auto all = root.find_all("at");
        REQUIRE(all.size() == 2);
        REQUIRE(all[1]->number_at(1) == 2.0);
    }

    SECTION("number_at requires the whole atom to be numeric") {
        const SexprNode* size = root.find("size");
        REQUIRE(size->number_at(1) == 1.5);
        REQUIRE_FALSE(size->number_at(2).has_value());
        REQUIRE_FALSE(size->number_at(9).has_value());
    }

    SECTION("number_at accepts only finite decimal numbers") {
        SexprNode node = SexprParser::parse("(at nan inf -infinity 0x1A 1e999 -2.5e-1)");
        REQUIRE_FALSE(node.number_at(1).has_value());
        REQUIRE_FALSE(node.number_at(2).has_value());
        REQUIRE_FALSE(node.number_at(3).has_value());
        REQUIRE_FALSE(node.number_at(4).has_value());
        REQUIRE_FALSE(node.number_at(5).has_value());
        REQUIRE(node.number_at(6) == -0.25);
    }

    SECTION("head of an atom or list child") {
        REQUIRE(root.children[1].head().empty());
        REQUIRE_FALSE(root.atom_at(4).has_value());
    }
}

TEST_CASE("SexprParser - errors report the line", "[sexpr][errors]") {
    SECTION("Missing close paren") {
        try {
            SexprParser::parse("(kicad_pcb\n  (gr_line (start 0 0)\n)");
            FAIL("expected SexprParseError");
        } catch (const SexprParseError& e) {
            REQUIRE(e.line() == 1);
            REQUIRE_THAT(e.what(), ContainsSubstring("missing ')'"));
        }
    }

    SECTION("Extra close paren") {
        REQUIRE_THROWS_WITH(SexprParser::parse("(a)\n)"), ContainsSubstring("line 2"));
    }

    SECTION("Unterminated string") {
        REQUIRE_THROWS_WITH(SexprParser::parse("(a\n \"open)"),
                            ContainsSubstring("unterminated string"));
    }

    SECTION("Stray atom before the root") {
        REQUIRE_THROWS_AS(SexprParser::parse("junk (a)"), SexprParseError);
    }

    SECTION("Second top-level list") {
        REQUIRE_THROWS_WITH(SexprParser::parse("(a) (b)"), ContainsSubstring("after the top-level"));
    }

    SECTION("Empty document") {
        REQUIRE_THROWS_AS(SexprParser::parse("  \n "), SexprParseError);
    }
}
