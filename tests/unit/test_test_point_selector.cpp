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

#include "test_point_selector.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace openfixture;

namespace {

PadInfo make_pad(const LayerSet& layers, PadType type, const std::string& number = "1") {
    PadInfo pad;
    pad.number = number;
    pad.layers = layers;
    pad.type = type;
    return pad;
}

const SideScan FRONT = SideScan::for_side(BoardSide::Front);
const SideScan BACK = SideScan::for_side(BoardSide::Back);

} // namespace

TEST_CASE("TestPointSelector - side scans", "[selector]") {
    REQUIRE(FRONT.copper == Layer::FrontCopper);
    REQUIRE(FRONT.paste == Layer::FrontPaste);
    REQUIRE_FALSE(FRONT.mirror);

    REQUIRE(BACK.copper == Layer::BackCopper);
    REQUIRE(BACK.paste == Layer::BackPaste);
    REQUIRE(BACK.mirror);

    SECTION("Both mode scans front first") {
        auto scans = TestPointSelector::scans_for(TestLayer::Both);
        REQUIRE(scans.size() == 2);
        REQUIRE(scans[0].side == BoardSide::Front);
        REQUIRE(scans[1].side == BoardSide::Back);
    }

    SECTION("Single-side modes scan one face") {
        REQUIRE(TestPointSelector::scans_for(TestLayer::Front).size() == 1);
        auto back = TestPointSelector::scans_for(TestLayer::Back);
        REQUIRE(back.size() == 1);
        REQUIRE(back[0].mirror);
    }
}

TEST_CASE("TestPointSelector - layer gate comes first", "[selector][precedence]") {
    TestPointSelector selector(SelectionConfig{});

    // Force layer does not help a pad that is not on the scanned copper
    PadInfo pad = make_pad({Layer::BackCopper, Layer::Eco2User}, PadType::Smd);
    REQUIRE(selector.evaluate(pad, BoardSide::Back, FRONT) == SelectionDecision::NotOnLayer);
}

TEST_CASE("TestPointSelector - bare SMD pad is accepted", "[selector]") {
    TestPointSelector selector(SelectionConfig{});

    PadInfo pad = make_pad({Layer::FrontCopper, Layer::FrontMask}, PadType::Smd);
    REQUIRE(selector.evaluate(pad, BoardSide::Front, FRONT) == SelectionDecision::Accepted);
}

TEST_CASE("TestPointSelector - force layer wins over everything else",
          "[selector][precedence]") {
    SelectionConfig config;
    config.include_smd = false;
    TestPointSelector selector(config);

    SECTION("Force beats ignore") {
        PadInfo pad =
            make_pad({Layer::FrontCopper, Layer::Eco2User, Layer::Eco1User}, PadType::Smd);
        REQUIRE(selector.evaluate(pad, BoardSide::Front, FRONT) ==
                SelectionDecision::AcceptedForced);
    }

    SECTION("Force beats paste and disabled pad type") {
        PadInfo pad =
            make_pad({Layer::FrontCopper, Layer::FrontPaste, Layer::Eco2User}, PadType::Smd);
        REQUIRE(selector.evaluate(pad, BoardSide::Front, FRONT) ==
                SelectionDecision::AcceptedForced);
    }

    SECTION("Force accepts pad types that are otherwise never eligible") {
        PadInfo pad = make_pad({Layer::FrontCopper, Layer::Eco2User}, PadType::Other);
        REQUIRE(selector.evaluate(pad, BoardSide::Front, FRONT) ==
                SelectionDecision::AcceptedForced);
    }
}

TEST_CASE("TestPointSelector - ignore layer beats exposed copper", "[selector][precedence]") {
    TestPointSelector selector(SelectionConfig{});

    PadInfo pad = make_pad({Layer::FrontCopper, Layer::FrontMask, Layer::Eco1User}, PadType::Smd);
    REQUIRE(selector.evaluate(pad, BoardSide::Front, FRONT) == SelectionDecision::Ignored);
}

TEST_CASE("TestPointSelector - paste on the scanned side rejects", "[selector]") {
    TestPointSelector selector(SelectionConfig{});

    SECTION("Front paste while scanning front") {
        PadInfo pad = make_pad({Layer::FrontCopper, Layer::FrontPaste}, PadType::Smd);
        REQUIRE(selector.evaluate(pad, BoardSide::Front, FRONT) == SelectionDecision::HasPaste);
    }

    SECTION("Front paste does not matter while scanning back") {
        PadInfo pad = make_pad({Layer::BackCopper, Layer::FrontPaste}, PadType::Smd);
        REQUIRE(selector.evaluate(pad, BoardSide::Back, BACK) == SelectionDecision::Accepted);
    }
}

TEST_CASE("TestPointSelector - pad type gate", "[selector]") {
    SECTION("SMD pads follow include_smd") {
        SelectionConfig config;
        config.include_smd = false;
        TestPointSelector selector(config);

        PadInfo pad = make_pad({Layer::FrontCopper}, PadType::Smd);
        REQUIRE(selector.evaluate(pad, BoardSide::Front, FRONT) == SelectionDecision::SmdExcluded);
    }

    SECTION("Through-hole pads are off by default") {
        TestPointSelector selector(SelectionConfig{});

        PadInfo pad = make_pad({Layer::FrontCopper, Layer::BackCopper}, PadType::ThroughHole);
        REQUIRE(selector.evaluate(pad, BoardSide::Back, FRONT) ==
                SelectionDecision::ThroughHoleExcluded);
    }

    SECTION("Other pad types are always rejected") {
        TestPointSelector selector(SelectionConfig{});

        PadInfo pad = make_pad({Layer::FrontCopper, Layer::BackCopper}, PadType::Other);
        REQUIRE(selector.evaluate(pad, BoardSide::Back, FRONT) ==
                SelectionDecision::UnsupportedPadType);
    }
}

TEST_CASE("TestPointSelector - through-hole pads only from the opposite side",
          "[selector][through_hole]") {
    SelectionConfig config;
    config.include_through_hole = true;
    TestPointSelector selector(config);

    // Connector body on the front
    PadInfo pad = make_pad({Layer::FrontCopper, Layer::BackCopper, Layer::FrontMask,
                            Layer::BackMask},
                           PadType::ThroughHole);

    REQUIRE(selector.evaluate(pad, BoardSide::Front, FRONT) ==
            SelectionDecision::ThroughHoleSameSide);
    REQUIRE(selector.evaluate(pad, BoardSide::Front, BACK) == SelectionDecision::Accepted);

    SECTION("Mirror image for a back-side component") {
        REQUIRE(selector.evaluate(pad, BoardSide::Back, BACK) ==
                SelectionDecision::ThroughHoleSameSide);
        REQUIRE(selector.evaluate(pad, BoardSide::Back, FRONT) == SelectionDecision::Accepted);
    }
}

TEST_CASE("TestPointSelector - select keeps footprint and pad order", "[selector]") {
    TestPointSelector selector(SelectionConfig{});

    std::vector<FootprintInfo> footprints(2);
    footprints[0].reference = "TP2";
    footprints[0].pads.push_back(make_pad({Layer::FrontCopper}, PadType::Smd, "1"));
    footprints[0].pads.push_back(make_pad({Layer::FrontCopper, Layer::FrontPaste}, PadType::Smd, "2"));
    footprints[0].pads.push_back(make_pad({Layer::FrontCopper}, PadType::Smd, "3"));
    footprints[1].reference = "TP1";
    footprints[1].pads.push_back(make_pad({Layer::FrontCopper, Layer::Eco2User}, PadType::Other, "1"));
    footprints[1].pads.push_back(make_pad({Layer::BackCopper}, PadType::Smd, "2"));

    auto selected = selector.select(footprints, FRONT);

    REQUIRE(selected.size() == 3);
    REQUIRE(selected[0].reference == "TP2");
    REQUIRE(selected[0].pad.number == "1");
    REQUIRE(selected[1].reference == "TP2");
    REQUIRE(selected[1].pad.number == "3");
    REQUIRE(selected[2].reference == "TP1");
    REQUIRE(selected[2].forced);
    REQUIRE(selected[2].scanned_side == BoardSide::Front);
}

TEST_CASE("TestPointSelector - test layer names", "[selector][config]") {
    REQUIRE(test_layer_from_name("F.Cu") == TestLayer::Front);
    REQUIRE(test_layer_from_name("b.cu") == TestLayer::Back);
    REQUIRE(test_layer_from_name("bottom") == TestLayer::Back);
    REQUIRE(test_layer_from_name("BOTH") == TestLayer::Both);
    REQUIRE_FALSE(test_layer_from_name("In1.Cu").has_value());

    REQUIRE(std::string(test_layer_name(TestLayer::Front)) == "F.Cu");
    REQUIRE(std::string(test_layer_name(TestLayer::Both)) == "both");
}

TEST_CASE("TestPointSelector - is_accepted", "[selector]") {
    REQUIRE(is_accepted(SelectionDecision::Accepted));
    REQUIRE(is_accepted(SelectionDecision::AcceptedForced));
    REQUIRE_FALSE(is_accepted(SelectionDecision::HasPaste));
    REQUIRE_FALSE(is_accepted(SelectionDecision::NotOnLayer));
}
