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

#pragma once

#include "board_snapshot.h"

#include <optional>
#include <string>
#include <vector>

namespace openfixture {

/**
 * @brief Which board face(s) the fixture probes
 */
enum class TestLayer {
    Front, ///< Probe F.Cu from above
    Back,  ///< Probe B.Cu, coordinates mirrored
    Both   ///< Probe both faces, front scanned first
};

/**
 * @brief Parse a test layer selection
 *
 * Accepts "F.Cu"/"front"/"top", "B.Cu"/"back"/"bottom" and "both".
 *
 * @return TestLayer, or std::nullopt if unrecognized
 */
std::optional<TestLayer> test_layer_from_name(const std::string& name);

const char* test_layer_name(TestLayer layer);

/**
 * @brief Rules for deciding which pads become test points
 */
struct SelectionConfig {
    TestLayer layer{TestLayer::Front};
    Layer force_layer{Layer::Eco2User};  ///< Pads on this layer are always test points
    Layer ignore_layer{Layer::Eco1User}; ///< Pads on this layer are never test points
    bool include_smd{true};              ///< Surface-mount pads are eligible
    bool include_through_hole{false};    ///< Through-hole pads are eligible (opposite side only)
};

/**
 * @brief Layer set used while scanning one face of the board
 */
struct SideScan {
    BoardSide side{BoardSide::Front};
    Layer copper{Layer::FrontCopper};
    Layer paste{Layer::FrontPaste};
    bool mirror{false}; ///< Back-side coordinates are flipped about the board width

    static SideScan for_side(BoardSide side);
};

/**
 * @brief Outcome of evaluating one pad against one side scan
 */
enum class SelectionDecision {
    Accepted,            ///< Passed every filter
    AcceptedForced,      ///< On the force layer, filters skipped
    NotOnLayer,          ///< Pad is not on the scanned copper layer
    Ignored,             ///< Pad is on the ignore layer
    HasPaste,            ///< Pad has paste on the scanned side, copper not exposed
    SmdExcluded,         ///< SMD pad while SMD pads are disabled
    ThroughHoleExcluded, ///< Through-hole pad while through-hole pads are disabled
    ThroughHoleSameSide, ///< Through-hole pad whose component body sits on the scanned side
    UnsupportedPadType   ///< Any other pad type
};

const char* selection_decision_name(SelectionDecision decision);

inline bool is_accepted(SelectionDecision decision) {
    return decision == SelectionDecision::Accepted ||
           decision == SelectionDecision::AcceptedForced;
}

/**
 * @brief A pad chosen as a test point
 */
struct SelectedPad {
    std::string reference; ///< Owning footprint reference
    PadInfo pad;
    BoardSide scanned_side{BoardSide::Front};
    bool forced{false};
};

/**
 * @brief Picks the pads a spring probe can reach
 *
 * Checks run in a fixed order and the first decisive check wins:
 *
 * 1. Pad must be on the scanned copper layer
 * 2. Force layer → accept
 * 3. Ignore layer → reject
 * 4. Paste on the scanned side → reject
 * 5. Pad type: SMD needs include_smd; through-hole needs include_through_hole
 *    and a component body on the opposite face; everything else is rejected
 *
 * The selector is stateless apart from its configuration and can be reused
 * for any number of boards.
 */
class TestPointSelector {
  public:
    explicit TestPointSelector(const SelectionConfig& config);

    /**
     * @brief Side scans for a test layer selection, in scan order
     * @return One scan for Front/Back, front then back for Both
     */
    static std::vector<SideScan> scans_for(TestLayer layer);

    /**
     * @brief Evaluate a single pad
     *
     * @param pad Pad to check
     * @param footprint_side Placement side of the pad's footprint
     * @param scan Face currently being scanned
     * @return Decision with the reason for rejection, if any
     */
    SelectionDecision evaluate(const PadInfo& pad, BoardSide footprint_side,
                               const SideScan& scan) const;

    /**
     * @brief Select test points on one face
     *
     * @param footprints All footprints of the board
     * @param scan Face to scan
     * @return Accepted pads in footprint/pad order
     */
    std::vector<SelectedPad> select(const std::vector<FootprintInfo>& footprints,
                                    const SideScan& scan) const;

    const SelectionConfig& config() const {
        return config_;
    }

  private:
    SelectionConfig config_;
};

} // namespace openfixture
