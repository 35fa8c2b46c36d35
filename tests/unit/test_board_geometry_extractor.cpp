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

#include "board_geometry_extractor.h"
#include "board_model.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <vector>

using namespace openfixture;

namespace {

// Outline of a rectangular board as four edge segments
std::vector<BoundingBox> rectangle_outline(double x0, double y0, double x1, double y1) {
    return {
        BoundingBox::from_corners(glm::dvec2(x0, y0), glm::dvec2(x1, y0)),
        BoundingBox::from_corners(glm::dvec2(x1, y0), glm::dvec2(x1, y1)),
        BoundingBox::from_corners(glm::dvec2(x1, y1), glm::dvec2(x0, y1)),
        BoundingBox::from_corners(glm::dvec2(x0, y1), glm::dvec2(x0, y0)),
    };
}

bool has_diagnostic(const BoardGeometry& geometry, DiagnosticKind kind) {
    return std::any_of(geometry.diagnostics.begin(), geometry.diagnostics.end(),
                       [kind](const Diagnostic& d) { return d.kind == kind; });
}

} // namespace

TEST_CASE("BoardGeometryExtractor - outline defines origin and dimensions",
          "[geometry][extractor]") {
    auto outline = rectangle_outline(10.0, 5.0, 110.0, 55.0);
    std::vector<BoundingBox> footprints{BoundingBox(20.0, 10.0, 5.0, 5.0)};

    BoardGeometry geometry = BoardGeometryExtractor::extract(outline, footprints);

    REQUIRE(geometry.origin == glm::dvec2(10.0, 5.0));
    REQUIRE(geometry.dimensions == glm::dvec2(100.0, 50.0));
    REQUIRE(geometry.from_outline);
    REQUIRE(geometry.diagnostics.empty());
}

TEST_CASE("BoardGeometryExtractor - origin does not depend on primitive order",
          "[geometry][extractor]") {
    auto outline = rectangle_outline(-3.5, 12.25, 61.75, 44.0);
    // Extra interior cutout
    outline.push_back(BoundingBox(20.0, 20.0, 4.0, 4.0));

    BoardGeometry reference = BoardGeometryExtractor::extract(outline, {});

    std::sort(outline.begin(), outline.end(), [](const BoundingBox& a, const BoundingBox& b) {
        return a.min.x < b.min.x || (a.min.x == b.min.x && a.min.y < b.min.y);
    });
    do {
        BoardGeometry geometry = BoardGeometryExtractor::extract(outline, {});
        REQUIRE(geometry.origin == reference.origin);
        REQUIRE(geometry.dimensions == reference.dimensions);
    } while (std::next_permutation(
        outline.begin(), outline.end(), [](const BoundingBox& a, const BoundingBox& b) {
            return a.min.x < b.min.x || (a.min.x == b.min.x && a.min.y < b.min.y);
        }));

    REQUIRE(reference.origin == glm::dvec2(-3.5, 12.25));
    REQUIRE(reference.dimensions == glm::dvec2(65.25, 31.75));
}

TEST_CASE("BoardGeometryExtractor - axes are folded independently", "[geometry][extractor]") {
    // Left-most primitive is not the top-most one
    std::vector<BoundingBox> outline{
        BoundingBox(0.0, 30.0, 0.0, 20.0),
        BoundingBox(10.0, 2.0, 40.0, 0.0),
    };

    BoardGeometry geometry = BoardGeometryExtractor::extract(outline, {});

    REQUIRE(geometry.origin == glm::dvec2(0.0, 2.0));
    REQUIRE(geometry.dimensions == glm::dvec2(50.0, 48.0));
}

TEST_CASE("BoardGeometryExtractor - dimensions are rounded to the grid",
          "[geometry][extractor]") {
    auto outline = rectangle_outline(0.0, 0.0, 80.3749, 40.0051);

    BoardGeometry geometry = BoardGeometryExtractor::extract(outline, {});

    REQUIRE(geometry.dimensions.x == 80.37);
    REQUIRE(geometry.dimensions.y == 40.01);
}

TEST_CASE("BoardGeometryExtractor - footprint fallback without outline",
          "[geometry][extractor][fallback]") {
    std::vector<BoundingBox> footprints{BoundingBox(0.0, 0.0, 80.0, 40.0)};

    BoardGeometry geometry = BoardGeometryExtractor::extract({}, footprints);

    REQUIRE(geometry.origin == glm::dvec2(0.0, 0.0));
    REQUIRE(geometry.dimensions == glm::dvec2(80.0, 40.0));
    REQUIRE_FALSE(geometry.from_outline);
    REQUIRE(has_diagnostic(geometry, DiagnosticKind::DegradedGeometry));
    REQUIRE_FALSE(has_diagnostic(geometry, DiagnosticKind::ComponentOverhang));
}

TEST_CASE("BoardGeometryExtractor - zero-extent outline falls back to footprints",
          "[geometry][extractor][fallback]") {
    std::vector<BoundingBox> outline{BoundingBox(5.0, 5.0, 0.0, 0.0)};
    std::vector<BoundingBox> footprints{BoundingBox(2.0, 3.0, 30.0, 20.0),
                                        BoundingBox(20.0, 10.0, 15.0, 15.0)};

    BoardGeometry geometry = BoardGeometryExtractor::extract(outline, footprints);

    REQUIRE(geometry.origin == glm::dvec2(2.0, 3.0));
    REQUIRE(geometry.dimensions == glm::dvec2(33.0, 22.0));
    REQUIRE(has_diagnostic(geometry, DiagnosticKind::DegradedGeometry));
}

TEST_CASE("BoardGeometryExtractor - empty board yields zero dimensions",
          "[geometry][extractor][fallback]") {
    BoardGeometry geometry = BoardGeometryExtractor::extract({}, {});

    REQUIRE(geometry.dimensions == glm::dvec2(0.0, 0.0));
    REQUIRE(has_diagnostic(geometry, DiagnosticKind::DegradedGeometry));
    REQUIRE(has_diagnostic(geometry, DiagnosticKind::BoardTooSmall));
}

TEST_CASE("BoardGeometryExtractor - component overhang", "[geometry][extractor][overhang]") {
    auto outline = rectangle_outline(0.0, 0.0, 60.0, 30.0);

    SECTION("Within tolerance is not reported") {
        std::vector<BoundingBox> footprints{BoundingBox(50.0, 10.0, 10.4, 5.0)};
        BoardGeometry geometry = BoardGeometryExtractor::extract(outline, footprints);
        REQUIRE_FALSE(has_diagnostic(geometry, DiagnosticKind::ComponentOverhang));
        REQUIRE(geometry.component_extent.x == 60.4);
    }

    SECTION("Beyond tolerance is reported as a warning") {
        // Edge connector sticking 2 mm past the outline
        std::vector<BoundingBox> footprints{BoundingBox(55.0, 10.0, 7.0, 5.0)};
        BoardGeometry geometry = BoardGeometryExtractor::extract(outline, footprints);
        REQUIRE(has_diagnostic(geometry, DiagnosticKind::ComponentOverhang));
        REQUIRE(geometry.dimensions == glm::dvec2(60.0, 30.0));
        REQUIRE(geometry.diagnostics.front().severity == DiagnosticSeverity::Warning);
    }
}

TEST_CASE("BoardGeometryExtractor - plausibility bounds", "[geometry][extractor]") {
    SECTION("Tiny board is an error") {
        BoardGeometry geometry =
            BoardGeometryExtractor::extract(rectangle_outline(0.0, 0.0, 8.0, 30.0), {});
        REQUIRE(has_diagnostic(geometry, DiagnosticKind::BoardTooSmall));
        REQUIRE(geometry.diagnostics.front().severity == DiagnosticSeverity::Error);
    }

    SECTION("Huge board is a warning") {
        BoardGeometry geometry =
            BoardGeometryExtractor::extract(rectangle_outline(0.0, 0.0, 600.0, 30.0), {});
        REQUIRE(has_diagnostic(geometry, DiagnosticKind::BoardTooLarge));
        REQUIRE(geometry.diagnostics.front().severity == DiagnosticSeverity::Warning);
    }

    SECTION("Normal board has no diagnostics") {
        BoardGeometry geometry =
            BoardGeometryExtractor::extract(rectangle_outline(0.0, 0.0, 10.0, 500.0), {});
        REQUIRE(geometry.diagnostics.empty());
    }
}

TEST_CASE("BoardGeometryExtractor - snapshot overload reads outline and footprints",
          "[geometry][extractor]") {
    BoardModel board;
    for (const auto& box : rectangle_outline(10.0, 5.0, 110.0, 55.0)) {
        board.add_outline(box);
    }
    board.add_footprint("U1", BoardSide::Front, BoundingBox(30.0, 20.0, 10.0, 10.0));

    BoardGeometry geometry = BoardGeometryExtractor::extract(board);

    REQUIRE(geometry.origin == glm::dvec2(10.0, 5.0));
    REQUIRE(geometry.dimensions == glm::dvec2(100.0, 50.0));
    REQUIRE(geometry.component_extent == glm::dvec2(30.0, 25.0));
}
