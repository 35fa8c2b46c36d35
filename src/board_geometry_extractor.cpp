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

#include "fixture_coordinate_transform.h"

#include <spdlog/spdlog.h>

#include <limits>
#include <numeric>
#include <sstream>

namespace openfixture {

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

// Per-axis min corner / max far edge over a set of boxes
struct Extent {
    glm::dvec2 min{INF, INF};
    glm::dvec2 max{-INF, -INF};

    bool valid() const {
        return min.x <= max.x && min.y <= max.y;
    }
};

Extent fold_extent(const std::vector<BoundingBox>& boxes) {
    return std::accumulate(boxes.begin(), boxes.end(), Extent{},
                           [](Extent acc, const BoundingBox& box) {
                               acc.min = glm::min(acc.min, box.min);
                               acc.max = glm::max(acc.max, box.max());
                               return acc;
                           });
}

glm::dvec2 rounded_span(const glm::dvec2& max, const glm::dvec2& origin) {
    return glm::dvec2(transform::round_to(max.x - origin.x),
                      transform::round_to(max.y - origin.y));
}

std::string format_dims(const glm::dvec2& dims) {
    return transform::format_fixed2(dims.x) + " x " + transform::format_fixed2(dims.y) + " mm";
}

void add_diagnostic(BoardGeometry& geometry, DiagnosticSeverity severity, DiagnosticKind kind,
                    const std::string& message) {
    switch (severity) {
    case DiagnosticSeverity::Error:
        spdlog::error("[BoardGeometry] {}", message);
        break;
    case DiagnosticSeverity::Warning:
        spdlog::warn("[BoardGeometry] {}", message);
        break;
    case DiagnosticSeverity::Info:
        spdlog::info("[BoardGeometry] {}", message);
        break;
    }
    geometry.diagnostics.push_back(Diagnostic{severity, kind, message});
}

void check_plausible_size(BoardGeometry& geometry) {
    const glm::dvec2& dims = geometry.dimensions;

    if (dims.x < BoardGeometryExtractor::MIN_BOARD_MM ||
        dims.y < BoardGeometryExtractor::MIN_BOARD_MM) {
        add_diagnostic(geometry, DiagnosticSeverity::Error, DiagnosticKind::BoardTooSmall,
                       "Board dimensions " + format_dims(dims) + " are below the " +
                           transform::format_fixed2(BoardGeometryExtractor::MIN_BOARD_MM) +
                           " mm minimum; check the Edge.Cuts outline");
    }

    if (dims.x > BoardGeometryExtractor::MAX_BOARD_MM ||
        dims.y > BoardGeometryExtractor::MAX_BOARD_MM) {
        add_diagnostic(geometry, DiagnosticSeverity::Warning, DiagnosticKind::BoardTooLarge,
                       "Board dimensions " + format_dims(dims) + " exceed the " +
                           transform::format_fixed2(BoardGeometryExtractor::MAX_BOARD_MM) +
                           " mm maximum; stray outline items may be present");
    }
}

} // namespace

// ============================================================================
// Diagnostic names
// ============================================================================

const char* diagnostic_kind_name(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::DegradedGeometry:
        return "degraded_geometry";
    case DiagnosticKind::ComponentOverhang:
        return "component_overhang";
    case DiagnosticKind::BoardTooSmall:
        return "board_too_small";
    case DiagnosticKind::BoardTooLarge:
        return "board_too_large";
    }
    return "unknown";
}

const char* diagnostic_severity_name(DiagnosticSeverity severity) {
    switch (severity) {
    case DiagnosticSeverity::Info:
        return "info";
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Error:
        return "error";
    }
    return "unknown";
}

// ============================================================================
// BoardGeometryExtractor
// ============================================================================

BoardGeometry BoardGeometryExtractor::extract(const IBoardSnapshot& board) {
    std::vector<BoundingBox> footprint_boxes;
    for (const auto& footprint : board.footprints()) {
        footprint_boxes.push_back(footprint.bounds);
    }
    return extract(board.outline_bounds(), footprint_boxes);
}

BoardGeometry BoardGeometryExtractor::extract(const std::vector<BoundingBox>& outline,
                                              const std::vector<BoundingBox>& footprints) {
    BoardGeometry geometry;

    Extent outline_extent = fold_extent(outline);
    Extent footprint_extent = fold_extent(footprints);

    bool outline_usable = outline_extent.valid() && (outline_extent.max.x > outline_extent.min.x ||
                                                     outline_extent.max.y > outline_extent.min.y);

    if (outline_usable) {
        geometry.origin = outline_extent.min;
        geometry.dimensions = rounded_span(outline_extent.max, geometry.origin);
        geometry.from_outline = true;
        spdlog::debug("[BoardGeometry] Outline: {} primitives, origin=({:.3f}, {:.3f})",
                      outline.size(), geometry.origin.x, geometry.origin.y);
    } else {
        std::string reason = outline.empty() ? "No Edge.Cuts outline found"
                                             : "Edge.Cuts outline has zero extent";

        if (footprint_extent.valid()) {
            geometry.origin = footprint_extent.min;
            geometry.dimensions = rounded_span(footprint_extent.max, geometry.origin);
            add_diagnostic(geometry, DiagnosticSeverity::Warning,
                           DiagnosticKind::DegradedGeometry,
                           reason + "; board size derived from " +
                               std::to_string(footprints.size()) +
                               " footprint bounding boxes, fixture accuracy is reduced");
        } else {
            add_diagnostic(geometry, DiagnosticSeverity::Warning,
                           DiagnosticKind::DegradedGeometry,
                           reason + " and the board has no footprints; dimensions are zero");
        }
    }

    // Footprint-only extent measured from whichever origin was chosen
    if (footprint_extent.valid()) {
        geometry.component_extent = rounded_span(footprint_extent.max, geometry.origin);

        glm::dvec2 overhang = geometry.component_extent - geometry.dimensions;
        if (overhang.x > OVERHANG_TOLERANCE_MM || overhang.y > OVERHANG_TOLERANCE_MM) {
            std::ostringstream msg;
            msg << "Footprints extend past the board outline (components "
                << format_dims(geometry.component_extent) << " vs outline "
                << format_dims(geometry.dimensions)
                << "); expected for edge connectors and mounting hardware";
            add_diagnostic(geometry, DiagnosticSeverity::Warning,
                           DiagnosticKind::ComponentOverhang, msg.str());
        }
    }

    check_plausible_size(geometry);

    spdlog::info("[BoardGeometry] origin=({:.2f}, {:.2f}) dims=({:.2f}, {:.2f}){}",
                 geometry.origin.x, geometry.origin.y, geometry.dimensions.x,
                 geometry.dimensions.y, geometry.from_outline ? "" : " (footprint fallback)");

    return geometry;
}

} // namespace openfixture
