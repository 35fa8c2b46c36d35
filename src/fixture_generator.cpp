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

#include "fixture_generator.h"

#include "board_geometry_extractor.h"
#include "fixture_coordinate_transform.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace openfixture {

const char* failure_kind_name(FailureKind kind) {
    switch (kind) {
    case FailureKind::None:
        return "none";
    case FailureKind::NoTestPointsFound:
        return "no test points found";
    case FailureKind::InvalidConfiguration:
        return "invalid configuration";
    case FailureKind::BoardLoadFailed:
        return "board load failed";
    }
    return "unknown";
}

bool GenerationResult::has_errors() const {
    return std::any_of(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& d) {
        return d.severity == DiagnosticSeverity::Error;
    });
}

GenerationResult GenerationResult::failed(FailureKind kind, std::string reason) {
    GenerationResult result;
    result.failure = kind;
    result.failure_reason = std::move(reason);
    return result;
}

FixtureGenerator::FixtureGenerator(const IBoardSnapshot& board, FixtureConfig config)
    : board_(board), config_(std::move(config)) {}

void FixtureGenerator::collect_side(const TestPointSelector& selector, const SideScan& scan,
                                    const std::vector<FootprintInfo>& footprints,
                                    GenerationResult& result) const {
    FixtureGeometry& geometry = result.geometry;
    std::vector<SelectedPad> selected = selector.select(footprints, scan);

    for (auto& entry : selected) {
        glm::dvec2 point = transform::board_to_fixture(entry.pad.position, geometry.origin,
                                                       geometry.dimensions, scan.mirror);
        spdlog::debug("[FixtureGenerator] TP[{}] = ({}, {})", entry.pad.net_name,
                      transform::format_fixed2(point.x), transform::format_fixed2(point.y));

        geometry.min_y = std::min(geometry.min_y, point.y);
        geometry.test_points.push_back(point);
        if (geometry.dual_sided) {
            if (scan.side == BoardSide::Front) {
                geometry.test_points_top.push_back(point);
            } else {
                geometry.test_points_bottom.push_back(point);
            }
        }
        result.selected_pads.push_back(std::move(entry));
    }
}

GenerationResult FixtureGenerator::generate(const std::string& output_dir) const {
    if (auto error = config_.validation_error()) {
        spdlog::error("[FixtureGenerator] Invalid configuration: {}", *error);
        return GenerationResult::failed(FailureKind::InvalidConfiguration, *error);
    }

    spdlog::info("[FixtureGenerator] Generating fixture for '{}' ({})", board_.name(),
                 test_layer_name(config_.selection.layer));

    GenerationResult result;

    // Board geometry
    BoardGeometry board_geometry = BoardGeometryExtractor::extract(board_);
    result.geometry.origin = board_geometry.origin;
    result.geometry.dimensions = board_geometry.dimensions;
    result.diagnostics = std::move(board_geometry.diagnostics);

    spdlog::info("[FixtureGenerator] Origin ({}, {}), size {} x {} mm",
                 transform::format_fixed2(result.geometry.origin.x),
                 transform::format_fixed2(result.geometry.origin.y),
                 transform::format_fixed2(result.geometry.dimensions.x),
                 transform::format_fixed2(result.geometry.dimensions.y));

    // Test points, one pass per scanned face
    result.geometry.dual_sided = (config_.selection.layer == TestLayer::Both);
    TestPointSelector selector(config_.selection);
    const std::vector<FootprintInfo> footprints = board_.footprints();
    for (const SideScan& scan : TestPointSelector::scans_for(config_.selection.layer)) {
        collect_side(selector, scan, footprints, result);
    }

    if (!result.geometry.has_test_points()) {
        result.failure = FailureKind::NoTestPointsFound;
        if (result.geometry.dual_sided) {
            result.failure_reason = "no test points found on either side";
        } else {
            result.failure_reason = std::string("no test points found on ") +
                                    test_layer_name(config_.selection.layer);
        }
        spdlog::warn("[FixtureGenerator] {}", result.failure_reason);
        return result;
    }

    spdlog::info("[FixtureGenerator] {} test points, min_y {}", result.geometry.test_points.size(),
                 transform::format_fixed2(result.geometry.min_y));

    // Parameters
    result.revision = ParameterAssembler::resolve_revision(config_, board_.title_revision());
    result.paths = FixtureOutputPaths::for_board(output_dir, board_.name());
    result.parameters =
        ParameterAssembler::assemble(result.geometry, config_, result.paths, result.revision);

    return result;
}

} // namespace openfixture
