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

#include <glm/glm.hpp>

#include <limits>
#include <string>
#include <vector>

namespace openfixture {

enum class DiagnosticSeverity { Info, Warning, Error };

/**
 * @brief Recoverable geometry findings collected during a run
 */
enum class DiagnosticKind {
    DegradedGeometry,  ///< No usable outline; bounds derived from footprints
    ComponentOverhang, ///< Footprints extend past the outline beyond tolerance
    BoardTooSmall,     ///< A dimension is below the plausible minimum
    BoardTooLarge      ///< A dimension is above the plausible maximum
};

const char* diagnostic_kind_name(DiagnosticKind kind);
const char* diagnostic_severity_name(DiagnosticSeverity severity);

/**
 * @brief One non-fatal finding attached to a generation run
 */
struct Diagnostic {
    DiagnosticSeverity severity{DiagnosticSeverity::Warning};
    DiagnosticKind kind{DiagnosticKind::DegradedGeometry};
    std::string message;
};

/**
 * @brief Geometry computed for one fixture generation run
 *
 * Built once from a single board snapshot and never modified after the
 * parameter set has been assembled from it.
 */
struct FixtureGeometry {
    glm::dvec2 origin{0.0, 0.0};     ///< Top-left corner of the board (mm, board space)
    glm::dvec2 dimensions{0.0, 0.0}; ///< Board width/height (mm)

    /// Smallest fixture-local Y among all test points, +inf when there are none
    double min_y{std::numeric_limits<double>::infinity()};

    std::vector<glm::dvec2> test_points;        ///< All points, scan order
    std::vector<glm::dvec2> test_points_top;    ///< Front-side points (dual-sided mode)
    std::vector<glm::dvec2> test_points_bottom; ///< Back-side points (dual-sided mode)
    bool dual_sided{false};

    bool has_test_points() const {
        return !test_points.empty();
    }
};

} // namespace openfixture
