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
#include "fixture_geometry.h"

#include <vector>

namespace openfixture {

/**
 * @brief Origin and size of a board, plus what was learned computing them
 */
struct BoardGeometry {
    glm::dvec2 origin{0.0, 0.0};           ///< Per-axis minimum corner (mm)
    glm::dvec2 dimensions{0.0, 0.0};       ///< Rounded width/height (mm)
    glm::dvec2 component_extent{0.0, 0.0}; ///< Footprint-only extent from origin (mm)
    bool from_outline{false};              ///< false when the footprint fallback was used
    std::vector<Diagnostic> diagnostics;
};

/**
 * @brief Computes board origin and dimensions
 *
 * The outline layer defines the board. Each axis is folded independently:
 * origin is the minimum corner over all outline boxes, dimensions run to the
 * maximum far edge. The result does not depend on primitive order.
 *
 * When the board has no usable outline the union of footprint boxes is used
 * instead and a DegradedGeometry diagnostic is attached. Extraction never
 * fails; a board without any geometry yields zero dimensions.
 */
class BoardGeometryExtractor {
  public:
    /// Footprints may overhang the outline by this much before it is reported (mm)
    static constexpr double OVERHANG_TOLERANCE_MM = 0.5;
    /// Smallest plausible board dimension (mm)
    static constexpr double MIN_BOARD_MM = 10.0;
    /// Largest plausible board dimension (mm)
    static constexpr double MAX_BOARD_MM = 500.0;

    /**
     * @brief Extract geometry from a board snapshot
     */
    static BoardGeometry extract(const IBoardSnapshot& board);

    /**
     * @brief Extract geometry from raw box lists
     *
     * @param outline Boxes of all outline-layer primitives
     * @param footprints Boxes of all footprints
     */
    static BoardGeometry extract(const std::vector<BoundingBox>& outline,
                                 const std::vector<BoundingBox>& footprints);
};

} // namespace openfixture
