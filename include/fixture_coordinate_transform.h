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

#ifndef FIXTURE_COORDINATE_TRANSFORM_H
#define FIXTURE_COORDINATE_TRANSFORM_H

#include <glm/glm.hpp>

#include <string>

/**
 * @file fixture_coordinate_transform.h
 * @brief Board-to-fixture coordinate math
 *
 * Maps absolute board coordinates into fixture-local coordinates:
 *
 * BOARD SPACE (mm) → ORIGIN-RELATIVE → GRID-ROUNDED → (MIRRORED)
 *
 * Every value that leaves this namespace sits on a 0.01 mm grid and is the
 * double closest to its two-decimal representation, so it prints identically
 * wherever it ends up as a geometry-tool literal.
 *
 * Rounding is round-half-to-even at both stages.
 */

namespace openfixture {
namespace transform {

/// Coordinate grid (mm)
constexpr double GRID_MM = 0.01;

/**
 * @brief Round to nearest integer, ties to even
 * @param x Finite value
 * @return Nearest integral value (2.5 → 2, 3.5 → 4)
 */
double round_half_even(double x);

/**
 * @brief Round to a number of decimal places
 *
 * Rounds the exact binary value of @p x, ties to even, then returns the
 * double nearest to the resulting decimal. round_decimals(2.675, 2) is 2.67
 * because 2.675 is stored slightly below the tie.
 *
 * @param x Finite value
 * @param digits Decimal places (0-15)
 * @return Rounded value
 */
double round_decimals(double x, int digits);

/**
 * @brief Snap a value to a grid, then clean it to two decimals
 *
 * Computes round(x / base) * base, then rounds that to 2 decimal places.
 * Idempotent: round_to(round_to(x)) == round_to(x).
 *
 * @param x Value in mm
 * @param base Grid size in mm (default 0.01)
 * @return Grid-aligned value
 */
double round_to(double x, double base = GRID_MM);

/**
 * @brief Format a value with exactly two decimals ("%.2f")
 */
std::string format_fixed2(double value);

/**
 * @brief Convert an absolute board position into fixture-local coordinates
 *
 * y = round_to(pad.y - origin.y)
 * x = round_to(pad.x - origin.x)                  (mirror == false)
 * x = width - round_to(pad.x - origin.x)          (mirror == true)
 *
 * The mirrored form subtracts the board width from the already rounded
 * relative X. Fixture parameters downstream were tuned against this order,
 * so it must not be folded into a single rounding.
 *
 * @param position Absolute pad position (mm)
 * @param origin Board origin (mm)
 * @param dimensions Board width/height (mm)
 * @param mirror true when probing from the back side
 * @return Fixture-local point
 */
glm::dvec2 board_to_fixture(const glm::dvec2& position, const glm::dvec2& origin,
                            const glm::dvec2& dimensions, bool mirror);

/**
 * @brief Undo the mirror applied by board_to_fixture()
 *
 * @param fixture_x Mirrored fixture X
 * @param width Board width used for mirroring
 * @return Rounded origin-relative X
 */
double unmirror_x(double fixture_x, double width);

} // namespace transform
} // namespace openfixture

#endif // FIXTURE_COORDINATE_TRANSFORM_H
