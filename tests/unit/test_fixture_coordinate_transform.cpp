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

#include "fixture_coordinate_transform.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

using namespace openfixture;
using Catch::Approx;

// ============================================================================
// Rounding
// ============================================================================

TEST_CASE("Fixture transform - round_half_even ties go to even", "[transform][rounding]") {
    REQUIRE(transform::round_half_even(0.5) == 0.0);
    REQUIRE(transform::round_half_even(1.5) == 2.0);
    REQUIRE(transform::round_half_even(2.5) == 2.0);
    REQUIRE(transform::round_half_even(3.5) == 4.0);
    REQUIRE(transform::round_half_even(-0.5) == 0.0);
    REQUIRE(transform::round_half_even(-1.5) == -2.0);
    REQUIRE(transform::round_half_even(-2.5) == -2.0);
}

TEST_CASE("Fixture transform - round_half_even off ties rounds to nearest",
          "[transform][rounding]") {
    REQUIRE(transform::round_half_even(2.49) == 2.0);
    REQUIRE(transform::round_half_even(2.51) == 3.0);
    REQUIRE(transform::round_half_even(-2.51) == -3.0);
    REQUIRE(transform::round_half_even(7.0) == 7.0);
}

TEST_CASE("Fixture transform - round_decimals uses the stored binary value",
          "[transform][rounding]") {
    // 2.675 is stored as 2.67499999...
    REQUIRE(transform::round_decimals(2.675, 2) == 2.67);
    REQUIRE(transform::round_decimals(0.125, 2) == 0.12);
    REQUIRE(transform::round_decimals(0.375, 2) == 0.38);
    REQUIRE(transform::round_decimals(1.0, 2) == 1.0);
}

TEST_CASE("Fixture transform - round_decimals passes non-finite values through",
          "[transform][rounding]") {
    double inf = std::numeric_limits<double>::infinity();
    REQUIRE(transform::round_decimals(inf, 2) == inf);
    REQUIRE(std::isnan(transform::round_decimals(std::nan(""), 2)));
}

TEST_CASE("Fixture transform - round_to snaps to the 0.01 grid", "[transform][rounding]") {
    REQUIRE(transform::round_to(5.003) == 5.0);
    REQUIRE(transform::round_to(2.006) == 2.01);
    REQUIRE(transform::round_to(100.0) == 100.0);
    REQUIRE(transform::round_to(-0.004) == 0.0);
    REQUIRE(transform::round_to(12.3456) == 12.35);
}

TEST_CASE("Fixture transform - round_to with coarser grid", "[transform][rounding]") {
    REQUIRE(transform::round_to(1.26, 0.5) == 1.5);
    REQUIRE(transform::round_to(1.24, 0.5) == 1.0);
    REQUIRE(transform::round_to(7.0, 2.0) == 8.0); // 3.5 rounds to 4
}

TEST_CASE("Fixture transform - round_to is idempotent", "[transform][rounding]") {
    const double values[] = {0.0,     0.004,    0.005,     0.015,   1.005,    2.675,
                             5.003,   12.34567, 99.995,    -3.215,  -0.0049,  123.456789,
                             1e-7,    0.1 + 0.2, 333.3333, 49.999,  250.125,  -250.125};

    for (double x : values) {
        double once = transform::round_to(x);
        double twice = transform::round_to(once);
        INFO("x = " << x);
        REQUIRE(twice == once);
    }
}

TEST_CASE("Fixture transform - format_fixed2 always prints two decimals",
          "[transform][format]") {
    REQUIRE(transform::format_fixed2(1.6) == "1.60");
    REQUIRE(transform::format_fixed2(14.0) == "14.00");
    REQUIRE(transform::format_fixed2(95.0) == "95.00");
    REQUIRE(transform::format_fixed2(2.01) == "2.01");
    REQUIRE(transform::format_fixed2(-3.5) == "-3.50");
}

// ============================================================================
// Board to fixture mapping
// ============================================================================

TEST_CASE("Fixture transform - front side point is origin-relative",
          "[transform][board_to_fixture]") {
    glm::dvec2 origin(10.0, 5.0);
    glm::dvec2 dims(100.0, 50.0);

    glm::dvec2 p = transform::board_to_fixture(glm::dvec2(15.003, 7.006), origin, dims, false);

    REQUIRE(p.x == 5.0);
    REQUIRE(p.y == 2.01);
    REQUIRE(transform::format_fixed2(p.x) == "5.00");
    REQUIRE(transform::format_fixed2(p.y) == "2.01");
}

TEST_CASE("Fixture transform - back side point is mirrored about the width",
          "[transform][board_to_fixture]") {
    glm::dvec2 origin(10.0, 5.0);
    glm::dvec2 dims(100.0, 50.0);

    glm::dvec2 p = transform::board_to_fixture(glm::dvec2(15.003, 7.006), origin, dims, true);

    REQUIRE(p.x == 95.0);
    REQUIRE(p.y == 2.01);
}

TEST_CASE("Fixture transform - mirror subtracts width from the rounded X",
          "[transform][board_to_fixture]") {
    glm::dvec2 origin(0.0, 0.0);
    glm::dvec2 dims(80.37, 40.0);

    glm::dvec2 p = transform::board_to_fixture(glm::dvec2(10.004, 1.0), origin, dims, true);

    // 80.37 - 10.00, not 80.37 - 10.004 rounded
    REQUIRE(p.x == Approx(70.37).margin(1e-9));
}

TEST_CASE("Fixture transform - unmirror recovers the rounded relative X",
          "[transform][board_to_fixture]") {
    glm::dvec2 origin(12.5, 3.25);
    glm::dvec2 dims(64.2, 31.8);

    const double xs[] = {12.5, 13.777, 20.004, 40.0051, 55.555, 76.7};
    for (double x : xs) {
        glm::dvec2 mirrored =
            transform::board_to_fixture(glm::dvec2(x, 10.0), origin, dims, true);
        double expected = transform::round_to(x - origin.x);

        INFO("x = " << x);
        REQUIRE(transform::unmirror_x(mirrored.x, dims.x) == Approx(expected).margin(0.005));
        REQUIRE(transform::round_to(transform::unmirror_x(mirrored.x, dims.x)) == expected);
    }
}

TEST_CASE("Fixture transform - Y is never mirrored", "[transform][board_to_fixture]") {
    glm::dvec2 origin(0.0, 0.0);
    glm::dvec2 dims(50.0, 50.0);

    glm::dvec2 front = transform::board_to_fixture(glm::dvec2(3.0, 7.0), origin, dims, false);
    glm::dvec2 back = transform::board_to_fixture(glm::dvec2(3.0, 7.0), origin, dims, true);

    REQUIRE(front.y == back.y);
    REQUIRE(front.x == 3.0);
    REQUIRE(back.x == 47.0);
}
