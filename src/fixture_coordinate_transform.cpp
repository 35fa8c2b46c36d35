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

#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace openfixture {
namespace transform {

double round_half_even(double x) {
    // Independent of the floating-point rounding mode
    double floor_x = std::floor(x);
    double diff = x - floor_x;
    if (diff < 0.5) {
        return floor_x;
    }
    if (diff > 0.5) {
        return floor_x + 1.0;
    }
    return std::fmod(floor_x, 2.0) == 0.0 ? floor_x : floor_x + 1.0;
}

double round_decimals(double x, int digits) {
    if (!std::isfinite(x)) {
        return x;
    }

    // printf-style formatting rounds the exact binary value (ties to even),
    // and strtod returns the double nearest to the resulting decimal
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", digits, x);
    return std::strtod(buf, nullptr);
}

double round_to(double x, double base) {
    return round_decimals(base * round_half_even(x / base), 2);
}

std::string format_fixed2(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

glm::dvec2 board_to_fixture(const glm::dvec2& position, const glm::dvec2& origin,
                            const glm::dvec2& dimensions, bool mirror) {
    double x = round_to(position.x - origin.x);
    if (mirror) {
        x = dimensions.x - x;
    }
    double y = round_to(position.y - origin.y);
    return glm::dvec2(x, y);
}

double unmirror_x(double fixture_x, double width) {
    return width - fixture_x;
}

} // namespace transform
} // namespace openfixture
