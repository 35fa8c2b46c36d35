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

#include "board_model.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace openfixture {

BoardModel::BoardModel(std::string name) : name_(std::move(name)) {}

std::vector<BoundingBox> BoardModel::outline_bounds() const {
    return outline_;
}

std::vector<FootprintInfo> BoardModel::footprints() const {
    return footprints_;
}

std::string BoardModel::title_revision() const {
    return revision_;
}

std::string BoardModel::name() const {
    return name_;
}

void BoardModel::add_outline(const BoundingBox& bounds) {
    outline_.push_back(bounds);
}

FootprintInfo& BoardModel::add_footprint(const std::string& reference, BoardSide side,
                                         const BoundingBox& bounds) {
    FootprintInfo footprint;
    footprint.reference = reference;
    footprint.side = side;
    footprint.bounds = bounds;
    footprints_.push_back(std::move(footprint));

    spdlog::trace("[BoardModel] Added footprint {} on {} side", reference,
                  board_side_name(side));
    return footprints_.back();
}

void BoardModel::add_pad(FootprintInfo& footprint, const std::string& number,
                         const glm::dvec2& position, const LayerSet& layers, PadType type,
                         const std::string& net_name) {
    PadInfo pad;
    pad.number = number;
    pad.position = position;
    pad.layers = layers;
    pad.type = type;
    pad.net_name = net_name;
    footprint.pads.push_back(std::move(pad));
}

} // namespace openfixture
