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

#include "board_snapshot.h"

#include <algorithm>
#include <utility>

namespace openfixture {

namespace {

struct LayerNameEntry {
    const char* name;
    Layer layer;
};

// First entry per layer is the canonical name
constexpr LayerNameEntry LAYER_NAMES[] = {
    {"F.Cu", Layer::FrontCopper},
    {"B.Cu", Layer::BackCopper},
    {"F.Paste", Layer::FrontPaste},
    {"B.Paste", Layer::BackPaste},
    {"F.Mask", Layer::FrontMask},
    {"B.Mask", Layer::BackMask},
    {"F.SilkS", Layer::FrontSilk},
    {"B.SilkS", Layer::BackSilk},
    {"F.CrtYd", Layer::FrontCourtyard},
    {"B.CrtYd", Layer::BackCourtyard},
    {"F.Fab", Layer::FrontFab},
    {"B.Fab", Layer::BackFab},
    {"Edge.Cuts", Layer::EdgeCuts},
    {"Margin", Layer::Margin},
    {"Dwgs.User", Layer::DrawingsUser},
    {"Cmts.User", Layer::CommentsUser},
    {"Eco1.User", Layer::Eco1User},
    {"Eco2.User", Layer::Eco2User},
    // Aliases used by the KiCad 7+ user interface
    {"F.Silkscreen", Layer::FrontSilk},
    {"B.Silkscreen", Layer::BackSilk},
    {"F.Courtyard", Layer::FrontCourtyard},
    {"B.Courtyard", Layer::BackCourtyard},
    {"User.Drawings", Layer::DrawingsUser},
    {"User.Comments", Layer::CommentsUser},
    {"User.Eco1", Layer::Eco1User},
    {"User.Eco2", Layer::Eco2User},
};

} // namespace

std::optional<Layer> layer_from_name(const std::string& name) {
    for (const auto& entry : LAYER_NAMES) {
        if (name == entry.name) {
            return entry.layer;
        }
    }
    return std::nullopt;
}

const char* layer_name(Layer layer) {
    for (const auto& entry : LAYER_NAMES) {
        if (entry.layer == layer) {
            return entry.name;
        }
    }
    return "unknown";
}

bool LayerSet::add_named(const std::string& token) {
    if (token == "*.Cu" || token == "F&B.Cu") {
        add(Layer::FrontCopper);
        add(Layer::BackCopper);
        return true;
    }
    if (token == "*.Mask") {
        add(Layer::FrontMask);
        add(Layer::BackMask);
        return true;
    }
    if (token == "*.Paste") {
        add(Layer::FrontPaste);
        add(Layer::BackPaste);
        return true;
    }
    if (token == "*.SilkS") {
        add(Layer::FrontSilk);
        add(Layer::BackSilk);
        return true;
    }

    auto layer = layer_from_name(token);
    if (!layer) {
        return false;
    }
    add(*layer);
    return true;
}

const char* board_side_name(BoardSide side) {
    return side == BoardSide::Front ? "front" : "back";
}

const char* pad_type_name(PadType type) {
    switch (type) {
    case PadType::Smd:
        return "smd";
    case PadType::ThroughHole:
        return "thru_hole";
    case PadType::Other:
        break;
    }
    return "other";
}

// ============================================================================
// BoundingBox
// ============================================================================

BoundingBox BoundingBox::from_corners(const glm::dvec2& a, const glm::dvec2& b) {
    glm::dvec2 lo = glm::min(a, b);
    glm::dvec2 hi = glm::max(a, b);
    return BoundingBox(lo.x, lo.y, hi.x - lo.x, hi.y - lo.y);
}

void BoundingBox::expand(const glm::dvec2& point) {
    glm::dvec2 lo = glm::min(min, point);
    glm::dvec2 hi = glm::max(max(), point);
    min = lo;
    width = hi.x - lo.x;
    height = hi.y - lo.y;
}

void BoundingBox::merge(const BoundingBox& other) {
    expand(other.min);
    expand(other.max());
}

} // namespace openfixture
