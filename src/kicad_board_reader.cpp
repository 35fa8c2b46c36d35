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

#include "kicad_board_reader.h"

#include <glm/glm.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace openfixture {

namespace {

/**
 * @brief Rotate a point the way KiCad does (Y axis points down)
 */
glm::dvec2 rotate_kicad(const glm::dvec2& p, double degrees) {
    if (degrees == 0.0) {
        return p;
    }
    double rad = glm::radians(degrees);
    double c = std::cos(rad);
    double s = std::sin(rad);
    return glm::dvec2(p.x * c + p.y * s, -p.x * s + p.y * c);
}

/**
 * @brief Footprint-local to board transform
 */
struct Placement {
    glm::dvec2 at{0.0, 0.0};
    double angle{0.0};

    glm::dvec2 apply(const glm::dvec2& local) const {
        return at + rotate_kicad(local, angle);
    }
};

std::optional<glm::dvec2> read_xy(const SexprNode& node) {
    auto x = node.number_at(1);
    auto y = node.number_at(2);
    if (!x || !y) {
        return std::nullopt;
    }
    return glm::dvec2(*x, *y);
}

std::optional<glm::dvec2> read_xy(const SexprNode& parent, const char* name) {
    const SexprNode* child = parent.find(name);
    if (!child) {
        return std::nullopt;
    }
    return read_xy(*child);
}

std::optional<std::string> read_atom(const SexprNode& parent, const char* name, size_t index = 1) {
    const SexprNode* child = parent.find(name);
    if (!child) {
        return std::nullopt;
    }
    return child->atom_at(index);
}

double normalize_degrees(double deg) {
    double r = std::fmod(deg, 360.0);
    return r < 0.0 ? r + 360.0 : r;
}

/**
 * @brief Bounds of a circular arc
 *
 * Angles are measured with atan2 in file coordinates. The box covers both
 * endpoints plus every axis crossing within the sweep.
 */
BoundingBox arc_bounds(const glm::dvec2& center, double radius, double start_deg,
                       double sweep_deg) {
    auto point_at = [&](double deg) {
        double rad = glm::radians(deg);
        return center + radius * glm::dvec2(std::cos(rad), std::sin(rad));
    };

    glm::dvec2 start = point_at(start_deg);
    BoundingBox box = BoundingBox::from_corners(start, start);
    box.expand(point_at(start_deg + sweep_deg));

    double lo = std::min(start_deg, start_deg + sweep_deg);
    double hi = std::max(start_deg, start_deg + sweep_deg);
    for (double k = std::ceil(lo / 90.0); k * 90.0 <= hi; k += 1.0) {
        box.expand(point_at(k * 90.0));
    }
    return box;
}

/**
 * @brief Arc given as center, start point and sweep (KiCad 5)
 */
BoundingBox arc_from_center(const glm::dvec2& center, const glm::dvec2& start, double sweep_deg) {
    glm::dvec2 d = start - center;
    double start_deg = glm::degrees(std::atan2(d.y, d.x));
    return arc_bounds(center, glm::length(d), start_deg, sweep_deg);
}

/**
 * @brief Arc given as start, mid and end points (KiCad 6+)
 */
BoundingBox arc_from_three_points(const glm::dvec2& a, const glm::dvec2& m, const glm::dvec2& b) {
    double d = 2.0 * (a.x * (m.y - b.y) + m.x * (b.y - a.y) + b.x * (a.y - m.y));
    if (std::abs(d) < 1e-12) {
        // Collinear, treat as a straight segment
        BoundingBox box = BoundingBox::from_corners(a, b);
        box.expand(m);
        return box;
    }

    double a2 = glm::dot(a, a);
    double m2 = glm::dot(m, m);
    double b2 = glm::dot(b, b);
    glm::dvec2 center((a2 * (m.y - b.y) + m2 * (b.y - a.y) + b2 * (a.y - m.y)) / d,
                      (a2 * (b.x - m.x) + m2 * (a.x - b.x) + b2 * (m.x - a.x)) / d);

    auto angle_of = [&center](const glm::dvec2& p) {
        return glm::degrees(std::atan2(p.y - center.y, p.x - center.x));
    };
    double start_deg = angle_of(a);
    double sweep_ccw = normalize_degrees(angle_of(b) - start_deg);
    double mid_ccw = normalize_degrees(angle_of(m) - start_deg);
    double sweep = (mid_ccw <= sweep_ccw) ? sweep_ccw : sweep_ccw - 360.0;

    return arc_bounds(center, glm::length(a - center), start_deg, sweep);
}

BoundingBox points_bounds(const std::vector<glm::dvec2>& points) {
    BoundingBox box = BoundingBox::from_corners(points.front(), points.front());
    for (const auto& p : points) {
        box.expand(p);
    }
    return box;
}

/**
 * @brief Bounds of a gr_* / fp_* drawing item
 *
 * @param node Drawing node
 * @param kind Item kind without its gr_/fp_ prefix ("line", "arc", ...)
 * @param place Local-to-board transform (identity for board drawings)
 * @return Bounds, or std::nullopt for unsupported or malformed items
 */
std::optional<BoundingBox> graphic_bounds(const SexprNode& node, const std::string& kind,
                                          const Placement& place) {
    if (kind == "line" || kind == "rect") {
        auto start = read_xy(node, "start");
        auto end = read_xy(node, "end");
        if (!start || !end) {
            return std::nullopt;
        }
        return BoundingBox::from_corners(place.apply(*start), place.apply(*end));
    }

    if (kind == "circle") {
        auto center = read_xy(node, "center");
        auto end = read_xy(node, "end");
        if (!center || !end) {
            return std::nullopt;
        }
        glm::dvec2 c = place.apply(*center);
        double r = glm::length(*end - *center);
        return BoundingBox(c.x - r, c.y - r, 2.0 * r, 2.0 * r);
    }

    if (kind == "arc") {
        auto start = read_xy(node, "start");
        auto end = read_xy(node, "end");
        if (!start || !end) {
            return std::nullopt;
        }
        if (auto mid = read_xy(node, "mid")) {
            return arc_from_three_points(place.apply(*start), place.apply(*mid),
                                         place.apply(*end));
        }
        // KiCad 5: start is the center, end is the arc start
        const SexprNode* angle = node.find("angle");
        auto sweep = angle ? angle->number_at(1) : std::nullopt;
        if (!sweep) {
            return std::nullopt;
        }
        return arc_from_center(place.apply(*start), place.apply(*end), *sweep);
    }

    if (kind == "poly" || kind == "curve") {
        const SexprNode* pts = node.find("pts");
        if (!pts) {
            return std::nullopt;
        }
        std::vector<glm::dvec2> points;
        std::optional<BoundingBox> arcs;
        for (const auto& item : pts->children) {
            if (item.head() == "xy") {
                if (auto p = read_xy(item)) {
                    points.push_back(place.apply(*p));
                }
            } else if (item.head() == "arc") {
                if (auto arc = graphic_bounds(item, "arc", place)) {
                    if (arcs) {
                        arcs->merge(*arc);
                    } else {
                        arcs = arc;
                    }
                }
            }
        }
        if (points.empty()) {
            return arcs;
        }
        BoundingBox box = points_bounds(points);
        if (arcs) {
            box.merge(*arcs);
        }
        return box;
    }

    return std::nullopt;
}

/**
 * @brief Strip the gr_ / fp_ prefix of a drawing token
 * @return Item kind, or empty string if the token is not a drawing
 */
std::string drawing_kind(const std::string& head, const char* prefix) {
    if (head.compare(0, 3, prefix) != 0) {
        return {};
    }
    std::string kind = head.substr(3);
    if (kind == "text" || kind == "text_box") {
        return {};
    }
    return kind;
}

PadType pad_type_from_token(const std::string& token) {
    if (token == "smd") {
        return PadType::Smd;
    }
    if (token == "thru_hole") {
        return PadType::ThroughHole;
    }
    return PadType::Other;
}

std::string footprint_reference(const SexprNode& node) {
    // KiCad 8+
    for (const SexprNode* prop : node.find_all("property")) {
        if (prop->atom_at(1).value_or("") == "Reference") {
            return prop->atom_at(2).value_or("");
        }
    }
    for (const SexprNode* text : node.find_all("fp_text")) {
        if (text->atom_at(1).value_or("") == "reference") {
            return text->atom_at(2).value_or("");
        }
    }
    return {};
}

std::string pad_net_name(const SexprNode& pad) {
    const SexprNode* net = pad.find("net");
    if (!net) {
        return {};
    }
    // (net 3 "GND"), or (net "GND") without the net code
    if (net->number_at(1) && net->size() > 2) {
        return net->atom_at(2).value_or("");
    }
    return net->atom_at(1).value_or("");
}

} // namespace

// ============================================================================
// KicadBoardSnapshot
// ============================================================================

KicadBoardSnapshot::KicadBoardSnapshot(const SexprNode& root, std::string name)
    : name_(std::move(name)) {
    if (root.head() != "kicad_pcb") {
        throw std::runtime_error("not a KiCad board (root is '" + root.head() + "')");
    }

    if (const SexprNode* version = root.find("version")) {
        // YYYYMMDD; anything outside that range is not a version we know
        double value = version->number_at(1).value_or(0.0);
        if (value >= 0.0 && value <= 99999999.0) {
            version_ = static_cast<long>(value);
        } else {
            spdlog::warn("[KicadBoard] Ignoring implausible format version {}", value);
        }
    }
    if (const SexprNode* title = root.find("title_block")) {
        revision_ = read_atom(*title, "rev").value_or("");
    }

    read_board_graphics(root);

    for (const auto& child : root.children) {
        const std::string& head = child.head();
        if (head == "footprint" || head == "module") {
            read_footprint(child);
        }
    }

    spdlog::info("[KicadBoard] '{}': version {}, {} outline items, {} footprints", name_,
                 version_, outline_.size(), footprints_.size());
}

void KicadBoardSnapshot::read_board_graphics(const SexprNode& root) {
    Placement identity;
    for (const auto& child : root.children) {
        std::string kind = drawing_kind(child.head(), "gr_");
        if (kind.empty()) {
            continue;
        }

        auto layer_token = read_atom(child, "layer");
        if (!layer_token || layer_from_name(*layer_token) != Layer::EdgeCuts) {
            continue;
        }

        if (auto box = graphic_bounds(child, kind, identity)) {
            outline_.push_back(*box);
        } else {
            spdlog::warn("[KicadBoard] Skipping unreadable {} on Edge.Cuts (line {})",
                         child.head(), child.line);
        }
    }
}

void KicadBoardSnapshot::read_footprint(const SexprNode& node) {
    FootprintInfo footprint;
    footprint.reference = footprint_reference(node);

    auto layer_token = read_atom(node, "layer");
    footprint.side = (layer_token && layer_from_name(*layer_token) == Layer::BackCopper)
                         ? BoardSide::Back
                         : BoardSide::Front;

    Placement place;
    if (const SexprNode* at = node.find("at")) {
        place.at = read_xy(*at).value_or(glm::dvec2(0.0, 0.0));
        place.angle = at->number_at(3).value_or(0.0);
    }

    std::optional<BoundingBox> bounds;
    auto include = [&bounds](const BoundingBox& box) {
        if (bounds) {
            bounds->merge(box);
        } else {
            bounds = box;
        }
    };

    for (const auto& child : node.children) {
        std::string kind = drawing_kind(child.head(), "fp_");
        if (!kind.empty()) {
            if (auto box = graphic_bounds(child, kind, place)) {
                include(*box);
            }
            continue;
        }

        if (child.head() != "pad") {
            continue;
        }

        PadInfo pad;
        pad.number = child.atom_at(1).value_or("");
        pad.type = pad_type_from_token(child.atom_at(2).value_or(""));
        pad.net_name = pad_net_name(child);

        double pad_angle = 0.0;
        if (const SexprNode* at = child.find("at")) {
            pad.position = place.apply(read_xy(*at).value_or(glm::dvec2(0.0, 0.0)));
            pad_angle = at->number_at(3).value_or(0.0);
        } else {
            pad.position = place.at;
        }

        if (const SexprNode* layers = child.find("layers")) {
            for (size_t i = 1; i < layers->size(); i++) {
                if (auto token = layers->atom_at(i)) {
                    pad.layers.add_named(*token);
                }
            }
        }

        // Pad orientation in the file already includes the footprint rotation
        if (auto size = read_xy(child, "size")) {
            glm::dvec2 half = *size * 0.5;
            BoundingBox pad_box = BoundingBox::from_corners(pad.position, pad.position);
            for (double sx : {-1.0, 1.0}) {
                for (double sy : {-1.0, 1.0}) {
                    pad_box.expand(pad.position +
                                   rotate_kicad(glm::dvec2(sx * half.x, sy * half.y), pad_angle));
                }
            }
            include(pad_box);
        }

        spdlog::trace("[KicadBoard] {}.{} {} at ({:.3f}, {:.3f}) net '{}'", footprint.reference,
                      pad.number, pad_type_name(pad.type), pad.position.x, pad.position.y,
                      pad.net_name);
        footprint.pads.push_back(std::move(pad));
    }

    footprint.bounds = bounds.value_or(BoundingBox(place.at.x, place.at.y, 0.0, 0.0));
    footprints_.push_back(std::move(footprint));
}

std::unique_ptr<KicadBoardSnapshot> KicadBoardSnapshot::from_string(const std::string& text,
                                                                    const std::string& name,
                                                                    std::string& error) {
    try {
        SexprNode root = SexprParser::parse(text);
        return std::make_unique<KicadBoardSnapshot>(root, name);
    } catch (const std::exception& e) {
        error = e.what();
        spdlog::error("[KicadBoard] Failed to read '{}': {}", name, error);
        return nullptr;
    }
}

std::unique_ptr<KicadBoardSnapshot> KicadBoardSnapshot::load(const std::string& path,
                                                             std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "cannot open " + path;
        spdlog::error("[KicadBoard] {}", error);
        return nullptr;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto board = from_string(buffer.str(), std::filesystem::path(path).stem().string(), error);
    if (!board) {
        error = path + ": " + error;
    }
    return board;
}

} // namespace openfixture
