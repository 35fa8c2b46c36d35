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

#include "board_json_reader.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace openfixture {

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

BoundingBox read_box(const json& j, double scale) {
    return BoundingBox(j.at("x").get<double>() * scale, j.at("y").get<double>() * scale,
                       j.at("width").get<double>() * scale, j.at("height").get<double>() * scale);
}

BoardSide read_side(const json& footprint) {
    std::string side = lower(footprint.value("side", std::string("front")));
    if (side == "front" || side == "top" || side == "f.cu") {
        return BoardSide::Front;
    }
    if (side == "back" || side == "bottom" || side == "b.cu") {
        return BoardSide::Back;
    }
    throw std::runtime_error("unknown footprint side '" + side + "'");
}

PadType read_pad_type(const json& pad) {
    std::string type = lower(pad.value("type", std::string("smd")));
    if (type == "smd") {
        return PadType::Smd;
    }
    if (type == "thru_hole" || type == "through_hole" || type == "th") {
        return PadType::ThroughHole;
    }
    return PadType::Other;
}

} // namespace

std::optional<double> BoardJsonReader::unit_scale(const std::string& units) {
    std::string u = lower(units);
    if (u == "mm") {
        return 1.0;
    }
    if (u == "mil") {
        return 0.0254;
    }
    if (u == "inch" || u == "in") {
        return 25.4;
    }
    if (u == "nm") {
        return 1e-6;
    }
    return std::nullopt;
}

std::unique_ptr<BoardModel> BoardJsonReader::from_json(const json& doc,
                                                       const std::string& default_name,
                                                       std::string& error) {
    try {
        if (!doc.is_object()) {
            throw std::runtime_error("board document must be a JSON object");
        }

        std::string units = doc.value("units", std::string("mm"));
        auto scale = unit_scale(units);
        if (!scale) {
            throw std::runtime_error("unknown units '" + units + "'");
        }

        auto board = std::make_unique<BoardModel>(doc.value("name", default_name));
        board->set_revision(doc.value("revision", std::string()));

        if (doc.contains("outline")) {
            for (const auto& item : doc.at("outline")) {
                board->add_outline(read_box(item, *scale));
            }
        }

        if (doc.contains("footprints")) {
            for (const auto& item : doc.at("footprints")) {
                std::string reference = item.value("reference", std::string());
                BoardSide side = read_side(item);
                bool has_bounds = item.contains("bounds");
                bool has_pads = item.contains("pads") && !item.at("pads").empty();
                if (!has_bounds && !has_pads) {
                    throw std::runtime_error("footprint '" + reference +
                                             "' has neither bounds nor pads");
                }

                BoundingBox bounds;
                if (has_bounds) {
                    bounds = read_box(item.at("bounds"), *scale);
                }
                FootprintInfo& footprint = board->add_footprint(reference, side, bounds);

                if (!has_pads) {
                    continue;
                }
                for (const auto& pad : item.at("pads")) {
                    LayerSet layers;
                    for (const auto& token : pad.at("layers")) {
                        if (!layers.add_named(token.get<std::string>())) {
                            spdlog::warn("[BoardJson] {}: unknown layer '{}'",
                                         footprint.reference, token.get<std::string>());
                        }
                    }
                    glm::dvec2 position(pad.at("x").get<double>() * *scale,
                                        pad.at("y").get<double>() * *scale);
                    board->add_pad(footprint, pad.value("number", std::string()), position,
                                   layers, read_pad_type(pad), pad.value("net", std::string()));
                }

                // No drawn extent: the pads are the footprint
                if (!has_bounds) {
                    const glm::dvec2& first = footprint.pads.front().position;
                    footprint.bounds = BoundingBox::from_corners(first, first);
                    for (const auto& pad : footprint.pads) {
                        footprint.bounds.expand(pad.position);
                    }
                }
            }
        }

        spdlog::info("[BoardJson] '{}': {} outline items, {} footprints ({})", board->name(),
                     board->outline_bounds().size(), board->footprint_count(), units);
        return board;
    } catch (const std::exception& e) {
        error = e.what();
        spdlog::error("[BoardJson] Invalid board document: {}", error);
        return nullptr;
    }
}

std::unique_ptr<BoardModel> BoardJsonReader::load(const std::string& path, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "cannot open " + path;
        spdlog::error("[BoardJson] {}", error);
        return nullptr;
    }

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::exception& e) {
        error = path + ": " + e.what();
        spdlog::error("[BoardJson] Failed to parse {}", error);
        return nullptr;
    }

    auto board = from_json(doc, std::filesystem::path(path).stem().string(), error);
    if (!board) {
        error = path + ": " + error;
    }
    return board;
}

} // namespace openfixture
