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

#include "fixture_parameters.h"

#include "fixture_coordinate_transform.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <system_error>

using json = nlohmann::json;

namespace openfixture {

// ============================================================================
// ParameterValue
// ============================================================================

ParameterValue ParameterValue::number(double value) {
    return ParameterValue(Storage(value));
}

ParameterValue ParameterValue::point_array(std::vector<glm::dvec2> points) {
    return ParameterValue(Storage(std::move(points)));
}

ParameterValue ParameterValue::string(std::string text) {
    return ParameterValue(Storage(std::move(text)));
}

ParameterKind ParameterValue::kind() const {
    if (std::holds_alternative<double>(value_)) {
        return ParameterKind::Number;
    }
    if (std::holds_alternative<std::vector<glm::dvec2>>(value_)) {
        return ParameterKind::PointArray;
    }
    return ParameterKind::String;
}

std::string ParameterValue::to_literal() const {
    switch (kind()) {
    case ParameterKind::Number:
        return transform::format_fixed2(as_number());
    case ParameterKind::PointArray:
        return format_point_array(as_points());
    case ParameterKind::String:
        return quote_string(as_string());
    }
    return {};
}

json ParameterValue::to_json() const {
    switch (kind()) {
    case ParameterKind::Number:
        return transform::round_decimals(as_number(), 2);
    case ParameterKind::PointArray: {
        json array = json::array();
        for (const auto& p : as_points()) {
            array.push_back({transform::round_decimals(p.x, 2), transform::round_decimals(p.y, 2)});
        }
        return array;
    }
    case ParameterKind::String:
        return as_string();
    }
    return nullptr;
}

// ============================================================================
// Literal formatting
// ============================================================================

std::string format_point_array(const std::vector<glm::dvec2>& points) {
    std::string out = "[";
    for (size_t i = 0; i < points.size(); i++) {
        if (i > 0) {
            out += ',';
        }
        out += '[';
        out += transform::format_fixed2(points[i].x);
        out += ',';
        out += transform::format_fixed2(points[i].y);
        out += ']';
    }
    out += ']';
    return out;
}

std::string quote_string(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

// ============================================================================
// FixtureParameters
// ============================================================================

void FixtureParameters::put(const std::string& name, ParameterValue value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&name](const FixtureParameter& p) { return p.name == name; });
    if (it != entries_.end()) {
        it->value = std::move(value);
        return;
    }
    entries_.push_back(FixtureParameter{name, std::move(value)});
}

void FixtureParameters::add_number(const std::string& name, double value) {
    put(name, ParameterValue::number(value));
}

void FixtureParameters::add_points(const std::string& name,
                                   const std::vector<glm::dvec2>& points) {
    put(name, ParameterValue::point_array(points));
}

void FixtureParameters::add_string(const std::string& name, const std::string& text) {
    put(name, ParameterValue::string(text));
}

void FixtureParameters::add_optional_number(const std::string& name,
                                            const std::optional<double>& value) {
    if (value) {
        add_number(name, *value);
    }
}

void FixtureParameters::add_optional_string(const std::string& name,
                                            const std::optional<std::string>& text) {
    if (text) {
        add_string(name, *text);
    }
}

const ParameterValue* FixtureParameters::find(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return &entry.value;
        }
    }
    return nullptr;
}

std::vector<std::string> FixtureParameters::to_openscad_args() const {
    std::vector<std::string> args;
    args.reserve(entries_.size() * 2);
    for (const auto& entry : entries_) {
        args.emplace_back("-D");
        args.push_back(entry.name + "=" + entry.value.to_literal());
    }
    return args;
}

json FixtureParameters::to_json() const {
    json doc = json::object();
    for (const auto& entry : entries_) {
        doc[entry.name] = entry.value.to_json();
    }
    return doc;
}

// ============================================================================
// FixtureOutputPaths
// ============================================================================

FixtureOutputPaths FixtureOutputPaths::for_board(const std::string& output_dir,
                                                 const std::string& board_name) {
    // The geometry tool resolves imports relative to its model file, not the
    // working directory
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::absolute(output_dir, ec);
    if (ec) {
        spdlog::warn("[FixtureParameters] Cannot make '{}' absolute: {}", output_dir,
                     ec.message());
        dir = output_dir;
    }
    auto file = [&](const char* suffix) { return (dir / (board_name + suffix)).string(); };

    FixtureOutputPaths paths;
    paths.outline = file("-outline.dxf");
    paths.track = file("-track.dxf");
    paths.track_top = file("-track-top.dxf");
    paths.track_bottom = file("-track-bottom.dxf");
    return paths;
}

// ============================================================================
// ParameterAssembler
// ============================================================================

std::string ParameterAssembler::resolve_revision(const FixtureConfig& config,
                                                 const std::string& title_revision) {
    if (config.revision) {
        return *config.revision;
    }
    if (title_revision.empty()) {
        return "rev.0";
    }
    return "rev." + title_revision;
}

FixtureParameters ParameterAssembler::assemble(const FixtureGeometry& geometry,
                                               const FixtureConfig& config,
                                               const FixtureOutputPaths& paths,
                                               const std::string& revision) {
    FixtureParameters params;

    params.add_points("test_points", geometry.test_points);
    params.add_number("tp_min_y", geometry.min_y);
    params.add_optional_number("mat_th", config.mat_th);
    params.add_number("pcb_th", config.pcb_th.value_or(DEFAULT_PCB_TH));
    params.add_number("pcb_x", geometry.dimensions.x);
    params.add_number("pcb_y", geometry.dimensions.y);
    params.add_string("pcb_outline", paths.outline);
    params.add_number("screw_thr_len", config.screw_len.value_or(DEFAULT_SCREW_LEN));
    params.add_number("screw_d", config.screw_d.value_or(DEFAULT_SCREW_D));
    params.add_string("pcb_track", paths.track);

    if (geometry.dual_sided) {
        params.add_points("test_points_top", geometry.test_points_top);
        params.add_points("test_points_bottom", geometry.test_points_bottom);
        params.add_string("pcb_track_top", paths.track_top);
        params.add_string("pcb_track_bottom", paths.track_bottom);
    }

    if (!revision.empty()) {
        params.add_string("rev", revision);
    }
    params.add_optional_number("washer_th", config.washer_th);
    params.add_optional_number("nut_od_f2f", config.nut_f2f);
    params.add_optional_number("nut_od_c2c", config.nut_c2c);
    params.add_optional_number("nut_th", config.nut_th);
    params.add_optional_number("pivot_d", config.pivot_d);
    params.add_optional_number("pcb_support_border", config.border);
    params.add_optional_number("pogo_uncompressed_length", config.pogo_uncompressed_length);
    params.add_optional_string("logo_file", config.logo_file);
    params.add_optional_number("logo_scale", config.logo_scale);

    spdlog::debug("[ParameterAssembler] {} parameters, {} test points{}", params.size(),
                  geometry.test_points.size(), geometry.dual_sided ? " (dual-sided)" : "");
    return params;
}

} // namespace openfixture
