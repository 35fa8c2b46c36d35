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

#include "fixture_config.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace openfixture {

namespace {

struct NumericField {
    const char* key;
    const char* pointer;
    std::optional<double> FixtureConfig::*member;
    bool allow_zero;
};

const NumericField NUMERIC_FIELDS[] = {
    {"mat_th", "/material/mat_th", &FixtureConfig::mat_th, false},
    {"pcb_th", "/board/pcb_th", &FixtureConfig::pcb_th, false},
    {"screw_len", "/hardware/screw_len", &FixtureConfig::screw_len, false},
    {"screw_d", "/hardware/screw_d", &FixtureConfig::screw_d, false},
    {"washer_th", "/hardware/washer_th", &FixtureConfig::washer_th, true},
    {"nut_f2f", "/hardware/nut_f2f", &FixtureConfig::nut_f2f, false},
    {"nut_c2c", "/hardware/nut_c2c", &FixtureConfig::nut_c2c, false},
    {"nut_th", "/hardware/nut_th", &FixtureConfig::nut_th, false},
    {"pivot_d", "/hardware/pivot_d", &FixtureConfig::pivot_d, false},
    {"border", "/hardware/border", &FixtureConfig::border, true},
    {"pogo_uncompressed_length", "/hardware/pogo_uncompressed_length",
     &FixtureConfig::pogo_uncompressed_length, false},
    {"logo_scale", "/logo/scale", &FixtureConfig::logo_scale, false},
};

const NumericField* find_numeric_field(const std::string& key) {
    for (const auto& field : NUMERIC_FIELDS) {
        if (key == field.key) {
            return &field;
        }
    }
    return nullptr;
}

void store_numeric(FixtureConfig& config, const NumericField& field, double value,
                   const std::string& original) {
    if (value < 0.0 || (!field.allow_zero && value == 0.0)) {
        throw ConfigError(std::string(field.key) + ": '" + original +
                          "' must be a positive dimension");
    }
    config.*(field.member) = value;
}

Layer parse_layer_value(const std::string& key, const std::string& value) {
    auto layer = layer_from_name(value);
    if (!layer) {
        throw ConfigError(key + ": '" + value + "' is not a known layer");
    }
    return *layer;
}

bool parse_flag_value(const std::string& key, const std::string& value) {
    bool flag = false;
    if (!parse_flag(value, flag)) {
        throw ConfigError(key + ": '" + value + "' is not a boolean");
    }
    return flag;
}

// JSON scalars are handed to FixtureConfig::set() as text
std::string scalar_to_string(const std::string& key, const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number()) {
        return value.dump();
    }
    throw ConfigError(key + ": expected a number or string, got " +
                      std::string(value.type_name()));
}

struct JsonBinding {
    const char* pointer;
    const char* key;
};

// Non-numeric keys; numeric keys come from NUMERIC_FIELDS
const JsonBinding JSON_BINDINGS[] = {
    {"/board/rev", "rev"},
    {"/selection/layer", "layer"},
    {"/selection/force_layer", "flayer"},
    {"/selection/ignore_layer", "ilayer"},
    {"/selection/smd", "smd"},
    {"/selection/through_hole", "th"},
    {"/logo/file", "logo"},
    {"/scad", "scad"},
};

} // namespace

bool parse_dimension(const std::string& text, double& out_value) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        start++;
    }
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        end--;
    }
    if (start == end) {
        return false;
    }

    std::string trimmed = text.substr(start, end - start);
    char* parse_end = nullptr;
    errno = 0;
    double value = std::strtod(trimmed.c_str(), &parse_end);
    if (parse_end != trimmed.c_str() + trimmed.size() || errno == ERANGE ||
        !std::isfinite(value)) {
        return false;
    }

    out_value = value;
    return true;
}

bool parse_flag(const std::string& text, bool& out_value) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        out_value = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        out_value = false;
        return true;
    }
    return false;
}

// ============================================================================
// FixtureConfig
// ============================================================================

FixtureConfig::FixtureConfig()
    : pcb_th(DEFAULT_PCB_TH), screw_len(DEFAULT_SCREW_LEN), screw_d(DEFAULT_SCREW_D) {}

void FixtureConfig::set(const std::string& key, const std::string& value) {
    if (const NumericField* field = find_numeric_field(key)) {
        double parsed = 0.0;
        if (!parse_dimension(value, parsed)) {
            throw ConfigError(key + ": '" + value + "' is not a number");
        }
        store_numeric(*this, *field, parsed, value);
        return;
    }

    if (key == "rev") {
        revision = value;
    } else if (key == "logo") {
        logo_file = value;
    } else if (key == "scad") {
        if (value.empty()) {
            throw ConfigError("scad: file name must not be empty");
        }
        scad_file = value;
    } else if (key == "layer") {
        auto layer = test_layer_from_name(value);
        if (!layer) {
            throw ConfigError("layer: '" + value + "' is not F.Cu, B.Cu or both");
        }
        selection.layer = *layer;
    } else if (key == "flayer") {
        selection.force_layer = parse_layer_value(key, value);
    } else if (key == "ilayer") {
        selection.ignore_layer = parse_layer_value(key, value);
    } else if (key == "smd") {
        selection.include_smd = parse_flag_value(key, value);
    } else if (key == "th") {
        selection.include_through_hole = parse_flag_value(key, value);
    } else {
        throw ConfigError("unknown configuration key '" + key + "'");
    }
}

void FixtureConfig::merge_json(const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("configuration root must be a JSON object");
    }

    for (const auto& field : NUMERIC_FIELDS) {
        json::json_pointer ptr(field.pointer);
        if (doc.contains(ptr)) {
            set(field.key, scalar_to_string(field.key, doc.at(ptr)));
        }
    }

    for (const auto& binding : JSON_BINDINGS) {
        json::json_pointer ptr(binding.pointer);
        if (doc.contains(ptr)) {
            set(binding.key, scalar_to_string(binding.key, doc.at(ptr)));
        }
    }
}

bool FixtureConfig::load_file(const std::string& path, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "cannot open config file " + path;
        spdlog::error("[FixtureConfig] {}", error);
        return false;
    }

    try {
        json doc = json::parse(file);
        merge_json(doc);
    } catch (const json::exception& e) {
        error = path + ": " + e.what();
        spdlog::error("[FixtureConfig] Failed to parse {}", error);
        return false;
    } catch (const ConfigError& e) {
        error = path + ": " + e.what();
        spdlog::error("[FixtureConfig] Invalid value in {}", error);
        return false;
    }

    spdlog::info("[FixtureConfig] Loaded {}", path);
    return true;
}

std::optional<std::string> FixtureConfig::validation_error() const {
    if (!mat_th) {
        return std::string("mat_th: material thickness is required");
    }

    for (const auto& field : NUMERIC_FIELDS) {
        const std::optional<double>& value = this->*(field.member);
        if (value && !std::isfinite(*value)) {
            return std::string(field.key) + ": value is not finite";
        }
    }

    if (!selection.include_smd && !selection.include_through_hole) {
        spdlog::warn("[FixtureConfig] SMD and through-hole pads are both disabled; only "
                     "force-layer pads can become test points");
    }

    return std::nullopt;
}

} // namespace openfixture
