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

#ifndef OPENFIXTURE_FIXTURE_CONFIG_H
#define OPENFIXTURE_FIXTURE_CONFIG_H

#include "test_point_selector.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace openfixture {

/**
 * @brief Raised when a configuration value cannot be used
 *
 * The message names the field and the rejected value.
 */
class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/// Default PCB thickness (mm)
constexpr double DEFAULT_PCB_TH = 1.6;
/// Default assembly screw thread length (mm)
constexpr double DEFAULT_SCREW_LEN = 14.0;
/// Default assembly screw diameter (mm)
constexpr double DEFAULT_SCREW_D = 3.0;
/// Default OpenSCAD model file
constexpr const char* DEFAULT_SCAD_FILE = "openfixture.scad";

/**
 * @brief Parse a dimension in millimeters
 *
 * The whole string must be a finite decimal number ("3", "2.45", "-1e-3");
 * surrounding whitespace is allowed.
 *
 * @param text Input text
 * @param out_value Parsed value (untouched on failure)
 * @return true on success
 */
bool parse_dimension(const std::string& text, double& out_value);

/**
 * @brief Parse a boolean flag ("true"/"false", "yes"/"no", "on"/"off", "1"/"0")
 */
bool parse_flag(const std::string& text, bool& out_value);

/**
 * @brief Everything one fixture generation run is configured with
 *
 * Three sources feed the record, later ones override earlier ones:
 *
 * 1. built-in defaults (constructor)
 * 2. a JSON config file (merge_json / load_file)
 * 3. command-line flags (set)
 *
 * Values are validated as they are set, so a bad number is reported at the
 * point it is supplied rather than when the geometry tool runs. Optional
 * hardware fields stay unset unless given; unset fields are left out of the
 * generated parameter set.
 *
 * JSON layout:
 * @code
 * {
 *   "board":     { "pcb_th": 1.6, "rev": "rev_01" },
 *   "material":  { "mat_th": 3.0 },
 *   "hardware":  { "screw_len": 16, "screw_d": 3, "nut_th": 2.4, "nut_f2f": 5.45,
 *                  "nut_c2c": 6.1, "washer_th": 1.0, "pivot_d": 3.0,
 *                  "border": 0.8, "pogo_uncompressed_length": 16 },
 *   "selection": { "layer": "F.Cu", "force_layer": "Eco2.User",
 *                  "ignore_layer": "Eco1.User", "smd": true, "through_hole": false },
 *   "logo":      { "file": "logo.dxf", "scale": 0.5 },
 *   "scad": "openfixture.scad"
 * }
 * @endcode
 */
struct FixtureConfig {
    FixtureConfig();

    SelectionConfig selection;

    // Fixture material and board
    std::optional<double> mat_th; ///< Laser-cut material thickness (required)
    std::optional<double> pcb_th;
    std::optional<std::string> revision; ///< Overrides the title block revision

    // Assembly hardware
    std::optional<double> screw_len;
    std::optional<double> screw_d;
    std::optional<double> washer_th;
    std::optional<double> nut_f2f;
    std::optional<double> nut_c2c;
    std::optional<double> nut_th;
    std::optional<double> pivot_d;
    std::optional<double> border; ///< Support ledge under the PCB
    std::optional<double> pogo_uncompressed_length;

    // Decorative logo engraved into the head plate
    std::optional<std::string> logo_file;
    std::optional<double> logo_scale;

    std::string scad_file{DEFAULT_SCAD_FILE};

    /**
     * @brief Set a field by its command-line name
     *
     * Recognized keys: mat_th, pcb_th, screw_len, screw_d, washer_th, nut_f2f,
     * nut_c2c, nut_th, pivot_d, border, pogo_uncompressed_length, logo_scale,
     * rev, logo, scad, layer, flayer, ilayer, smd, th.
     *
     * @throws ConfigError for unknown keys and unusable values
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Overlay values from a parsed JSON document
     *
     * Numbers may be JSON numbers or numeric strings.
     *
     * @throws ConfigError for unusable values
     */
    void merge_json(const nlohmann::json& doc);

    /**
     * @brief Overlay values from a JSON config file
     *
     * @param path Config file path
     * @param error Receives a description of the problem on failure
     * @return true if the file was read and every value accepted
     */
    bool load_file(const std::string& path, std::string& error);

    /**
     * @brief Check the record is complete enough to generate a fixture
     * @return Error message, or std::nullopt if the record is usable
     */
    std::optional<std::string> validation_error() const;
};

} // namespace openfixture

#endif // OPENFIXTURE_FIXTURE_CONFIG_H
