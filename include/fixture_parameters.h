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

#pragma once

#include "fixture_config.h"
#include "fixture_geometry.h"

#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file fixture_parameters.h
 * @brief Named parameter set handed to the fixture geometry tool
 *
 * The geometry tool (OpenSCAD) receives every value as a `-D name=literal`
 * override. Three literal forms exist:
 *
 * - Number:      `1.60` (always two decimals, never quoted)
 * - PointArray:  `[[5.00,2.01],[95.00,2.01]]`, or `[]` when empty
 * - String:      `"fixture-rev_01/board-outline.dxf"` (always quoted)
 */

namespace openfixture {

enum class ParameterKind { Number, PointArray, String };

/**
 * @brief One typed parameter value
 */
class ParameterValue {
  public:
    static ParameterValue number(double value);
    static ParameterValue point_array(std::vector<glm::dvec2> points);
    static ParameterValue string(std::string text);

    ParameterKind kind() const;

    double as_number() const {
        return std::get<double>(value_);
    }

    const std::vector<glm::dvec2>& as_points() const {
        return std::get<std::vector<glm::dvec2>>(value_);
    }

    const std::string& as_string() const {
        return std::get<std::string>(value_);
    }

    /**
     * @brief Literal text as the geometry tool expects it
     */
    std::string to_literal() const;

    /**
     * @brief Same value as JSON (number, array of [x, y] pairs, or string)
     */
    nlohmann::json to_json() const;

  private:
    using Storage = std::variant<double, std::vector<glm::dvec2>, std::string>;

    explicit ParameterValue(Storage value) : value_(std::move(value)) {}

    Storage value_;
};

struct FixtureParameter {
    std::string name;
    ParameterValue value;
};

/**
 * @brief Format points as `[[x.xx,y.xx],...]`
 */
std::string format_point_array(const std::vector<glm::dvec2>& points);

/**
 * @brief Quote text as a geometry-tool string literal, escaping `"` and `\`
 */
std::string quote_string(const std::string& text);

/**
 * @brief Ordered name → value mapping
 *
 * Insertion order is kept so generated command lines are stable. Adding a
 * name twice replaces the earlier value in place.
 */
class FixtureParameters {
  public:
    void add_number(const std::string& name, double value);
    void add_points(const std::string& name, const std::vector<glm::dvec2>& points);
    void add_string(const std::string& name, const std::string& text);

    /// Adds the value only when it is set
    void add_optional_number(const std::string& name, const std::optional<double>& value);
    /// Adds the value only when it is set
    void add_optional_string(const std::string& name, const std::optional<std::string>& text);

    const std::vector<FixtureParameter>& entries() const {
        return entries_;
    }

    size_t size() const {
        return entries_.size();
    }

    bool contains(const std::string& name) const {
        return find(name) != nullptr;
    }

    /**
     * @brief Look up a parameter
     * @return Pointer to the value, or nullptr if absent
     */
    const ParameterValue* find(const std::string& name) const;

    /**
     * @brief Command-line overrides in insertion order
     *
     * Each parameter yields two argv entries: "-D" and "name=literal".
     */
    std::vector<std::string> to_openscad_args() const;

    /**
     * @brief JSON object of all parameters
     */
    nlohmann::json to_json() const;

  private:
    void put(const std::string& name, ParameterValue value);

    std::vector<FixtureParameter> entries_;
};

/**
 * @brief Drawing files the CAD export step writes for the geometry tool
 */
struct FixtureOutputPaths {
    std::string outline;      ///< Board outline drawing
    std::string track;        ///< Copper layer drawing (single-sided)
    std::string track_top;    ///< Front copper drawing (dual-sided)
    std::string track_bottom; ///< Back copper drawing (dual-sided)

    /**
     * @brief Conventional paths: <dir>/<name>-outline.dxf, <dir>/<name>-track.dxf, ...
     *
     * Relative directories are resolved against the current working directory.
     */
    static FixtureOutputPaths for_board(const std::string& output_dir,
                                        const std::string& board_name);
};

/**
 * @brief Builds the parameter set from computed geometry and configuration
 *
 * Emission order:
 *   test_points, tp_min_y, mat_th, pcb_th, pcb_x, pcb_y, pcb_outline,
 *   screw_thr_len, screw_d, pcb_track,
 *   [test_points_top, test_points_bottom, pcb_track_top, pcb_track_bottom]  (dual-sided)
 *   rev, washer_th, nut_od_f2f, nut_od_c2c, nut_th, pivot_d,
 *   pcb_support_border, pogo_uncompressed_length, logo_file, logo_scale     (when set)
 */
class ParameterAssembler {
  public:
    /**
     * @brief Assemble parameters for a completed geometry
     *
     * @param geometry Geometry with at least one test point
     * @param config Validated configuration (mat_th set)
     * @param paths Drawing file paths
     * @param revision Revision string (see resolve_revision)
     * @return Parameter set
     */
    static FixtureParameters assemble(const FixtureGeometry& geometry,
                                      const FixtureConfig& config,
                                      const FixtureOutputPaths& paths,
                                      const std::string& revision);

    /**
     * @brief Revision label for the fixture
     *
     * Configured revision if any, else "rev." + title block revision,
     * else "rev.0".
     */
    static std::string resolve_revision(const FixtureConfig& config,
                                        const std::string& title_revision);
};

} // namespace openfixture
