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

#include "board_model.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace openfixture {

/**
 * @brief Loads a board snapshot exported as JSON
 *
 * Lets boards from other CAD tools (or hand-written test boards) feed the
 * generator. All coordinates are converted to millimeters at load time.
 *
 * @code
 * {
 *   "name": "probe-board",
 *   "revision": "3",
 *   "units": "mm",                          // mm | mil | inch | nm
 *   "outline": [ { "x": 10, "y": 5, "width": 100, "height": 0 } ],
 *   "footprints": [
 *     { "reference": "TP1", "side": "front",
 *       "bounds": { "x": 14, "y": 6, "width": 2, "height": 2 },
 *       "pads": [ { "number": "1", "x": 15.003, "y": 7.006, "type": "smd",
 *                   "layers": ["F.Cu", "F.Mask"], "net": "VCC" } ] }
 *   ]
 * }
 * @endcode
 */
class BoardJsonReader {
  public:
    /**
     * @brief Millimeters per unit
     * @return Scale, or std::nullopt for unknown unit names
     */
    static std::optional<double> unit_scale(const std::string& units);

    /**
     * @brief Build a board from a parsed document
     *
     * @param doc Board document
     * @param default_name Name used when the document has none
     * @param error Receives the reason on failure
     * @return Board, or nullptr on failure
     */
    static std::unique_ptr<BoardModel> from_json(const nlohmann::json& doc,
                                                 const std::string& default_name,
                                                 std::string& error);

    /**
     * @brief Load a board file
     *
     * @param path JSON file path
     * @param error Receives the reason on failure
     * @return Board, or nullptr on failure
     */
    static std::unique_ptr<BoardModel> load(const std::string& path, std::string& error);
};

} // namespace openfixture
