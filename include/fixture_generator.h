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

#include "board_snapshot.h"
#include "fixture_config.h"
#include "fixture_geometry.h"
#include "fixture_parameters.h"

#include <string>
#include <vector>

namespace openfixture {

/**
 * @brief Why a generation run stopped
 */
enum class FailureKind {
    None,                 ///< Parameters were assembled
    NoTestPointsFound,    ///< Selection produced no probe-able pads
    InvalidConfiguration, ///< A required or malformed configuration value
    BoardLoadFailed       ///< The board file could not be read
};

const char* failure_kind_name(FailureKind kind);

/**
 * @brief Everything one generation run produced
 *
 * When succeeded() is false, failure_reason explains why and parameters is
 * empty. Geometry and diagnostics are filled in as far as the run got.
 */
struct GenerationResult {
    FailureKind failure{FailureKind::None};
    std::string failure_reason;

    FixtureGeometry geometry;
    std::vector<Diagnostic> diagnostics;
    std::vector<SelectedPad> selected_pads; ///< Scan order, parallel to geometry.test_points

    std::string revision;
    FixtureOutputPaths paths;
    FixtureParameters parameters;

    bool succeeded() const {
        return failure == FailureKind::None;
    }

    bool has_errors() const;

    static GenerationResult failed(FailureKind kind, std::string reason);
};

/**
 * @brief Runs extraction, selection, normalization and assembly for one board
 *
 * The board snapshot is only queried, never modified. The generator holds a
 * reference to it, so the board must outlive the generator.
 *
 * Usage:
 * @code
 * FixtureGenerator generator(board, config);
 * GenerationResult result = generator.generate("fixture-rev_01");
 * if (!result.succeeded()) {
 *     spdlog::error("{}", result.failure_reason);
 * }
 * @endcode
 */
class FixtureGenerator {
  public:
    FixtureGenerator(const IBoardSnapshot& board, FixtureConfig config);

    /**
     * @brief Run the pipeline
     *
     * @param output_dir Directory the drawing files are expected in
     * @return Result with parameters, or a failure reason
     */
    GenerationResult generate(const std::string& output_dir) const;

    const FixtureConfig& config() const {
        return config_;
    }

  private:
    void collect_side(const TestPointSelector& selector, const SideScan& scan,
                      const std::vector<FootprintInfo>& footprints,
                      GenerationResult& result) const;

    const IBoardSnapshot& board_;
    FixtureConfig config_;
};

} // namespace openfixture
