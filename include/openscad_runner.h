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

#include "fixture_parameters.h"

#include <string>
#include <vector>

namespace openfixture {

/**
 * @brief Output the fixture model renders
 */
enum class RenderMode {
    Model3d,  ///< Assembled 3D preview image (-fixture.png)
    LaserCut, ///< Flat laser-cut layout (-fixture.dxf)
    TestCut   ///< Small test piece for checking material fit (-test.dxf)
};

/**
 * @brief Value of the model's `mode` variable ("3dmodel", "lasercut", "testcut")
 */
const char* render_mode_name(RenderMode mode);

/**
 * @brief Invokes OpenSCAD on the fixture model
 *
 * Each render is a separate child process started with fork()/execvp() and
 * waited for. In dry-run mode the command lines are logged and printed but
 * nothing is executed.
 */
class OpenScadRunner {
  public:
    explicit OpenScadRunner(std::string executable = "openscad");

    void set_dry_run(bool dry_run) {
        dry_run_ = dry_run;
    }

    bool dry_run() const {
        return dry_run_;
    }

    /**
     * @brief Output file for a render mode
     * @return <output_dir>/<board_name>-fixture.png, -fixture.dxf or -test.dxf
     */
    static std::string output_file(RenderMode mode, const std::string& output_dir,
                                   const std::string& board_name);

    /**
     * @brief Full argv for one render
     *
     * openscad <params> -D mode="<mode>" [--render] -o <output> <scad_file>
     */
    std::vector<std::string> build_command(const FixtureParameters& params, RenderMode mode,
                                           const std::string& scad_file,
                                           const std::string& output_file) const;

    /**
     * @brief Command line as a shell-quoted string for display
     */
    static std::string format_command(const std::vector<std::string>& argv);

    /**
     * @brief Run a command and wait for it
     *
     * @param argv Program and arguments
     * @return Exit status, or -1 if the process could not be started or was
     *         killed by a signal
     */
    int run(const std::vector<std::string>& argv) const;

    /**
     * @brief Render each mode in order, stopping at the first failure
     *
     * @return true if every render succeeded (always true in dry-run mode)
     */
    bool render(const FixtureParameters& params, const std::vector<RenderMode>& modes,
                const std::string& scad_file, const std::string& output_dir,
                const std::string& board_name) const;

  private:
    std::string executable_;
    bool dry_run_{false};
};

} // namespace openfixture
