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
#include "sexpr_parser.h"

#include <memory>
#include <string>
#include <vector>

/**
 * @file kicad_board_reader.h
 * @brief Board snapshot read from a .kicad_pcb file
 *
 * Supported file generations:
 *
 * | KiCad | Footprint token | Arc encoding                 | Reference          |
 * |-------|-----------------|------------------------------|--------------------|
 * | 5     | module          | (start center) (end) (angle) | fp_text reference  |
 * | 6, 7  | footprint       | (start) (mid) (end)          | fp_text reference  |
 * | 8, 9  | footprint       | (start) (mid) (end)          | property Reference |
 *
 * Back-side footprints are stored already flipped in the file, so pad
 * positions only need the footprint rotation and translation applied.
 */

namespace openfixture {

/**
 * @brief Read-only snapshot of a KiCad board
 */
class KicadBoardSnapshot : public IBoardSnapshot {
  public:
    /**
     * @brief Build a snapshot from a parsed board tree
     *
     * @param root Root `kicad_pcb` list
     * @param name Project name for output files
     * @throws std::runtime_error if the root is not a KiCad board
     */
    KicadBoardSnapshot(const SexprNode& root, std::string name);
    ~KicadBoardSnapshot() override = default;

    /**
     * @brief Load a board file
     *
     * @param path Path to a .kicad_pcb file
     * @param error Receives the reason on failure
     * @return Snapshot, or nullptr on failure
     */
    static std::unique_ptr<KicadBoardSnapshot> load(const std::string& path, std::string& error);

    /**
     * @brief Parse board text already in memory
     *
     * @param text File contents
     * @param name Project name
     * @param error Receives the reason on failure
     * @return Snapshot, or nullptr on failure
     */
    static std::unique_ptr<KicadBoardSnapshot> from_string(const std::string& text,
                                                           const std::string& name,
                                                           std::string& error);

    // IBoardSnapshot
    std::vector<BoundingBox> outline_bounds() const override {
        return outline_;
    }

    std::vector<FootprintInfo> footprints() const override {
        return footprints_;
    }

    std::string title_revision() const override {
        return revision_;
    }

    std::string name() const override {
        return name_;
    }

    /// File format version (YYYYMMDD), 0 if the file has none
    long format_version() const {
        return version_;
    }

  private:
    void read_board_graphics(const SexprNode& root);
    void read_footprint(const SexprNode& node);

    std::string name_;
    std::string revision_;
    long version_{0};
    std::vector<BoundingBox> outline_;
    std::vector<FootprintInfo> footprints_;
};

} // namespace openfixture
