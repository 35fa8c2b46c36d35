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

#include <string>
#include <vector>

namespace openfixture {

/**
 * @brief In-memory board snapshot
 *
 * Backing store for the JSON snapshot reader and the board double used
 * by unit tests. Everything is held by value; the model is filled once and
 * then only read through the IBoardSnapshot interface.
 *
 * Usage:
 * @code
 *   BoardModel board("demo");
 *   board.add_outline(BoundingBox(10, 5, 100, 50));
 *   FootprintInfo& tp = board.add_footprint("TP1", BoardSide::Front,
 *                                           BoundingBox(14, 6, 2, 2));
 *   board.add_pad(tp, "1", {15.0, 7.0}, {Layer::FrontCopper, Layer::FrontMask},
 *                 PadType::Smd, "GND");
 * @endcode
 */
class BoardModel : public IBoardSnapshot {
  public:
    explicit BoardModel(std::string name = "board");
    ~BoardModel() override = default;

    // IBoardSnapshot
    std::vector<BoundingBox> outline_bounds() const override;
    std::vector<FootprintInfo> footprints() const override;
    std::string title_revision() const override;
    std::string name() const override;

    // Builders

    void add_outline(const BoundingBox& bounds);

    /**
     * @brief Append a footprint and return it for pad insertion
     *
     * The returned reference stays valid until the next add_footprint() call.
     */
    FootprintInfo& add_footprint(const std::string& reference, BoardSide side,
                                 const BoundingBox& bounds);

    void add_pad(FootprintInfo& footprint, const std::string& number,
                 const glm::dvec2& position, const LayerSet& layers, PadType type,
                 const std::string& net_name = "");

    void set_revision(const std::string& revision) {
        revision_ = revision;
    }

    void set_name(const std::string& name) {
        name_ = name;
    }

    size_t footprint_count() const {
        return footprints_.size();
    }

  private:
    std::string name_;
    std::string revision_;
    std::vector<BoundingBox> outline_;
    std::vector<FootprintInfo> footprints_;
};

} // namespace openfixture
