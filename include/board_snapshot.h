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

#include <glm/glm.hpp>

#include <bitset>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

/**
 * @file board_snapshot.h
 * @brief Read-only query surface over a PCB design
 *
 * The fixture pipeline never talks to a CAD host directly. Adapters
 * (KiCad file reader, JSON snapshot reader, in-memory model) implement
 * IBoardSnapshot and absorb any differences between host versions, so the
 * extraction and selection code only sees:
 *
 * - outline primitive bounding boxes
 * - footprints with a placement side and bounding box
 * - pads with an absolute position, layer membership and a pad type
 *
 * All coordinates are millimeters in the board's native orientation
 * (X right, Y down).
 */

namespace openfixture {

/**
 * @brief Board layers the fixture pipeline knows about
 *
 * Inner copper layers are not represented: probes only ever reach the
 * outer faces.
 */
enum class Layer {
    FrontCopper,
    BackCopper,
    FrontPaste,
    BackPaste,
    FrontMask,
    BackMask,
    FrontSilk,
    BackSilk,
    FrontCourtyard,
    BackCourtyard,
    FrontFab,
    BackFab,
    EdgeCuts,
    Margin,
    DrawingsUser,
    CommentsUser,
    Eco1User,
    Eco2User,
    COUNT
};

/**
 * @brief Parse a KiCad layer name
 *
 * Accepts canonical file names ("F.Cu", "Eco1.User") and the user-facing
 * aliases introduced by newer KiCad releases ("User.Eco1", "User.Drawings").
 *
 * @param name Layer name, quotes already stripped
 * @return Layer, or std::nullopt for names outside the known set
 */
std::optional<Layer> layer_from_name(const std::string& name);

/**
 * @brief Canonical KiCad name for a layer (e.g. "B.Paste")
 */
const char* layer_name(Layer layer);

/**
 * @brief Set of layers a pad or item occupies
 */
class LayerSet {
  public:
    LayerSet() = default;
    LayerSet(std::initializer_list<Layer> layers) {
        for (Layer layer : layers) {
            add(layer);
        }
    }

    void add(Layer layer) {
        bits_.set(static_cast<size_t>(layer));
    }

    bool contains(Layer layer) const {
        return bits_.test(static_cast<size_t>(layer));
    }

    bool empty() const {
        return bits_.none();
    }

    size_t count() const {
        return bits_.count();
    }

    /**
     * @brief Add layers named by a KiCad layer token
     *
     * Expands wildcards: "*.Cu" and "F&B.Cu" add both copper layers,
     * "*.Mask" and "*.Paste" add both sides. Unknown names are ignored.
     *
     * @param token Layer token from a board file
     * @return true if at least one known layer was added
     */
    bool add_named(const std::string& token);

  private:
    std::bitset<static_cast<size_t>(Layer::COUNT)> bits_;
};

/**
 * @brief Physical face of the board
 */
enum class BoardSide { Front, Back };

/**
 * @brief Opposite face of the board
 */
inline BoardSide opposite_side(BoardSide side) {
    return side == BoardSide::Front ? BoardSide::Back : BoardSide::Front;
}

const char* board_side_name(BoardSide side);

/**
 * @brief Pad attribute as reported by the CAD host
 */
enum class PadType {
    Smd,         ///< Surface-mount pad
    ThroughHole, ///< Plated through-hole pad
    Other        ///< Non-plated holes, connector-only pads, anything else
};

const char* pad_type_name(PadType type);

/**
 * @brief Axis-aligned bounding box stored as min corner plus size
 */
struct BoundingBox {
    glm::dvec2 min{0.0, 0.0};
    double width{0.0};
    double height{0.0};

    BoundingBox() = default;
    BoundingBox(double x, double y, double w, double h) : min(x, y), width(w), height(h) {}

    /**
     * @brief Box spanning two arbitrary corners
     */
    static BoundingBox from_corners(const glm::dvec2& a, const glm::dvec2& b);

    glm::dvec2 max() const {
        return glm::dvec2(min.x + width, min.y + height);
    }

    /**
     * @brief Grow the box to include a point
     */
    void expand(const glm::dvec2& point);

    /**
     * @brief Grow the box to include another box
     */
    void merge(const BoundingBox& other);

    bool is_empty() const {
        return width <= 0.0 && height <= 0.0;
    }
};

/**
 * @brief One pad of a footprint
 */
struct PadInfo {
    std::string number;              ///< Pad number/name inside its footprint
    glm::dvec2 position{0.0, 0.0};   ///< Absolute board position (mm)
    LayerSet layers;                 ///< Layers the pad occupies
    PadType type{PadType::Smd};      ///< Pad attribute
    std::string net_name;            ///< Net name, used for log output only

    bool is_on_layer(Layer layer) const {
        return layers.contains(layer);
    }
};

/**
 * @brief One placed footprint with its pads
 */
struct FootprintInfo {
    std::string reference;             ///< Reference designator (e.g. "J1")
    BoardSide side{BoardSide::Front};  ///< Placement side of the component body
    BoundingBox bounds;                ///< Footprint extent (mm)
    std::vector<PadInfo> pads;         ///< Pads in file order
};

/**
 * @brief Read-only view of one board design
 *
 * Implementations must return the same data on every call; the pipeline
 * may query more than once per run.
 */
class IBoardSnapshot {
  public:
    virtual ~IBoardSnapshot() = default;

    /**
     * @brief Bounding boxes of every board-level drawing on the outline layer
     * @return One box per primitive, in file order
     */
    virtual std::vector<BoundingBox> outline_bounds() const = 0;

    /**
     * @brief All footprints on the board, in file order
     */
    virtual std::vector<FootprintInfo> footprints() const = 0;

    /**
     * @brief Revision string from the title block (may be empty)
     */
    virtual std::string title_revision() const = 0;

    /**
     * @brief Project name used to derive output file names
     */
    virtual std::string name() const = 0;
};

} // namespace openfixture
