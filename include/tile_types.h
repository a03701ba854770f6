// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "fixed_point.h"

#include <cstdint>
#include <memory>
#include <vector>

/**
 * @file tile_types.h
 * @brief Tile identity, status and density data
 *
 * A tile is a fixed-width vertical strip of the rendered view. Its identity
 * is the full set of view parameters it was rendered with; a view change
 * produces new tiles instead of mutating old ones.
 */

namespace turboplot {

/**
 * @brief Width and height of a tile in physical pixels
 */
struct TileSize {
    uint32_t w = 0;
    uint32_t h = 0;

    TileSize() = default;
    TileSize(uint32_t width, uint32_t height) : w(width), h(height) {}

    /// Width multiplied by height. Fails fast on overflow.
    uint32_t area() const;

    bool operator==(const TileSize& other) const {
        return w == other.w && h == other.h;
    }
    bool operator!=(const TileSize& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Uniquely identifies a renderable tile
 *
 * If any field changes, the rendered density changes as well.
 */
struct TileProperties {
    /// Owner (trace/view) identifier, so several traces can share one cache
    uint32_t owner_id = 0;
    /// Rendering scale. X: samples per pixel column. Y: amplitude gain.
    FixedVec2 scale;
    /// Vertical offset added to samples before scaling
    Fixed offset;
    /// Tile column index; tile i starts at sample floor(i * w * scale.x)
    int32_t index = 0;
    TileSize size;

    bool operator==(const TileProperties& other) const {
        return owner_id == other.owner_id && scale == other.scale && offset == other.offset &&
               index == other.index && size == other.size;
    }
    bool operator!=(const TileProperties& other) const {
        return !(*this == other);
    }
};

enum class TileStatus {
    NotRendered, ///< Requested, waiting for a worker
    Rendering,   ///< Taken by a worker
    Rendered     ///< Density data is complete
};

const char* tile_status_name(TileStatus status);

/**
 * @brief Per-pixel hit counts, column-major (one contiguous column per pixel X)
 */
struct DensityGrid {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint32_t> counts;

    DensityGrid() = default;
    DensityGrid(uint32_t w, uint32_t h) : width(w), height(h), counts(size_t{w} * h, 0) {}

    uint32_t at(uint32_t x, uint32_t y) const {
        return counts[size_t{x} * height + y];
    }

    uint32_t& at(uint32_t x, uint32_t y) {
        return counts[size_t{x} * height + y];
    }

    /// True when every count is zero
    bool is_blank() const;

    /// Sum of all counts
    uint64_t total() const;
};

/**
 * @brief Cache entry
 *
 * Copies share the immutable density grid, so handing tiles out by value is
 * cheap and never exposes references into the cache.
 */
struct Tile {
    TileStatus status = TileStatus::NotRendered;
    TileProperties properties;
    /// Non-null only when status == Rendered
    std::shared_ptr<const DensityGrid> data;

    Tile() = default;
    explicit Tile(const TileProperties& props) : properties(props) {}

    bool is_rendered() const {
        return status == TileStatus::Rendered && data != nullptr;
    }
};

} // namespace turboplot

namespace std {

template <> struct hash<turboplot::TileProperties> {
    size_t operator()(const turboplot::TileProperties& p) const noexcept {
        size_t seed = std::hash<uint32_t>{}(p.owner_id);
        turboplot::hash_combine(seed, std::hash<turboplot::FixedVec2>{}(p.scale));
        turboplot::hash_combine(seed, std::hash<turboplot::Fixed>{}(p.offset));
        turboplot::hash_combine(seed, std::hash<int32_t>{}(p.index));
        turboplot::hash_combine(seed, (size_t{p.size.w} << 32) | p.size.h);
        return seed;
    }
};

} // namespace std
