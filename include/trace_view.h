// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "color_scale.h"
#include "tiling.h"
#include "tiling_renderer.h"
#include "trace_camera.h"

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

/**
 * @file trace_view.h
 * @brief Consumer side of the tile cache for one trace
 *
 * Each frame the view works out which tiles cover the screen under the
 * current camera, requests the missing ones, and paints whatever is
 * available. While the camera moves, tiles from earlier generations are
 * stretched into place as a preview; once every current tile is rendered the
 * previews are evicted.
 *
 * The view never waits for workers. All of one frame's requests happen in a
 * single lock scope.
 */

namespace turboplot {

/// Default tile width in physical pixels
constexpr uint32_t kDefaultTileWidth = 64;

/// Default number of (scale, offset) generations one view keeps cached
constexpr size_t kDefaultMaxGenerations = 4;

/**
 * @brief Largest scale.x for which a tile still fits in one render call
 */
Fixed max_tile_scale_x(uint32_t tile_width);

/**
 * @brief Axis-aligned rectangle in logical points
 */
struct ScreenRect {
    float x0 = 0.0f;
    float y0 = 0.0f;
    float x1 = 0.0f;
    float y1 = 0.0f;

    float width() const {
        return x1 - x0;
    }
    float height() const {
        return y1 - y0;
    }
};

class TraceView {
  public:
    /**
     * @param owner_id Identifier of this view's tiles in the shared cache;
     *        also the trace's index in the workers' TraceSet
     * @param tiling Cache shared with the workers
     * @param trace The trace this view displays
     * @param tile_width Tile width in physical pixels
     */
    TraceView(uint32_t owner_id, std::shared_ptr<SharedTiling> tiling,
              std::shared_ptr<const Trace> trace, uint32_t tile_width = kDefaultTileWidth);

    /**
     * @brief Tiles covering the viewport under the current camera
     *
     * Ordered by distance from the centre tile, so the middle of the screen
     * renders first. Height is the physical viewport height, reduced when
     * needed so one tile stays within kRendererMaxPixels.
     */
    std::vector<TileProperties> compute_viewport_tiles(const Viewport& viewport,
                                                       float pixel_ratio) const;

    /**
     * @brief Request this frame's tiles
     * @return true when every required tile is rendered
     *
     * On completion every tile of this view from another generation is
     * evicted. Otherwise old generations are capped and workers are woken.
     */
    bool request_tiles(const Viewport& viewport, float pixel_ratio);

    /// This view's rendered tiles, oldest request first (paint order)
    std::vector<Tile> rendered_tiles() const;

    /**
     * @brief Where a tile lands on screen under the current camera
     *
     * Tiles rendered with another scale or offset are stretched and moved
     * (a homothety per axis) so they line up with current ones.
     */
    ScreenRect place_tile(const TileProperties& properties, const Viewport& viewport,
                          float pixel_ratio) const;

    /// Fit the whole trace in the viewport
    void autoscale(const Viewport& viewport, float pixel_ratio);

    TraceCamera& camera() {
        return camera_;
    }
    const TraceCamera& camera() const {
        return camera_;
    }

    /// Smallest and largest non-NaN sample (0, 0 for an empty trace)
    std::pair<float, float> trace_min_max() const {
        return {min_value_, max_value_};
    }

    const ColorScale& color_scale() const {
        return color_scale_;
    }
    void set_color_scale(const ColorScale& color_scale) {
        color_scale_ = color_scale;
    }

    /// Image of a tile with this view's colour scale
    DensityImage tile_image(const Tile& tile) const;

    void set_max_generations(size_t max_generations);

    size_t max_generations() const {
        return max_generations_;
    }

    uint32_t owner_id() const {
        return owner_id_;
    }

    uint32_t tile_width() const {
        return tile_width_;
    }

    const std::shared_ptr<const Trace>& trace() const {
        return trace_;
    }

  private:
    uint32_t owner_id_;
    std::shared_ptr<SharedTiling> tiling_;
    std::shared_ptr<const Trace> trace_;
    uint32_t tile_width_;
    size_t max_generations_ = kDefaultMaxGenerations;

    TraceCamera camera_;
    ColorScale color_scale_;
    float min_value_ = 0.0f;
    float max_value_ = 0.0f;
};

} // namespace turboplot
