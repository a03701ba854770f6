// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "trace_view.h"

#include "turboplot_assert.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace turboplot {

Fixed max_tile_scale_x(uint32_t tile_width) {
    TURBOPLOT_ASSERT(tile_width > 0, "tile width must be positive");
    const uint64_t w = tile_width;
    // A tile slice holds at most chunk + 1 samples, and GPU column math
    // multiplies sample positions by the tile width in 32 bits
    const uint64_t by_capacity = (kRendererMaxTraceSize - 1) / w;
    const uint64_t by_column_math = (UINT32_MAX / w - 1) / w;
    return Fixed::from_int(static_cast<int64_t>(std::max<uint64_t>(
        std::min(by_capacity, by_column_math), 1)));
}

TraceView::TraceView(uint32_t owner_id, std::shared_ptr<SharedTiling> tiling,
                     std::shared_ptr<const Trace> trace, uint32_t tile_width)
    : owner_id_(owner_id), tiling_(std::move(tiling)), trace_(std::move(trace)),
      tile_width_(tile_width) {
    TURBOPLOT_ASSERT(tiling_ != nullptr, "TraceView needs a tile cache");
    TURBOPLOT_ASSERT(trace_ != nullptr, "TraceView needs a trace");
    TURBOPLOT_ASSERT(tile_width_ > 0 && tile_width_ <= kRendererMaxPixels,
                     "invalid tile width {}", tile_width_);

    camera_.set_scale_x_range(Fixed::from_int(1), max_tile_scale_x(tile_width_));

    bool first = true;
    for (float v : *trace_) {
        if (std::isnan(v)) {
            continue;
        }
        if (first) {
            min_value_ = max_value_ = v;
            first = false;
        } else {
            min_value_ = std::min(min_value_, v);
            max_value_ = std::max(max_value_, v);
        }
    }

    spdlog::debug("[TraceView] Owner {}: {} samples, range [{}, {}], tile width {}", owner_id_,
                  trace_->size(), min_value_, max_value_, tile_width_);
}

// ============================================================================
// TILE REQUESTS
// ============================================================================

std::vector<TileProperties> TraceView::compute_viewport_tiles(const Viewport& viewport,
                                                              float pixel_ratio) const {
    std::vector<TileProperties> result;
    const double width_px = static_cast<double>(viewport.width) * pixel_ratio;
    const double height_px = static_cast<double>(viewport.height) * pixel_ratio;
    if (width_px < 1.0 || height_px < 1.0) {
        return result;
    }

    const Fixed half_width = Fixed::from_double(width_px / 2.0);
    const Fixed tile_width = Fixed::from_int(tile_width_);
    const Fixed dx = camera_.shift().x / camera_.scale().x;

    constexpr int64_t kMinIndex = std::numeric_limits<int32_t>::min();
    constexpr int64_t kMaxIndex = std::numeric_limits<int32_t>::max();
    const int64_t start = std::max(((dx - half_width) / tile_width).floor_to_int(), kMinIndex);
    const int64_t end = std::min(((dx + half_width) / tile_width).ceil_to_int(), kMaxIndex);
    if (end <= start) {
        return result;
    }

    const uint32_t max_height = static_cast<uint32_t>(kRendererMaxPixels / tile_width_);
    const uint32_t height =
        std::max<uint32_t>(1, std::min(static_cast<uint32_t>(height_px), max_height));

    std::vector<int64_t> indexes;
    indexes.reserve(static_cast<size_t>(end - start));
    for (int64_t i = start; i < end; ++i) {
        indexes.push_back(i);
    }
    const int64_t mid = (start + end) / 2;
    std::stable_sort(indexes.begin(), indexes.end(), [mid](int64_t a, int64_t b) {
        return std::llabs(a - mid) < std::llabs(b - mid);
    });

    result.reserve(indexes.size());
    for (int64_t i : indexes) {
        TileProperties p;
        p.owner_id = owner_id_;
        p.scale = camera_.scale();
        p.offset = camera_.shift().y;
        p.index = static_cast<int32_t>(i);
        p.size = TileSize(tile_width_, height);
        result.push_back(p);
    }
    return result;
}

bool TraceView::request_tiles(const Viewport& viewport, float pixel_ratio) {
    const std::vector<TileProperties> required = compute_viewport_tiles(viewport, pixel_ratio);
    const FixedVec2 scale = camera_.scale();
    const Fixed offset = camera_.shift().y;
    const uint32_t owner = owner_id_;
    const size_t max_generations = max_generations_;

    size_t removed = 0;
    bool complete = tiling_->with_lock([&](Tiling& tiling) {
        bool all_rendered = true;
        for (const auto& p : required) {
            std::optional<Tile> tile = tiling.get(p, true);
            all_rendered = all_rendered && tile && tile->status == TileStatus::Rendered;
        }

        if (all_rendered) {
            // Previews are no longer needed; other owners' tiles stay
            removed = tiling.retain([&](const Tile& t) {
                const TileProperties& tp = t.properties;
                return tp.owner_id != owner || (tp.scale == scale && tp.offset == offset);
            });
        } else {
            removed = tiling.limit_generations(owner, scale, offset, max_generations);
        }
        return all_rendered;
    });

    if (!complete) {
        tiling_->notify_workers();
    } else if (removed > 0) {
        spdlog::debug("[TraceView] Owner {}: view complete, evicted {} preview tiles", owner_id_,
                      removed);
    }
    return complete;
}

std::vector<Tile> TraceView::rendered_tiles() const {
    const uint32_t owner = owner_id_;
    return tiling_->with_lock([owner](Tiling& tiling) {
        std::vector<Tile> out;
        for (const Tile& t : tiling.tiles()) {
            if (t.properties.owner_id == owner && t.is_rendered()) {
                out.push_back(t);
            }
        }
        return out;
    });
}

// ============================================================================
// PLACEMENT
// ============================================================================

ScreenRect TraceView::place_tile(const TileProperties& properties, const Viewport& viewport,
                                 float pixel_ratio) const {
    const int64_t w = properties.size.w;
    const int64_t h = properties.size.h;

    // Horizontal: the tile's sample span under the current camera
    const Fixed left = properties.scale.x * (int64_t{properties.index} * w);
    const Fixed right = properties.scale.x * ((int64_t{properties.index} + 1) * w);

    // Vertical: invert row = h / 2 + (amplitude + offset) * scale.y at rows 0 and h
    const int64_t half = h / 2;
    const Fixed bottom = Fixed::from_int(-half) / properties.scale.y - properties.offset;
    const Fixed top = Fixed::from_int(h - half) / properties.scale.y - properties.offset;

    ScreenRect rect;
    rect.x0 = camera_.world_to_screen_x(viewport, pixel_ratio, left).to_float();
    rect.x1 = camera_.world_to_screen_x(viewport, pixel_ratio, right).to_float();
    rect.y0 = camera_.world_to_screen_y(viewport, pixel_ratio, bottom).to_float();
    rect.y1 = camera_.world_to_screen_y(viewport, pixel_ratio, top).to_float();
    return rect;
}

void TraceView::autoscale(const Viewport& viewport, float pixel_ratio) {
    camera_.fit(trace_->size(), min_value_, max_value_, viewport, pixel_ratio);
}

DensityImage TraceView::tile_image(const Tile& tile) const {
    return generate_image(tile, tile.properties.scale.x, color_scale_);
}

void TraceView::set_max_generations(size_t max_generations) {
    if (max_generations < 1) {
        spdlog::warn("[TraceView] max_generations must be at least 1, using 1");
        max_generations = 1;
    }
    max_generations_ = max_generations;
}

} // namespace turboplot
