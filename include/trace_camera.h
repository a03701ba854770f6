// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "fixed_point.h"

#include <cstdint>

/**
 * @file trace_camera.h
 * @brief View transform between trace space and screen space
 *
 * Coordinate System:
 * - World space: X = sample index, Y = sample amplitude
 * - Screen space: logical points, origin at the viewport's top-left corner
 * - Physical pixels: logical points multiplied by the device pixel ratio
 *
 * The X axis divides by the scale (samples per pixel column), the Y axis
 * multiplies (vertical zoom behaves like a gain).
 *
 * Usage pattern:
 * @code
 *   TraceCamera camera;
 *   camera.set_scale_x_range(Fixed::from_int(1), max_tile_scale_x(64));
 *   camera.fit(trace.size(), min, max, viewport, 1.0f);
 *   camera.zoom_x(1.5, mouse_x, viewport, 1.0f);
 *   Fixed sample = camera.screen_to_world_x(viewport, 1.0f, mouse_x);
 * @endcode
 */

namespace turboplot {

/**
 * @brief Size of the drawing area in logical points
 */
struct Viewport {
    float width = 0.0f;
    float height = 0.0f;
};

class TraceCamera {
  public:
    /// Smallest vertical gain reachable with zoom_y()
    static constexpr int64_t kMinScaleYRaw = Fixed::kOne / 1000;

    TraceCamera();

    // ==============================================
    // Transforms
    // ==============================================

    /**
     * @brief Map a sample index to a horizontal screen coordinate
     * @param viewport Drawing area (logical points)
     * @param pixel_ratio Physical pixels per logical point
     * @param world_x Sample index
     * @return Screen X in logical points
     */
    Fixed world_to_screen_x(const Viewport& viewport, float pixel_ratio, Fixed world_x) const;

    /**
     * @brief Exact inverse of world_to_screen_x() up to one fixed-point unit
     */
    Fixed screen_to_world_x(const Viewport& viewport, float pixel_ratio, Fixed screen_x) const;

    /**
     * @brief Map an amplitude to a vertical screen coordinate
     *
     * screen_y = height / 2 + (amplitude + shift.y) * scale.y, matching the row
     * formula used by the density renderers.
     */
    Fixed world_to_screen_y(const Viewport& viewport, float pixel_ratio, Fixed amplitude) const;

    Fixed screen_to_world_y(const Viewport& viewport, float pixel_ratio, Fixed screen_y) const;

    // ==============================================
    // Camera Controls
    // ==============================================

    /**
     * @brief Horizontal zoom around a screen anchor
     * @param factor Multiplier applied to scale.x (>1 zooms out)
     * @param anchor_x Screen X (logical points) whose sample stays under the cursor
     *
     * The resulting scale is clamped to the configured range.
     */
    void zoom_x(double factor, float anchor_x, const Viewport& viewport, float pixel_ratio);

    /// Vertical gain change, clamped to kMinScaleYRaw
    void zoom_y(double factor);

    /// Drag horizontally by a screen delta (logical points)
    void pan_x(float screen_dx, float pixel_ratio);

    /// Drag vertically by a screen delta (logical points)
    void pan_y(float screen_dy, float pixel_ratio);

    /**
     * @brief Fit a whole trace in the viewport
     *
     * The trace spans the full width and its amplitude range covers 75% of
     * the height, centred on the midpoint of min and max.
     */
    void fit(size_t trace_length, float min_value, float max_value, const Viewport& viewport,
             float pixel_ratio);

    // ==============================================
    // State
    // ==============================================

    FixedVec2 scale() const {
        return scale_;
    }

    FixedVec2 shift() const {
        return shift_;
    }

    /// Sets scale, clamping X to the configured range and Y to the minimum gain
    void set_scale(FixedVec2 scale);

    void set_shift(FixedVec2 shift) {
        shift_ = shift;
    }

    /**
     * @brief Bounds for scale.x
     *
     * The upper bound comes from renderer capacity: a tile must never need
     * more samples than a backend accepts in one call.
     */
    void set_scale_x_range(Fixed min_scale, Fixed max_scale);

    Fixed min_scale_x() const {
        return min_scale_x_;
    }

    Fixed max_scale_x() const {
        return max_scale_x_;
    }

    bool operator==(const TraceCamera& other) const {
        return scale_ == other.scale_ && shift_ == other.shift_;
    }
    bool operator!=(const TraceCamera& other) const {
        return !(*this == other);
    }

  private:
    FixedVec2 scale_;
    FixedVec2 shift_;
    Fixed min_scale_x_;
    Fixed max_scale_x_;
};

} // namespace turboplot
