// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "trace_camera.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace turboplot {

namespace {

Fixed half_extent(float extent, float pixel_ratio) {
    return Fixed::from_double(static_cast<double>(extent) * pixel_ratio / 2.0);
}

} // namespace

TraceCamera::TraceCamera()
    : scale_{Fixed::from_int(1000), Fixed::from_int(1)}, shift_{Fixed{}, Fixed{}},
      min_scale_x_(Fixed::from_int(1)), max_scale_x_(Fixed::from_int(int64_t{1} << 32)) {}

// ============================================================================
// TRANSFORMS
// ============================================================================

// Every step rounds to nearest so that screen -> world -> screen stays within
// one raw unit for scale.x >= 1 and pixel ratios >= 1, including ratios such
// as 1.25 that are not powers of two.

Fixed TraceCamera::world_to_screen_x(const Viewport& viewport, float pixel_ratio,
                                     Fixed world_x) const {
    Fixed physical =
        half_extent(viewport.width, pixel_ratio) + div_nearest(world_x - shift_.x, scale_.x);
    return div_nearest(physical, Fixed::from_double(pixel_ratio));
}

Fixed TraceCamera::screen_to_world_x(const Viewport& viewport, float pixel_ratio,
                                     Fixed screen_x) const {
    Fixed physical = mul_nearest(screen_x, Fixed::from_double(pixel_ratio));
    return mul_nearest(physical - half_extent(viewport.width, pixel_ratio), scale_.x) + shift_.x;
}

Fixed TraceCamera::world_to_screen_y(const Viewport& viewport, float pixel_ratio,
                                     Fixed amplitude) const {
    Fixed physical =
        half_extent(viewport.height, pixel_ratio) + mul_nearest(amplitude + shift_.y, scale_.y);
    return div_nearest(physical, Fixed::from_double(pixel_ratio));
}

Fixed TraceCamera::screen_to_world_y(const Viewport& viewport, float pixel_ratio,
                                     Fixed screen_y) const {
    Fixed physical = mul_nearest(screen_y, Fixed::from_double(pixel_ratio));
    return div_nearest(physical - half_extent(viewport.height, pixel_ratio), scale_.y) - shift_.y;
}

// ============================================================================
// CONTROLS
// ============================================================================

void TraceCamera::zoom_x(double factor, float anchor_x, const Viewport& viewport,
                         float pixel_ratio) {
    Fixed s1 = scale_.x;
    Fixed s2 = (s1 * Fixed::from_double(factor)).clamp(min_scale_x_, max_scale_x_);
    Fixed k =
        Fixed::from_double((static_cast<double>(anchor_x) - viewport.width / 2.0) * pixel_ratio);
    // Keep the sample under the anchor at the same screen position
    shift_.x = s1 * k + shift_.x - s2 * k;
    scale_.x = s2;

    spdlog::trace("[TraceCamera] zoom_x: scale {:.3f} -> {:.3f}, shift={:.1f}", s1.to_double(),
                  s2.to_double(), shift_.x.to_double());
}

void TraceCamera::zoom_y(double factor) {
    scale_.y = std::max(scale_.y * Fixed::from_double(factor), Fixed::from_raw(kMinScaleYRaw));
}

void TraceCamera::pan_x(float screen_dx, float pixel_ratio) {
    shift_.x -= Fixed::from_double(static_cast<double>(screen_dx) * pixel_ratio) * scale_.x;
}

void TraceCamera::pan_y(float screen_dy, float pixel_ratio) {
    shift_.y += Fixed::from_double(static_cast<double>(screen_dy) * pixel_ratio) / scale_.y;
}

void TraceCamera::fit(size_t trace_length, float min_value, float max_value,
                      const Viewport& viewport, float pixel_ratio) {
    const double width_px = static_cast<double>(viewport.width) * pixel_ratio;
    const double height_px = static_cast<double>(viewport.height) * pixel_ratio;
    const Fixed length = Fixed::from_int(static_cast<int64_t>(trace_length));

    if (width_px >= 1.0) {
        scale_.x = (length / Fixed::from_double(width_px)).clamp(min_scale_x_, max_scale_x_);
    }
    shift_.x = length / Fixed::from_int(2);

    const double range = static_cast<double>(max_value) - static_cast<double>(min_value);
    if (range > 0.0 && height_px >= 1.0) {
        scale_.y = std::max(Fixed::from_double(height_px * 0.75 / range),
                            Fixed::from_raw(kMinScaleYRaw));
    } else {
        scale_.y = Fixed::from_int(1);
    }
    shift_.y = -Fixed::from_double((static_cast<double>(min_value) + max_value) / 2.0);

    spdlog::debug("[TraceCamera] Fit {} samples: scale=({:.3f}, {:.3f}), shift=({:.1f}, {:.3f})",
                  trace_length, scale_.x.to_double(), scale_.y.to_double(), shift_.x.to_double(),
                  shift_.y.to_double());
}

// ============================================================================
// STATE
// ============================================================================

void TraceCamera::set_scale(FixedVec2 scale) {
    scale_.x = scale.x.clamp(min_scale_x_, max_scale_x_);
    scale_.y = std::max(scale.y, Fixed::from_raw(kMinScaleYRaw));
}

void TraceCamera::set_scale_x_range(Fixed min_scale, Fixed max_scale) {
    if (max_scale < min_scale) {
        spdlog::warn("[TraceCamera] Inverted scale range ({:.3f} > {:.3f}), swapping",
                     min_scale.to_double(), max_scale.to_double());
        std::swap(min_scale, max_scale);
    }
    min_scale_x_ = min_scale;
    max_scale_x_ = max_scale;
    scale_.x = scale_.x.clamp(min_scale_x_, max_scale_x_);
}

} // namespace turboplot
