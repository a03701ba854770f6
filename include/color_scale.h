// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "fixed_point.h"
#include "tile_types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @file color_scale.h
 * @brief Density to colour mapping
 *
 * Colours are 0x00RRGGBB on input and ARGB8888 (0xAARRGGBB) in images.
 * Zero density is always fully transparent so the background shows through
 * where the trace never went.
 */

namespace turboplot {

enum class GradientKind {
    SingleColor, ///< One colour, intensity carried by alpha
    BiColor,     ///< Opaque blend from start to end colour
    Rainbow      ///< Opaque hue sweep from blue to red
};

struct Gradient {
    GradientKind kind = GradientKind::SingleColor;
    /// SingleColor: alpha floor added to every non-empty cell
    float minimum = 0.1f;
    /// BiColor: colour at zero intensity
    uint32_t start = 0x000000;
    /// SingleColor / BiColor: colour at full intensity
    uint32_t end = 0xFFFFFF;

    bool operator==(const Gradient& o) const {
        return kind == o.kind && minimum == o.minimum && start == o.start && end == o.end;
    }
    bool operator!=(const Gradient& o) const {
        return !(*this == o);
    }
};

struct ColorScale {
    /// Exponent applied to each density count
    float power = 1.0f;
    /// Intensity gain
    float opacity = 10.0f;
    Gradient gradient;

    bool operator==(const ColorScale& o) const {
        return power == o.power && opacity == o.opacity && gradient == o.gradient;
    }
    bool operator!=(const ColorScale& o) const {
        return !(*this == o);
    }
};

/**
 * @brief Row-major ARGB8888 pixels
 */
struct DensityImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint32_t> pixels;

    uint32_t at(uint32_t x, uint32_t y) const {
        return pixels[size_t{y} * width + x];
    }
};

/**
 * @brief Normalized intensity of one cell
 *
 * clamp(density^power * opacity * 0.005 * 1000 / scale_x, 0, 1). Dividing by
 * the horizontal scale keeps brightness stable across zoom levels, since a
 * pixel column gathers scale_x samples.
 */
float density_intensity(uint32_t density, float scale_x, const ColorScale& color_scale);

/// Colour of one cell. Density 0 maps to 0x00000000.
uint32_t density_color(uint32_t density, float scale_x, const ColorScale& color_scale);

/**
 * @brief Convert a column-major density grid into a row-major image
 * @param scale_x Samples per pixel column the grid was rendered with
 */
DensityImage generate_image(const DensityGrid& grid, Fixed scale_x,
                            const ColorScale& color_scale);

/// Same as above for a cache entry. Unrendered tiles give an empty image.
DensityImage generate_image(const Tile& tile, Fixed scale_x, const ColorScale& color_scale);

/// HSV (h in degrees, s and v in [0, 1]) to 0x00RRGGBB
uint32_t hsv_to_rgb(float h, float s, float v);

/**
 * @brief Parse "#RRGGBB" or "RRGGBB"
 * @return 0x00RRGGBB, or nullopt if malformed
 */
std::optional<uint32_t> parse_hex_color(const std::string& hex_str);

std::string format_hex_color(uint32_t rgb);

/// "single", "bicolor", "rainbow"
std::optional<GradientKind> parse_gradient_kind(const std::string& str);

const char* gradient_kind_name(GradientKind kind);

} // namespace turboplot
