// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "color_scale.h"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace turboplot {

namespace {

uint32_t channel(uint32_t rgb, int shift) {
    return (rgb >> shift) & 0xFF;
}

uint32_t to_byte(float v) {
    return static_cast<uint32_t>(std::lround(std::min(std::max(v, 0.0f), 1.0f) * 255.0f));
}

uint32_t lerp_rgb(uint32_t a, uint32_t b, float t) {
    uint32_t out = 0;
    for (int shift : {16, 8, 0}) {
        float ca = static_cast<float>(channel(a, shift));
        float cb = static_cast<float>(channel(b, shift));
        uint32_t c = static_cast<uint32_t>(std::lround(ca + (cb - ca) * t));
        out |= std::min<uint32_t>(c, 255) << shift;
    }
    return out;
}

} // namespace

float density_intensity(uint32_t density, float scale_x, const ColorScale& color_scale) {
    if (density == 0 || !(scale_x > 0.0f)) {
        return 0.0f;
    }
    float a = std::pow(static_cast<float>(density), color_scale.power) * color_scale.opacity *
              0.005f * (1000.0f / scale_x);
    if (std::isnan(a)) {
        return 0.0f;
    }
    return std::min(std::max(a, 0.0f), 1.0f);
}

uint32_t density_color(uint32_t density, float scale_x, const ColorScale& color_scale) {
    if (density == 0) {
        return 0x00000000;
    }

    const float a = density_intensity(density, scale_x, color_scale);
    const Gradient& g = color_scale.gradient;
    switch (g.kind) {
    case GradientKind::SingleColor:
        return (to_byte(g.minimum + a) << 24) | (g.end & 0xFFFFFF);
    case GradientKind::BiColor:
        return 0xFF000000 | lerp_rgb(g.start, g.end, a);
    case GradientKind::Rainbow:
        return 0xFF000000 | hsv_to_rgb(240.0f * (1.0f - a), 1.0f, 1.0f);
    }
    return 0x00000000;
}

DensityImage generate_image(const DensityGrid& grid, Fixed scale_x,
                            const ColorScale& color_scale) {
    DensityImage image;
    image.width = grid.width;
    image.height = grid.height;
    image.pixels.assign(size_t{grid.width} * grid.height, 0);

    const float sx = scale_x.to_float();
    for (uint32_t x = 0; x < grid.width; ++x) {
        for (uint32_t y = 0; y < grid.height; ++y) {
            image.pixels[size_t{y} * grid.width + x] = density_color(grid.at(x, y), sx, color_scale);
        }
    }
    return image;
}

DensityImage generate_image(const Tile& tile, Fixed scale_x, const ColorScale& color_scale) {
    if (!tile.is_rendered()) {
        return DensityImage{};
    }
    return generate_image(*tile.data, scale_x, color_scale);
}

uint32_t hsv_to_rgb(float h, float s, float v) {
    h = std::fmod(h, 360.0f);
    if (h < 0.0f) {
        h += 360.0f;
    }
    const float c = v * s;
    const float x = c * (1.0f - std::fabs(std::fmod(h / 60.0f, 2.0f) - 1.0f));
    const float m = v - c;

    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    if (h < 60.0f) {
        r = c;
        g = x;
    } else if (h < 120.0f) {
        r = x;
        g = c;
    } else if (h < 180.0f) {
        g = c;
        b = x;
    } else if (h < 240.0f) {
        g = x;
        b = c;
    } else if (h < 300.0f) {
        r = x;
        b = c;
    } else {
        r = c;
        b = x;
    }
    return (to_byte(r + m) << 16) | (to_byte(g + m) << 8) | to_byte(b + m);
}

std::optional<uint32_t> parse_hex_color(const std::string& hex_str) {
    if (hex_str.empty()) {
        return std::nullopt;
    }

    std::string hex = hex_str;
    if (hex[0] == '#') {
        hex = hex.substr(1);
    }

    if (hex.length() != 6 ||
        !std::all_of(hex.begin(), hex.end(), [](unsigned char c) { return std::isxdigit(c); })) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(std::stoul(hex, nullptr, 16));
}

std::string format_hex_color(uint32_t rgb) {
    return fmt::format("#{:06X}", rgb & 0xFFFFFF);
}

std::optional<GradientKind> parse_gradient_kind(const std::string& str) {
    if (str == "single" || str == "single_color") {
        return GradientKind::SingleColor;
    }
    if (str == "bicolor") {
        return GradientKind::BiColor;
    }
    if (str == "rainbow") {
        return GradientKind::Rainbow;
    }
    return std::nullopt;
}

const char* gradient_kind_name(GradientKind kind) {
    switch (kind) {
    case GradientKind::SingleColor:
        return "single";
    case GradientKind::BiColor:
        return "bicolor";
    case GradientKind::Rainbow:
        return "rainbow";
    }
    return "unknown";
}

} // namespace turboplot
