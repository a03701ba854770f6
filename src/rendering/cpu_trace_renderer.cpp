// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cpu_trace_renderer.h"

#include "turboplot_assert.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace turboplot {

int32_t density_row(float sample, float vertical_offset, float vertical_scale, uint32_t height) {
    const float limit = static_cast<float>(height) + 1.0f;
    float fy = (sample + vertical_offset) * vertical_scale;
    fy = std::min(std::max(fy, -limit), limit);
    // Truncation toward zero, as the shader's int() conversion
    return static_cast<int32_t>(height / 2) + static_cast<int32_t>(fy);
}

DensityGrid CpuTraceRenderer::render(uint32_t chunk_samples, const float* samples, size_t count,
                                     uint32_t width, uint32_t height, float vertical_offset,
                                     float vertical_scale) {
    TURBOPLOT_ASSERT(width > 0 && height > 0, "empty grid requested ({}x{})", width, height);
    TURBOPLOT_ASSERT(chunk_samples > 0, "chunk_samples must be positive");

    DensityGrid result(width, height);
    if (count < 2 || samples == nullptr) {
        return result;
    }

    const int32_t max_row = static_cast<int32_t>(height) - 1;
    for (size_t i = 0; i + 1 < count; ++i) {
        const float p0 = samples[i];
        const float p1 = samples[i + 1];
        if (std::isnan(p0) || std::isnan(p1)) {
            continue;
        }

        const uint64_t column = (uint64_t{i} * width) / chunk_samples;
        const uint32_t x = static_cast<uint32_t>(std::min<uint64_t>(column, width - 1));

        const int32_t y0 = density_row(p0, vertical_offset, vertical_scale, height);
        const int32_t y1 = density_row(p1, vertical_offset, vertical_scale, height);
        const int32_t lo = std::max(std::min(y0, y1), 0);
        const int32_t hi = std::min(std::max(y0, y1), max_row);

        uint32_t* col = result.counts.data() + size_t{x} * height;
        for (int32_t y = lo; y <= hi; ++y) {
            ++col[y];
        }
    }

    spdlog::trace("[CpuTraceRenderer] Rendered {} samples into {}x{} (chunk {})", count, width,
                  height, chunk_samples);
    return result;
}

} // namespace turboplot
