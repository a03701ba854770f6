// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trace_renderer.h"

namespace turboplot {

/**
 * @brief Reference rasterizer: one loop over sample pairs
 *
 * Stateless, so one instance may be used from any thread.
 */
class CpuTraceRenderer : public TraceRenderer {
  public:
    CpuTraceRenderer() = default;

    DensityGrid render(uint32_t chunk_samples, const float* samples, size_t count, uint32_t width,
                       uint32_t height, float vertical_offset, float vertical_scale) override;

    const char* name() const override {
        return "cpu";
    }
};

/**
 * @brief Row of one sample, as used by every backend
 *
 * Returns half_height + (sample + offset) * scale truncated toward zero.
 * The product is clamped to [-height - 1, height + 1] before the integer
 * conversion so far off-screen samples cannot overflow.
 */
int32_t density_row(float sample, float vertical_offset, float vertical_scale, uint32_t height);

} // namespace turboplot
