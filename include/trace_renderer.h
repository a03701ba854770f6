// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tile_types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace turboplot {

/// Maximum number of float samples a backend accepts in one render call
constexpr size_t kRendererMaxTraceSize = size_t{8} * 1024 * 1024 * 4;

/// Maximum number of density cells a backend produces in one render call
constexpr size_t kRendererMaxPixels = 524288;

/**
 * @brief Abstract interface for density rasterizers
 *
 * Every consecutive sample pair (i, i+1) lands in pixel column
 * min(i * width / chunk_samples, width - 1). Each sample maps to row
 * height / 2 + floor((sample + vertical_offset) * vertical_scale), and every
 * row between the two rows (inclusive) gets one hit. Rows outside the grid
 * are clipped and pairs containing NaN are skipped.
 *
 * chunk_samples is the sample count the tile would cover if the trace did not
 * end inside it. Columns are computed against it rather than against count so
 * the final, truncated tile lines up with its neighbours.
 *
 * Implementations must agree exactly for identical inputs.
 * Implementations: CpuTraceRenderer (direct loop), GpuTraceRenderer (EGL/GLES compute)
 */
class TraceRenderer {
  public:
    virtual ~TraceRenderer() = default;

    /**
     * @brief Rasterize a trace slice into a density grid
     * @param chunk_samples Samples the full tile spans (column reference)
     * @param samples First sample of the slice
     * @param count Number of samples in the slice (<= chunk_samples + 1)
     * @param width Grid width in pixels
     * @param height Grid height in pixels
     * @param vertical_offset Added to every sample before scaling
     * @param vertical_scale Rows per amplitude unit
     * @return Column-major grid of width * height counts
     */
    virtual DensityGrid render(uint32_t chunk_samples, const float* samples, size_t count,
                               uint32_t width, uint32_t height, float vertical_offset,
                               float vertical_scale) = 0;

    /// Backend name for logs ("cpu", "gpu")
    virtual const char* name() const = 0;

    /// Largest sample count accepted by render()
    virtual size_t max_samples() const {
        return kRendererMaxTraceSize;
    }

    /// Largest width * height accepted by render()
    virtual size_t max_pixels() const {
        return kRendererMaxPixels;
    }

    /**
     * @brief Called by a worker thread before it exits
     *
     * Backends with thread-bound device state (a current GL context) release
     * it here so the object can be destroyed from another thread.
     */
    virtual void release_thread() {}
};

enum class RendererBackend {
    Cpu,
    Gpu
};

/**
 * @brief Fatal backend initialization failure
 *
 * Thrown when no compute-capable device is available. This is a startup
 * condition, never a per-tile error.
 */
class RendererInitError : public std::runtime_error {
  public:
    explicit RendererInitError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Create a renderer for a backend
 * @throws RendererInitError if the backend cannot be initialized
 */
std::unique_ptr<TraceRenderer> create_trace_renderer(RendererBackend backend);

/// Parse "cpu" / "gpu"; nullopt for anything else
std::optional<RendererBackend> parse_renderer_backend(const std::string& str);

const char* renderer_backend_name(RendererBackend backend);

} // namespace turboplot
