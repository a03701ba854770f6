// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tiling.h"
#include "trace_renderer.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

/**
 * @file tiling_renderer.h
 * @brief Worker that turns pending cache entries into density grids
 *
 * One TilingRenderer per worker thread. Each owns its backend, so device
 * state (a GL context) is only ever touched from that worker. Traces are
 * read-only and shared with the consumer.
 *
 * Usage:
 * @code
 *   auto tiling = std::make_shared<SharedTiling>();
 *   TilingRenderer worker(tiling, traces, create_trace_renderer(RendererBackend::Cpu));
 *   std::thread t([&] { worker.render_loop(); });
 *   // ... consumer requests tiles ...
 *   tiling->close();
 *   t.join();
 * @endcode
 */

namespace turboplot {

using Trace = std::vector<float>;

/// Traces indexed by TileProperties::owner_id
using TraceSet = std::vector<std::shared_ptr<const Trace>>;

/**
 * @brief Sample span covered by a tile
 */
struct SampleRange {
    int64_t start = 0;
    /// One past the last sample, before clamping to the trace length
    int64_t end = 0;
    /// Samples a full tile spans, the column reference passed to the renderer
    uint32_t chunk_samples = 0;
};

class TilingRenderer {
  public:
    TilingRenderer(std::shared_ptr<SharedTiling> tiling, TraceSet traces,
                   std::unique_ptr<TraceRenderer> renderer);
    ~TilingRenderer();

    TilingRenderer(const TilingRenderer&) = delete;
    TilingRenderer& operator=(const TilingRenderer&) = delete;

    /**
     * @brief Sample range of a tile
     *
     * start = floor(index * w * scale.x), end = floor((index + 1) * w * scale.x),
     * computed in fixed point so neighbouring tiles share their boundary.
     */
    static SampleRange sample_range(const TileProperties& properties);

    /**
     * @brief Render one tile without touching the cache
     *
     * Tiles starting before the trace or at/after its end, and tiles of
     * unknown owners, render as all-zero grids.
     */
    DensityGrid render_tile(const TileProperties& properties);

    /**
     * @brief Take one job, render it and write the result back
     * @return false if no job was available
     */
    bool render_next_tile();

    /**
     * @brief Worker thread body
     *
     * Sleeps until a job is available, renders it, repeats. Returns once the
     * cache is closed. A tile in progress at that point still completes.
     */
    void render_loop();

    /// Tiles this worker has written back
    uint64_t tiles_rendered() const {
        return tiles_rendered_.load(std::memory_order_relaxed);
    }

    const TraceRenderer& renderer() const {
        return *renderer_;
    }

  private:
    void write_back(const TileProperties& properties, DensityGrid grid);

    std::shared_ptr<SharedTiling> tiling_;
    TraceSet traces_;
    std::unique_ptr<TraceRenderer> renderer_;
    std::atomic<uint64_t> tiles_rendered_{0};
};

} // namespace turboplot
