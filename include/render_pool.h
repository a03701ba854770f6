// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tiling_renderer.h"

#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace turboplot {

/**
 * @brief Snapshot of pool activity
 */
struct RenderPoolStats {
    size_t workers = 0;
    uint64_t tiles_rendered = 0;
    /// Per-worker counts, in add_worker() order
    std::vector<uint64_t> tiles_per_worker;
    /// Backend name of each worker, same order
    std::vector<std::string> backends;
};

/**
 * @brief Owns the render workers and their threads
 *
 * Workers may mix backends. They all pull from the same SharedTiling, so the
 * pool scales by adding workers, not by partitioning tiles.
 *
 * Lifecycle: add_worker() any number of times, start(), then shutdown() (or
 * destruction). shutdown() closes the cache and joins every thread; tiles
 * already taken are finished first.
 */
class RenderPool {
  public:
    RenderPool(std::shared_ptr<SharedTiling> tiling, TraceSet traces);
    ~RenderPool();

    RenderPool(const RenderPool&) = delete;
    RenderPool& operator=(const RenderPool&) = delete;

    /**
     * @brief Add a worker using the given backend
     *
     * Must be called before start(). The renderer is constructed by the
     * caller, so a RendererInitError surfaces here, at startup.
     */
    void add_worker(std::unique_ptr<TraceRenderer> renderer);

    /// Launch one thread per worker
    void start();

    /// Close the cache and join all workers. Idempotent.
    void shutdown();

    bool is_running() const {
        return running_;
    }

    size_t worker_count() const {
        return workers_.size();
    }

    RenderPoolStats stats() const;

  private:
    std::shared_ptr<SharedTiling> tiling_;
    TraceSet traces_;
    std::vector<std::unique_ptr<TilingRenderer>> workers_;
    std::vector<std::thread> threads_;
    bool running_ = false;
};

} // namespace turboplot
