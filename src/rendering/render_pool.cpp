// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "render_pool.h"

#include "turboplot_assert.h"

#include <spdlog/spdlog.h>

namespace turboplot {

RenderPool::RenderPool(std::shared_ptr<SharedTiling> tiling, TraceSet traces)
    : tiling_(std::move(tiling)), traces_(std::move(traces)) {
    TURBOPLOT_ASSERT(tiling_ != nullptr, "RenderPool needs a tile cache");
}

RenderPool::~RenderPool() {
    shutdown();
}

void RenderPool::add_worker(std::unique_ptr<TraceRenderer> renderer) {
    TURBOPLOT_ASSERT(!running_, "workers must be added before start()");
    workers_.push_back(std::make_unique<TilingRenderer>(tiling_, traces_, std::move(renderer)));
}

void RenderPool::start() {
    if (running_) {
        spdlog::warn("[RenderPool] start() called twice, ignoring");
        return;
    }
    TURBOPLOT_ASSERT(!workers_.empty(), "RenderPool started without workers");

    threads_.reserve(workers_.size());
    for (auto& worker : workers_) {
        TilingRenderer* w = worker.get();
        spdlog::debug("[RenderPool] Worker {}: {} backend", threads_.size(), w->renderer().name());
        threads_.emplace_back([w]() { w->render_loop(); });
    }
    running_ = true;
    spdlog::info("[RenderPool] Started {} worker(s)", workers_.size());
}

void RenderPool::shutdown() {
    if (!running_) {
        return;
    }
    tiling_->close();
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
    running_ = false;

    RenderPoolStats s = stats();
    spdlog::info("[RenderPool] Stopped, {} tiles rendered by {} worker(s)", s.tiles_rendered,
                 s.workers);
}

RenderPoolStats RenderPool::stats() const {
    RenderPoolStats s;
    s.workers = workers_.size();
    s.tiles_per_worker.reserve(workers_.size());
    s.backends.reserve(workers_.size());
    for (const auto& worker : workers_) {
        uint64_t n = worker->tiles_rendered();
        s.tiles_per_worker.push_back(n);
        s.tiles_rendered += n;
        s.backends.emplace_back(worker->renderer().name());
    }
    return s;
}

} // namespace turboplot
