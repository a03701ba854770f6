// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tiling_renderer.h"

#include "turboplot_assert.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace turboplot {

TilingRenderer::TilingRenderer(std::shared_ptr<SharedTiling> tiling, TraceSet traces,
                               std::unique_ptr<TraceRenderer> renderer)
    : tiling_(std::move(tiling)), traces_(std::move(traces)), renderer_(std::move(renderer)) {
    TURBOPLOT_ASSERT(tiling_ != nullptr, "TilingRenderer needs a tile cache");
    TURBOPLOT_ASSERT(renderer_ != nullptr, "TilingRenderer needs a renderer");
    spdlog::debug("[TilingRenderer] Created with {} backend, {} trace(s)", renderer_->name(),
                  traces_.size());
}

TilingRenderer::~TilingRenderer() = default;

SampleRange TilingRenderer::sample_range(const TileProperties& properties) {
    const int64_t w = properties.size.w;
    SampleRange range;
    range.start = (properties.scale.x * (int64_t{properties.index} * w)).floor_to_int();
    range.end = (properties.scale.x * ((int64_t{properties.index} + 1) * w)).floor_to_int();
    const int64_t chunk = (properties.scale.x * w).floor_to_int();
    TURBOPLOT_ASSERT(chunk > 0 && chunk <= UINT32_MAX, "tile spans {} samples", chunk);
    range.chunk_samples = static_cast<uint32_t>(chunk);
    return range;
}

DensityGrid TilingRenderer::render_tile(const TileProperties& properties) {
    const TileSize size = properties.size;
    TURBOPLOT_ASSERT(size.w > 0 && size.h > 0, "empty tile size {}x{}", size.w, size.h);

    const Trace* trace = nullptr;
    if (properties.owner_id < traces_.size() && traces_[properties.owner_id]) {
        trace = traces_[properties.owner_id].get();
    } else {
        spdlog::debug("[TilingRenderer] No trace for owner {}, rendering blank tile",
                      properties.owner_id);
        return DensityGrid(size.w, size.h);
    }

    const SampleRange range = sample_range(properties);
    const int64_t trace_len = static_cast<int64_t>(trace->size());
    if (range.start < 0 || range.start >= trace_len) {
        spdlog::trace("[TilingRenderer] Tile {} outside trace [{}, {}), blank", properties.index,
                      range.start, range.end);
        return DensityGrid(size.w, size.h);
    }

    const int64_t end = std::min(range.end, trace_len);
    const size_t count = static_cast<size_t>(end - range.start);
    TURBOPLOT_ASSERT(count <= renderer_->max_samples(), "tile {} slices {} samples, {} accepts {}",
                     properties.index, count, renderer_->name(), renderer_->max_samples());
    TURBOPLOT_ASSERT(size.area() <= renderer_->max_pixels(), "tile {}x{} exceeds {} pixels of {}",
                     size.w, size.h, renderer_->max_pixels(), renderer_->name());
    return renderer_->render(range.chunk_samples, trace->data() + range.start, count, size.w,
                             size.h, properties.offset.to_float(), properties.scale.y.to_float());
}

void TilingRenderer::write_back(const TileProperties& properties, DensityGrid grid) {
    tiling_->complete(properties, std::make_shared<const DensityGrid>(std::move(grid)));
    tiles_rendered_.fetch_add(1, std::memory_order_relaxed);
}

bool TilingRenderer::render_next_tile() {
    auto job = tiling_->try_take_job();
    if (!job) {
        return false;
    }
    write_back(*job, render_tile(*job));
    return true;
}

void TilingRenderer::render_loop() {
    spdlog::debug("[TilingRenderer] Worker started ({})", renderer_->name());
    while (auto job = tiling_->wait_for_job()) {
        write_back(*job, render_tile(*job));
    }
    renderer_->release_thread();
    spdlog::debug("[TilingRenderer] Worker stopped after {} tiles ({})", tiles_rendered(),
                  renderer_->name());
}

} // namespace turboplot
