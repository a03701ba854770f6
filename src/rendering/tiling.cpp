// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tiling.h"

#include "turboplot_assert.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace turboplot {

// ============================================================================
// TILE TYPES
// ============================================================================

uint32_t TileSize::area() const {
    uint64_t a = uint64_t{w} * h;
    TURBOPLOT_ASSERT(a <= UINT32_MAX, "tile area overflow ({}x{})", w, h);
    return static_cast<uint32_t>(a);
}

const char* tile_status_name(TileStatus status) {
    switch (status) {
    case TileStatus::NotRendered:
        return "not-rendered";
    case TileStatus::Rendering:
        return "rendering";
    case TileStatus::Rendered:
        return "rendered";
    }
    return "unknown";
}

bool DensityGrid::is_blank() const {
    return std::all_of(counts.begin(), counts.end(), [](uint32_t c) { return c == 0; });
}

uint64_t DensityGrid::total() const {
    uint64_t sum = 0;
    for (uint32_t c : counts) {
        sum += c;
    }
    return sum;
}

// ============================================================================
// TILING
// ============================================================================

std::vector<Tile>::iterator Tiling::find(const TileProperties& properties) {
    return std::find_if(tiles_.begin(), tiles_.end(),
                        [&](const Tile& t) { return t.properties == properties; });
}

std::vector<Tile>::const_iterator Tiling::find(const TileProperties& properties) const {
    return std::find_if(tiles_.cbegin(), tiles_.cend(),
                        [&](const Tile& t) { return t.properties == properties; });
}

std::optional<Tile> Tiling::get(const TileProperties& properties, bool create_if_missing) {
    auto it = find(properties);
    if (it != tiles_.end()) {
        return *it;
    }
    if (!create_if_missing) {
        return std::nullopt;
    }
    tiles_.emplace_back(properties);
    spdlog::trace("[Tiling] Requested tile owner={} index={} ({} tiles)", properties.owner_id,
                  properties.index, tiles_.size());
    return tiles_.back();
}

bool Tiling::has_pending() const {
    return std::any_of(tiles_.begin(), tiles_.end(),
                       [](const Tile& t) { return t.status != TileStatus::Rendered; });
}

bool Tiling::has_jobs() const {
    return std::any_of(tiles_.begin(), tiles_.end(),
                       [](const Tile& t) { return t.status == TileStatus::NotRendered; });
}

size_t Tiling::pending_count() const {
    return static_cast<size_t>(
        std::count_if(tiles_.begin(), tiles_.end(),
                      [](const Tile& t) { return t.status != TileStatus::Rendered; }));
}

std::optional<TileProperties> Tiling::take_job() {
    auto it = std::find_if(tiles_.begin(), tiles_.end(),
                           [](const Tile& t) { return t.status == TileStatus::NotRendered; });
    if (it == tiles_.end()) {
        return std::nullopt;
    }
    it->status = TileStatus::Rendering;
    return it->properties;
}

void Tiling::complete(const TileProperties& properties, std::shared_ptr<const DensityGrid> data) {
    auto it = find(properties);
    if (it != tiles_.end()) {
        if (it->status != TileStatus::Rendering) {
            spdlog::debug("[Tiling] Completing tile owner={} index={} found {}",
                          properties.owner_id, properties.index, tile_status_name(it->status));
        }
        it->data = std::move(data);
        it->status = TileStatus::Rendered;
        return;
    }

    // Evicted while rendering: keep the result anyway
    spdlog::trace("[Tiling] Tile owner={} index={} evicted during render, re-inserting",
                  properties.owner_id, properties.index);
    Tile tile(properties);
    tile.status = TileStatus::Rendered;
    tile.data = std::move(data);
    tiles_.push_back(std::move(tile));
}

size_t Tiling::retain(const std::function<bool(const Tile&)>& predicate) {
    size_t before = tiles_.size();
    tiles_.erase(std::remove_if(tiles_.begin(), tiles_.end(),
                                [&](const Tile& t) { return !predicate(t); }),
                 tiles_.end());
    return before - tiles_.size();
}

size_t Tiling::limit_generations(uint32_t owner_id, FixedVec2 keep_scale, Fixed keep_offset,
                                 size_t max_generations) {
    struct Generation {
        FixedVec2 scale;
        Fixed offset;
    };

    auto same = [](const Generation& g, const TileProperties& p) {
        return g.scale == p.scale && g.offset == p.offset;
    };

    // Current generation first, then others from most to least recently requested
    std::vector<Generation> kept{{keep_scale, keep_offset}};
    const size_t limit = std::max<size_t>(max_generations, 1);
    for (auto it = tiles_.rbegin(); it != tiles_.rend() && kept.size() < limit; ++it) {
        const TileProperties& p = it->properties;
        if (p.owner_id != owner_id) {
            continue;
        }
        bool known = std::any_of(kept.begin(), kept.end(),
                                 [&](const Generation& g) { return same(g, p); });
        if (!known) {
            kept.push_back({p.scale, p.offset});
        }
    }

    size_t removed = retain([&](const Tile& t) {
        if (t.properties.owner_id != owner_id) {
            return true;
        }
        return std::any_of(kept.begin(), kept.end(),
                           [&](const Generation& g) { return same(g, t.properties); });
    });

    if (removed > 0) {
        spdlog::debug("[Tiling] Dropped {} tiles of owner {} beyond {} generations", removed,
                      owner_id, limit);
    }
    return removed;
}

// ============================================================================
// SHARED TILING
// ============================================================================

std::optional<Tile> SharedTiling::get(const TileProperties& properties, bool create_if_missing) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tiling_.get(properties, create_if_missing);
}

bool SharedTiling::has_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tiling_.has_pending();
}

size_t SharedTiling::retain(const std::function<bool(const Tile&)>& predicate) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tiling_.retain(predicate);
}

void SharedTiling::complete(const TileProperties& properties,
                            std::shared_ptr<const DensityGrid> data) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tiling_.complete(properties, std::move(data));
    }
    cv_.notify_all();
}

void SharedTiling::notify_workers() {
    cv_.notify_all();
}

std::optional<TileProperties> SharedTiling::wait_for_job() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || tiling_.has_jobs(); });
    if (closed_) {
        return std::nullopt;
    }
    return tiling_.take_job();
}

std::optional<TileProperties> SharedTiling::try_take_job() {
    std::lock_guard<std::mutex> lock(mutex_);
    return tiling_.take_job();
}

bool SharedTiling::wait_idle_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return !tiling_.has_pending(); });
}

void SharedTiling::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
    spdlog::debug("[SharedTiling] Closed, releasing waiting workers");
}

bool SharedTiling::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace turboplot
