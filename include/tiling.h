// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tile_types.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

/**
 * @file tiling.h
 * @brief Tile cache shared between the view and the render workers
 *
 * Tiling is the plain data structure; it is not thread-safe. SharedTiling
 * wraps it with the one mutex and one condition variable that the consumer
 * and every worker use. Both sides hold SharedTiling through a shared_ptr so
 * its lifetime is that of the longest user.
 *
 * Tiles are kept in request order. The view paints them in that order, so
 * stale previews end up behind the authoritative tiles.
 */

namespace turboplot {

class Tiling {
  public:
    Tiling() = default;

    /**
     * @brief Look up a tile, optionally requesting it
     * @param properties Tile identity
     * @param create_if_missing Insert a NotRendered tile when absent
     * @return Copy of the entry, or nullopt when absent and not created
     *
     * A lookup with create_if_missing=false never mutates the cache.
     */
    std::optional<Tile> get(const TileProperties& properties, bool create_if_missing);

    /// True if any tile is NotRendered or Rendering
    bool has_pending() const;

    /// True if any tile is NotRendered (a worker could take it)
    bool has_jobs() const;

    /**
     * @brief Take the next job
     *
     * Flips the first NotRendered tile to Rendering and returns its identity.
     * The scan and the flip happen in one call, so two workers holding the
     * cache lock in turn can never take the same tile.
     */
    std::optional<TileProperties> take_job();

    /**
     * @brief Store a render result
     *
     * The entry becomes Rendered. If the consumer evicted it while it was
     * being rendered, it is inserted again: finished work is never dropped.
     */
    void complete(const TileProperties& properties, std::shared_ptr<const DensityGrid> data);

    /**
     * @brief Keep only the tiles for which predicate returns true
     * @return Number of tiles removed
     */
    size_t retain(const std::function<bool(const Tile&)>& predicate);

    /**
     * @brief Bound the number of cached view generations of one owner
     *
     * A generation is the set of an owner's tiles sharing one (scale, offset)
     * pair. The generation matching keep_scale/keep_offset is always kept; the
     * most recently requested other generations fill the remaining slots.
     * Tiles of other owners are untouched.
     *
     * @return Number of tiles removed
     */
    size_t limit_generations(uint32_t owner_id, FixedVec2 keep_scale, Fixed keep_offset,
                             size_t max_generations);

    size_t size() const {
        return tiles_.size();
    }

    /// Number of tiles not yet Rendered
    size_t pending_count() const;

    const std::vector<Tile>& tiles() const {
        return tiles_;
    }

  private:
    std::vector<Tile>::iterator find(const TileProperties& properties);
    std::vector<Tile>::const_iterator find(const TileProperties& properties) const;

    std::vector<Tile> tiles_;
};

/**
 * @brief Tiling guarded by one mutex and one condition variable
 *
 * Workers sleep in wait_for_job() until a NotRendered tile appears. The
 * consumer never blocks on render completion; it polls statuses every frame.
 */
class SharedTiling {
  public:
    SharedTiling() = default;

    SharedTiling(const SharedTiling&) = delete;
    SharedTiling& operator=(const SharedTiling&) = delete;

    /**
     * @brief Run fn with the cache locked
     *
     * Used by the consumer to issue a whole frame's requests in one lock scope.
     * Callers that add jobs must call notify_workers() afterwards.
     */
    template <typename Fn> auto with_lock(Fn&& fn) -> decltype(fn(std::declval<Tiling&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(tiling_);
    }

    std::optional<Tile> get(const TileProperties& properties, bool create_if_missing);

    bool has_pending() const;

    size_t retain(const std::function<bool(const Tile&)>& predicate);

    /// Write back a render result and wake anyone waiting for idle
    void complete(const TileProperties& properties, std::shared_ptr<const DensityGrid> data);

    /// Wake sleeping workers after new tiles were requested
    void notify_workers();

    /**
     * @brief Block until a job is available, then take it
     * @return Job identity, or nullopt once the cache has been closed
     */
    std::optional<TileProperties> wait_for_job();

    /// Take a job without blocking
    std::optional<TileProperties> try_take_job();

    /**
     * @brief Wait until no tile is pending
     * @return true if idle, false on timeout
     */
    bool wait_idle_for(std::chrono::milliseconds timeout);

    /**
     * @brief Release every worker blocked in wait_for_job()
     *
     * Jobs already taken still complete and are written back.
     */
    void close();

    bool is_closed() const;

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Tiling tiling_;
    bool closed_ = false;
};

} // namespace turboplot
