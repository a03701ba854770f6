// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "color_scale.h"
#include "trace_renderer.h"

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace turboplot {

/**
 * @brief JSON configuration file
 *
 * Values are addressed with JSON pointers (RFC 6901). A missing file is
 * created with defaults; a corrupt one is moved aside to "<path>.corrupt" and
 * replaced by defaults.
 *
 * Thread safety: none. Load once at startup on the main thread.
 *
 * Example usage:
 * ```cpp
 * Config cfg;
 * cfg.init("turboplot.json");
 * uint32_t width = cfg.get<uint32_t>("/render/tile_width", 64);
 * cfg.set<std::string>("/log_level", "debug");
 * cfg.save();
 * ```
 */
class Config {
  public:
    Config();

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load the configuration file
     * @param config_path Path to the JSON file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get a value, falling back when absent or of the wrong type
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) const {
        try {
            json::json_pointer ptr(json_ptr);
            if (data_.contains(ptr)) {
                return data_.at(ptr).template get<T>();
            }
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Invalid value at {}: {}", json_ptr, e.what());
        }
        return default_value;
    }

    /// Set a value in memory, creating intermediate objects
    template <typename T> void set(const std::string& json_ptr, const T& v) {
        data_[json::json_pointer(json_ptr)] = v;
    }

    bool contains(const std::string& json_ptr) const;

    /**
     * @brief Write to disk atomically (temp file + rename)
     * @return false if the file could not be written
     */
    bool save();

    const std::string& get_path() const {
        return path_;
    }

    const json& data() const {
        return data_;
    }

    /// Built-in defaults, also written for a missing file
    static json default_config();

  private:
    std::string path_;
    json data_;
};

/**
 * @brief Render and display settings resolved from a Config
 */
struct RenderSettings {
    uint32_t tile_width = 64;
    /// One entry per worker
    std::vector<RendererBackend> workers{RendererBackend::Gpu};
    size_t max_cache_generations = 4;
    std::string log_level = "info";
    std::string log_target = "console";
    ColorScale color;
};

/// Smallest and largest accepted /render/tile_width
constexpr uint32_t kMinTileWidth = 8;
constexpr uint32_t kMaxTileWidth = 1024;

/**
 * @brief Read RenderSettings, replacing invalid entries by defaults
 *
 * Unknown backend names are skipped with a warning; an empty worker list
 * falls back to the default.
 */
RenderSettings load_render_settings(const Config& config);

} // namespace turboplot
