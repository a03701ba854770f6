// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace fs = std::filesystem;

namespace turboplot {

json Config::default_config() {
    return json{{"log_level", "info"},
                {"log_target", "console"},
                {"render",
                 {{"tile_width", 64}, {"workers", {"gpu"}}, {"max_cache_generations", 4}}},
                {"color",
                 {{"power", 1.0},
                  {"opacity", 10.0},
                  {"gradient", "single"},
                  {"minimum", 0.1},
                  {"start", "#000000"},
                  {"end", "#FFFFFF"}}}};
}

Config::Config() : data_(default_config()) {}

void Config::init(const std::string& config_path) {
    path_ = config_path;
    std::error_code ec;

    if (fs::exists(config_path, ec)) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::ifstream in(config_path);
        try {
            json parsed = json::parse(in);
            if (parsed.is_object()) {
                data_ = std::move(parsed);
                return;
            }
            spdlog::error("[Config] {} does not hold a JSON object", config_path);
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
        }

        in.close();
        spdlog::warn("[Config] Config file is corrupt, resetting to defaults");
        std::string backup_path = config_path + ".corrupt";
        if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
            spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
        }
    } else {
        spdlog::info("[Config] No config at {}, creating defaults", config_path);
    }

    data_ = default_config();
    if (!save()) {
        spdlog::warn("[Config] Continuing with in-memory defaults");
    }
}

bool Config::contains(const std::string& json_ptr) const {
    try {
        return data_.contains(json::json_pointer(json_ptr));
    } catch (const json::exception& e) {
        spdlog::warn("[Config] Bad JSON pointer {}: {}", json_ptr, e.what());
        return false;
    }
}

bool Config::save() {
    if (path_.empty()) {
        spdlog::error("[Config] save() called before init()");
        return false;
    }
    spdlog::trace("[Config] Saving config to {}", path_);

    fs::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open {} for writing", tmp_path);
            return false;
        }
        o << std::setw(2) << data_ << std::endl;
        if (!o.good()) {
            spdlog::error("[Config] Error writing {}", tmp_path);
            return false;
        }
    }

    fs::rename(tmp_path, path_, ec);
    if (ec) {
        spdlog::error("[Config] Failed to replace {}: {}", path_, ec.message());
        fs::remove(tmp_path, ec);
        return false;
    }
    spdlog::trace("[Config] Saved successfully to {}", path_);
    return true;
}

// ============================================================================
// RENDER SETTINGS
// ============================================================================

RenderSettings load_render_settings(const Config& config) {
    RenderSettings s;

    int64_t tile_width = config.get<int64_t>("/render/tile_width", s.tile_width);
    if (tile_width < kMinTileWidth || tile_width > kMaxTileWidth) {
        spdlog::warn("[Config] /render/tile_width {} outside [{}, {}], clamping", tile_width,
                     kMinTileWidth, kMaxTileWidth);
        tile_width = std::min<int64_t>(std::max<int64_t>(tile_width, kMinTileWidth), kMaxTileWidth);
    }
    s.tile_width = static_cast<uint32_t>(tile_width);

    auto names = config.get<std::vector<std::string>>("/render/workers", {"gpu"});
    std::vector<RendererBackend> workers;
    for (const auto& name : names) {
        if (auto backend = parse_renderer_backend(name)) {
            workers.push_back(*backend);
        } else {
            spdlog::warn("[Config] Unknown renderer backend '{}' in /render/workers, skipping",
                         name);
        }
    }
    if (!workers.empty()) {
        s.workers = std::move(workers);
    }

    int64_t generations =
        config.get<int64_t>("/render/max_cache_generations",
                            static_cast<int64_t>(s.max_cache_generations));
    if (generations < 1) {
        spdlog::warn("[Config] /render/max_cache_generations must be >= 1, using 1");
        generations = 1;
    }
    s.max_cache_generations = static_cast<size_t>(generations);

    s.log_level = config.get<std::string>("/log_level", s.log_level);
    s.log_target = config.get<std::string>("/log_target", s.log_target);

    ColorScale& c = s.color;
    c.power = config.get<float>("/color/power", c.power);
    c.opacity = config.get<float>("/color/opacity", c.opacity);
    c.gradient.minimum = config.get<float>("/color/minimum", c.gradient.minimum);

    const std::string gradient = config.get<std::string>("/color/gradient", "single");
    if (auto kind = parse_gradient_kind(gradient)) {
        c.gradient.kind = *kind;
    } else {
        spdlog::warn("[Config] Unknown gradient '{}', using {}", gradient,
                     gradient_kind_name(c.gradient.kind));
    }

    auto read_color = [&config](const char* ptr, uint32_t& out) {
        const std::string hex = config.get<std::string>(ptr, format_hex_color(out));
        if (auto rgb = parse_hex_color(hex)) {
            out = *rgb;
        } else {
            spdlog::warn("[Config] Invalid colour '{}' at {}, keeping {}", hex, ptr,
                         format_hex_color(out));
        }
    };
    read_color("/color/start", c.gradient.start);
    read_color("/color/end", c.gradient.end);

    spdlog::debug("[Config] Render settings: tile_width={}, workers={}, generations={}",
                  s.tile_width, s.workers.size(), s.max_cache_generations);
    return s;
}

} // namespace turboplot
