// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"
#include "config.h"
#include "logging_init.h"
#include "render_pool.h"
#include "trace_renderer.h"
#include "trace_view.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace turboplot;

namespace {

/// Upper bound on how long one view may take to render completely
constexpr auto kViewTimeout = std::chrono::seconds(120);

/**
 * @brief Deterministic test signal: two tones plus seeded noise
 */
std::shared_ptr<const Trace> make_synthetic_trace(uint64_t samples) {
    auto trace = std::make_shared<Trace>(static_cast<size_t>(samples));
    std::mt19937 rng(42);
    std::uniform_real_distribution<float> noise(-0.1f, 0.1f);
    constexpr double kTwoPi = 6.283185307179586;
    for (size_t i = 0; i < trace->size(); ++i) {
        double t = static_cast<double>(i);
        (*trace)[i] = static_cast<float>(std::sin(kTwoPi * t / 5000.0) +
                                         0.3 * std::sin(kTwoPi * t / 137.0)) +
                      noise(rng);
    }
    return trace;
}

/**
 * @brief Request tiles until the current view is complete
 * @return false on timeout
 */
bool render_view(TraceView& view, SharedTiling& tiling, const Viewport& viewport,
                 const char* label) {
    auto start = std::chrono::steady_clock::now();
    int frames = 0;
    while (!view.request_tiles(viewport, 1.0f)) {
        ++frames;
        if (std::chrono::steady_clock::now() - start > kViewTimeout) {
            spdlog::error("[Main] {}: view not complete after {}s", label,
                          std::chrono::duration_cast<std::chrono::seconds>(kViewTimeout).count());
            return false;
        }
        tiling.wait_idle_for(std::chrono::milliseconds(16));
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::info("[Main] {}: complete in {}ms ({} frames, scale.x={:.3f})", label,
                 elapsed.count(), frames, view.camera().scale().x.to_double());
    return true;
}

uint32_t blend_over(uint32_t dst, uint32_t src) {
    const uint32_t a = src >> 24;
    if (a == 0) {
        return dst;
    }
    uint32_t out = 0xFF000000;
    for (int shift : {16, 8, 0}) {
        uint32_t s = (src >> shift) & 0xFF;
        uint32_t d = (dst >> shift) & 0xFF;
        out |= ((s * a + d * (255 - a)) / 255) << shift;
    }
    return out;
}

/**
 * @brief Paint every rendered tile into an opaque ARGB frame
 *
 * Tiles are drawn in cache order, so previews end up beneath current tiles.
 */
std::vector<uint32_t> compose_frame(const TraceView& view, const Viewport& viewport) {
    const int width = static_cast<int>(viewport.width);
    const int height = static_cast<int>(viewport.height);
    std::vector<uint32_t> frame(static_cast<size_t>(width) * height, 0xFF000000);

    for (const Tile& tile : view.rendered_tiles()) {
        const ScreenRect rect = view.place_tile(tile.properties, viewport, 1.0f);
        if (rect.width() <= 0.0f || rect.height() <= 0.0f) {
            continue;
        }
        const DensityImage image = view.tile_image(tile);

        const int x_begin = std::max(0, static_cast<int>(std::floor(rect.x0)));
        const int x_end = std::min(width, static_cast<int>(std::ceil(rect.x1)));
        const int y_begin = std::max(0, static_cast<int>(std::floor(rect.y0)));
        const int y_end = std::min(height, static_cast<int>(std::ceil(rect.y1)));
        for (int y = y_begin; y < y_end; ++y) {
            float v = (static_cast<float>(y) + 0.5f - rect.y0) / rect.height();
            int iy = static_cast<int>(v * static_cast<float>(image.height));
            if (iy < 0 || iy >= static_cast<int>(image.height)) {
                continue;
            }
            for (int x = x_begin; x < x_end; ++x) {
                float u = (static_cast<float>(x) + 0.5f - rect.x0) / rect.width();
                int ix = static_cast<int>(u * static_cast<float>(image.width));
                if (ix < 0 || ix >= static_cast<int>(image.width)) {
                    continue;
                }
                uint32_t& dst = frame[static_cast<size_t>(y) * width + x];
                dst = blend_over(dst, image.at(static_cast<uint32_t>(ix),
                                               static_cast<uint32_t>(iy)));
            }
        }
    }
    return frame;
}

bool write_ppm(const std::string& path, const std::vector<uint32_t>& frame, int width,
               int height) {
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open()) {
        spdlog::error("[Main] Cannot open {} for writing", path);
        return false;
    }
    out << "P6\n" << width << " " << height << "\n255\n";
    // Screen Y grows with amplitude; PPM rows go top-down
    for (int y = height - 1; y >= 0; --y) {
        for (int x = 0; x < width; ++x) {
            uint32_t p = frame[static_cast<size_t>(y) * width + x];
            char rgb[3] = {static_cast<char>((p >> 16) & 0xFF), static_cast<char>((p >> 8) & 0xFF),
                           static_cast<char>(p & 0xFF)};
            out.write(rgb, 3);
        }
    }
    if (!out.good()) {
        spdlog::error("[Main] Error writing {}", path);
        return false;
    }
    spdlog::info("[Main] Wrote {}x{} view to {}", width, height, path);
    return true;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.help_requested ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    // Console-only until the config says otherwise
    logging::LogConfig log_config;
    log_config.level = logging::resolve_log_level(args.verbosity, "");
    logging::init(log_config);

    Config config;
    config.init(args.config_path);
    RenderSettings settings = load_render_settings(config);

    log_config.level = logging::resolve_log_level(args.verbosity, settings.log_level);
    log_config.target = logging::parse_log_target(settings.log_target);
    logging::init(log_config);
    spdlog::info("[Main] Config {}: tile width {}, {} worker(s)", config.get_path(),
                 settings.tile_width, settings.workers.size());

    std::vector<RendererBackend> backends = settings.workers;
    if (args.workers > 0) {
        backends.assign(static_cast<size_t>(args.workers), backends.front());
    }
    if (args.backend) {
        std::fill(backends.begin(), backends.end(), *args.backend);
    }

    auto trace = make_synthetic_trace(args.samples);
    auto tiling = std::make_shared<SharedTiling>();
    RenderPool pool(tiling, TraceSet{trace});

    try {
        for (RendererBackend backend : backends) {
            pool.add_worker(create_trace_renderer(backend));
        }
    } catch (const RendererInitError& e) {
        spdlog::critical("[Main] Renderer initialization failed: {}", e.what());
        spdlog::critical("[Main] No compute-capable device; try --backend cpu");
        return EXIT_FAILURE;
    }
    pool.start();

    const Viewport viewport{static_cast<float>(args.view_width),
                            static_cast<float>(args.view_height)};
    TraceView view(0, tiling, trace, settings.tile_width);
    view.set_max_generations(settings.max_cache_generations);
    view.set_color_scale(settings.color);
    view.autoscale(viewport, 1.0f);

    bool ok = render_view(view, *tiling, viewport, "Full trace");
    for (int step = 1; ok && step <= args.zoom_steps; ++step) {
        view.camera().zoom_x(0.5, viewport.width / 2.0f, viewport, 1.0f);
        std::string label = "Zoom step " + std::to_string(step);
        ok = render_view(view, *tiling, viewport, label.c_str());
    }

    if (ok && !args.output_path.empty()) {
        ok = write_ppm(args.output_path, compose_frame(view, viewport), args.view_width,
                       args.view_height);
    }

    pool.shutdown();
    RenderPoolStats stats = pool.stats();
    for (size_t i = 0; i < stats.tiles_per_worker.size(); ++i) {
        spdlog::info("[Main] Worker {} ({}): {} tiles", i, stats.backends[i],
                     stats.tiles_per_worker[i]);
    }

    spdlog::default_logger()->flush();
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
