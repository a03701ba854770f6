// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cpu_trace_renderer.h"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <string>
#include <vector>

using namespace turboplot;

TEST_CASE("CpuTraceRenderer: one pair fills an inclusive row span", "[renderer][cpu]") {
    CpuTraceRenderer renderer;
    const std::vector<float> samples{0.0f, 10.0f};

    DensityGrid grid = renderer.render(2, samples.data(), samples.size(), 1, 100, 0.0f, 1.0f);
    REQUIRE(grid.width == 1);
    REQUIRE(grid.height == 100);
    REQUIRE(grid.counts.size() == 100);
    for (uint32_t y = 0; y < 100; ++y) {
        INFO("row " << y);
        REQUIRE(grid.at(0, y) == ((y >= 50 && y <= 60) ? 1u : 0u));
    }
    REQUIRE(grid.total() == 11);
}

TEST_CASE("CpuTraceRenderer: row mapping", "[renderer][cpu]") {
    SECTION("offset and scale apply before the conversion") {
        REQUIRE(density_row(0.0f, 0.0f, 1.0f, 100) == 50);
        REQUIRE(density_row(1.5f, 0.0f, 2.0f, 100) == 53);
        REQUIRE(density_row(2.0f, -2.0f, 5.0f, 100) == 50);
        REQUIRE(density_row(1.0f, 0.5f, 1.0f, 100) == 51);
    }

    SECTION("fractional rows truncate toward zero") {
        REQUIRE(density_row(0.75f, 0.0f, 1.0f, 100) == 50);
        REQUIRE(density_row(-0.25f, 0.0f, 1.0f, 100) == 50);
        REQUIRE(density_row(-0.99f, 0.0f, 1.0f, 100) == 50);
        REQUIRE(density_row(-1.5f, 0.0f, 1.0f, 100) == 49);
        REQUIRE(density_row(-2.5f, 0.0f, 2.0f, 100) == 45);
    }

    SECTION("far off-screen samples are clamped before conversion") {
        REQUIRE(density_row(1e30f, 0.0f, 1.0f, 100) == 151);
        REQUIRE(density_row(-1e30f, 0.0f, 1.0f, 100) == -51);
    }
}

TEST_CASE("CpuTraceRenderer: small swings around zero share the centre row", "[renderer][cpu]") {
    CpuTraceRenderer renderer;
    const std::vector<float> samples{-0.5f, 0.5f, -0.5f};
    DensityGrid grid = renderer.render(3, samples.data(), samples.size(), 1, 100, 0.0f, 1.0f);
    REQUIRE(grid.at(0, 50) == 2);
    REQUIRE(grid.total() == 2);
}

TEST_CASE("CpuTraceRenderer: rows outside the grid are clipped", "[renderer][cpu]") {
    CpuTraceRenderer renderer;

    SECTION("span crossing the top edge") {
        const std::vector<float> samples{0.0f, 1000.0f};
        DensityGrid grid = renderer.render(2, samples.data(), samples.size(), 1, 100, 0.0f, 1.0f);
        REQUIRE(grid.at(0, 49) == 0);
        REQUIRE(grid.at(0, 50) == 1);
        REQUIRE(grid.at(0, 99) == 1);
        REQUIRE(grid.total() == 50);
    }

    SECTION("span entirely below the grid") {
        const std::vector<float> samples{-500.0f, -400.0f};
        DensityGrid grid = renderer.render(2, samples.data(), samples.size(), 1, 100, 0.0f, 1.0f);
        REQUIRE(grid.is_blank());
    }
}

TEST_CASE("CpuTraceRenderer: columns follow chunk_samples", "[renderer][cpu]") {
    CpuTraceRenderer renderer;

    SECTION("full chunk spreads over every column") {
        std::vector<float> samples(100, 0.0f);
        DensityGrid grid = renderer.render(100, samples.data(), samples.size(), 10, 4, 0.0f, 1.0f);
        // 99 pairs: ten per column, nine in the last
        for (uint32_t x = 0; x < 9; ++x) {
            REQUIRE(grid.at(x, 2) == 10);
        }
        REQUIRE(grid.at(9, 2) == 9);
    }

    SECTION("truncated final tile keeps its columns aligned") {
        std::vector<float> samples(50, 0.0f);
        DensityGrid grid = renderer.render(100, samples.data(), samples.size(), 10, 4, 0.0f, 1.0f);
        for (uint32_t x = 0; x < 4; ++x) {
            REQUIRE(grid.at(x, 2) == 10);
        }
        REQUIRE(grid.at(4, 2) == 9);
        for (uint32_t x = 5; x < 10; ++x) {
            REQUIRE(grid.at(x, 2) == 0);
        }
    }
}

TEST_CASE("CpuTraceRenderer: degenerate input", "[renderer][cpu]") {
    CpuTraceRenderer renderer;

    SECTION("fewer than two samples give a zero grid") {
        const float one = 3.0f;
        DensityGrid grid = renderer.render(64, &one, 1, 8, 8, 0.0f, 1.0f);
        REQUIRE(grid.counts.size() == 64);
        REQUIRE(grid.is_blank());

        DensityGrid empty = renderer.render(64, nullptr, 0, 8, 8, 0.0f, 1.0f);
        REQUIRE(empty.is_blank());
    }

    SECTION("pairs containing NaN are skipped") {
        const std::vector<float> samples{0.0f, std::nanf(""), 0.0f, 0.0f};
        DensityGrid grid = renderer.render(4, samples.data(), samples.size(), 1, 10, 0.0f, 1.0f);
        // Only the pair (2, 3) counts
        REQUIRE(grid.total() == 1);
        REQUIRE(grid.at(0, 5) == 1);
    }
}

// ============================================================================
// Factory
// ============================================================================

TEST_CASE("create_trace_renderer: CPU backend", "[renderer]") {
    auto renderer = create_trace_renderer(RendererBackend::Cpu);
    REQUIRE(renderer != nullptr);
    REQUIRE(std::string(renderer->name()) == "cpu");
    REQUIRE(renderer->max_samples() == kRendererMaxTraceSize);
    REQUIRE(renderer->max_pixels() == kRendererMaxPixels);
}

TEST_CASE("parse_renderer_backend: names", "[renderer][config]") {
    REQUIRE(parse_renderer_backend("cpu") == RendererBackend::Cpu);
    REQUIRE(parse_renderer_backend("GPU") == RendererBackend::Gpu);
    REQUIRE_FALSE(parse_renderer_backend("vulkan").has_value());
    REQUIRE_FALSE(parse_renderer_backend("").has_value());
    REQUIRE(parse_renderer_backend(renderer_backend_name(RendererBackend::Gpu)) ==
            RendererBackend::Gpu);
}
