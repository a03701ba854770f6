// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cpu_trace_renderer.h"
#include "gpu_trace_renderer.h"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <memory>
#include <random>
#include <thread>
#include <vector>

using namespace turboplot;

namespace {

/// nullptr when the machine has no usable OpenGL ES 3.1 device
std::unique_ptr<GpuTraceRenderer> try_create_gpu() {
    try {
        return std::make_unique<GpuTraceRenderer>();
    } catch (const RendererInitError& e) {
        UNSCOPED_INFO("GPU unavailable: " << e.what());
        return nullptr;
    }
}

std::vector<float> noisy_trace(size_t n, uint32_t seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> noise(0.0f, 0.3f);
    std::vector<float> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = std::sin(static_cast<float>(i) * 0.01f) + noise(rng);
    }
    return out;
}

void require_same(const DensityGrid& a, const DensityGrid& b) {
    REQUIRE(a.width == b.width);
    REQUIRE(a.height == b.height);
    REQUIRE(a.counts == b.counts);
}

} // namespace

TEST_CASE("GpuTraceRenderer: matches the CPU renderer", "[renderer][gpu]") {
    auto gpu = try_create_gpu();
    if (!gpu) {
        SKIP("no compute-capable device");
    }
    CpuTraceRenderer cpu;

    SECTION("single pair") {
        const std::vector<float> samples{0.0f, 10.0f};
        require_same(gpu->render(2, samples.data(), 2, 1, 100, 0.0f, 1.0f),
                     cpu.render(2, samples.data(), 2, 1, 100, 0.0f, 1.0f));
    }

    SECTION("noisy trace, several geometries") {
        const auto trace = noisy_trace(200000, 7);
        struct Case {
            uint32_t chunk;
            size_t count;
            uint32_t width;
            uint32_t height;
            float offset;
            float scale;
        };
        const Case cases[] = {
            {640, 641, 64, 480, 0.0f, 100.0f},
            {64000, 64000, 64, 720, -0.5f, 250.0f},
            {100000, 37000, 64, 300, 0.25f, 80.0f}, // truncated final tile
            {200000, 200000, 128, 4096, 0.0f, 1500.0f},
        };
        for (const Case& c : cases) {
            INFO("chunk=" << c.chunk << " count=" << c.count << " " << c.width << "x"
                          << c.height);
            require_same(gpu->render(c.chunk, trace.data(), c.count, c.width, c.height, c.offset,
                                     c.scale),
                         cpu.render(c.chunk, trace.data(), c.count, c.width, c.height, c.offset,
                                    c.scale));
        }
    }

    SECTION("NaN and clipped samples") {
        std::vector<float> samples = noisy_trace(5000, 3);
        samples[10] = std::nanf("");
        samples[2000] = 1e9f;
        samples[3000] = -1e9f;
        require_same(gpu->render(5000, samples.data(), samples.size(), 64, 200, 0.0f, 50.0f),
                     cpu.render(5000, samples.data(), samples.size(), 64, 200, 0.0f, 50.0f));
    }

    SECTION("fractional rows on both sides of zero") {
        std::vector<float> samples;
        for (int k = -40; k <= 40; ++k) {
            samples.push_back(static_cast<float>(k) * 0.05f);
            samples.push_back(static_cast<float>(-k) * 0.0375f);
        }
        const uint32_t n = static_cast<uint32_t>(samples.size());
        for (float scale : {1.0f, 3.9f, 4.0f, 20.0f}) {
            INFO("scale=" << scale);
            require_same(gpu->render(n, samples.data(), n, 16, 64, 0.0f, scale),
                         cpu.render(n, samples.data(), n, 16, 64, 0.0f, scale));
            require_same(gpu->render(n, samples.data(), n, 16, 64, -0.125f, scale),
                         cpu.render(n, samples.data(), n, 16, 64, -0.125f, scale));
        }

        const std::vector<float> swing{-0.5f, 0.5f, -0.5f};
        DensityGrid grid = gpu->render(3, swing.data(), 3, 1, 100, 0.0f, 1.0f);
        REQUIRE(grid.at(0, 50) == 2);
        REQUIRE(grid.total() == 2);
    }

    SECTION("fewer than two samples") {
        const float one = 1.0f;
        REQUIRE(gpu->render(64, &one, 1, 64, 10, 0.0f, 1.0f).is_blank());
    }
}

TEST_CASE("GpuTraceRenderer: context moves between threads", "[renderer][gpu]") {
    auto gpu = try_create_gpu();
    if (!gpu) {
        SKIP("no compute-capable device");
    }
    const auto trace = noisy_trace(10000, 11);
    DensityGrid first;
    DensityGrid second;

    std::thread worker([&]() {
        first = gpu->render(10000, trace.data(), trace.size(), 64, 100, 0.0f, 30.0f);
        gpu->release_thread();
    });
    worker.join();
    second = gpu->render(10000, trace.data(), trace.size(), 64, 100, 0.0f, 30.0f);
    gpu->release_thread();

    require_same(first, second);
    REQUIRE(first.total() > 0);
}
