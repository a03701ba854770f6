// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_TRACE_RENDERER_H
#define MOCK_TRACE_RENDERER_H

/**
 * @file mock_trace_renderer.h
 * @brief Recording renderer for tiling and pool tests
 *
 * Delegates to CpuTraceRenderer so results are real, and records every call
 * in a RenderLog the test keeps after the renderer has been moved into a
 * worker. A gate lets tests hold renders in flight.
 *
 * @example
 * auto log = std::make_shared<RenderLog>();
 * pool.add_worker(std::make_unique<MockTraceRenderer>(log));
 * log->close_gate();   // renders now block
 * ...
 * log->open_gate();
 */

#include "cpu_trace_renderer.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

using namespace turboplot;

struct RenderCall {
    uint32_t chunk_samples = 0;
    std::vector<float> samples;
    uint32_t width = 0;
    uint32_t height = 0;
    float vertical_offset = 0.0f;
    float vertical_scale = 0.0f;
};

/**
 * @brief Calls seen by one or more MockTraceRenderer instances
 */
class RenderLog {
  public:
    void record(RenderCall call) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(std::move(call));
        ++started_;
        cv_.notify_all();
    }

    std::vector<RenderCall> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    size_t call_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    void close_gate() {
        std::lock_guard<std::mutex> lock(mutex_);
        gate_open_ = false;
    }

    void open_gate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            gate_open_ = true;
        }
        cv_.notify_all();
    }

    /// Blocks the calling render while the gate is closed
    void pass_gate() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return gate_open_; });
    }

    /// Wait until at least n renders have started
    bool wait_for_calls(size_t n, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return started_ >= n; });
    }

    void note_release() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++releases_;
    }

    int releases() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return releases_;
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<RenderCall> calls_;
    size_t started_ = 0;
    bool gate_open_ = true;
    int releases_ = 0;
};

class MockTraceRenderer : public TraceRenderer {
  public:
    explicit MockTraceRenderer(std::shared_ptr<RenderLog> log) : log_(std::move(log)) {}

    DensityGrid render(uint32_t chunk_samples, const float* samples, size_t count, uint32_t width,
                       uint32_t height, float vertical_offset, float vertical_scale) override {
        RenderCall call;
        call.chunk_samples = chunk_samples;
        if (samples != nullptr) {
            call.samples.assign(samples, samples + count);
        }
        call.width = width;
        call.height = height;
        call.vertical_offset = vertical_offset;
        call.vertical_scale = vertical_scale;
        log_->record(std::move(call));
        log_->pass_gate();
        return cpu_.render(chunk_samples, samples, count, width, height, vertical_offset,
                           vertical_scale);
    }

    const char* name() const override {
        return "mock";
    }

    void release_thread() override {
        log_->note_release();
    }

  private:
    std::shared_ptr<RenderLog> log_;
    CpuTraceRenderer cpu_;
};

#endif // MOCK_TRACE_RENDERER_H
