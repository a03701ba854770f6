// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trace_renderer.h"

#include <EGL/egl.h>
#include <GLES3/gl31.h>

#include <string>
#include <vector>

/**
 * @file gpu_trace_renderer.h
 * @brief Density rasterizer running as an OpenGL ES 3.1 compute shader
 *
 * Creates a headless EGL context (Mesa surfaceless platform when available,
 * otherwise the default display with a 1x1 pbuffer), allocates one storage
 * buffer for samples and one for density counts, and dispatches one shader
 * lane per sample pair. Lanes hit cells with atomicAdd, so the result matches
 * CpuTraceRenderer exactly.
 *
 * Thread safety: a GL context is current on one thread at a time. The
 * renderer is built on the startup thread, released, and then bound by the
 * worker on its first render() call. Each worker owns its own instance.
 */

namespace turboplot {

class GpuTraceRenderer : public TraceRenderer {
  public:
    /**
     * @brief Initialize device, buffers and compute pipeline
     * @throws RendererInitError if EGL, OpenGL ES 3.1 or compute shaders are
     *         unavailable, or the device cannot hold the required buffers
     */
    GpuTraceRenderer();
    ~GpuTraceRenderer() override;

    GpuTraceRenderer(const GpuTraceRenderer&) = delete;
    GpuTraceRenderer& operator=(const GpuTraceRenderer&) = delete;

    DensityGrid render(uint32_t chunk_samples, const float* samples, size_t count, uint32_t width,
                       uint32_t height, float vertical_offset, float vertical_scale) override;

    const char* name() const override {
        return "gpu";
    }

    void release_thread() override;

    /// Renderer/vendor/version strings of the selected device
    const std::string& device_description() const {
        return device_description_;
    }

  private:
    void init_display();
    void init_context();
    void init_pipeline();
    void destroy();

    /// Bind the context to the calling thread if it is not already
    void make_current();

    EGLDisplay display_ = EGL_NO_DISPLAY;
    EGLContext context_ = EGL_NO_CONTEXT;
    /// 1x1 pbuffer, only when surfaceless contexts are unsupported
    EGLSurface surface_ = EGL_NO_SURFACE;

    GLuint program_ = 0;
    GLuint input_buffer_ = 0;
    GLuint output_buffer_ = 0;

    GLint loc_chunk_samples_ = -1;
    GLint loc_trace_samples_ = -1;
    GLint loc_width_ = -1;
    GLint loc_height_ = -1;
    GLint loc_offset_ = -1;
    GLint loc_scale_ = -1;
    GLint loc_lane_stride_ = -1;

    GLint max_group_count_x_ = 65535;

    /// Zero block uploaded to clear the output buffer before each dispatch
    std::vector<uint32_t> zeros_;

    std::string device_description_;
};

} // namespace turboplot
