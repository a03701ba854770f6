// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gpu_trace_renderer.h"

#include "turboplot_assert.h"

#include <spdlog/spdlog.h>

#include <EGL/eglext.h>
#include <algorithm>
#include <chrono>
#include <cstring>

namespace turboplot {

namespace {

/// Must match local_size_x in the shader
constexpr GLuint kWorkgroupSize = 64;

// One lane per sample pair. Row mapping and clipping mirror density_row()
// and CpuTraceRenderer::render() operation for operation.
const char* const kDensityShaderSource = R"GLSL(#version 310 es
#ifdef GL_EXT_gpu_shader5
#extension GL_EXT_gpu_shader5 : enable
#define PRECISE precise
#else
#define PRECISE
#endif
layout(local_size_x = 64) in;

layout(std430, binding = 0) readonly buffer TraceSamples {
    float samples[];
};

layout(std430, binding = 1) buffer DensityCounts {
    uint counts[];
};

uniform uint u_chunk_samples;
uniform uint u_trace_samples;
uniform uint u_width;
uniform uint u_height;
uniform float u_offset;
uniform float u_scale;
uniform uint u_lane_stride;

int density_row(float s) {
    float limit = float(u_height) + 1.0;
    PRECISE float fy = (s + u_offset) * u_scale;
    fy = min(max(fy, -limit), limit);
    // int() truncates toward zero
    return int(u_height / 2u) + int(fy);
}

void main() {
    uint i = gl_GlobalInvocationID.y * u_lane_stride + gl_GlobalInvocationID.x;
    if (i + 1u >= u_trace_samples) {
        return;
    }

    float p0 = samples[i];
    float p1 = samples[i + 1u];
    if (isnan(p0) || isnan(p1)) {
        return;
    }

    uint x = min((i * u_width) / u_chunk_samples, u_width - 1u);
    int y0 = density_row(p0);
    int y1 = density_row(p1);
    int lo = max(min(y0, y1), 0);
    int hi = min(max(y0, y1), int(u_height) - 1);

    uint base = x * u_height;
    for (int y = lo; y <= hi; ++y) {
        atomicAdd(counts[base + uint(y)], 1u);
    }
}
)GLSL";

std::string egl_error_string() {
    return fmt::format("EGL error 0x{:04x}", static_cast<unsigned>(eglGetError()));
}

std::string gl_string(GLenum name) {
    const GLubyte* s = glGetString(name);
    return s ? reinterpret_cast<const char*>(s) : "?";
}

bool has_extension(const char* extensions, const char* name) {
    return extensions != nullptr && std::strstr(extensions, name) != nullptr;
}

GLuint compile_compute_shader(const char* source) {
    GLuint shader = glCreateShader(GL_COMPUTE_SHADER);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);

    GLint ok = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
    if (ok != GL_TRUE) {
        GLint len = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &len);
        std::string log(static_cast<size_t>(std::max(len, 1)), '\0');
        glGetShaderInfoLog(shader, len, nullptr, &log[0]);
        glDeleteShader(shader);
        throw RendererInitError("compute shader compilation failed: " + log);
    }
    return shader;
}

} // namespace

// ============================================================================
// CONSTRUCTION / DESTRUCTION
// ============================================================================

GpuTraceRenderer::GpuTraceRenderer() {
    auto start_time = std::chrono::steady_clock::now();
    try {
        init_display();
        init_context();
        init_pipeline();
    } catch (const RendererInitError&) {
        destroy();
        throw;
    }

    // Hand the context over to whichever worker thread renders first
    eglMakeCurrent(display_, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    spdlog::info("[GpuTraceRenderer] Running on {} ({}ms init)", device_description_,
                 elapsed.count());
}

GpuTraceRenderer::~GpuTraceRenderer() {
    destroy();
}

void GpuTraceRenderer::init_display() {
    const char* client_extensions = eglQueryString(EGL_NO_DISPLAY, EGL_EXTENSIONS);

    // Prefer a display that needs no window system at all
    if (has_extension(client_extensions, "EGL_MESA_platform_surfaceless")) {
        auto get_platform_display = reinterpret_cast<PFNEGLGETPLATFORMDISPLAYEXTPROC>(
            eglGetProcAddress("eglGetPlatformDisplayEXT"));
        if (get_platform_display) {
            display_ =
                get_platform_display(EGL_PLATFORM_SURFACELESS_MESA, EGL_DEFAULT_DISPLAY, nullptr);
        }
    }
    if (display_ == EGL_NO_DISPLAY) {
        display_ = eglGetDisplay(EGL_DEFAULT_DISPLAY);
    }
    if (display_ == EGL_NO_DISPLAY) {
        throw RendererInitError("no EGL display available");
    }

    EGLint major = 0;
    EGLint minor = 0;
    if (eglInitialize(display_, &major, &minor) != EGL_TRUE) {
        display_ = EGL_NO_DISPLAY;
        throw RendererInitError("eglInitialize failed: " + egl_error_string());
    }
    spdlog::debug("[GpuTraceRenderer] EGL {}.{} ({})", major, minor,
                  eglQueryString(display_, EGL_VENDOR));
}

void GpuTraceRenderer::init_context() {
    if (eglBindAPI(EGL_OPENGL_ES_API) != EGL_TRUE) {
        throw RendererInitError("OpenGL ES API unavailable: " + egl_error_string());
    }

    const char* display_extensions = eglQueryString(display_, EGL_EXTENSIONS);
    const bool surfaceless = has_extension(display_extensions, "EGL_KHR_surfaceless_context");

    const EGLint config_attribs[] = {EGL_RENDERABLE_TYPE, EGL_OPENGL_ES3_BIT, EGL_SURFACE_TYPE,
                                     surfaceless ? 0 : EGL_PBUFFER_BIT, EGL_NONE};
    EGLConfig config = nullptr;
    EGLint config_count = 0;
    if (eglChooseConfig(display_, config_attribs, &config, 1, &config_count) != EGL_TRUE ||
        config_count < 1) {
        throw RendererInitError("no EGL config with OpenGL ES 3 support");
    }

    const EGLint context_attribs[] = {EGL_CONTEXT_MAJOR_VERSION, 3, EGL_CONTEXT_MINOR_VERSION, 1,
                                      EGL_NONE};
    context_ = eglCreateContext(display_, config, EGL_NO_CONTEXT, context_attribs);
    if (context_ == EGL_NO_CONTEXT) {
        throw RendererInitError("OpenGL ES 3.1 context unavailable: " + egl_error_string());
    }

    if (!surfaceless) {
        const EGLint pbuffer_attribs[] = {EGL_WIDTH, 1, EGL_HEIGHT, 1, EGL_NONE};
        surface_ = eglCreatePbufferSurface(display_, config, pbuffer_attribs);
        if (surface_ == EGL_NO_SURFACE) {
            throw RendererInitError("pbuffer creation failed: " + egl_error_string());
        }
    }

    if (eglMakeCurrent(display_, surface_, surface_, context_) != EGL_TRUE) {
        throw RendererInitError("eglMakeCurrent failed: " + egl_error_string());
    }
}

void GpuTraceRenderer::init_pipeline() {
    device_description_ = fmt::format("{} / {} / {}", gl_string(GL_RENDERER), gl_string(GL_VENDOR),
                                      gl_string(GL_VERSION));

    GLint major = 0;
    GLint minor = 0;
    glGetIntegerv(GL_MAJOR_VERSION, &major);
    glGetIntegerv(GL_MINOR_VERSION, &minor);
    if (major < 3 || (major == 3 && minor < 1)) {
        throw RendererInitError(fmt::format("device lacks compute shaders (OpenGL ES {}.{}): {}",
                                            major, minor, device_description_));
    }

    glGetIntegeri_v(GL_MAX_COMPUTE_WORK_GROUP_COUNT, 0, &max_group_count_x_);

    GLint64 max_block_size = 0;
    glGetInteger64v(GL_MAX_SHADER_STORAGE_BLOCK_SIZE, &max_block_size);
    const GLsizeiptr input_size = static_cast<GLsizeiptr>(kRendererMaxTraceSize * sizeof(float));
    const GLsizeiptr output_size = static_cast<GLsizeiptr>(kRendererMaxPixels * sizeof(uint32_t));
    if (max_block_size < input_size) {
        throw RendererInitError(fmt::format(
            "storage buffer limit {} bytes is below the {} bytes needed for {} samples: {}",
            max_block_size, input_size, kRendererMaxTraceSize, device_description_));
    }

    GLuint shader = compile_compute_shader(kDensityShaderSource);
    program_ = glCreateProgram();
    glAttachShader(program_, shader);
    glLinkProgram(program_);
    glDeleteShader(shader);

    GLint linked = GL_FALSE;
    glGetProgramiv(program_, GL_LINK_STATUS, &linked);
    if (linked != GL_TRUE) {
        GLint len = 0;
        glGetProgramiv(program_, GL_INFO_LOG_LENGTH, &len);
        std::string log(static_cast<size_t>(std::max(len, 1)), '\0');
        glGetProgramInfoLog(program_, len, nullptr, &log[0]);
        throw RendererInitError("compute program link failed: " + log);
    }

    loc_chunk_samples_ = glGetUniformLocation(program_, "u_chunk_samples");
    loc_trace_samples_ = glGetUniformLocation(program_, "u_trace_samples");
    loc_width_ = glGetUniformLocation(program_, "u_width");
    loc_height_ = glGetUniformLocation(program_, "u_height");
    loc_offset_ = glGetUniformLocation(program_, "u_offset");
    loc_scale_ = glGetUniformLocation(program_, "u_scale");
    loc_lane_stride_ = glGetUniformLocation(program_, "u_lane_stride");

    GLuint buffers[2] = {0, 0};
    glGenBuffers(2, buffers);
    input_buffer_ = buffers[0];
    output_buffer_ = buffers[1];

    glBindBuffer(GL_SHADER_STORAGE_BUFFER, input_buffer_);
    glBufferData(GL_SHADER_STORAGE_BUFFER, input_size, nullptr, GL_DYNAMIC_DRAW);
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, output_buffer_);
    glBufferData(GL_SHADER_STORAGE_BUFFER, output_size, nullptr, GL_DYNAMIC_READ);
    glBindBufferBase(GL_SHADER_STORAGE_BUFFER, 0, input_buffer_);
    glBindBufferBase(GL_SHADER_STORAGE_BUFFER, 1, output_buffer_);

    GLenum err = glGetError();
    if (err != GL_NO_ERROR) {
        throw RendererInitError(fmt::format("buffer allocation failed (GL error 0x{:04x}): {}",
                                            static_cast<unsigned>(err), device_description_));
    }

    spdlog::debug("[GpuTraceRenderer] Buffers: {} MB samples, {} KB density, max groups {}",
                  input_size / (1024 * 1024), output_size / 1024, max_group_count_x_);
}

void GpuTraceRenderer::destroy() {
    if (display_ == EGL_NO_DISPLAY) {
        return;
    }

    if (context_ != EGL_NO_CONTEXT &&
        eglMakeCurrent(display_, surface_, surface_, context_) == EGL_TRUE) {
        if (input_buffer_ != 0 || output_buffer_ != 0) {
            GLuint buffers[2] = {input_buffer_, output_buffer_};
            glDeleteBuffers(2, buffers);
        }
        if (program_ != 0) {
            glDeleteProgram(program_);
        }
    } else if (context_ != EGL_NO_CONTEXT) {
        spdlog::warn("[GpuTraceRenderer] Context still bound elsewhere, leaking GL objects: {}",
                     egl_error_string());
    }
    input_buffer_ = 0;
    output_buffer_ = 0;
    program_ = 0;

    eglMakeCurrent(display_, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
    if (surface_ != EGL_NO_SURFACE) {
        eglDestroySurface(display_, surface_);
        surface_ = EGL_NO_SURFACE;
    }
    if (context_ != EGL_NO_CONTEXT) {
        eglDestroyContext(display_, context_);
        context_ = EGL_NO_CONTEXT;
    }
    // The display is process-wide and may back other renderers: no eglTerminate()
    display_ = EGL_NO_DISPLAY;
}

// ============================================================================
// RENDERING
// ============================================================================

void GpuTraceRenderer::make_current() {
    if (eglGetCurrentContext() == context_) {
        return;
    }
    EGLBoolean ok = eglMakeCurrent(display_, surface_, surface_, context_);
    TURBOPLOT_ASSERT(ok == EGL_TRUE, "cannot bind GPU context to worker thread ({})",
                     egl_error_string());
}

void GpuTraceRenderer::release_thread() {
    if (eglGetCurrentContext() == context_ && context_ != EGL_NO_CONTEXT) {
        eglMakeCurrent(display_, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
        spdlog::trace("[GpuTraceRenderer] Released context from worker thread");
    }
}

DensityGrid GpuTraceRenderer::render(uint32_t chunk_samples, const float* samples, size_t count,
                                     uint32_t width, uint32_t height, float vertical_offset,
                                     float vertical_scale) {
    TURBOPLOT_ASSERT(width > 0 && height > 0, "empty grid requested ({}x{})", width, height);
    TURBOPLOT_ASSERT(chunk_samples > 0, "chunk_samples must be positive");
    TURBOPLOT_ASSERT(count <= kRendererMaxTraceSize, "{} samples exceed GPU capacity of {}", count,
                     kRendererMaxTraceSize);
    TURBOPLOT_ASSERT(size_t{width} * height <= kRendererMaxPixels,
                     "{}x{} grid exceeds GPU capacity of {} pixels", width, height,
                     kRendererMaxPixels);
    TURBOPLOT_ASSERT(uint64_t{count} * width <= UINT32_MAX,
                     "{} samples x {} columns overflows 32-bit column arithmetic", count, width);

    DensityGrid result(width, height);
    if (count < 2 || samples == nullptr) {
        return result;
    }

    make_current();

    const size_t pixel_count = result.counts.size();
    if (zeros_.size() < pixel_count) {
        zeros_.assign(pixel_count, 0);
    }

    glBindBuffer(GL_SHADER_STORAGE_BUFFER, output_buffer_);
    glBufferSubData(GL_SHADER_STORAGE_BUFFER, 0,
                    static_cast<GLsizeiptr>(pixel_count * sizeof(uint32_t)), zeros_.data());
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, input_buffer_);
    glBufferSubData(GL_SHADER_STORAGE_BUFFER, 0, static_cast<GLsizeiptr>(count * sizeof(float)),
                    samples);

    const GLuint lanes = static_cast<GLuint>(count - 1);
    const GLuint groups = (lanes + kWorkgroupSize - 1) / kWorkgroupSize;
    const GLuint groups_x = std::min(groups, static_cast<GLuint>(max_group_count_x_));
    const GLuint groups_y = (groups + groups_x - 1) / groups_x;

    glUseProgram(program_);
    glUniform1ui(loc_chunk_samples_, chunk_samples);
    glUniform1ui(loc_trace_samples_, static_cast<GLuint>(count));
    glUniform1ui(loc_width_, width);
    glUniform1ui(loc_height_, height);
    glUniform1f(loc_offset_, vertical_offset);
    glUniform1f(loc_scale_, vertical_scale);
    glUniform1ui(loc_lane_stride_, groups_x * kWorkgroupSize);
    glBindBufferBase(GL_SHADER_STORAGE_BUFFER, 0, input_buffer_);
    glBindBufferBase(GL_SHADER_STORAGE_BUFFER, 1, output_buffer_);

    glDispatchCompute(groups_x, groups_y, 1);
    glMemoryBarrier(GL_BUFFER_UPDATE_BARRIER_BIT);

    glBindBuffer(GL_SHADER_STORAGE_BUFFER, output_buffer_);
    const void* mapped =
        glMapBufferRange(GL_SHADER_STORAGE_BUFFER, 0,
                         static_cast<GLsizeiptr>(pixel_count * sizeof(uint32_t)), GL_MAP_READ_BIT);
    TURBOPLOT_ASSERT(mapped != nullptr, "density readback failed (GL error 0x{:04x}) on {}",
                     static_cast<unsigned>(glGetError()), device_description_);
    std::memcpy(result.counts.data(), mapped, pixel_count * sizeof(uint32_t));
    glUnmapBuffer(GL_SHADER_STORAGE_BUFFER);

    spdlog::trace("[GpuTraceRenderer] Rendered {} samples into {}x{} ({}x{} groups)", count,
                  width, height, groups_x, groups_y);
    return result;
}

} // namespace turboplot
