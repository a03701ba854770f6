// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "trace_renderer.h"

#include "cpu_trace_renderer.h"
#include "gpu_trace_renderer.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace turboplot {

std::unique_ptr<TraceRenderer> create_trace_renderer(RendererBackend backend) {
    switch (backend) {
    case RendererBackend::Cpu:
        spdlog::debug("[TraceRenderer] Creating CPU renderer");
        return std::make_unique<CpuTraceRenderer>();
    case RendererBackend::Gpu:
        spdlog::debug("[TraceRenderer] Creating GPU renderer");
        return std::make_unique<GpuTraceRenderer>();
    }
    throw RendererInitError("unknown renderer backend");
}

std::optional<RendererBackend> parse_renderer_backend(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "cpu") {
        return RendererBackend::Cpu;
    }
    if (lower == "gpu") {
        return RendererBackend::Gpu;
    }
    return std::nullopt;
}

const char* renderer_backend_name(RendererBackend backend) {
    switch (backend) {
    case RendererBackend::Cpu:
        return "cpu";
    case RendererBackend::Gpu:
        return "gpu";
    }
    return "unknown";
}

} // namespace turboplot
