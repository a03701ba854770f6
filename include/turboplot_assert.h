// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

/**
 * @file turboplot_assert.h
 * @brief Fail-fast contract checks
 *
 * Contract violations (a render request above a backend's capacity, a zero
 * divisor in fixed-point arithmetic) are programmer errors, not runtime
 * conditions. They are logged through spdlog together with the recent log
 * backtrace and the process aborts so a core dump points at the caller.
 *
 * Checks stay enabled in release builds.
 */

namespace turboplot {

[[noreturn]] inline void contract_failure(const char* expr, const char* file, int line,
                                          const char* func, const std::string& message) {
    spdlog::critical("╔═══════════════════════════════════════════════════════════╗");
    spdlog::critical("║              CONTRACT VIOLATION                           ║");
    spdlog::critical("╠═══════════════════════════════════════════════════════════╣");
    spdlog::critical("║ Check: {}", expr);
    spdlog::critical("║ What:  {}", message);
    spdlog::critical("║ File:  {}:{}", file, line);
    spdlog::critical("║ Func:  {}()", func);
    spdlog::critical("╚═══════════════════════════════════════════════════════════╝");
    spdlog::dump_backtrace();
    spdlog::default_logger()->flush();
    std::abort();
}

} // namespace turboplot

#define TURBOPLOT_ASSERT(cond, ...)                                                                \
    do {                                                                                           \
        if (!(cond)) {                                                                             \
            ::turboplot::contract_failure(#cond, __FILE__, __LINE__, __func__,                     \
                                          fmt::format(__VA_ARGS__));                               \
        }                                                                                          \
    } while (0)
