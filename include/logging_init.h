// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

/**
 * @file logging_init.h
 * @brief spdlog setup shared by the tools and the test runner
 *
 * One "turboplot" logger with a colour console sink and, optionally, a
 * system sink (syslog or a rotating file). A 32-message backtrace buffer is
 * kept so contract failures can dump what led up to them.
 */

namespace turboplot::logging {

enum class LogTarget {
    Auto,   ///< Syslog on Linux, console elsewhere
    Syslog, ///< syslog(3)
    File,   ///< Rotating file, 5 MB x 3
    Console ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true;
    LogTarget target = LogTarget::Console;
    /// File target path; empty picks a default under XDG_DATA_HOME
    std::string file_path;
};

/// Install the default logger. Safe to call again to reconfigure.
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace" ... "off", "warning" alias)
 * @return default_level for empty or unknown strings (case sensitive)
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::info);

/// -v count to level: 0 warn, 1 info, 2 debug, 3+ trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Pick the effective level
 *
 * Command-line verbosity wins, then the configured level, then warn.
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level);

/// Unknown strings map to Auto
LogTarget parse_log_target(const std::string& str);

/// Target actually used by init(): Auto becomes Syslog on Linux, Console elsewhere
LogTarget resolve_log_target(LogTarget target);

const char* log_target_name(LogTarget target);

} // namespace turboplot::logging
