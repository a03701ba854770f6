// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <vector>

#ifdef __linux__
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace turboplot::logging {

namespace {

/// Get XDG_DATA_HOME or default ~/.local/share
std::string get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share";
    }

    return "/tmp";
}

std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    std::string dir = get_xdg_data_home() + "/turboplot";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return dir + "/turboplot.log";
}

void add_system_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const std::string& file_path) {
    switch (target) {
    case LogTarget::Syslog:
#ifdef __linux__
        sinks.push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>("turboplot", LOG_PID,
                                                                        LOG_USER, false));
#endif
        break;
    case LogTarget::File: {
        std::string path = resolve_log_file_path(file_path);
        try {
            // 5MB max size, 3 rotated files
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path, 5 * 1024 * 1024, 3));
        } catch (const spdlog::spdlog_ex& e) {
            // No logger exists yet; report once the console sink is up
            std::fprintf(stderr, "turboplot: cannot open log file %s: %s\n", path.c_str(),
                         e.what());
        }
        break;
    }
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget effective_target = resolve_log_target(config.target);
    add_system_sink(sinks, effective_target, config.file_path);

    auto logger = std::make_shared<spdlog::logger>("turboplot", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    // Recent messages are dumped by contract_failure()
    spdlog::enable_backtrace(32);

    spdlog::debug("[Logging] Initialized: target={}, console={}, backtrace=32 messages",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no");
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity >= 3)
        return spdlog::level::trace;
    if (verbosity == 2)
        return spdlog::level::debug;
    if (verbosity == 1)
        return spdlog::level::info;
    return spdlog::level::warn;
}

spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level) {
    if (cli_verbosity > 0) {
        return verbosity_to_level(cli_verbosity);
    }
    return parse_level(config_level, spdlog::level::warn);
}

LogTarget resolve_log_target(LogTarget target) {
    if (target != LogTarget::Auto) {
        return target;
    }
#ifdef __linux__
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

} // namespace turboplot::logging
