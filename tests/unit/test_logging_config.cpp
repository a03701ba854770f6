// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <utility>

#include <catch2/catch_test_macros.hpp>

using namespace turboplot::logging;

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Puts the default console logger back after a test swaps sinks
struct DefaultLoggerGuard {
    ~DefaultLoggerGuard() {
        init(LogConfig{});
    }
};

} // namespace

// ============================================================================
// Level selection
// ============================================================================

TEST_CASE("parse_level: names written in /log_level", "[logging][config]") {
    const std::pair<const char*, spdlog::level::level_enum> names[] = {
        {"trace", spdlog::level::trace},   {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},     {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},  {"error", spdlog::level::err},
        {"critical", spdlog::level::critical}, {"off", spdlog::level::off},
    };
    for (const auto& [name, level] : names) {
        INFO(name);
        REQUIRE(parse_level(name, spdlog::level::critical) == level);
    }
}

TEST_CASE("parse_level: anything else keeps the caller's default", "[logging][config]") {
    REQUIRE(parse_level("") == spdlog::level::info);
    REQUIRE(parse_level("Debug", spdlog::level::err) == spdlog::level::err);
    REQUIRE(parse_level("err", spdlog::level::warn) == spdlog::level::warn);
}

TEST_CASE("resolve_log_level: -v flags, then /log_level, then warn", "[logging][config]") {
    // No flags: the configured level is used as is, even when quieter than warn
    REQUIRE(resolve_log_level(0, "error") == spdlog::level::err);
    REQUIRE(resolve_log_level(0, "trace") == spdlog::level::trace);

    // Any flag overrides the file, in both directions
    REQUIRE(resolve_log_level(1, "trace") == spdlog::level::info);
    REQUIRE(resolve_log_level(2, "off") == spdlog::level::debug);
    REQUIRE(resolve_log_level(7, "info") == spdlog::level::trace);

    // Missing or unreadable /log_level
    REQUIRE(resolve_log_level(0, "") == spdlog::level::warn);
    REQUIRE(resolve_log_level(0, "chatty") == spdlog::level::warn);
    REQUIRE(resolve_log_level(-3, "") == spdlog::level::warn);
}

// ============================================================================
// Targets
// ============================================================================

TEST_CASE("log targets: names round-trip, unknown names mean auto", "[logging][config]") {
    for (auto target : {LogTarget::Auto, LogTarget::Syslog, LogTarget::File, LogTarget::Console}) {
        REQUIRE(parse_log_target(log_target_name(target)) == target);
    }
    // systemd's journal is not a target here
    REQUIRE(parse_log_target("journal") == LogTarget::Auto);
    REQUIRE(parse_log_target("File") == LogTarget::Auto);
}

TEST_CASE("resolve_log_target: auto picks the platform sink", "[logging][config]") {
#ifdef __linux__
    REQUIRE(resolve_log_target(LogTarget::Auto) == LogTarget::Syslog);
#else
    REQUIRE(resolve_log_target(LogTarget::Auto) == LogTarget::Console);
#endif
    REQUIRE(resolve_log_target(LogTarget::File) == LogTarget::File);
    REQUIRE(resolve_log_target(LogTarget::Console) == LogTarget::Console);
}

// ============================================================================
// init()
// ============================================================================

TEST_CASE("init: default logger named turboplot with the configured level", "[logging]") {
    DefaultLoggerGuard guard;
    LogConfig config;
    config.level = spdlog::level::debug;
    config.target = LogTarget::Console;
    init(config);

    auto logger = spdlog::default_logger();
    REQUIRE(logger->name() == "turboplot");
    REQUIRE(logger->level() == spdlog::level::debug);
    REQUIRE(logger->sinks().size() == 1);
}

TEST_CASE("init: file target writes to the given path", "[logging]") {
    std::random_device rd;
    const fs::path dir = fs::temp_directory_path() / ("turboplot_log_test_" + std::to_string(rd()));
    fs::create_directories(dir);
    const fs::path log_path = dir / "render.log";

    {
        DefaultLoggerGuard guard;
        LogConfig config;
        config.level = spdlog::level::info;
        config.enable_console = false;
        config.target = LogTarget::File;
        config.file_path = log_path.string();
        init(config);

        REQUIRE(spdlog::default_logger()->sinks().size() == 1);
        spdlog::info("[Test] tile cache warmed");
        spdlog::debug("[Test] below the configured level");
        spdlog::default_logger()->flush();

        const std::string contents = read_file(log_path);
        REQUIRE(contents.find("tile cache warmed") != std::string::npos);
        REQUIRE(contents.find("below the configured level") == std::string::npos);
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
}

#ifdef __linux__
TEST_CASE("init: auto target adds syslog beside the console", "[logging]") {
    DefaultLoggerGuard guard;
    LogConfig config;
    config.target = LogTarget::Auto;
    init(config);
    REQUIRE(spdlog::default_logger()->sinks().size() == 2);
}
#endif
