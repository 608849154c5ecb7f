/*
 * Diagnostics logging - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Runtime log of the tool itself (not the per-command logs). Backed by a
 * named spdlog logger writing to <project>/.devdeck/logs/devdeck.log, or
 * ~/.devdeck/logs/devdeck.log when the project has no tool directory, plus a
 * stderr sink for warnings. Usable before init(): messages then go to a
 * stderr-only logger.
 */
#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <spdlog/spdlog.h>

namespace devdeck::log {

struct Options {
    std::filesystem::path project_dir;  // empty: use home directory
    std::string level = "info";         // trace|debug|info|warn|error|off
    bool console = true;                // mirror warnings to stderr
};

// Idempotent per process; a later call replaces the sinks.
void init(const Options& opts);

std::shared_ptr<spdlog::logger> logger();

// Path of the active log file, empty when only stderr is in use.
std::filesystem::path file_path();

template <typename... Args>
void info(std::string_view category, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger()->info("[{}] {}", category, fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::string_view category, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger()->warn("[{}] {}", category, fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::string_view category, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger()->error("[{}] {}", category, fmt::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(std::string_view category, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger()->debug("[{}] {}", category, fmt::format(fmt, std::forward<Args>(args)...));
}

} // namespace devdeck::log
