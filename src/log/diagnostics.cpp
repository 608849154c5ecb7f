/*
 * Diagnostics logging implementation - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/log/diagnostics.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <system_error>
#include <vector>

namespace devdeck::log {

namespace fs = std::filesystem;

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;
fs::path g_file;

constexpr const char* k_pattern = "[%Y-%m-%d %H:%M:%S] %l [%n] %v";

std::shared_ptr<spdlog::logger> make_stderr_logger() {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern(k_pattern);
    auto lg = std::make_shared<spdlog::logger>("devdeck", sink);
    lg->set_level(spdlog::level::warn);
    return lg;
}

fs::path choose_log_file(const fs::path& project_dir) {
    std::error_code ec;
    if (!project_dir.empty() && fs::is_directory(project_dir / ".devdeck", ec)) {
        return project_dir / ".devdeck" / "logs" / "devdeck.log";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".devdeck" / "logs" / "devdeck.log";
    }
    return fs::temp_directory_path(ec) / "devdeck.log";
}

} // namespace

void init(const Options& opts) {
    fs::path file = choose_log_file(opts.project_dir);
    std::vector<spdlog::sink_ptr> sinks;
    if (opts.console) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(spdlog::level::warn);
        console->set_pattern(k_pattern);
        sinks.push_back(console);
    }
    std::error_code ec;
    fs::create_directories(file.parent_path(), ec);
    bool have_file = false;
    if (!ec) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string(), false);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern(k_pattern);
            sinks.push_back(file_sink);
            have_file = true;
        } catch (const spdlog::spdlog_ex& ex) {
            std::fprintf(stderr, "devdeck: cannot open log file %s: %s\n", file.c_str(), ex.what());
        }
    } else {
        std::fprintf(stderr, "devdeck: cannot create log dir %s: %s\n", file.parent_path().c_str(), ec.message().c_str());
    }
    if (sinks.empty()) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern(k_pattern);
        sinks.push_back(console);
    }
    auto lg = std::make_shared<spdlog::logger>("devdeck", sinks.begin(), sinks.end());
    lg->set_level(spdlog::level::from_str(opts.level));
    lg->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(g_mutex);
    g_logger = lg;
    g_file = have_file ? file : fs::path();
    g_logger->info("[LOG] logger initialized ({})", have_file ? file.string() : std::string("stderr"));
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) g_logger = make_stderr_logger();
    return g_logger;
}

fs::path file_path() {
    std::lock_guard<std::mutex> lock(g_mutex);
    return g_file;
}

} // namespace devdeck::log
