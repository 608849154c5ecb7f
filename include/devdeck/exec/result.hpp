/*
 * Command result - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <string>

namespace devdeck {

// Exit code reported for a child terminated by a signal.
constexpr int k_signal_exit_code = -1;

struct CommandResult {
    std::string command_display;   // original invocation text
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    bool success = false;          // always exit_code == 0
    std::chrono::system_clock::time_point started_at{};
    std::chrono::milliseconds duration{0};
};

inline CommandResult make_result(std::string display, std::string out, std::string err, int exit_code,
                                 std::chrono::system_clock::time_point started_at,
                                 std::chrono::milliseconds duration) {
    CommandResult r;
    r.command_display = std::move(display);
    r.stdout_text = std::move(out);
    r.stderr_text = std::move(err);
    r.exit_code = exit_code;
    r.success = exit_code == 0;
    r.started_at = started_at;
    r.duration = duration;
    return r;
}

} // namespace devdeck
