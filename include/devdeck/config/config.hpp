/*
 * Configuration - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Two sources:
 *   ~/.devdeckrc (or $DEVDECK_RC)   key=value user settings
 *   <project>/.devdeck/commands     name = command text, one per line
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace devdeck {

class ExecutionEngine;

struct DevdeckConfig {
    std::chrono::milliseconds tick{16};
    std::chrono::milliseconds min_visible{500};
    std::chrono::milliseconds result_display{3000};
    std::size_t log_keep = 20;
    std::string log_level = "info";
    bool color = true;
    std::string editor;          // empty: detect
    bool trusted_config = true;  // allow shell syntax in configured commands
};

struct NamedCommand {
    std::string name;
    std::string text;
    bool build_task = false;     // declared as `build:<name>`
};

std::filesystem::path default_rc_path();

// Unknown keys are ignored; a malformed number keeps its default.
DevdeckConfig parse_config(std::istream& in, DevdeckConfig base = {});
DevdeckConfig load_config(const std::filesystem::path& rc_path = default_rc_path());

std::vector<NamedCommand> parse_commands(std::istream& in);
std::vector<NamedCommand> load_commands(const std::filesystem::path& project_dir);
std::filesystem::path commands_file(const std::filesystem::path& project_dir);

// `editor` key, $EDITOR, $VISUAL, then the first installed of vim/nano/vi/emacs
// (probed with `which` in status mode), finally "vi".
std::string default_editor(const DevdeckConfig& cfg, const ExecutionEngine& engine);

} // namespace devdeck
