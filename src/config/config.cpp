/*
 * Configuration implementation - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/config/config.hpp>
#include <devdeck/exec/command_spec.hpp>
#include <devdeck/exec/engine.hpp>
#include <devdeck/log/diagnostics.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace devdeck {

namespace fs = std::filesystem;

static std::string getenv_or(const char* k, const std::string& def = "") {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}

static std::string trim(const std::string& s) {
    size_t a = 0; while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    size_t b = s.size(); while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    return s.substr(a, b - a);
}

static bool parse_bool(const std::string& v) { return v == "1" || v == "true" || v == "on" || v == "yes"; }

static bool parse_count(const std::string& key, const std::string& val, long long& out) {
    try {
        size_t used = 0;
        long long n = std::stoll(val, &used);
        if (used != val.size() || n < 0) throw std::invalid_argument(val);
        out = n;
        return true;
    } catch (const std::logic_error&) {
        log::warn("CONFIG", "ignoring invalid value for {}: '{}'", key, val);
        return false;
    }
}

static void parse_ms(const std::string& key, const std::string& val, std::chrono::milliseconds& out) {
    long long n = 0;
    if (parse_count(key, val, n)) out = std::chrono::milliseconds(n);
}

fs::path default_rc_path() {
    std::string over = getenv_or("DEVDECK_RC");
    if (!over.empty()) return over;
    std::string home = getenv_or("HOME");
    if (home.empty()) return {};
    return fs::path(home) / ".devdeckrc";
}

DevdeckConfig parse_config(std::istream& in, DevdeckConfig cfg) {
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        auto key = trim(line.substr(0, eq));
        auto val = trim(line.substr(eq + 1));
        long long n = 0;
        if (key == "tick_ms") {
            if (parse_count(key, val, n) && n > 0) cfg.tick = std::chrono::milliseconds(n);
        } else if (key == "min_visible_ms") parse_ms(key, val, cfg.min_visible);
        else if (key == "result_display_ms") parse_ms(key, val, cfg.result_display);
        else if (key == "log_keep") {
            if (parse_count(key, val, n) && n > 0) cfg.log_keep = static_cast<size_t>(n);
        }
        else if (key == "log_level") cfg.log_level = val;
        else if (key == "color") cfg.color = parse_bool(val);
        else if (key == "editor") cfg.editor = val;
        else if (key == "trusted_config") cfg.trusted_config = parse_bool(val);
    }
    return cfg;
}

DevdeckConfig load_config(const fs::path& rc_path) {
    if (rc_path.empty()) return {};
    std::ifstream in(rc_path);
    if (!in) return {};
    return parse_config(in);
}

std::vector<NamedCommand> parse_commands(std::istream& in) {
    std::vector<NamedCommand> out;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            log::warn("CONFIG", "commands:{}: expected 'name = command'", lineno);
            continue;
        }
        NamedCommand cmd;
        cmd.name = trim(line.substr(0, eq));
        cmd.text = trim(line.substr(eq + 1));
        if (cmd.name.rfind("build:", 0) == 0) {
            cmd.build_task = true;
            cmd.name = trim(cmd.name.substr(6));
        }
        if (cmd.name.empty() || cmd.text.empty()) {
            log::warn("CONFIG", "commands:{}: empty name or command", lineno);
            continue;
        }
        out.push_back(std::move(cmd));
    }
    return out;
}

fs::path commands_file(const fs::path& project_dir) {
    return project_dir / ".devdeck" / "commands";
}

std::vector<NamedCommand> load_commands(const fs::path& project_dir) {
    std::ifstream in(commands_file(project_dir));
    if (!in) return {};
    return parse_commands(in);
}

std::string default_editor(const DevdeckConfig& cfg, const ExecutionEngine& engine) {
    if (!cfg.editor.empty()) return cfg.editor;
    for (const char* var : {"EDITOR", "VISUAL"}) {
        std::string v = getenv_or(var);
        if (!v.empty()) return v;
    }
    for (const char* candidate : {"vim", "nano", "vi", "emacs"}) {
        auto probe = CommandBuilder("which").arg(candidate).mode(ExecMode::StatusOnly).build();
        if (engine.run_status(probe)) return candidate;
    }
    return "vi";
}

} // namespace devdeck
