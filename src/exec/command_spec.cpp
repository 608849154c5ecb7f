/*
 * Command specification and builder implementation - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/exec/command_spec.hpp>
#include <devdeck/exec/errors.hpp>
#include <string_view>

namespace devdeck {

namespace {

// Single-letter shell flags that do not change where the command text comes
// from. Anything else (-s, -i, unknown long options) disqualifies the spec.
constexpr std::string_view k_plain_shell_flags = "efhlnuvx";

// Position of <text> in `sh [flags] -c <text> [args]`, or npos when the
// arguments are not a `-c` invocation. Bundled flags (-lc, -ec) count.
size_t find_shell_text(const std::vector<std::string>& args) {
    bool has_c = false;
    size_t i = 0;
    for (; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--") { ++i; break; }
        if (a == "--login" || a == "--noprofile" || a == "--norc") continue;
        if (a.size() < 2 || (a[0] != '-' && a[0] != '+') || a[1] == '-') break;
        if (a == "-o" || a == "+o") { ++i; continue; } // option name follows
        for (size_t k = 1; k < a.size(); ++k) {
            if (a[k] == 'c' && a[0] == '-') has_c = true;
            else if (k_plain_shell_flags.find(a[k]) == std::string_view::npos) return std::string::npos;
        }
    }
    if (!has_c || i >= args.size()) return std::string::npos;
    return i;
}

} // namespace

const char* to_string(ExecMode mode) {
    switch (mode) {
        case ExecMode::Captured: return "captured";
        case ExecMode::StatusOnly: return "status";
        case ExecMode::Interactive: return "interactive";
    }
    return "?";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EmptyCommand: return "EmptyCommand";
        case ErrorKind::NotWhitelisted: return "NotWhitelisted";
        case ErrorKind::UntrustedShellSyntax: return "UntrustedShellSyntax";
        case ErrorKind::Busy: return "Busy";
        case ErrorKind::SpawnFailed: return "SpawnFailed";
        case ErrorKind::NonZeroExit: return "NonZeroExit";
        case ErrorKind::Io: return "Io";
    }
    return "?";
}

bool CommandSpec::is_interpreter() const {
    return m_program == "sh" || m_program == "bash";
}

bool CommandSpec::is_shell() const {
    return is_interpreter() && find_shell_text(m_args) != std::string::npos;
}

std::string CommandSpec::shell_text() const {
    if (!is_interpreter()) return std::string();
    size_t i = find_shell_text(m_args);
    return i == std::string::npos ? std::string() : m_args[i];
}

CommandBuilder::CommandBuilder(std::string program) {
    m_spec.m_program = std::move(program);
}

CommandBuilder CommandBuilder::shell(const std::string& text) {
    CommandBuilder b("sh");
    b.m_spec.m_args = {"-c", text};
    b.m_spec.m_display = text;
    b.m_shell = true;
    return b;
}

CommandBuilder CommandBuilder::git(const std::string& subcommand) {
    CommandBuilder b("git");
    b.arg(subcommand);
    return b;
}

CommandBuilder& CommandBuilder::arg(std::string a) {
    m_spec.m_args.push_back(std::move(a));
    return *this;
}

CommandBuilder& CommandBuilder::args(const std::vector<std::string>& list) {
    for (auto &a : list) m_spec.m_args.push_back(a);
    return *this;
}

CommandBuilder& CommandBuilder::working_dir(std::filesystem::path dir) {
    m_spec.m_working_dir = std::move(dir);
    return *this;
}

CommandBuilder& CommandBuilder::env(std::string key, std::string value) {
    m_spec.m_env[std::move(key)] = std::move(value);
    return *this;
}

CommandBuilder& CommandBuilder::mode(ExecMode m) {
    m_spec.m_mode = m;
    return *this;
}

CommandBuilder& CommandBuilder::log_as(std::string category) {
    m_spec.m_log_category = std::move(category);
    return *this;
}

CommandBuilder& CommandBuilder::timeout(std::chrono::milliseconds t) {
    m_spec.m_timeout = t;
    return *this;
}

CommandSpec CommandBuilder::build() const {
    CommandSpec spec = m_spec;
    if (!m_shell) {
        std::string display = spec.m_program;
        for (auto &a : spec.m_args) { display += ' '; display += a; }
        spec.m_display = display;
    }
    return spec;
}

} // namespace devdeck
