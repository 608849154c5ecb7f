/*
 * Command specification and builder - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * A CommandSpec is the immutable description of one process to run. It is
 * produced by CommandBuilder and never modified afterwards: validation,
 * spawning and logging all read the same instance.
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace devdeck {

enum class ExecMode { Captured, StatusOnly, Interactive };

const char* to_string(ExecMode mode);

class CommandBuilder;

class CommandSpec {
public:
    const std::string& program() const { return m_program; }
    const std::vector<std::string>& args() const { return m_args; }
    const std::optional<std::filesystem::path>& working_dir() const { return m_working_dir; }
    const std::map<std::string, std::string>& env() const { return m_env; }
    ExecMode mode() const { return m_mode; }
    const std::optional<std::string>& log_category() const { return m_log_category; }
    // Stored for callers that display it; the engine does not enforce it.
    const std::optional<std::chrono::milliseconds>& timeout() const { return m_timeout; }
    // Original invocation text (shell text for shell specs, joined argv otherwise).
    const std::string& display() const { return m_display; }

    // Program is `sh` or `bash`.
    bool is_interpreter() const;
    // True for `sh -c <text>` / `bash -c <text>` specs, flags before the
    // text included (`bash -lc <text>`, `sh -e -c <text>`).
    bool is_shell() const;
    // Command text passed to the interpreter; empty for direct specs.
    std::string shell_text() const;

private:
    friend class CommandBuilder;
    CommandSpec() = default;

    std::string m_program;
    std::vector<std::string> m_args;
    std::optional<std::filesystem::path> m_working_dir;
    std::map<std::string, std::string> m_env;
    ExecMode m_mode = ExecMode::Captured;
    std::optional<std::string> m_log_category;
    std::optional<std::chrono::milliseconds> m_timeout;
    std::string m_display;
};

class CommandBuilder {
public:
    explicit CommandBuilder(std::string program);

    // Runs `text` through `sh -c`. Shell features (pipes, &&, redirections)
    // are available; the text must come from trusted configuration.
    static CommandBuilder shell(const std::string& text);
    static CommandBuilder git(const std::string& subcommand);

    CommandBuilder& arg(std::string a);
    CommandBuilder& args(const std::vector<std::string>& list);
    CommandBuilder& working_dir(std::filesystem::path dir);
    CommandBuilder& env(std::string key, std::string value);
    CommandBuilder& mode(ExecMode m);
    CommandBuilder& log_as(std::string category);
    CommandBuilder& timeout(std::chrono::milliseconds t);

    CommandSpec build() const;

private:
    CommandSpec m_spec;
    bool m_shell = false;
};

} // namespace devdeck
