/*
 * Command runner - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Application-side owner of the execution pipeline for one project:
 *
 *   submit() -> Supervisor (worker thread) -> tick(): try_take -> AnimationGate
 *            -> settle: categorize, write command log, update build state
 *
 * Everything here runs on the UI thread; the only blocking call is
 * run_interactive(), which hands the terminal to the child.
 */
#pragma once
#include <devdeck/config/config.hpp>
#include <devdeck/exec/animation_gate.hpp>
#include <devdeck/exec/categorizer.hpp>
#include <devdeck/exec/command_spec.hpp>
#include <devdeck/exec/engine.hpp>
#include <devdeck/exec/errors.hpp>
#include <devdeck/exec/result.hpp>
#include <devdeck/exec/supervisor.hpp>
#include <devdeck/exec/validator.hpp>
#include <devdeck/log/command_log.hpp>
#include <devdeck/state/build_state.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace devdeck {

class TerminalSession;

struct RunnerOptions {
    std::filesystem::path project_dir;
    std::chrono::milliseconds min_visible{AnimationGate::k_default_min_visible};
    std::size_t log_keep = CommandLogWriter::k_default_keep;
    ValidatorPolicy policy;

    static RunnerOptions from_config(const DevdeckConfig& cfg, std::filesystem::path project_dir);
};

// What the UI gets once a command has settled.
struct SettledRun {
    CommandResult result;
    Category category = Category::Other;
    std::optional<std::filesystem::path> log_path;  // nullopt if the write failed
    bool build_state_updated = false;
};

class CommandRunner {
public:
    explicit CommandRunner(RunnerOptions opts);
    ~CommandRunner();

    CommandRunner(const CommandRunner&) = delete;
    CommandRunner& operator=(const CommandRunner&) = delete;

    // Runs a configured command through the shell in the project directory.
    std::optional<ExecError> submit(const NamedCommand& cmd);
    // `task` names the build in the state file; empty uses the command text.
    std::optional<ExecError> submit(const CommandSpec& spec, const std::string& task = {});

    // Call once per UI tick. Returns the result the first time the gate
    // releases it, after logging and build-state bookkeeping are done.
    std::optional<SettledRun> tick(std::chrono::steady_clock::time_point now);

    // Validates, releases the terminal, waits for the child, reacquires.
    std::optional<ExecError> run_interactive(const CommandSpec& spec, TerminalSession& term);

    bool running() const { return m_gate.active(); }
    const AnimationGate& gate() const { return m_gate; }
    const ExecutionSupervisor& supervisor() const { return m_supervisor; }
    const ExecutionEngine& engine() const { return m_engine; }
    const CommandLogWriter& logs() const { return m_logs; }
    const BuildStateStore& build_state() const { return m_state; }
    const std::filesystem::path& project_dir() const { return m_opts.project_dir; }
    // Spec of the command currently tracked by the gate.
    const std::optional<CommandSpec>& current() const { return m_current; }

private:
    SettledRun settle(CommandResult result);

    RunnerOptions m_opts;
    ExecutionSupervisor m_supervisor;
    ExecutionEngine m_engine;
    AnimationGate m_gate;
    CommandLogWriter m_logs;
    BuildStateStore m_state;
    std::optional<CommandSpec> m_current;
    std::string m_current_task;
};

} // namespace devdeck
