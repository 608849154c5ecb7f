/*
 * Command runner implementation - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/app/runner.hpp>
#include <devdeck/log/diagnostics.hpp>
#include <devdeck/term/terminal.hpp>

namespace devdeck {

namespace fs = std::filesystem;

// Last few hundred bytes of output, enough to see why a command failed.
static std::string tail_of(const std::string& s, size_t max = 400) {
    size_t end = s.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return {};
    std::string t = s.substr(0, end + 1);
    if (t.size() > max) t = "..." + t.substr(t.size() - max);
    return t;
}

RunnerOptions RunnerOptions::from_config(const DevdeckConfig& cfg, fs::path project_dir) {
    RunnerOptions o;
    o.project_dir = std::move(project_dir);
    o.min_visible = cfg.min_visible;
    o.log_keep = cfg.log_keep;
    o.policy.trusted_config_source = cfg.trusted_config;
    return o;
}

CommandRunner::CommandRunner(RunnerOptions opts)
    : m_opts(std::move(opts)),
      m_supervisor(Validator(m_opts.policy)),
      m_gate(m_opts.min_visible),
      m_logs(m_opts.project_dir, m_opts.log_keep),
      m_state(m_opts.project_dir) {}

CommandRunner::~CommandRunner() {
    if (m_gate.active() && m_current) {
        log::info("EXEC", "abandoning '{}' (still running at shutdown)", m_current->display());
    }
    m_gate.reset();
}

std::optional<ExecError> CommandRunner::submit(const NamedCommand& cmd) {
    auto spec = CommandBuilder::shell(cmd.text).working_dir(m_opts.project_dir).build();
    return submit(spec, cmd.build_task ? cmd.name : std::string());
}

std::optional<ExecError> CommandRunner::submit(const CommandSpec& spec, const std::string& task) {
    if (m_gate.active()) {
        std::string what = m_current ? m_current->display() : std::string("a command");
        return ExecError{ErrorKind::Busy, "'" + what + "' is still running"};
    }
    if (spec.mode() == ExecMode::Interactive) {
        return ExecError{ErrorKind::SpawnFailed,
                         "'" + spec.display() + "' needs the terminal; use run_interactive"};
    }
    if (auto err = m_supervisor.validator().validate(spec)) {
        log::warn("EXEC", "rejected '{}': {}", spec.display(), err->message);
        return err;
    }

    bool is_build = categorize(spec.display()) == Category::Build;
    if (is_build) {
        if (auto err = m_state.mark_running(task.empty() ? spec.display() : task)) {
            log::error("STATE", "failed to mark build running: {}", err->message);
        }
    }

    if (auto err = m_supervisor.spawn(spec)) return err;

    fs::path dir = spec.working_dir() ? *spec.working_dir() : fs::current_path();
    log::info("EXEC", "Executing: {} in {}", spec.display(), dir.string());
    m_current = spec;
    m_current_task = task;
    m_gate.start(*m_supervisor.started_at());
    return std::nullopt;
}

std::optional<SettledRun> CommandRunner::tick(std::chrono::steady_clock::time_point now) {
    if (m_gate.state() == GateState::Running) {
        if (auto result = m_supervisor.try_take()) m_gate.offer(std::move(*result));
    }
    auto released = m_gate.poll(now);
    if (!released) return std::nullopt;
    return settle(std::move(*released));
}

SettledRun CommandRunner::settle(CommandResult result) {
    SettledRun out;
    out.category = categorize(result.command_display);
    if (m_current && m_current->log_category()) {
        if (auto c = parse_category(*m_current->log_category())) out.category = *c;
    }

    if (result.success) {
        log::info("EXEC", "Success: {} ({} ms)", result.command_display, result.duration.count());
    } else {
        std::string detail = tail_of(result.stderr_text);
        if (detail.empty()) detail = tail_of(result.stdout_text);
        log::warn("EXEC", "Failed: {} (exit {}) {}", result.command_display, result.exit_code, detail);
    }

    fs::path wd = (m_current && m_current->working_dir()) ? *m_current->working_dir() : m_opts.project_dir;
    auto written = m_logs.write_log(out.category, result, wd);
    if (auto* p = std::get_if<fs::path>(&written)) {
        out.log_path = *p;
    } else {
        log::error("LOGS", "failed to write command log: {}", std::get<ExecError>(written).message);
    }

    out.build_state_updated = update_build_state(m_state, result, m_current_task);
    out.result = std::move(result);
    m_current.reset();
    m_current_task.clear();
    return out;
}

std::optional<ExecError> CommandRunner::run_interactive(const CommandSpec& spec, TerminalSession& term) {
    if (m_gate.active()) return ExecError{ErrorKind::Busy, "a command is still running"};
    if (auto err = m_supervisor.validator().validate(spec)) return err;
    log::info("EXEC", "Interactive: {}", spec.display());
    std::optional<ExecError> err;
    {
        TerminalRelease handover(term);
        err = m_engine.run_interactive(spec);
    }
    if (err) log::warn("EXEC", "{}", err->message);
    return err;
}

} // namespace devdeck
