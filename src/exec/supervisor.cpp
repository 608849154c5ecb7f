/*
 * Execution Supervisor implementation - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/exec/supervisor.hpp>
#include <exception>
#include <thread>

namespace devdeck {

static CommandResult failed_result(const CommandSpec& spec, const std::string& message,
                                   std::chrono::system_clock::time_point started_at) {
    return make_result(spec.display(), "", message, k_signal_exit_code, started_at, std::chrono::milliseconds(0));
}

std::optional<ExecError> ExecutionSupervisor::spawn(const CommandSpec& spec) {
    if (m_pending) {
        return ExecError{ErrorKind::Busy, "'" + m_pending->spec.display() + "' is still running"};
    }
    if (spec.mode() == ExecMode::Interactive) {
        return ExecError{ErrorKind::SpawnFailed,
                         "'" + spec.display() + "' needs the terminal; run it in the foreground"};
    }
    if (auto err = m_validator.validate(spec)) return err;

    std::promise<CommandResult> promise;
    std::future<CommandResult> future = promise.get_future();
    auto started = std::chrono::steady_clock::now();

    // The worker owns its own copy of the spec and the promise; nothing it
    // touches is shared with the UI thread except the future's state. It may
    // outlive the supervisor (and the process statics), so it never logs:
    // failures travel in the result and are reported when it is consumed.
    std::thread worker([prom = std::move(promise), spec, engine = m_engine]() mutable {
        auto wall_start = std::chrono::system_clock::now();
        CommandResult result;
        try {
            CaptureOutcome outcome = engine.run_captured(spec);
            if (auto* e = std::get_if<ExecError>(&outcome)) {
                result = failed_result(spec, e->message, wall_start);
            } else {
                result = std::move(std::get<CommandResult>(outcome));
            }
        } catch (const std::exception& ex) {
            result = failed_result(spec, ex.what(), wall_start);
        }
        prom.set_value(std::move(result));
    });
    worker.detach();

    m_pending = PendingExecution{std::move(future), started, spec};
    return std::nullopt;
}

std::optional<CommandResult> ExecutionSupervisor::try_take() {
    if (!m_pending) return std::nullopt;
    if (m_pending->result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return std::nullopt;
    CommandResult result = m_pending->result.get();
    m_pending.reset();
    return result;
}

std::optional<std::chrono::steady_clock::time_point> ExecutionSupervisor::started_at() const {
    if (!m_pending) return std::nullopt;
    return m_pending->started_at;
}

} // namespace devdeck
