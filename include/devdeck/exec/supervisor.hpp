/*
 * Execution Supervisor - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Runs one command at a time off the UI thread. spawn() validates, starts a
 * detached worker and returns at once; the worker runs the spec captured,
 * whatever its mode, and delivers exactly one CommandResult through a
 * promise. Interactive specs need the terminal and are refused here. The UI polls try_take() every tick.
 * A second spawn() while a result is still unconsumed is rejected with Busy;
 * requests are never queued.
 *
 * There is no cancellation: dropping the supervisor while a command runs
 * lets the worker finish on its own and discards the result.
 */
#pragma once
#include <devdeck/exec/command_spec.hpp>
#include <devdeck/exec/engine.hpp>
#include <devdeck/exec/errors.hpp>
#include <devdeck/exec/result.hpp>
#include <devdeck/exec/validator.hpp>
#include <chrono>
#include <future>
#include <optional>

namespace devdeck {

struct PendingExecution {
    std::future<CommandResult> result;
    std::chrono::steady_clock::time_point started_at;
    CommandSpec spec;
};

class ExecutionSupervisor {
public:
    ExecutionSupervisor() = default;
    explicit ExecutionSupervisor(Validator validator) : m_validator(std::move(validator)) {}

    ExecutionSupervisor(const ExecutionSupervisor&) = delete;
    ExecutionSupervisor& operator=(const ExecutionSupervisor&) = delete;

    // nullopt when accepted. Busy, validation and interactive-mode errors
    // leave state untouched.
    std::optional<ExecError> spawn(const CommandSpec& spec);

    // Non-blocking. Returns the result once the worker has delivered it and
    // clears the pending slot.
    std::optional<CommandResult> try_take();

    bool busy() const { return m_pending.has_value(); }
    const CommandSpec* pending_spec() const { return m_pending ? &m_pending->spec : nullptr; }
    std::optional<std::chrono::steady_clock::time_point> started_at() const;

    const Validator& validator() const { return m_validator; }

private:
    Validator m_validator;
    ExecutionEngine m_engine;
    std::optional<PendingExecution> m_pending;
};

} // namespace devdeck
