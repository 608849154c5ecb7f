/*
 * POSIX Execution Engine - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Spawns a validated CommandSpec in one of three modes:
 *   captured    - stdout/stderr collected, full CommandResult returned
 *   status      - output discarded, only success reported
 *   interactive - standard streams inherited; the caller must have released
 *                 the terminal beforehand (the engine never changes tty modes)
 * Working directory and environment overrides apply to every mode.
 */
#pragma once
#include <devdeck/exec/command_spec.hpp>
#include <devdeck/exec/errors.hpp>
#include <devdeck/exec/result.hpp>
#include <optional>
#include <string>
#include <variant>

namespace devdeck {

using CaptureOutcome = std::variant<CommandResult, ExecError>;

class ExecutionEngine {
public:
    CaptureOutcome run_captured(const CommandSpec& spec) const;
    bool run_status(const CommandSpec& spec) const;
    std::optional<ExecError> run_interactive(const CommandSpec& spec) const;

    // Dispatch on spec.mode(); status/interactive outcomes are folded into a
    // CommandResult with empty output. Spawn failures stay ExecErrors in
    // every mode.
    CaptureOutcome run(const CommandSpec& spec) const;
};

// Replace invalid UTF-8 sequences with U+FFFD.
std::string decode_lossy(const std::string& bytes);

} // namespace devdeck
