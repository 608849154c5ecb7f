/*
 * Execution errors - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>

namespace devdeck {

enum class ErrorKind {
    EmptyCommand,          // nothing to run
    NotWhitelisted,        // program (or first shell token) not in allow-list
    UntrustedShellSyntax,  // shell metacharacters while trust flag is off
    Busy,                  // a command is already in flight
    SpawnFailed,           // OS refused to create/exec the process
    NonZeroExit,           // interactive child exited with failure
    Io                     // log / state write failure
};

struct ExecError {
    ErrorKind kind;
    std::string message;
};

const char* to_string(ErrorKind kind);

// Validation-class errors are raised before any process exists.
inline bool is_validation_error(ErrorKind kind) {
    return kind == ErrorKind::EmptyCommand || kind == ErrorKind::NotWhitelisted
        || kind == ErrorKind::UntrustedShellSyntax;
}

} // namespace devdeck
