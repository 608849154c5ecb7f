/*
 * PATH resolution utilities - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <optional>

namespace devdeck {

// Resolve command name to an executable path. Names containing '/' are
// checked as given. `path_env` replaces $PATH when set (CommandSpec env override).
std::optional<std::string> resolve_executable(const std::string& cmd,
                                              const std::optional<std::string>& path_env = std::nullopt);

} // namespace devdeck
