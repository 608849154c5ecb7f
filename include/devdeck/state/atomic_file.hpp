/*
 * Atomic file replacement - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <devdeck/exec/errors.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace devdeck {

// Writes `content` to `<target>.tmp`, fsyncs it and renames it over
// `target`. Readers see either the old file or the new one, never a prefix.
// Returns an Io error (with strerror text) on failure; the target is left
// untouched in that case.
std::optional<ExecError> write_file_atomic(const std::filesystem::path& target, const std::string& content);

std::filesystem::path temp_path_for(const std::filesystem::path& target);

} // namespace devdeck
