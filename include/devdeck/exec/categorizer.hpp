/*
 * Command categorizer - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Pure classification of raw command text. Used to pick the log directory and
 * to decide whether a result updates the build state.
 */
#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace devdeck {

enum class Category { Build, Test, Lint, Git, Other };

// Total over all inputs; empty or unrecognised text is Other.
Category categorize(std::string_view text);

// Removes one leading `cd <path> &&` (case preserved). Text without the
// prefix is returned unchanged.
std::string strip_cd_prefix(std::string_view text);

const char* to_string(Category c);     // "Build", "Test", ...
const char* log_dir_name(Category c);  // "build", "test", ...
std::optional<Category> parse_category(std::string_view name);

} // namespace devdeck
