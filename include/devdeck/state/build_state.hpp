/*
 * Build state record - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Last build outcome of a project, kept in <project>/.devdeck/state/build.json:
 *   {"timestamp": 1735689600, "status": "Success", "task": "build"}
 * Only Build-classified commands touch it. Writes are atomic.
 */
#pragma once
#include <devdeck/exec/errors.hpp>
#include <devdeck/exec/result.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace devdeck {

enum class BuildStatus { Success, Failed, Running };

const char* to_string(BuildStatus s);
std::optional<BuildStatus> parse_build_status(const std::string& s);

struct BuildStateRecord {
    std::int64_t timestamp = 0;   // unix seconds
    BuildStatus status = BuildStatus::Running;
    std::string task;
};

std::string to_json(const BuildStateRecord& rec);
// nullopt when the text is not a complete record.
std::optional<BuildStateRecord> parse_build_state_json(const std::string& json);

class BuildStateStore {
public:
    explicit BuildStateStore(std::filesystem::path project_dir);

    std::filesystem::path path() const;

    std::optional<ExecError> save(const BuildStateRecord& rec) const;
    std::optional<BuildStateRecord> load() const;

    // Running, before a build command starts.
    std::optional<ExecError> mark_running(const std::string& task) const;
    // Success/Failed from a finished result; `task` falls back to the command text.
    std::optional<ExecError> record_result(const CommandResult& result, const std::string& task = {}) const;

private:
    std::filesystem::path m_project_dir;
};

// Writes the result only when the command text categorizes as Build.
// Returns true when the record was written.
bool update_build_state(const BuildStateStore& store, const CommandResult& result, const std::string& task = {});

std::optional<BuildStateRecord> load_build_state(const std::filesystem::path& project_dir);

} // namespace devdeck
