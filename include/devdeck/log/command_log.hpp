/*
 * Command log writer - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * One file per finished command under
 *   <project>/.devdeck/logs/commands/<category>/<YYYY-MM-DD-HHMMSS>-<slug>.log
 * A name already taken within the same second gets a growing `-NNN` suffix.
 * Each category directory keeps only the newest `keep` files.
 */
#pragma once
#include <devdeck/exec/categorizer.hpp>
#include <devdeck/exec/errors.hpp>
#include <devdeck/exec/result.hpp>
#include <cstddef>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace devdeck {

struct LogFile {
    std::filesystem::path path;
    Category category = Category::Other;
    std::filesystem::file_time_type modified{};
    std::string filename;
};

class CommandLogWriter {
public:
    static constexpr std::size_t k_default_keep = 20;

    explicit CommandLogWriter(std::filesystem::path project_dir, std::size_t keep = k_default_keep);

    // Writes the log for `result` and applies retention to its directory.
    std::variant<std::filesystem::path, ExecError> write_log(Category category, const CommandResult& result,
                                                             const std::filesystem::path& working_dir);

    // Deletes all but the newest `keep` *.log files (mtime, then write
    // sequence from the name).
    // Returns the number of files removed.
    std::size_t cleanup_old_logs(Category category) const;

    std::vector<LogFile> recent_logs(Category category, std::size_t limit) const;
    std::vector<LogFile> recent_logs_all(std::size_t limit) const;

    std::filesystem::path commands_dir() const;
    std::filesystem::path category_dir(Category category) const;
    std::size_t keep() const { return m_keep; }

private:
    std::filesystem::path m_project_dir;
    std::size_t m_keep;
};

// Filename fragment for a command: second word after any `cd <dir> &&`,
// else the first, reduced to [A-Za-z0-9-]; "cmd" when nothing is left.
std::string command_slug(const std::string& command_text);

// Full log text. Output sections are present only for failed results.
std::string format_log(const CommandResult& result, const std::filesystem::path& working_dir);

} // namespace devdeck
