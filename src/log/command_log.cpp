/*
 * Command log writer implementation - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/log/command_log.hpp>
#include <devdeck/log/diagnostics.hpp>
#include <devdeck/state/atomic_file.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <system_error>
#include <utility>

namespace devdeck {

namespace fs = std::filesystem;

namespace {

constexpr size_t k_max_slug = 40;
constexpr size_t k_seq_min_digits = 3;
constexpr size_t k_seq_max_digits = 9;

std::string format_time(std::chrono::system_clock::time_point tp, const char* pattern) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), pattern, &tm);
    return std::string(buf, n);
}

// "<base>-NNN.log" -> {base, NNN}; a name without a collision suffix is
// sequence 0, so it orders before every suffixed sibling.
std::pair<std::string, unsigned long> split_sequence(const std::string& filename) {
    std::string stem = filename;
    if (stem.size() > 4 && stem.compare(stem.size() - 4, 4, ".log") == 0) stem.resize(stem.size() - 4);
    size_t dash = stem.rfind('-');
    if (dash == std::string::npos) return {stem, 0};
    size_t digits = stem.size() - dash - 1;
    if (digits < k_seq_min_digits || digits > k_seq_max_digits) return {stem, 0};
    for (size_t i = dash + 1; i < stem.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(stem[i]))) return {stem, 0};
    }
    return {stem.substr(0, dash), std::stoul(stem.substr(dash + 1))};
}

// mtime first; same-instant files fall back to write order encoded in the name.
bool newer_first(const LogFile& a, const LogFile& b) {
    if (a.modified != b.modified) return a.modified > b.modified;
    auto ka = split_sequence(a.filename);
    auto kb = split_sequence(b.filename);
    if (ka.first != kb.first) return ka.first > kb.first;
    return ka.second > kb.second;
}

// First free name for `base`. Suffixes only grow, so a name freed by
// retention is never handed out again while newer siblings exist.
fs::path next_log_path(const fs::path& dir, const std::string& base) {
    fs::path plain = dir / (base + ".log");
    std::error_code ec;
    bool taken = fs::exists(plain, ec);
    unsigned long last = 0;
    fs::directory_iterator it(dir, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        auto key = split_sequence(it->path().filename().string());
        if (key.first != base || key.second == 0) continue;
        taken = true;
        if (key.second > last) last = key.second;
    }
    if (!taken) return plain;
    char suffix[24];
    std::snprintf(suffix, sizeof(suffix), "-%03lu", last + 1);
    return dir / (base + suffix + ".log");
}

void collect_logs(const fs::path& dir, Category category, std::vector<LogFile>& out) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec), end;
    if (ec) return;
    for (; it != end; it.increment(ec)) {
        if (ec) break;
        const fs::path& p = it->path();
        if (p.extension() != ".log") continue;
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        auto mtime = it->last_write_time(fec);
        if (fec) continue;
        out.push_back(LogFile{p, category, mtime, p.filename().string()});
    }
}

} // namespace

std::string command_slug(const std::string& command_text) {
    std::istringstream iss(strip_cd_prefix(command_text));
    std::vector<std::string> words;
    std::string w;
    while (iss >> w && words.size() < 2) words.push_back(w);
    std::string src = words.size() >= 2 ? words[1] : (words.empty() ? std::string() : words[0]);
    std::string slug;
    for (char c : src) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-') slug.push_back(c);
        if (slug.size() >= k_max_slug) break;
    }
    return slug.empty() ? "cmd" : slug;
}

std::string format_log(const CommandResult& result, const fs::path& working_dir) {
    std::ostringstream os;
    os << "Command: " << result.command_display << "\n";
    os << "Timestamp: " << format_time(result.started_at, "%Y-%m-%d %H:%M:%S") << "\n";
    os << "Exit Code: " << result.exit_code << "\n";
    os << "Working Directory: " << working_dir.string() << "\n";
    os << "Duration: " << result.duration.count() << "ms\n";
    if (!result.success) {
        os << "\n--- STDOUT ---\n" << result.stdout_text;
        if (!result.stdout_text.empty() && result.stdout_text.back() != '\n') os << "\n";
        os << "\n--- STDERR ---\n" << result.stderr_text;
        if (!result.stderr_text.empty() && result.stderr_text.back() != '\n') os << "\n";
    }
    return os.str();
}

CommandLogWriter::CommandLogWriter(fs::path project_dir, size_t keep)
    : m_project_dir(std::move(project_dir)), m_keep(keep == 0 ? 1 : keep) {}

fs::path CommandLogWriter::commands_dir() const {
    return m_project_dir / ".devdeck" / "logs" / "commands";
}

fs::path CommandLogWriter::category_dir(Category category) const {
    return commands_dir() / log_dir_name(category);
}

std::variant<fs::path, ExecError> CommandLogWriter::write_log(Category category, const CommandResult& result,
                                                              const fs::path& working_dir) {
    fs::path dir = category_dir(category);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return ExecError{ErrorKind::Io, "cannot create " + dir.string() + ": " + ec.message()};
    }

    std::string base = format_time(result.started_at, "%Y-%m-%d-%H%M%S") + "-" + command_slug(result.command_display);
    fs::path target = next_log_path(dir, base);

    if (auto err = write_file_atomic(target, format_log(result, working_dir))) return *err;

    size_t removed = cleanup_old_logs(category);
    if (removed > 0) log::debug("LOGS", "removed {} old {} log(s)", removed, log_dir_name(category));
    return target;
}

size_t CommandLogWriter::cleanup_old_logs(Category category) const {
    std::vector<LogFile> logs;
    collect_logs(category_dir(category), category, logs);
    if (logs.size() <= m_keep) return 0;
    std::sort(logs.begin(), logs.end(), newer_first);
    size_t removed = 0;
    for (size_t i = m_keep; i < logs.size(); ++i) {
        std::error_code ec;
        if (fs::remove(logs[i].path, ec)) {
            ++removed;
        } else if (ec) {
            log::warn("LOGS", "cannot remove {}: {}", logs[i].path.string(), ec.message());
        }
    }
    return removed;
}

std::vector<LogFile> CommandLogWriter::recent_logs(Category category, size_t limit) const {
    std::vector<LogFile> logs;
    collect_logs(category_dir(category), category, logs);
    std::sort(logs.begin(), logs.end(), newer_first);
    if (logs.size() > limit) logs.resize(limit);
    return logs;
}

std::vector<LogFile> CommandLogWriter::recent_logs_all(size_t limit) const {
    std::vector<LogFile> logs;
    for (Category c : {Category::Build, Category::Test, Category::Lint, Category::Git, Category::Other}) {
        collect_logs(category_dir(c), c, logs);
    }
    std::sort(logs.begin(), logs.end(), newer_first);
    if (logs.size() > limit) logs.resize(limit);
    return logs;
}

} // namespace devdeck
