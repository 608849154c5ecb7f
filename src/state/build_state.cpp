/*
 * Build state record implementation - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/state/build_state.hpp>
#include <devdeck/exec/categorizer.hpp>
#include <devdeck/log/diagnostics.hpp>
#include <devdeck/state/atomic_file.hpp>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace devdeck {

namespace fs = std::filesystem;

namespace {

std::string escape_json(const std::string& in) {
    std::string out;
    out.reserve(in.size() + 8);
    for (char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

// Position just after `"key"` and the following ':', or npos.
size_t value_start(const std::string& json, const std::string& key) {
    std::string k = "\"" + key + "\"";
    size_t p = json.find(k);
    if (p == std::string::npos) return std::string::npos;
    size_t colon = json.find(':', p + k.size());
    if (colon == std::string::npos) return std::string::npos;
    size_t v = colon + 1;
    while (v < json.size() && std::isspace(static_cast<unsigned char>(json[v]))) ++v;
    return v < json.size() ? v : std::string::npos;
}

std::optional<std::string> string_field(const std::string& json, const std::string& key) {
    size_t v = value_start(json, key);
    if (v == std::string::npos || json[v] != '"') return std::nullopt;
    std::string out;
    for (size_t i = v + 1; i < json.size(); ++i) {
        char c = json[i];
        if (c == '"') return out;
        if (c != '\\') { out.push_back(c); continue; }
        if (++i >= json.size()) return std::nullopt;
        switch (json[i]) {
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                if (i + 4 >= json.size()) return std::nullopt;
                unsigned code = 0;
                if (std::sscanf(json.c_str() + i + 1, "%4x", &code) != 1) return std::nullopt;
                // Only control characters are escaped on write.
                if (code < 0x80) out.push_back(static_cast<char>(code));
                i += 4;
                break;
            }
            default: out.push_back(json[i]);
        }
    }
    return std::nullopt; // unterminated
}

std::optional<std::int64_t> int_field(const std::string& json, const std::string& key) {
    size_t v = value_start(json, key);
    if (v == std::string::npos) return std::nullopt;
    size_t e = v;
    if (e < json.size() && json[e] == '-') ++e;
    size_t digits = e;
    while (e < json.size() && std::isdigit(static_cast<unsigned char>(json[e]))) ++e;
    if (e == digits) return std::nullopt;
    try {
        return std::stoll(json.substr(v, e - v));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

const char* to_string(BuildStatus s) {
    switch (s) {
        case BuildStatus::Success: return "Success";
        case BuildStatus::Failed: return "Failed";
        case BuildStatus::Running: return "Running";
    }
    return "Failed";
}

std::optional<BuildStatus> parse_build_status(const std::string& s) {
    if (s == "Success") return BuildStatus::Success;
    if (s == "Failed") return BuildStatus::Failed;
    if (s == "Running") return BuildStatus::Running;
    return std::nullopt;
}

std::string to_json(const BuildStateRecord& rec) {
    std::ostringstream os;
    os << "{\n"
       << "  \"timestamp\": " << rec.timestamp << ",\n"
       << "  \"status\": \"" << to_string(rec.status) << "\",\n"
       << "  \"task\": \"" << escape_json(rec.task) << "\"\n"
       << "}\n";
    return os.str();
}

std::optional<BuildStateRecord> parse_build_state_json(const std::string& input) {
    size_t a = input.find('{');
    size_t b = input.find_last_of('}');
    if (a == std::string::npos || b == std::string::npos || b <= a) return std::nullopt;
    std::string json = input.substr(a, b - a + 1);

    auto ts = int_field(json, "timestamp");
    auto status = string_field(json, "status");
    auto task = string_field(json, "task");
    if (!ts || !status || !task) return std::nullopt;
    auto parsed = parse_build_status(*status);
    if (!parsed) return std::nullopt;
    return BuildStateRecord{*ts, *parsed, *task};
}

BuildStateStore::BuildStateStore(fs::path project_dir) : m_project_dir(std::move(project_dir)) {}

fs::path BuildStateStore::path() const {
    return m_project_dir / ".devdeck" / "state" / "build.json";
}

std::optional<ExecError> BuildStateStore::save(const BuildStateRecord& rec) const {
    fs::path p = path();
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);
    if (ec) return ExecError{ErrorKind::Io, "cannot create " + p.parent_path().string() + ": " + ec.message()};
    return write_file_atomic(p, to_json(rec));
}

std::optional<BuildStateRecord> BuildStateStore::load() const {
    std::ifstream in(path());
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    auto rec = parse_build_state_json(ss.str());
    if (!rec) log::warn("STATE", "ignoring malformed {}", path().string());
    return rec;
}

std::optional<ExecError> BuildStateStore::mark_running(const std::string& task) const {
    return save(BuildStateRecord{unix_now(), BuildStatus::Running, task});
}

std::optional<ExecError> BuildStateStore::record_result(const CommandResult& result, const std::string& task) const {
    BuildStateRecord rec;
    rec.timestamp = unix_now();
    rec.status = result.success ? BuildStatus::Success : BuildStatus::Failed;
    rec.task = task.empty() ? result.command_display : task;
    return save(rec);
}

bool update_build_state(const BuildStateStore& store, const CommandResult& result, const std::string& task) {
    if (categorize(result.command_display) != Category::Build) return false;
    if (auto err = store.record_result(result, task)) {
        log::error("STATE", "failed to update build state: {}", err->message);
        return false;
    }
    log::info("STATE", "build state -> {} ({})", result.success ? "Success" : "Failed",
              task.empty() ? result.command_display : task);
    return true;
}

std::optional<BuildStateRecord> load_build_state(const fs::path& project_dir) {
    return BuildStateStore(project_dir).load();
}

} // namespace devdeck
