/*
 * DevDeck main
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/app/runner.hpp>
#include <devdeck/config/config.hpp>
#include <devdeck/exec/categorizer.hpp>
#include <devdeck/log/diagnostics.hpp>
#include <devdeck/state/build_state.hpp>
#include <devdeck/term/terminal.hpp>

#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace devdeck;

static volatile sig_atomic_t g_interrupted = 0;
static void sigint_handler(int) { g_interrupted = 1; }

static DevdeckConfig g_cfg;

static std::string apply_color(const std::string& s, const char* code) {
    if (!g_cfg.color) return s;
    return std::string("\x1b[") + code + "m" + s + "\x1b[0m";
}

static const char* category_color(Category c) {
    switch (c) {
        case Category::Build: return "1;34";
        case Category::Test: return "1;32";
        case Category::Lint: return "1;33";
        case Category::Git: return "1;35";
        case Category::Other: return "0;37";
    }
    return "0";
}

static void usage() {
    std::cout << "usage: devdeck [--dir <path>] [-d] <command>\n"
                 "  list               configured commands\n"
                 "  run <name>         run a configured command\n"
                 "  exec <text>        run ad-hoc command text\n"
                 "  logs [category]    recent command logs\n"
                 "  state              last build state\n"
                 "  edit <file>        open a file in the editor\n"
                 "  ui                 interactive menu\n";
}

static void print_settled(const SettledRun& s) {
    const auto& r = s.result;
    if (r.success) {
        std::cout << apply_color("OK", "1;32") << "  " << r.command_display << " (" << r.duration.count() << " ms)\n";
    } else {
        std::cout << apply_color("FAILED", "1;31") << "  " << r.command_display << " (exit " << r.exit_code << ")\n";
        if (!r.stderr_text.empty()) std::cout << r.stderr_text << (r.stderr_text.back() == '\n' ? "" : "\n");
    }
    if (s.log_path) std::cout << "log: " << s.log_path->string() << "\n";
    if (s.build_state_updated) std::cout << "build state updated\n";
}

// Tick loop for scripted runs: spinner until the gate releases the result.
static int wait_and_report(CommandRunner& runner) {
    static const char frames[] = {'|', '/', '-', '\\'};
    size_t frame = 0;
    while (true) {
        if (g_interrupted) {
            std::cout << "\n" << apply_color("interrupted", "1;31") << "\n";
            return 130;
        }
        if (auto settled = runner.tick(std::chrono::steady_clock::now())) {
            std::cout << "\r\x1b[K";
            print_settled(*settled);
            return settled->result.success ? 0 : 1;
        }
        std::cout << "\r" << apply_color(std::string(1, frames[frame++ % 4]), "1;36") << " "
                  << (runner.current() ? runner.current()->display() : std::string()) << std::flush;
        std::this_thread::sleep_for(g_cfg.tick);
    }
}

// Refused before anything ran exits 2; failures while running exit 1.
static int report_error(const ExecError& e) {
    std::cerr << apply_color(to_string(e.kind), "1;31") << ": " << e.message << "\n";
    return is_validation_error(e.kind) ? 2 : 1;
}

static std::string format_mtime(fs::file_time_type t) {
    auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        t - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    std::time_t tt = std::chrono::system_clock::to_time_t(sys);
    std::tm tm{};
    localtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

static CommandSpec editor_spec(const std::string& editor, const std::string& file, const fs::path& dir) {
    std::istringstream iss(editor);
    std::string program, word;
    iss >> program;
    CommandBuilder b(program);
    while (iss >> word) b.arg(word);
    return b.arg(file).working_dir(dir).mode(ExecMode::Interactive).build();
}

static int cmd_list(const std::vector<NamedCommand>& cmds) {
    if (cmds.empty()) {
        std::cout << "no commands configured (add 'name = command' lines to .devdeck/commands)\n";
        return 0;
    }
    for (size_t i = 0; i < cmds.size(); ++i) {
        Category c = categorize(cmds[i].text);
        std::cout << (i + 1) << ". " << cmds[i].name << "  "
                  << apply_color(std::string("[") + to_string(c) + "]", category_color(c))
                  << "  " << cmds[i].text << "\n";
    }
    return 0;
}

static int cmd_logs(const CommandRunner& runner, const std::string& filter) {
    std::vector<LogFile> logs;
    if (filter.empty()) {
        logs = runner.logs().recent_logs_all(20);
    } else {
        auto c = parse_category(filter);
        if (!c) { std::cerr << "unknown category: " << filter << "\n"; return 2; }
        logs = runner.logs().recent_logs(*c, 20);
    }
    if (logs.empty()) { std::cout << "no logs\n"; return 0; }
    for (auto& l : logs) {
        std::cout << format_mtime(l.modified) << "  "
                  << apply_color(log_dir_name(l.category), category_color(l.category)) << "  "
                  << l.path.string() << "\n";
    }
    return 0;
}

static int cmd_state(const fs::path& project) {
    auto st = load_build_state(project);
    if (!st) { std::cout << "no build state\n"; return 0; }
    std::time_t tt = static_cast<std::time_t>(st->timestamp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    const char* color = st->status == BuildStatus::Success ? "1;32" : st->status == BuildStatus::Failed ? "1;31" : "1;33";
    std::cout << apply_color(to_string(st->status), color) << "  " << st->task << "  (" << buf << ")\n";
    return 0;
}

static const Category k_filters[] = {Category::Build, Category::Test, Category::Lint, Category::Git, Category::Other};

static int cmd_ui(CommandRunner& runner, const std::vector<NamedCommand>& all) {
    TerminalSession term;
    if (!term.acquire()) {
        std::cerr << "ui needs an interactive terminal\n";
        return 2;
    }
    int filter = -1; // -1 = all
    std::vector<const NamedCommand*> shown;
    std::string status;
    std::chrono::steady_clock::time_point status_until{};
    bool dirty = true;
    size_t frame = 0;
    static const char frames[] = {'|', '/', '-', '\\'};

    auto rebuild = [&] {
        shown.clear();
        for (auto& c : all) {
            if (filter < 0 || categorize(c.text) == k_filters[filter]) shown.push_back(&c);
        }
    };
    rebuild();

    while (!g_interrupted) {
        auto now = std::chrono::steady_clock::now();
        if (auto settled = runner.tick(now)) {
            const auto& r = settled->result;
            status = r.success ? apply_color("OK ", "1;32") + r.command_display
                               : apply_color("FAILED ", "1;31") + r.command_display + " (exit " + std::to_string(r.exit_code) + ")";
            status_until = now + g_cfg.result_display;
            dirty = true;
        }
        if (!status.empty() && !runner.running() && now >= status_until) { status.clear(); dirty = true; }

        if (dirty || runner.running()) {
            std::ostringstream os;
            os << "\x1b[2J\x1b[H" << apply_color("DevDeck", "1;36") << "  " << runner.project_dir().string() << "\r\n";
            os << "filter: " << (filter < 0 ? "all" : to_string(k_filters[filter])) << "\r\n\r\n";
            for (size_t i = 0; i < shown.size() && i < 9; ++i) {
                Category c = categorize(shown[i]->text);
                os << "  " << (i + 1) << ". " << shown[i]->name << " "
                   << apply_color(std::string("[") + to_string(c) + "]", category_color(c)) << "\r\n";
            }
            os << "\r\n";
            if (runner.running() && runner.current()) {
                os << apply_color(std::string(1, frames[frame++ % 4]), "1;36") << " " << runner.current()->display() << "\r\n";
            } else if (!status.empty()) {
                os << status << "\r\n";
            }
            os << "\r\n[1-9] run  [f] filter  [l] last log  [q] quit\r\n";
            term.write(os.str());
            dirty = false;
        }

        int k = term.read_key(g_cfg.tick);
        if (k < 0) continue;
        dirty = true;
        if (k == 'q' || k == 3) break;
        if (k == 'f') {
            filter = filter + 1 >= static_cast<int>(std::size(k_filters)) ? -1 : filter + 1;
            rebuild();
        } else if (k == 'l') {
            auto logs = runner.logs().recent_logs_all(1);
            if (logs.empty()) { status = "no logs yet"; status_until = now + g_cfg.result_display; continue; }
            auto spec = editor_spec(default_editor(g_cfg, runner.engine()), logs.front().path.string(), runner.project_dir());
            if (auto err = runner.run_interactive(spec, term)) {
                status = apply_color(to_string(err->kind), "1;31") + std::string(": ") + err->message;
                status_until = std::chrono::steady_clock::now() + g_cfg.result_display;
            }
        } else if (k >= '1' && k <= '9') {
            size_t idx = static_cast<size_t>(k - '1');
            if (idx >= shown.size()) continue;
            if (auto err = runner.submit(*shown[idx])) {
                status = apply_color(to_string(err->kind), "1;31") + std::string(": ") + err->message;
                status_until = now + g_cfg.result_display;
            }
        }
    }
    term.write("\x1b[2J\x1b[H");
    return 0;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, sigint_handler);
    g_cfg = load_config();

    fs::path project = fs::current_path();
    bool debug = false;
    std::vector<std::string> rest;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--dir" && i + 1 < argc) project = argv[++i];
        else if (a == "-d" || a == "--debug") debug = true;
        else if (a == "-h" || a == "--help") { usage(); return 0; }
        else rest.push_back(a);
    }
    if (rest.empty()) { usage(); return 2; }

    std::error_code ec;
    fs::path abs = fs::absolute(project, ec);
    if (ec || !fs::is_directory(abs, ec)) {
        std::cerr << "devdeck: not a directory: " << project.string() << "\n";
        return 2;
    }
    project = abs.lexically_normal();

    log::init(log::Options{project, debug ? std::string("debug") : g_cfg.log_level, true});
    log::debug("MAIN", "project {}", project.string());

    CommandRunner runner(RunnerOptions::from_config(g_cfg, project));
    auto commands = load_commands(project);
    const std::string& sub = rest[0];

    if (sub == "list") return cmd_list(commands);
    if (sub == "run") {
        if (rest.size() < 2) { usage(); return 2; }
        for (auto& c : commands) {
            if (c.name != rest[1]) continue;
            if (auto err = runner.submit(c)) return report_error(*err);
            return wait_and_report(runner);
        }
        std::cerr << "unknown command: " << rest[1] << "\n";
        return 2;
    }
    if (sub == "exec") {
        if (rest.size() < 2) { usage(); return 2; }
        std::string text;
        for (size_t i = 1; i < rest.size(); ++i) text += (i > 1 ? " " : "") + rest[i];
        if (auto err = runner.submit(NamedCommand{"exec", text, false})) return report_error(*err);
        return wait_and_report(runner);
    }
    if (sub == "logs") return cmd_logs(runner, rest.size() > 1 ? rest[1] : std::string());
    if (sub == "state") return cmd_state(project);
    if (sub == "edit") {
        if (rest.size() < 2) { usage(); return 2; }
        TerminalSession term;
        auto spec = editor_spec(default_editor(g_cfg, runner.engine()), rest[1], project);
        if (auto err = runner.run_interactive(spec, term)) return report_error(*err);
        return 0;
    }
    if (sub == "ui") return cmd_ui(runner, commands);

    usage();
    return 2;
}
