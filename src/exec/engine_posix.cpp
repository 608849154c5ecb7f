/*
 * POSIX Execution Engine implementation - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/exec/engine.hpp>
#include <devdeck/exec/path.hpp>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace devdeck {

namespace {

enum class Streams { Capture, Discard, Inherit };

enum class FailStage : int { Chdir = 1, Exec = 2, Redirect = 3 };

struct ChildFailure {
    int stage;
    int err;
};

struct Child {
    pid_t pid = -1;
    int out_fd = -1;
    int err_fd = -1;
};

void close_fd(int& fd) {
    if (fd >= 0) { ::close(fd); fd = -1; }
}

// Child side: report why we could not reach exec, then die.
[[noreturn]] void child_fail(int report_fd, FailStage stage) {
    ChildFailure f{static_cast<int>(stage), errno};
    ssize_t ignored = ::write(report_fd, &f, sizeof(f));
    (void)ignored;
    _exit(127);
}

// Environment for the child: inherited variables with overrides applied.
// Built before fork; the child must not allocate.
std::vector<std::string> build_env(const CommandSpec& spec) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::string key = entry.substr(0, entry.find('='));
        if (spec.env().find(key) == spec.env().end()) env.push_back(entry);
    }
    for (auto &kv : spec.env()) env.push_back(kv.first + "=" + kv.second);
    return env;
}

std::variant<Child, ExecError> spawn_child(const CommandSpec& spec, Streams streams) {
    std::optional<std::string> path_env;
    auto pit = spec.env().find("PATH");
    if (pit != spec.env().end()) path_env = pit->second;
    auto exe = resolve_executable(spec.program(), path_env);
    if (!exe) return ExecError{ErrorKind::SpawnFailed, spec.program() + ": command not found"};

    std::vector<std::string> argv_s;
    argv_s.reserve(spec.args().size() + 1);
    argv_s.push_back(spec.program());
    for (auto &a : spec.args()) argv_s.push_back(a);
    std::vector<char*> cargv; cargv.reserve(argv_s.size()+1);
    for (auto &s : argv_s) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<std::string> env_s = build_env(spec);
    std::vector<char*> cenv; cenv.reserve(env_s.size()+1);
    for (auto &s : env_s) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    std::string cwd = spec.working_dir() ? spec.working_dir()->string() : std::string();

    int out_p[2] = {-1, -1}, err_p[2] = {-1, -1}, report_p[2] = {-1, -1};
    auto close_all = [&]{
        close_fd(out_p[0]); close_fd(out_p[1]);
        close_fd(err_p[0]); close_fd(err_p[1]);
        close_fd(report_p[0]); close_fd(report_p[1]);
    };
    if (pipe2(report_p, O_CLOEXEC) != 0) {
        return ExecError{ErrorKind::SpawnFailed, std::string("pipe: ") + std::strerror(errno)};
    }
    if (streams == Streams::Capture) {
        if (pipe2(out_p, O_CLOEXEC) != 0 || pipe2(err_p, O_CLOEXEC) != 0) {
            int e = errno; close_all();
            return ExecError{ErrorKind::SpawnFailed, std::string("pipe: ") + std::strerror(e)};
        }
    }

    pid_t pid = fork();
    if (pid < 0) {
        int e = errno; close_all();
        return ExecError{ErrorKind::SpawnFailed, std::string("fork: ") + std::strerror(e)};
    }
    if (pid == 0) {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGPIPE, SIG_DFL);
        if (streams != Streams::Inherit) {
            int devnull = ::open("/dev/null", O_RDWR);
            if (devnull < 0) child_fail(report_p[1], FailStage::Redirect);
            if (dup2(devnull, STDIN_FILENO) < 0) child_fail(report_p[1], FailStage::Redirect);
            if (streams == Streams::Discard) {
                if (dup2(devnull, STDOUT_FILENO) < 0 || dup2(devnull, STDERR_FILENO) < 0)
                    child_fail(report_p[1], FailStage::Redirect);
            } else {
                if (dup2(out_p[1], STDOUT_FILENO) < 0 || dup2(err_p[1], STDERR_FILENO) < 0)
                    child_fail(report_p[1], FailStage::Redirect);
            }
            if (devnull > STDERR_FILENO) ::close(devnull);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) child_fail(report_p[1], FailStage::Chdir);
        execve(exe->c_str(), cargv.data(), cenv.data());
        child_fail(report_p[1], FailStage::Exec);
    }

    close_fd(report_p[1]);
    close_fd(out_p[1]);
    close_fd(err_p[1]);

    ChildFailure failure{};
    ssize_t n;
    do { n = ::read(report_p[0], &failure, sizeof(failure)); } while (n < 0 && errno == EINTR);
    close_fd(report_p[0]);
    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int st = 0; while (waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        close_fd(out_p[0]); close_fd(err_p[0]);
        std::string what;
        switch (static_cast<FailStage>(failure.stage)) {
            case FailStage::Chdir: what = "cannot enter working directory '" + cwd + "'"; break;
            case FailStage::Redirect: what = "cannot set up standard streams"; break;
            case FailStage::Exec: what = "failed to execute '" + spec.program() + "'"; break;
        }
        return ExecError{ErrorKind::SpawnFailed, what + ": " + std::strerror(failure.err)};
    }
    return Child{pid, out_p[0], err_p[0]};
}

int wait_exit_code(pid_t pid) {
    int st = 0;
    while (waitpid(pid, &st, 0) < 0) {
        if (errno != EINTR) return k_signal_exit_code;
    }
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    return k_signal_exit_code;
}

// Drain both pipes until EOF; reading them together keeps a chatty stderr
// from blocking the child while we wait on stdout.
void read_pipes(int out_fd, int err_fd, std::string& out, std::string& err) {
    std::array<char, 4096> buf{};
    std::array<pollfd, 2> fds = {{ {out_fd, POLLIN, 0}, {err_fd, POLLIN, 0} }};
    std::string* sinks[2] = { &out, &err };
    int open_count = 2;
    while (open_count > 0) {
        int r = poll(fds.data(), fds.size(), -1);
        if (r < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
            if (n > 0) { sinks[i]->append(buf.data(), static_cast<size_t>(n)); continue; }
            if (n < 0 && errno == EINTR) continue;
            fds[i].fd = -1; // EOF or error: stop watching (poll ignores negative fds)
            --open_count;
        }
    }
}

// Exit code of a child whose output goes to /dev/null.
std::variant<int, ExecError> run_discarding(const CommandSpec& spec) {
    auto spawned = spawn_child(spec, Streams::Discard);
    if (auto* e = std::get_if<ExecError>(&spawned)) return *e;
    return wait_exit_code(std::get<Child>(spawned).pid);
}

} // namespace

CaptureOutcome ExecutionEngine::run_captured(const CommandSpec& spec) const {
    auto started_at = std::chrono::system_clock::now();
    auto t0 = std::chrono::steady_clock::now();
    auto spawned = spawn_child(spec, Streams::Capture);
    if (auto* e = std::get_if<ExecError>(&spawned)) return *e;
    Child child = std::get<Child>(spawned);
    std::string out, err;
    read_pipes(child.out_fd, child.err_fd, out, err);
    close_fd(child.out_fd);
    close_fd(child.err_fd);
    int code = wait_exit_code(child.pid);
    auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
    return make_result(spec.display(), decode_lossy(out), decode_lossy(err), code, started_at, dur);
}

bool ExecutionEngine::run_status(const CommandSpec& spec) const {
    auto code = run_discarding(spec);
    return std::holds_alternative<int>(code) && std::get<int>(code) == 0;
}

std::optional<ExecError> ExecutionEngine::run_interactive(const CommandSpec& spec) const {
    auto spawned = spawn_child(spec, Streams::Inherit);
    if (auto* e = std::get_if<ExecError>(&spawned)) return *e;
    int code = wait_exit_code(std::get<Child>(spawned).pid);
    if (code != 0) {
        return ExecError{ErrorKind::NonZeroExit,
                         "interactive command '" + spec.program() + "' failed with exit code " + std::to_string(code)};
    }
    return std::nullopt;
}

CaptureOutcome ExecutionEngine::run(const CommandSpec& spec) const {
    switch (spec.mode()) {
        case ExecMode::Captured:
            return run_captured(spec);
        case ExecMode::StatusOnly: {
            auto started_at = std::chrono::system_clock::now();
            auto t0 = std::chrono::steady_clock::now();
            auto code = run_discarding(spec);
            if (auto* e = std::get_if<ExecError>(&code)) return *e;
            auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
            return make_result(spec.display(), "", "", std::get<int>(code), started_at, dur);
        }
        case ExecMode::Interactive: {
            auto started_at = std::chrono::system_clock::now();
            auto t0 = std::chrono::steady_clock::now();
            auto err = run_interactive(spec);
            if (err && err->kind == ErrorKind::SpawnFailed) return *err;
            auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
            return make_result(spec.display(), "", err ? err->message : "", err ? 1 : 0, started_at, dur);
        }
    }
    return ExecError{ErrorKind::SpawnFailed, "unknown execution mode"};
}

std::string decode_lossy(const std::string& bytes) {
    static const char* k_replacement = "\xEF\xBF\xBD";
    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) { out.push_back(static_cast<char>(c)); ++i; continue; }
        size_t len = 0; unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) len = 2;
        else if (c >= 0xE0 && c <= 0xEF) { len = 3; if (c == 0xE0) lo = 0xA0; if (c == 0xED) hi = 0x9F; }
        else if (c >= 0xF0 && c <= 0xF4) { len = 4; if (c == 0xF0) lo = 0x90; if (c == 0xF4) hi = 0x8F; }
        if (len == 0) { out += k_replacement; ++i; continue; }
        size_t j = 1;
        for (; j < len && i + j < n; ++j) {
            unsigned char cc = static_cast<unsigned char>(bytes[i+j]);
            unsigned char min = (j == 1) ? lo : 0x80, max = (j == 1) ? hi : 0xBF;
            if (cc < min || cc > max) break;
        }
        if (j == len) { out.append(bytes, i, len); i += len; }
        else { out += k_replacement; i += j; } // maximal invalid prefix -> one U+FFFD
    }
    return out;
}

} // namespace devdeck
