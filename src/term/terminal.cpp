/*
 * Terminal session implementation - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/term/terminal.hpp>
#include <devdeck/log/diagnostics.hpp>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace devdeck {

static const char* k_hide_cursor = "\x1b[?25l";
static const char* k_show_cursor = "\x1b[?25h";

TerminalSession::TerminalSession(int fd) : m_fd(fd), m_tty(::isatty(fd) == 1) {}

TerminalSession::~TerminalSession() { if (m_raw) release(); }

bool TerminalSession::acquire() {
    if (m_raw) return true;
    if (!m_tty) return false;
    struct termios t;
    if (tcgetattr(m_fd, &t) != 0) {
        log::warn("TERM", "tcgetattr: {}", std::strerror(errno));
        return false;
    }
    m_orig = t;
    t.c_lflag &= ~(ICANON | ECHO);
    t.c_cc[VMIN] = 0; t.c_cc[VTIME] = 0;
    if (tcsetattr(m_fd, TCSAFLUSH, &t) != 0) {
        log::warn("TERM", "tcsetattr: {}", std::strerror(errno));
        return false;
    }
    m_raw = true;
    write(k_hide_cursor);
    return true;
}

void TerminalSession::release() {
    if (!m_raw) return;
    write(k_show_cursor);
    if (tcsetattr(m_fd, TCSAFLUSH, &m_orig) != 0) {
        log::warn("TERM", "restoring terminal mode: {}", std::strerror(errno));
    }
    m_raw = false;
}

int TerminalSession::read_key(std::chrono::milliseconds timeout) {
    struct pollfd p{m_fd, POLLIN, 0};
    int r;
    do { r = ::poll(&p, 1, static_cast<int>(timeout.count())); } while (r < 0 && errno == EINTR);
    if (r <= 0) return -1;
    unsigned char c;
    if (::read(m_fd, &c, 1) != 1) return -1;
    return c;
}

void TerminalSession::write(const std::string& s) {
    const char* p = s.data();
    size_t left = s.size();
    while (left > 0) {
        ssize_t n = ::write(STDOUT_FILENO, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        p += n; left -= static_cast<size_t>(n);
    }
}

TerminalRelease::TerminalRelease(TerminalSession& session)
    : m_session(session), m_was_acquired(session.acquired()) {
    m_session.release();
}

TerminalRelease::~TerminalRelease() {
    if (m_was_acquired && !m_session.acquire()) {
        log::error("TERM", "could not reacquire terminal after interactive command");
    }
}

} // namespace devdeck
