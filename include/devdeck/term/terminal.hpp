/*
 * Terminal session - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Owns the terminal while the menu is shown: raw (non-canonical, no echo)
 * input, hidden cursor. An interactive child needs the terminal back in its
 * original mode; TerminalRelease hands it over for one scope and takes it
 * back on every exit path.
 */
#pragma once
#include <chrono>
#include <string>
#include <termios.h>

namespace devdeck {

class TerminalSession {
public:
    explicit TerminalSession(int fd = 0);
    ~TerminalSession();

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    // False when fd is not a tty or tcsetattr fails; the session then stays
    // released and read_key still works in cooked mode.
    bool acquire();
    void release();
    bool acquired() const { return m_raw; }
    bool is_tty() const { return m_tty; }

    // Next byte from input, or -1 after `timeout` with nothing to read (or EOF).
    int read_key(std::chrono::milliseconds timeout);
    void write(const std::string& s);

private:
    int m_fd;
    bool m_tty = false;
    bool m_raw = false;
    struct termios m_orig {};
};

class TerminalRelease {
public:
    explicit TerminalRelease(TerminalSession& session);
    ~TerminalRelease();

    TerminalRelease(const TerminalRelease&) = delete;
    TerminalRelease& operator=(const TerminalRelease&) = delete;

private:
    TerminalSession& m_session;
    bool m_was_acquired;
};

} // namespace devdeck
