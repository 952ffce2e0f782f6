// src/term/session.cpp
// @brief Enter and leave raw terminal mode around an interactive run.
// @invariant A session that failed to configure the TTY stays inactive and touches nothing.
// @ownership Saves termios state and the SIGWINCH handler on entry; restores both on exit.

#include "morlock/term/session.hpp"

#include "morlock/util/log.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#if !defined(_WIN32)
#include <cerrno>
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace morlock::term
{
namespace
{
constexpr const char kEnterScreen[] = "\x1b[?1049h\x1b[?25l";
constexpr const char kLeaveScreen[] = "\x1b[0m\x1b[?25h\x1b[?1049l";

volatile std::sig_atomic_t g_resizePending = 0;

void writeRaw(const char *seq)
{
    std::fputs(seq, stdout);
    std::fflush(stdout);
}

#if !defined(_WIN32)
void onWindowChange(int)
{
    g_resizePending = 1;
}
#endif
} // namespace

bool TerminalSession::takeResize()
{
    if (g_resizePending == 0)
    {
        return false;
    }
    g_resizePending = 0;
    return true;
}

bool TerminalSession::headlessRequested()
{
    const char *v = std::getenv("MORLOCK_NO_TTY");
    return v && v[0] == '1';
}

TerminalSession::TerminalSession()
{
#if defined(_WIN32)
    util::logInfo("terminal session: raw mode is not supported on this platform");
#else
    if (headlessRequested())
    {
        util::logDebug("terminal session: MORLOCK_NO_TTY set, staying headless");
        return;
    }
    if (!::isatty(STDIN_FILENO) || !::isatty(STDOUT_FILENO))
    {
        util::logDebug("terminal session: stdin/stdout is not a tty");
        return;
    }
    if (::tcgetattr(STDIN_FILENO, &saved_) != 0)
    {
        util::logWarn(std::string("terminal session: tcgetattr failed: ") + std::strerror(errno));
        return;
    }
    struct termios raw = saved_;
    raw.c_iflag &= static_cast<tcflag_t>(~(BRKINT | ICRNL | INPCK | ISTRIP | IXON));
    raw.c_oflag &= static_cast<tcflag_t>(~OPOST);
    raw.c_cflag |= CS8;
    raw.c_lflag &= static_cast<tcflag_t>(~(ECHO | ICANON | IEXTEN | ISIG));
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0)
    {
        util::logWarn(std::string("terminal session: tcsetattr failed: ") + std::strerror(errno));
        return;
    }
    writeRaw(kEnterScreen);
    active_ = true;

    // No SA_RESTART: a blocked read returns EINTR so the caller can redraw.
    struct sigaction sa
    {
    };
    sa.sa_handler = onWindowChange;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    if (::sigaction(SIGWINCH, &sa, &savedWinch_) == 0)
    {
        winchInstalled_ = true;
    }
    else
    {
        util::logWarn(std::string("terminal session: cannot watch SIGWINCH: ") +
                      std::strerror(errno));
    }
#endif
}

TerminalSession::~TerminalSession()
{
#if !defined(_WIN32)
    if (!active_)
    {
        return;
    }
    if (winchInstalled_ && ::sigaction(SIGWINCH, &savedWinch_, nullptr) != 0)
    {
        util::logWarn(std::string("terminal session: restoring SIGWINCH failed: ") +
                      std::strerror(errno));
    }
    writeRaw(kLeaveScreen);
    if (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_) != 0)
    {
        util::logWarn(std::string("terminal session: restoring tty failed: ") +
                      std::strerror(errno));
    }
#endif
}

bool TerminalSession::querySize(TermSize &out)
{
#if defined(_WIN32)
    (void)out;
    return false;
#else
    struct winsize ws
    {
    };
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0 || ws.ws_row == 0)
    {
        return false;
    }
    out.rows = ws.ws_row;
    out.cols = ws.ws_col;
    return true;
#endif
}

} // namespace morlock::term
