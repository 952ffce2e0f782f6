// include/morlock/term/session.hpp
// @brief RAII guard putting the terminal into raw mode on the alternate screen.
// @invariant When active(), the destructor restores the terminal state and SIGWINCH handler.
// @ownership The session borrows the process TTY; it owns only the saved state.
#pragma once

#if !defined(_WIN32)
#include <signal.h>
#include <termios.h>
#endif

namespace morlock::term
{

/// @brief Terminal dimensions in character cells.
struct TermSize
{
    int rows{0};
    int cols{0};
};

class TerminalSession
{
  public:
    /// @brief Enter raw mode unless headless; never throws.
    TerminalSession();
    ~TerminalSession();

    TerminalSession(const TerminalSession &) = delete;
    TerminalSession &operator=(const TerminalSession &) = delete;

    /// @brief Whether raw mode was entered and will be restored.
    [[nodiscard]] bool active() const
    {
        return active_;
    }

    /// @brief Query the current terminal size.
    /// @return False when stdout is not a terminal; @p out is left unchanged.
    static bool querySize(TermSize &out);

    /// @brief True when MORLOCK_NO_TTY=1 requests headless operation.
    static bool headlessRequested();

    /// @brief Consume a pending window-size change (SIGWINCH) notification.
    /// @return True once per batch of resize signals received while active.
    static bool takeResize();

  private:
    bool active_{false};
#if !defined(_WIN32)
    struct termios saved_
    {
    };
    struct sigaction savedWinch_
    {
    };
    bool winchInstalled_{false};
#endif
};

} // namespace morlock::term
