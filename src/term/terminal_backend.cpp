// src/term/terminal_backend.cpp
// @brief TerminalBackend: ScreenBuffer + Renderer over a borrowed TermIO.
// @invariant pollEvent returns queued events in order before reading more input.
// @ownership Owns buffer, renderer and decoder; borrows the TermIO.

#include "morlock/term/terminal_backend.hpp"

#include "morlock/term/session.hpp"
#include "morlock/term/term_io.hpp"
#include "morlock/util/log.hpp"

#include <string>
#include <string_view>

namespace morlock::term
{

TerminalBackend::TerminalBackend(TermIO &tio, int rows, int cols, bool truecolor)
    : tio_(tio), renderer_(tio, truecolor)
{
    screen_.resize(rows, cols);
}

ui::Size TerminalBackend::size() const
{
    return ui::Size{screen_.cols(), screen_.rows()};
}

void TerminalBackend::clear(render::Color fg, render::Color bg)
{
    render::Style style{};
    style.fg = fg;
    style.bg = bg;
    screen_.clear(style);
}

void TerminalBackend::flush()
{
    renderer_.draw(screen_);
}

render::ScreenBuffer &TerminalBackend::cells()
{
    return screen_;
}

void TerminalBackend::resize(int rows, int cols)
{
    if (util::logEnabled(util::LogLevel::Debug))
    {
        util::logDebug("backend resize to " + std::to_string(cols) + "x" + std::to_string(rows));
    }
    screen_.resize(rows, cols);
}

void TerminalBackend::notifyResize(int rows, int cols)
{
    resize(rows, cols);
    ui::Event ev{};
    ev.type = ui::Event::Type::Resize;
    ev.size = size();
    queued_.push_back(ev);
}

ui::Event TerminalBackend::pollEvent()
{
    char in[64];
    while (queued_.empty())
    {
        if (TerminalSession::takeResize())
        {
            TermSize ts{};
            if (TerminalSession::querySize(ts))
            {
                notifyResize(ts.rows, ts.cols);
            }
            continue;
        }
        const std::size_t n = tio_.read(in, sizeof(in));
        if (n == 0)
        {
            if (tio_.interrupted())
            {
                continue;
            }
            ui::Event eof{};
            eof.type = ui::Event::Type::Eof;
            return eof;
        }
        decoder_.feed(std::string_view(in, n));
        for (const auto &key : decoder_.drain())
        {
            ui::Event ev{};
            ev.key = key;
            queued_.push_back(ev);
        }
    }
    ui::Event ev = queued_.front();
    queued_.pop_front();
    return ev;
}

} // namespace morlock::term
