// apps/sparrow.cpp
// @brief Demo drawing an aligned grid of labels, redrawn on resize until a key is pressed.
// @invariant Headless runs (MORLOCK_NO_TTY=1) draw one frame and exit.
// @ownership main owns the widget tree, backend and session.

#include "morlock/config/config.hpp"
#include "morlock/draw.hpp"
#include "morlock/render/style.hpp"
#include "morlock/term/session.hpp"
#include "morlock/term/term_io.hpp"
#include "morlock/term/terminal_backend.hpp"
#include "morlock/util/log.hpp"
#include "morlock/widgets/container.hpp"
#include "morlock/widgets/grid.hpp"
#include "morlock/widgets/label.hpp"
#include "morlock/widgets/tint.hpp"

namespace w = morlock::widgets;
using morlock::render::kRed;
using morlock::render::kYellow;

int main(int argc, char **argv)
{
    morlock::config::Config cfg;
    if (argc > 1 && !morlock::config::loadFromFile(argv[1], cfg))
    {
        return 1;
    }
    morlock::config::applyLogging(cfg);

    auto root = w::grid({
        w::row({w::label("wind speed:"), w::label("40 knots/s")}),
        w::row({w::label("species:"),
                w::label("african swallow"),
                w::tint(kYellow, w::column({w::label("// multiple line"), w::label("// comment")}))}),
        w::row({w::label("laden:"),
                w::tint(kRed, w::label("true")),
                w::tint(kYellow, w::label("// weight of coconut required!"))}),
    });

    morlock::term::TerminalSession session;
    morlock::term::RealTermIO tio;
    morlock::term::TermSize size{24, 80};
    if (!morlock::term::TerminalSession::querySize(size))
    {
        morlock::util::logDebug("sparrow: terminal size unknown, using 80x24");
    }

    morlock::term::TerminalBackend backend(tio, size.rows, size.cols, cfg.render.truecolor);
    morlock::render::Style defaults{};
    defaults.fg = cfg.theme.fg;
    defaults.bg = cfg.theme.bg;
    backend.renderer().setDefaultStyle(defaults);

    morlock::draw(backend, root);
    if (!session.active())
    {
        return 0;
    }

    // Redraw after each resize; any key, or the end of input, quits.
    while (backend.pollEvent().type == morlock::ui::Event::Type::Resize)
    {
        morlock::draw(backend, root);
    }
    return 0;
}
