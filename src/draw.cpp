// src/draw.cpp
// @brief Drive one full draw pass from the root widget to the backend.
// @invariant The backend is flushed even when there is nothing to paint.
// @ownership The full-screen Surface lives only for this call.

#include "morlock/draw.hpp"

#include "morlock/ui/surface.hpp"
#include "morlock/util/log.hpp"

#include <algorithm>
#include <string>

namespace morlock
{

void draw(ui::Backend &backend, const ui::WidgetPtr &root)
{
    backend.clear(render::kDefault, render::kDefault);
    if (root)
    {
        const ui::Size size = backend.size();
        render::ScreenBuffer &cells = backend.cells();
        ui::Surface screen(cells,
                           std::clamp(size.width, 0, cells.cols()),
                           std::clamp(size.height, 0, cells.rows()));
        if (util::logEnabled(util::LogLevel::Debug))
        {
            util::logDebug("draw pass " + std::to_string(screen.width()) + "x" +
                           std::to_string(screen.height()));
        }
        root->paint(screen);
    }
    backend.flush();
}

} // namespace morlock
