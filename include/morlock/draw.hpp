// include/morlock/draw.hpp
// @brief Root driver painting a widget tree onto a backend.
// @invariant Each call clears, repaints the entire tree, and flushes exactly once.
// @ownership Borrows the backend and the tree for the duration of the call.
#pragma once

#include "morlock/ui/backend.hpp"
#include "morlock/ui/widget.hpp"

namespace morlock
{

/// @brief Clear @p backend, paint @p root over the full grid, then flush.
/// @details A null @p root produces a cleared frame.
void draw(ui::Backend &backend, const ui::WidgetPtr &root);

} // namespace morlock
