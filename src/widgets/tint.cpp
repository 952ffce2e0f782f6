// src/widgets/tint.cpp
// @brief Tint delegation.
// @invariant Colour changes apply to the surface handed in, never to a parent's.
// @ownership Shares ownership of the child widget.

#include "morlock/widgets/tint.hpp"

#include <memory>
#include <utility>

namespace morlock::widgets
{

Tint::Tint(render::Color fg, render::Color bg, ui::WidgetPtr child)
    : fg_(fg), bg_(bg), child_(std::move(child))
{
}

ui::SizeReq Tint::reqWidth() const
{
    return ui::reqWidthOf(child_);
}

ui::SizeReq Tint::reqHeight() const
{
    return ui::reqHeightOf(child_);
}

void Tint::paint(ui::Surface &s) const
{
    if (!fg_.isDefault())
    {
        s.setForeground(fg_);
    }
    if (!bg_.isDefault())
    {
        s.setBackground(bg_);
    }
    ui::paintWidget(child_, s);
}

ui::WidgetPtr tint(render::Color fg, render::Color bg, ui::WidgetPtr child)
{
    return std::make_shared<const Tint>(fg, bg, std::move(child));
}

ui::WidgetPtr tint(render::Color fg, ui::WidgetPtr child)
{
    return tint(fg, render::kDefault, std::move(child));
}

} // namespace morlock::widgets
