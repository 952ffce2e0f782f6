// include/morlock/widgets/tint.hpp
// @brief Decorator recolouring the surface before painting its child.
// @invariant Size requirements are exactly the child's.
// @ownership Shares ownership of the child widget.
#pragma once

#include "morlock/render/style.hpp"
#include "morlock/ui/widget.hpp"

namespace morlock::widgets
{

/// @brief Sets foreground and background for its child.
/// @details Colours equal to render::kDefault leave the inherited colour in
///          place, so a Tint can change only one of the two.
class Tint final : public ui::Widget
{
  public:
    Tint(render::Color fg, render::Color bg, ui::WidgetPtr child);

    [[nodiscard]] ui::SizeReq reqWidth() const override;
    [[nodiscard]] ui::SizeReq reqHeight() const override;
    void paint(ui::Surface &s) const override;

  private:
    render::Color fg_;
    render::Color bg_;
    ui::WidgetPtr child_;
};

ui::WidgetPtr tint(render::Color fg, render::Color bg, ui::WidgetPtr child);

/// @brief Foreground-only tint.
ui::WidgetPtr tint(render::Color fg, ui::WidgetPtr child);

} // namespace morlock::widgets
