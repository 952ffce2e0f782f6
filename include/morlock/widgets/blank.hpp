// include/morlock/widgets/blank.hpp
// @brief Empty spacer with explicit size requirements.
// @invariant Requirements are returned exactly as configured.
// @ownership Plain value widget.
#pragma once

#include "morlock/ui/widget.hpp"

namespace morlock::widgets
{

/// @brief Paints nothing; pads Row and Column containers.
class Blank final : public ui::Widget
{
  public:
    Blank(int minWidth, int maxWidth, int minHeight, int maxHeight)
        : width_{minWidth, maxWidth}, height_{minHeight, maxHeight}
    {
    }

    [[nodiscard]] ui::SizeReq reqWidth() const override
    {
        return width_;
    }

    [[nodiscard]] ui::SizeReq reqHeight() const override
    {
        return height_;
    }

    void paint(ui::Surface &) const override {}

  private:
    ui::SizeReq width_;
    ui::SizeReq height_;
};

ui::WidgetPtr blank(int minWidth, int maxWidth, int minHeight, int maxHeight);

/// @brief Spacer that takes whatever space is left over in both axes.
ui::WidgetPtr fill();

} // namespace morlock::widgets
