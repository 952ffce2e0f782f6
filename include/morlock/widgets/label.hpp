// include/morlock/widgets/label.hpp
// @brief Single-line constant text.
// @invariant Width requirement is exactly the code point count; height is 1.
// @ownership Label owns its text.
#pragma once

#include "morlock/ui/widget.hpp"

#include <string>

namespace morlock::widgets
{

class Label final : public ui::Widget
{
  public:
    explicit Label(std::string text);

    [[nodiscard]] ui::SizeReq reqWidth() const override;
    [[nodiscard]] ui::SizeReq reqHeight() const override;
    void paint(ui::Surface &s) const override;

    [[nodiscard]] const std::string &text() const
    {
        return text_;
    }

  private:
    std::string text_;
    int length_{0};
};

ui::WidgetPtr label(std::string text);

} // namespace morlock::widgets
