// src/widgets/label.cpp
// @brief Label sizing and painting.
// @invariant length_ is measured once, in code points, at construction.
// @ownership Label owns its text.

#include "morlock/widgets/label.hpp"

#include "morlock/util/unicode.hpp"

#include <algorithm>
#include <memory>
#include <utility>

namespace morlock::widgets
{

Label::Label(std::string text)
    : text_(std::move(text)), length_(static_cast<int>(util::utf8_length(text_)))
{
}

ui::SizeReq Label::reqWidth() const
{
    return {length_, length_};
}

ui::SizeReq Label::reqHeight() const
{
    return {1, 1};
}

void Label::paint(ui::Surface &s) const
{
    // Labels are one line tall; text past the right edge is cut, not wrapped.
    ui::Surface line = s.clip(0, 0, s.width(), std::min(1, s.height()));
    line.print(text_);
}

ui::WidgetPtr label(std::string text)
{
    return std::make_shared<const Label>(std::move(text));
}

} // namespace morlock::widgets
