// src/widgets/blank.cpp
// @brief Blank factories.

#include "morlock/widgets/blank.hpp"

#include <memory>

namespace morlock::widgets
{

ui::WidgetPtr blank(int minWidth, int maxWidth, int minHeight, int maxHeight)
{
    return std::make_shared<const Blank>(minWidth, maxWidth, minHeight, maxHeight);
}

ui::WidgetPtr fill()
{
    return blank(0, ui::kUnbounded, 0, ui::kUnbounded);
}

} // namespace morlock::widgets
