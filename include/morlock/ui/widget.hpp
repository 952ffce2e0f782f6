// include/morlock/ui/widget.hpp
// @brief Base widget capability: declare size requirements and paint.
// @invariant Widgets are immutable after construction; paint never retains the Surface.
// @ownership Trees share nodes through WidgetPtr (shared_ptr to const).
#pragma once

#include "morlock/ui/size.hpp"
#include "morlock/ui/surface.hpp"

#include <memory>

namespace morlock::ui
{

/// @brief A node of the UI tree.
class Widget
{
  public:
    virtual ~Widget() = default;

    /// @brief Minimum and maximum width this widget accepts.
    [[nodiscard]] virtual SizeReq reqWidth() const = 0;

    /// @brief Minimum and maximum height this widget accepts.
    [[nodiscard]] virtual SizeReq reqHeight() const = 0;

    /// @brief Paint into @p s, which may be absent.
    virtual void paint(Surface &s) const = 0;
};

using WidgetPtr = std::shared_ptr<const Widget>;

/// @brief reqWidth() of @p w, or {0, 0} for a null widget.
inline SizeReq reqWidthOf(const WidgetPtr &w)
{
    return w ? w->reqWidth() : SizeReq{};
}

/// @brief reqHeight() of @p w, or {0, 0} for a null widget.
inline SizeReq reqHeightOf(const WidgetPtr &w)
{
    return w ? w->reqHeight() : SizeReq{};
}

/// @brief Paint @p w into @p s; a null widget paints nothing.
inline void paintWidget(const WidgetPtr &w, Surface &s)
{
    if (w)
    {
        w->paint(s);
    }
}

} // namespace morlock::ui
