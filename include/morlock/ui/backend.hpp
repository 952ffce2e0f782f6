// include/morlock/ui/backend.hpp
// @brief Boundary between the layout core and whatever owns the cell grid.
// @invariant cells() dimensions equal size() between calls to resize.
// @ownership The backend owns the cell buffer; the core borrows it per draw.
#pragma once

#include "morlock/render/screen.hpp"
#include "morlock/render/style.hpp"
#include "morlock/ui/event.hpp"
#include "morlock/ui/size.hpp"

namespace morlock::ui
{

/// @brief Character-grid provider consumed by morlock::draw.
class Backend
{
  public:
    virtual ~Backend() = default;

    /// @brief Current grid dimensions.
    [[nodiscard]] virtual Size size() const = 0;

    /// @brief Reset every cell to a blank in @p fg / @p bg.
    virtual void clear(render::Color fg, render::Color bg) = 0;

    /// @brief Present the cell buffer.
    virtual void flush() = 0;

    /// @brief Shared cell grid written by surfaces.
    virtual render::ScreenBuffer &cells() = 0;
};

} // namespace morlock::ui
