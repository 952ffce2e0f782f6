// include/morlock/ui/surface.hpp
// @brief Clipped drawing surface through which widgets paint into the shared cell buffer.
// @invariant A valid surface lies inside its parent; an absent surface ignores every operation.
// @ownership Borrows the ScreenBuffer; surfaces must not outlive the draw pass.
#pragma once

#include "morlock/render/screen.hpp"
#include "morlock/render/style.hpp"

#include <string_view>

namespace morlock::ui
{

/// @brief Rectangular view onto a ScreenBuffer with its own cursor and colours.
/// @details A Surface is either valid, addressing an absolute rectangle of the
///          buffer, or absent.  Absent surfaces come from clip requests that
///          do not fit; painting into one does nothing, so a child laid out
///          off-screen simply disappears.
class Surface
{
  public:
    /// @brief Construct an absent surface.
    Surface() = default;

    /// @brief Surface covering the whole of @p buf.
    explicit Surface(render::ScreenBuffer &buf);

    /// @brief Surface covering the top-left @p width x @p height cells of @p buf.
    /// @details Absent when the extent is negative or larger than the buffer.
    Surface(render::ScreenBuffer &buf, int width, int height);

    /// @brief Derive a sub-surface at (@p x, @p y) relative to this origin.
    /// @return An absent surface when any argument is negative or the
    ///         rectangle crosses the right or bottom edge.
    [[nodiscard]] Surface clip(int x, int y, int w, int h) const;

    [[nodiscard]] bool valid() const
    {
        return buf_ != nullptr;
    }

    explicit operator bool() const
    {
        return valid();
    }

    [[nodiscard]] int width() const
    {
        return buf_ ? w_ : 0;
    }

    [[nodiscard]] int height() const
    {
        return buf_ ? h_ : 0;
    }

    /// @brief Absolute column of the origin within the buffer.
    [[nodiscard]] int x() const
    {
        return x_;
    }

    /// @brief Absolute row of the origin within the buffer.
    [[nodiscard]] int y() const
    {
        return y_;
    }

    [[nodiscard]] int cursorX() const
    {
        return dx_;
    }

    [[nodiscard]] int cursorY() const
    {
        return dy_;
    }

    [[nodiscard]] render::Color foreground() const
    {
        return style_.fg;
    }

    [[nodiscard]] render::Color background() const
    {
        return style_.bg;
    }

    void setForeground(render::Color fg);
    void setBackground(render::Color bg);

    /// @brief Blank every cell in the current colours and home the cursor.
    void clear();

    /// @brief Paint UTF-8 @p text at the cursor, wrapping at the right edge.
    /// @details Text is indexed by code point.  Characters past the last row
    ///          are dropped.  A newline moves the cursor to the next row; other
    ///          control characters are painted as U+FFFD.
    void print(std::string_view text);

    /// @brief print() then move the cursor to the start of the next row.
    void println(std::string_view text);

  private:
    Surface(render::ScreenBuffer *buf, int x, int y, int w, int h, render::Style style);

    void put(char32_t ch);

    render::ScreenBuffer *buf_{nullptr};
    int x_{0};
    int y_{0};
    int w_{0};
    int h_{0};
    int dx_{0};
    int dy_{0};
    render::Style style_{};
};

} // namespace morlock::ui
