// include/morlock/render/renderer.hpp
// @brief ANSI renderer presenting a ScreenBuffer frame through TermIO.
// @invariant setStyle and moveCursor avoid redundant sequences based on cached state.
// @ownership Renderer writes through a borrowed TermIO reference.
#pragma once

#include "morlock/render/screen.hpp"
#include "morlock/render/style.hpp"

#include <optional>
#include <string>

namespace morlock::term
{
class TermIO;
}

namespace morlock::render
{

/// @brief Emits every cell of a frame with minimal SGR and cursor sequences.
class Renderer
{
  public:
    Renderer(::morlock::term::TermIO &tio, bool truecolor);

    /// @brief Colours substituted for Color::Default cells.
    void setDefaultStyle(const Style &style)
    {
        defaults_ = style;
    }

    /// @brief Write the whole buffer and flush the terminal.
    void draw(const ScreenBuffer &sb);

    /// @brief Build the SGR sequence selecting @p style.
    [[nodiscard]] std::string sgr(const Style &style) const;

  private:
    void setStyle(const Style &style);
    void moveCursor(int y, int x);
    void appendColor(std::string &seq, const Color &c, bool background) const;

    ::morlock::term::TermIO &tio_;
    bool truecolor_{false};
    Style defaults_{};
    std::optional<Style> currentStyle_{};
    int cursorX_{-1};
    int cursorY_{-1};
};

} // namespace morlock::render
