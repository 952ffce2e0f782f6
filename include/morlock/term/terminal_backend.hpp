// include/morlock/term/terminal_backend.hpp
// @brief Backend rendering the cell grid to a TermIO and polling its input.
// @invariant The screen buffer always matches the last size passed to resize().
// @ownership Owns the screen buffer and renderer; borrows the TermIO.
#pragma once

#include "morlock/render/renderer.hpp"
#include "morlock/render/screen.hpp"
#include "morlock/term/input.hpp"
#include "morlock/ui/backend.hpp"

#include <deque>

namespace morlock::term
{

class TermIO;

class TerminalBackend final : public ui::Backend
{
  public:
    TerminalBackend(TermIO &tio, int rows, int cols, bool truecolor = true);

    [[nodiscard]] ui::Size size() const override;
    void clear(render::Color fg, render::Color bg) override;
    void flush() override;
    render::ScreenBuffer &cells() override;

    /// @brief Resize the backing buffer; contents are reset.
    void resize(int rows, int cols);

    /// @brief resize() and queue a Resize event for pollEvent().
    void notifyResize(int rows, int cols);

    /// @brief Renderer used by flush(), for default-colour configuration.
    render::Renderer &renderer()
    {
        return renderer_;
    }

    /// @brief Block until a key is decoded, the terminal is resized, or input ends.
    /// @details A window-size change reported by TerminalSession resizes the
    ///          buffer before the Resize event is returned.
    ui::Event pollEvent();

  private:
    TermIO &tio_;
    render::ScreenBuffer screen_{};
    render::Renderer renderer_;
    InputDecoder decoder_{};
    std::deque<ui::Event> queued_{};
};

} // namespace morlock::term
