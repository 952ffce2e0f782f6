// include/morlock/term/input.hpp
// @brief Incremental decoder turning raw terminal bytes into ui::KeyEvents.
// @invariant Incomplete UTF-8 or CSI sequences stay buffered until completed.
// @ownership InputDecoder owns its pending bytes and decoded event queue.
#pragma once

#include "morlock/ui/event.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace morlock::term
{

using KeyEvent = ui::KeyEvent;

/// @brief Incremental decoder for terminal input bytes.
class InputDecoder
{
  public:
    /// @brief Append raw bytes and decode every complete sequence.
    void feed(std::string_view bytes);

    /// @brief Take all events decoded so far.
    std::vector<KeyEvent> drain();

  private:
    /// @return Bytes consumed at @p i, or 0 when more input is needed.
    std::size_t decodeEscape(std::size_t i);
    std::size_t decodeUtf8(std::size_t i);
    void decodeControl(unsigned char b);

    std::string pending_{};
    std::vector<KeyEvent> events_{};
};

} // namespace morlock::term
