// tests/ScreenText.hpp
// @brief Helpers reading painted cells back as UTF-8 text.
// @invariant Helpers never modify the buffer.
// @ownership Returned strings are owned by the caller.
#pragma once

#include "morlock/render/screen.hpp"
#include "morlock/util/unicode.hpp"

#include <string>

namespace morlock_test
{

/// @brief Columns [x0, x1) of row @p y as UTF-8.
inline std::string rowText(const morlock::render::ScreenBuffer &sb, int y, int x0, int x1)
{
    std::string out;
    for (int x = x0; x < x1; ++x)
    {
        morlock::util::encode_utf8(sb.at(y, x).ch, out);
    }
    return out;
}

/// @brief Entire row @p y as UTF-8.
inline std::string rowText(const morlock::render::ScreenBuffer &sb, int y)
{
    return rowText(sb, y, 0, sb.cols());
}

} // namespace morlock_test
