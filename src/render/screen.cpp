// src/render/screen.cpp
// @brief ScreenBuffer storage management.
// @invariant Storage is resized together with the recorded dimensions.
// @ownership ScreenBuffer owns the cell vector.

#include "morlock/render/screen.hpp"

#include <algorithm>
#include <cstddef>

namespace morlock::render
{

void ScreenBuffer::resize(int rows, int cols)
{
    rows_ = std::max(rows, 0);
    cols_ = std::max(cols, 0);
    cells_.assign(static_cast<std::size_t>(rows_) * static_cast<std::size_t>(cols_), Cell{});
}

void ScreenBuffer::clear(const Style &style)
{
    std::fill(cells_.begin(), cells_.end(), Cell{U' ', style});
}

Cell &ScreenBuffer::at(int y, int x)
{
    return cells_[static_cast<std::size_t>(y) * static_cast<std::size_t>(cols_) +
                  static_cast<std::size_t>(x)];
}

const Cell &ScreenBuffer::at(int y, int x) const
{
    return cells_[static_cast<std::size_t>(y) * static_cast<std::size_t>(cols_) +
                  static_cast<std::size_t>(x)];
}

bool ScreenBuffer::contains(int y, int x) const
{
    return y >= 0 && x >= 0 && y < rows_ && x < cols_;
}

} // namespace morlock::render
