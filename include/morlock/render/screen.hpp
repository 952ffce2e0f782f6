// include/morlock/render/screen.hpp
// @brief Character-cell grid written by surfaces and read by the renderer.
// @invariant cells_.size() == rows_ * cols_ at all times.
// @ownership ScreenBuffer owns its cell storage.
#pragma once

#include "morlock/render/style.hpp"

#include <vector>

namespace morlock::render
{

/// @brief One character cell of the terminal grid.
struct Cell
{
    char32_t ch{U' '};
    Style style{};

    bool operator==(const Cell &other) const = default;
};

/// @brief Row-major grid of cells addressed by absolute (row, column).
class ScreenBuffer
{
  public:
    /// @brief Resize to @p rows x @p cols; existing contents are discarded.
    void resize(int rows, int cols);

    /// @brief Fill every cell with a blank in @p style.
    void clear(const Style &style);

    /// @brief Access the cell at (@p y, @p x). Caller guarantees bounds.
    Cell &at(int y, int x);
    const Cell &at(int y, int x) const;

    /// @brief Whether (@p y, @p x) lies inside the grid.
    [[nodiscard]] bool contains(int y, int x) const;

    [[nodiscard]] int rows() const
    {
        return rows_;
    }

    [[nodiscard]] int cols() const
    {
        return cols_;
    }

  private:
    int rows_{0};
    int cols_{0};
    std::vector<Cell> cells_{};
};

} // namespace morlock::render
