// include/morlock/widgets/grid.hpp
// @brief Table widget aligning the cells of several Rows into shared columns and rows.
// @invariant Missing cells of short rows do not widen columns; cells are one column apart.
// @ownership Grid shares ownership of its rows.
#pragma once

#include "morlock/ui/widget.hpp"
#include "morlock/widgets/container.hpp"

#include <initializer_list>
#include <vector>

namespace morlock::widgets
{

/// @brief Aligned table of rows.
/// @details Rows are used only as ordered lists of cells: Row::paint is never
///          called, the grid places every cell itself.
class Grid final : public ui::Widget
{
  public:
    explicit Grid(std::vector<RowPtr> rows);

    /// @brief Widest row requirement plus one padding cell per row.
    [[nodiscard]] ui::SizeReq reqWidth() const override;

    /// @brief Sum of the rows' height requirements.
    [[nodiscard]] ui::SizeReq reqHeight() const override;

    void paint(ui::Surface &s) const override;

    /// @brief Shared column widths (widest cell minimum per column).
    [[nodiscard]] std::vector<int> columnWidths() const;

    /// @brief Shared row heights (tallest cell minimum per row).
    [[nodiscard]] std::vector<int> rowHeights() const;

  private:
    std::vector<RowPtr> rows_;
};

ui::WidgetPtr grid(std::vector<RowPtr> rows);
ui::WidgetPtr grid(std::initializer_list<RowPtr> rows);

} // namespace morlock::widgets
