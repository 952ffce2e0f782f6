// src/widgets/grid.cpp
// @brief Grid requirement folding and cell-by-cell placement.
// @invariant Cells missing from short rows contribute nothing to column widths.
// @ownership Grid shares ownership of its rows.

#include "morlock/widgets/grid.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>

namespace morlock::widgets
{

Grid::Grid(std::vector<RowPtr> rows) : rows_(std::move(rows)) {}

ui::SizeReq Grid::reqWidth() const
{
    ui::SizeReq widest{};
    for (const auto &r : rows_)
    {
        if (r)
        {
            widest = ui::widest(widest, r->reqWidth());
        }
    }
    // One padding cell per row, not per column gap; see DESIGN.md.
    const int padding = static_cast<int>(rows_.size());
    return {ui::saturatingAdd(widest.min, padding), ui::saturatingAdd(widest.max, padding)};
}

ui::SizeReq Grid::reqHeight() const
{
    ui::SizeReq total{};
    for (const auto &r : rows_)
    {
        if (r)
        {
            total = ui::stack(total, r->reqHeight());
        }
    }
    return total;
}

std::vector<int> Grid::columnWidths() const
{
    std::size_t cols = 0;
    for (const auto &r : rows_)
    {
        if (r)
        {
            cols = std::max(cols, r->children().size());
        }
    }

    std::vector<int> widths(cols, 0);
    for (const auto &r : rows_)
    {
        if (!r)
        {
            continue;
        }
        const auto &cells = r->children();
        for (std::size_t j = 0; j < cells.size(); ++j)
        {
            widths[j] = std::max(widths[j], ui::reqWidthOf(cells[j]).min);
        }
    }
    return widths;
}

std::vector<int> Grid::rowHeights() const
{
    std::vector<int> heights(rows_.size(), 0);
    for (std::size_t i = 0; i < rows_.size(); ++i)
    {
        if (!rows_[i])
        {
            continue;
        }
        for (const auto &cell : rows_[i]->children())
        {
            heights[i] = std::max(heights[i], ui::reqHeightOf(cell).min);
        }
    }
    return heights;
}

void Grid::paint(ui::Surface &s) const
{
    const std::vector<int> w = columnWidths();
    const std::vector<int> h = rowHeights();

    int y = 0;
    for (std::size_t i = 0; i < rows_.size(); ++i)
    {
        if (rows_[i])
        {
            const auto &cells = rows_[i]->children();
            int x = 0;
            for (std::size_t j = 0; j < cells.size(); ++j)
            {
                ui::Surface cell = s.clip(x, y, w[j], h[i]);
                ui::paintWidget(cells[j], cell);
                x = ui::saturatingAdd(x, ui::saturatingAdd(w[j], 1));
            }
        }
        y = ui::saturatingAdd(y, h[i]);
    }
}

ui::WidgetPtr grid(std::vector<RowPtr> rows)
{
    return std::make_shared<const Grid>(std::move(rows));
}

ui::WidgetPtr grid(std::initializer_list<RowPtr> rows)
{
    return grid(std::vector<RowPtr>(rows));
}

} // namespace morlock::widgets
