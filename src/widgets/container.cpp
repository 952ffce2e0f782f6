// src/widgets/container.cpp
// @brief Row and Column requirement folding and negotiated painting.
// @invariant Child i is clipped at the sum of the allocations before it.
// @ownership Containers share ownership of children.

#include "morlock/widgets/container.hpp"

#include "morlock/ui/distribute.hpp"

#include <cstddef>
#include <utility>

namespace morlock::widgets
{

Row::Row(std::vector<ui::WidgetPtr> children) : children_(std::move(children)) {}

ui::SizeReq Row::reqWidth() const
{
    ui::SizeReq total{};
    for (const auto &child : children_)
    {
        total = ui::stack(total, ui::reqWidthOf(child));
    }
    return total;
}

ui::SizeReq Row::reqHeight() const
{
    ui::SizeReq tallest{};
    for (const auto &child : children_)
    {
        tallest = ui::widest(tallest, ui::reqHeightOf(child));
    }
    return tallest;
}

void Row::paint(ui::Surface &s) const
{
    std::vector<ui::SizeReq> reqs;
    reqs.reserve(children_.size());
    for (const auto &child : children_)
    {
        reqs.push_back(ui::reqWidthOf(child));
    }
    const std::vector<int> widths = ui::distribute(s.width(), reqs);

    const int h = s.height();
    int x = 0;
    for (std::size_t i = 0; i < children_.size(); ++i)
    {
        ui::Surface cell = s.clip(x, 0, widths[i], h);
        ui::paintWidget(children_[i], cell);
        x = ui::saturatingAdd(x, widths[i]);
    }
}

Column::Column(std::vector<ui::WidgetPtr> children) : children_(std::move(children)) {}

ui::SizeReq Column::reqWidth() const
{
    ui::SizeReq widest{};
    for (const auto &child : children_)
    {
        widest = ui::widest(widest, ui::reqWidthOf(child));
    }
    return widest;
}

ui::SizeReq Column::reqHeight() const
{
    ui::SizeReq total{};
    for (const auto &child : children_)
    {
        total = ui::stack(total, ui::reqHeightOf(child));
    }
    return total;
}

void Column::paint(ui::Surface &s) const
{
    std::vector<ui::SizeReq> reqs;
    reqs.reserve(children_.size());
    for (const auto &child : children_)
    {
        reqs.push_back(ui::reqHeightOf(child));
    }
    const std::vector<int> heights = ui::distribute(s.height(), reqs);

    const int w = s.width();
    int y = 0;
    for (std::size_t i = 0; i < children_.size(); ++i)
    {
        ui::Surface cell = s.clip(0, y, w, heights[i]);
        ui::paintWidget(children_[i], cell);
        y = ui::saturatingAdd(y, heights[i]);
    }
}

RowPtr row(std::vector<ui::WidgetPtr> children)
{
    return std::make_shared<const Row>(std::move(children));
}

RowPtr row(std::initializer_list<ui::WidgetPtr> children)
{
    return row(std::vector<ui::WidgetPtr>(children));
}

ui::WidgetPtr column(std::vector<ui::WidgetPtr> children)
{
    return std::make_shared<const Column>(std::move(children));
}

ui::WidgetPtr column(std::initializer_list<ui::WidgetPtr> children)
{
    return column(std::vector<ui::WidgetPtr>(children));
}

} // namespace morlock::widgets
