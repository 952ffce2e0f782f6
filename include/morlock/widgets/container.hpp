// include/morlock/widgets/container.hpp
// @brief One-dimensional containers splitting their surface among children.
// @invariant Children are laid out in order with no gaps, each in a clipped surface.
// @ownership Containers share ownership of their children.
#pragma once

#include "morlock/ui/widget.hpp"

#include <initializer_list>
#include <memory>
#include <vector>

namespace morlock::widgets
{

/// @brief Children placed left to right.
/// @details Width requirements add up; the height requirement is the largest
///          child minimum and the largest child maximum.  Painting negotiates
///          each child's width with ui::distribute and gives every child the
///          full height.
class Row final : public ui::Widget
{
  public:
    explicit Row(std::vector<ui::WidgetPtr> children);

    [[nodiscard]] ui::SizeReq reqWidth() const override;
    [[nodiscard]] ui::SizeReq reqHeight() const override;
    void paint(ui::Surface &s) const override;

    [[nodiscard]] const std::vector<ui::WidgetPtr> &children() const
    {
        return children_;
    }

  private:
    std::vector<ui::WidgetPtr> children_;
};

/// @brief Children placed top to bottom; the transpose of Row.
class Column final : public ui::Widget
{
  public:
    explicit Column(std::vector<ui::WidgetPtr> children);

    [[nodiscard]] ui::SizeReq reqWidth() const override;
    [[nodiscard]] ui::SizeReq reqHeight() const override;
    void paint(ui::Surface &s) const override;

    [[nodiscard]] const std::vector<ui::WidgetPtr> &children() const
    {
        return children_;
    }

  private:
    std::vector<ui::WidgetPtr> children_;
};

using RowPtr = std::shared_ptr<const Row>;

RowPtr row(std::vector<ui::WidgetPtr> children);
RowPtr row(std::initializer_list<ui::WidgetPtr> children);

ui::WidgetPtr column(std::vector<ui::WidgetPtr> children);
ui::WidgetPtr column(std::initializer_list<ui::WidgetPtr> children);

} // namespace morlock::widgets
