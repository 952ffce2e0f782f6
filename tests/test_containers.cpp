// tests/test_containers.cpp
// @brief Row and Column requirement folding and negotiated child placement.
// @invariant Children are packed in order and receive the full cross-axis extent.
// @ownership Widget trees are shared_ptr values owned by each test.

#include "morlock/render/screen.hpp"
#include "morlock/ui/size.hpp"
#include "morlock/ui/surface.hpp"
#include "morlock/ui/widget.hpp"
#include "morlock/widgets/blank.hpp"
#include "morlock/widgets/container.hpp"
#include "morlock/widgets/label.hpp"

#include "tests/ScreenText.hpp"
#include "tests/TestHarness.hpp"

#include <memory>

using morlock::render::ScreenBuffer;
using morlock::render::Style;
using morlock::ui::kUnbounded;
using morlock::ui::SizeReq;
using morlock::ui::Surface;
using morlock::ui::Widget;
using morlock::ui::WidgetPtr;
using morlock_test::rowText;

namespace w = morlock::widgets;

namespace
{
/// Records the surface it was painted into.
struct Probe : Widget
{
    SizeReq width{0, kUnbounded};
    SizeReq height{0, kUnbounded};
    mutable bool painted{false};
    mutable bool valid{false};
    mutable int x{-1};
    mutable int y{-1};
    mutable int w{-1};
    mutable int h{-1};

    Probe() = default;

    Probe(SizeReq width, SizeReq height) : width(width), height(height) {}

    SizeReq reqWidth() const override
    {
        return width;
    }

    SizeReq reqHeight() const override
    {
        return height;
    }

    void paint(Surface &s) const override
    {
        painted = true;
        valid = s.valid();
        x = s.x();
        y = s.y();
        w = s.width();
        h = s.height();
    }
};

ScreenBuffer makeBuffer(int rows, int cols)
{
    ScreenBuffer sb;
    sb.resize(rows, cols);
    sb.clear(Style{});
    return sb;
}
} // namespace

TEST(Row, WidthSumsAndHeightTakesTallest)
{
    auto r = w::row({w::label("ab"), w::blank(1, 3, 2, 5), w::label("c")});
    EXPECT_EQ(r->reqWidth(), (SizeReq{4, 6}));
    EXPECT_EQ(r->reqHeight(), (SizeReq{2, 5}));
}

TEST(Row, UnboundedWidthSaturates)
{
    auto r = w::row({w::fill(), w::fill(), w::label("x")});
    EXPECT_EQ(r->reqWidth(), (SizeReq{1, kUnbounded}));
}

TEST(Row, EmptyRowRequiresNothing)
{
    auto r = w::row(std::vector<WidgetPtr>{});
    EXPECT_EQ(r->reqWidth(), (SizeReq{0, 0}));
    EXPECT_EQ(r->reqHeight(), (SizeReq{0, 0}));
}

TEST(Row, FixedLabelsKeepTheirWidths)
{
    ScreenBuffer sb = makeBuffer(1, 10);
    Surface s(sb);
    w::row({w::label("a"), w::label("bb")})->paint(s);
    EXPECT_EQ(rowText(sb, 0), "abb       ");
}

TEST(Row, FlexibleCellsShareExtraSpace)
{
    // Each cell is a label followed by a filler: (1,inf) and (2,inf).
    auto cellA = w::row({w::label("a"), w::fill()});
    auto cellB = w::row({w::label("bb"), w::fill()});
    ScreenBuffer sb = makeBuffer(1, 10);
    Surface s(sb);
    w::row({cellA, cellB})->paint(s);
    EXPECT_EQ(rowText(sb, 0), "a    bb   ");
}

TEST(Row, ChildrenGetFullHeightAndPackedOffsets)
{
    auto p1 = std::make_shared<Probe>(SizeReq{2, 2}, SizeReq{1, 1});
    auto p2 = std::make_shared<Probe>();
    auto p3 = std::make_shared<Probe>(SizeReq{0, 3}, SizeReq{0, 1});
    ScreenBuffer sb = makeBuffer(4, 12);
    Surface s = Surface(sb).clip(1, 1, 10, 3);
    w::row({p1, p2, p3})->paint(s);

    EXPECT_TRUE(p1->valid && p2->valid && p3->valid);
    EXPECT_EQ(p1->x, 1);
    EXPECT_EQ(p1->w, 2);
    EXPECT_EQ(p2->x, 3);
    EXPECT_EQ(p2->w, 5);
    EXPECT_EQ(p3->x, 8);
    EXPECT_EQ(p3->w, 3);
    EXPECT_EQ(p1->y, 1);
    EXPECT_EQ(p1->h, 3);
    EXPECT_EQ(p3->h, 3);
}

TEST(Row, OverflowingChildGetsAbsentSurface)
{
    auto p = std::make_shared<Probe>(SizeReq{3, 3}, SizeReq{1, 1});
    ScreenBuffer sb = makeBuffer(1, 4);
    Surface s(sb);
    w::row({w::label("abc"), p})->paint(s);
    EXPECT_EQ(rowText(sb, 0), "abc ");
    EXPECT_TRUE(p->painted);
    EXPECT_FALSE(p->valid);
}

TEST(Row, NullChildIsEmpty)
{
    auto r = w::row({w::label("ab"), nullptr, w::label("c")});
    EXPECT_EQ(r->reqWidth(), (SizeReq{3, 3}));
    ScreenBuffer sb = makeBuffer(1, 4);
    Surface s(sb);
    r->paint(s);
    EXPECT_EQ(rowText(sb, 0), "abc ");
}

TEST(Column, HeightSumsAndWidthTakesWidest)
{
    auto c = w::column({w::label("abc"), w::blank(1, 7, 2, 4)});
    EXPECT_EQ(c->reqWidth(), (SizeReq{3, 7}));
    EXPECT_EQ(c->reqHeight(), (SizeReq{3, 5}));
}

TEST(Column, StacksChildrenVertically)
{
    ScreenBuffer sb = makeBuffer(4, 5);
    Surface s(sb);
    w::column({w::label("top"), w::fill(), w::label("bot")})->paint(s);
    EXPECT_EQ(rowText(sb, 0), "top  ");
    EXPECT_EQ(rowText(sb, 1), "     ");
    EXPECT_EQ(rowText(sb, 2), "     ");
    EXPECT_EQ(rowText(sb, 3), "bot  ");
}

TEST(Column, ChildrenGetFullWidth)
{
    auto p1 = std::make_shared<Probe>(SizeReq{1, 1}, SizeReq{1, 1});
    auto p2 = std::make_shared<Probe>();
    ScreenBuffer sb = makeBuffer(5, 6);
    Surface s(sb);
    w::column({p1, p2})->paint(s);
    EXPECT_EQ(p1->w, 6);
    EXPECT_EQ(p1->h, 1);
    EXPECT_EQ(p2->y, 1);
    EXPECT_EQ(p2->w, 6);
    EXPECT_EQ(p2->h, 4);
}

TEST(Column, NestedInRow)
{
    ScreenBuffer sb = makeBuffer(2, 6);
    Surface s(sb);
    w::row({w::label("k:"), w::column({w::label("one"), w::label("two")})})->paint(s);
    EXPECT_EQ(rowText(sb, 0), "k:one ");
    EXPECT_EQ(rowText(sb, 1), "  two ");
}

int main(int argc, char **argv)
{
    morlock_test::init(&argc, argv);
    return morlock_test::run_all_tests();
}
