// src/ui/surface.cpp
// @brief Clipping and cursor-relative text painting for Surface.
// @invariant Writes land only inside [x_, x_+w_) x [y_, y_+h_).
// @ownership Surface borrows the ScreenBuffer.

#include "morlock/ui/surface.hpp"

#include "morlock/util/unicode.hpp"

#include <string>

namespace morlock::ui
{

Surface::Surface(render::ScreenBuffer &buf) : Surface(buf, buf.cols(), buf.rows()) {}

Surface::Surface(render::ScreenBuffer &buf, int width, int height)
{
    if (width < 0 || height < 0 || width > buf.cols() || height > buf.rows())
    {
        return;
    }
    buf_ = &buf;
    w_ = width;
    h_ = height;
}

Surface::Surface(render::ScreenBuffer *buf, int x, int y, int w, int h, render::Style style)
    : buf_(buf), x_(x), y_(y), w_(w), h_(h), style_(style)
{
}

Surface Surface::clip(int x, int y, int w, int h) const
{
    if (!buf_)
    {
        return Surface{};
    }
    if (x < 0 || y < 0 || w < 0 || h < 0)
    {
        return Surface{};
    }
    // Compare against the remaining extent so large offsets cannot overflow.
    if (x > w_ || w > w_ - x || y > h_ || h > h_ - y)
    {
        return Surface{};
    }
    return Surface(buf_, x_ + x, y_ + y, w, h, style_);
}

void Surface::setForeground(render::Color fg)
{
    if (!buf_)
    {
        return;
    }
    style_.fg = fg;
}

void Surface::setBackground(render::Color bg)
{
    if (!buf_)
    {
        return;
    }
    style_.bg = bg;
}

void Surface::clear()
{
    if (!buf_)
    {
        return;
    }
    const render::Cell blank{U' ', style_};
    for (int row = 0; row < h_; ++row)
    {
        for (int col = 0; col < w_; ++col)
        {
            buf_->at(y_ + row, x_ + col) = blank;
        }
    }
    dx_ = 0;
    dy_ = 0;
}

void Surface::put(char32_t ch)
{
    buf_->at(y_ + dy_, x_ + dx_) = render::Cell{ch, style_};
    ++dx_;
}

void Surface::print(std::string_view text)
{
    if (!buf_)
    {
        return;
    }
    const std::u32string chars = util::decode_utf8(text);
    std::size_t n = 0;
    while (n < chars.size() && dy_ < h_)
    {
        if (chars[n] == U'\n')
        {
            dx_ = 0;
            ++dy_;
            ++n;
            continue;
        }
        if (dx_ >= w_)
        {
            dx_ = 0;
            ++dy_;
            continue;
        }
        // Control characters never reach the cell buffer.
        put(util::is_control(chars[n]) ? util::kReplacementChar : chars[n]);
        ++n;
    }
}

void Surface::println(std::string_view text)
{
    if (!buf_)
    {
        return;
    }
    print(text);
    dx_ = 0;
    ++dy_;
}

} // namespace morlock::ui
