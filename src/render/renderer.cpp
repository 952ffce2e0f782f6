// src/render/renderer.cpp
// @brief Implementation of the ANSI renderer emitting full frames.
// @invariant Every cell is written on each draw; wide glyphs cover their right neighbour.
// @ownership Renderer writes through a borrowed TermIO reference.

#include "morlock/render/renderer.hpp"

#include "morlock/term/term_io.hpp"
#include "morlock/util/unicode.hpp"

#include <string>

namespace morlock::render
{

Renderer::Renderer(::morlock::term::TermIO &tio, bool truecolor) : tio_(tio), truecolor_(truecolor)
{
}

namespace
{
int toCube(uint8_t c)
{
    return c / 51; // map 0-255 to 0-5
}
} // namespace

void Renderer::appendColor(std::string &seq, const Color &c, bool background) const
{
    switch (c.kind())
    {
        case Color::Kind::Default:
            seq += background ? ";49" : ";39";
            break;
        case Color::Kind::Indexed:
            if (c.index() < 8)
            {
                seq += ';';
                seq += std::to_string((background ? 40 : 30) + c.index());
            }
            else
            {
                seq += background ? ";48;5;" : ";38;5;";
                seq += std::to_string(c.index());
            }
            break;
        case Color::Kind::Rgb:
        {
            const RGBA v = c.value();
            if (truecolor_)
            {
                seq += background ? ";48;2;" : ";38;2;";
                seq += std::to_string(v.r) + ";" + std::to_string(v.g) + ";" + std::to_string(v.b);
            }
            else
            {
                int idx = 16 + 36 * toCube(v.r) + 6 * toCube(v.g) + toCube(v.b);
                seq += background ? ";48;5;" : ";38;5;";
                seq += std::to_string(idx);
            }
            break;
        }
    }
}

std::string Renderer::sgr(const Style &style) const
{
    std::string seq = "\x1b[0";
    if (style.attrs & Bold)
        seq += ";1";
    if (style.attrs & Faint)
        seq += ";2";
    if (style.attrs & Italic)
        seq += ";3";
    if (style.attrs & Underline)
        seq += ";4";
    if (style.attrs & Blink)
        seq += ";5";
    if (style.attrs & Reverse)
        seq += ";7";
    if (style.attrs & Invisible)
        seq += ";8";
    if (style.attrs & Strike)
        seq += ";9";

    appendColor(seq, style.fg.isDefault() ? defaults_.fg : style.fg, false);
    appendColor(seq, style.bg.isDefault() ? defaults_.bg : style.bg, true);
    seq += 'm';
    return seq;
}

void Renderer::setStyle(const Style &style)
{
    if (currentStyle_ && *currentStyle_ == style)
    {
        return;
    }
    tio_.write(sgr(style));
    currentStyle_ = style;
}

void Renderer::moveCursor(int y, int x)
{
    if (y == cursorY_ && x == cursorX_)
    {
        return;
    }
    std::string seq = "\x1b[" + std::to_string(y + 1) + ";" + std::to_string(x + 1) + 'H';
    tio_.write(seq);
    cursorY_ = y;
    cursorX_ = x;
}

void Renderer::draw(const ScreenBuffer &sb)
{
    std::string glyph;
    for (int y = 0; y < sb.rows(); ++y)
    {
        for (int x = 0; x < sb.cols(); ++x)
        {
            const Cell &cell = sb.at(y, x);
            char32_t ch = util::is_control(cell.ch) ? util::kReplacementChar : cell.ch;
            int width = util::char_width(ch);
            if (width == 2 && x + 1 >= sb.cols())
            {
                // No room for the right half at the last column.
                ch = U' ';
                width = 1;
            }
            moveCursor(y, x);
            setStyle(cell.style);
            glyph.clear();
            if (width == 0)
            {
                // A lone combining mark is drawn over a blank so it keeps its cell.
                glyph += ' ';
                width = 1;
            }
            util::encode_utf8(ch, glyph);
            tio_.write(glyph);
            cursorX_ += width;
            if (width == 2)
            {
                // The glyph covers the next cell as well.
                ++x;
            }
        }
    }
    tio_.flush();
}

} // namespace morlock::render
