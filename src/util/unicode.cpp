// src/util/unicode.cpp
// @brief Strict UTF-8 decoder, encoder and cell width lookup.
// @invariant Overlong forms, surrogates and values above U+10FFFF decode to U+FFFD per byte.
// @ownership Stateless free functions.

#include "morlock/util/unicode.hpp"

namespace morlock::util
{
namespace
{

/// @brief Decode one sequence at @p i; on failure consume a single byte.
char32_t decode_one(std::string_view s, std::size_t &i)
{
    const auto b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80)
    {
        ++i;
        return b0;
    }

    std::size_t len = 0;
    char32_t cp = 0;
    char32_t min = 0;
    if ((b0 & 0xE0) == 0xC0)
    {
        len = 2;
        cp = b0 & 0x1F;
        min = 0x80;
    }
    else if ((b0 & 0xF0) == 0xE0)
    {
        len = 3;
        cp = b0 & 0x0F;
        min = 0x800;
    }
    else if ((b0 & 0xF8) == 0xF0)
    {
        len = 4;
        cp = b0 & 0x07;
        min = 0x10000;
    }
    else
    {
        ++i;
        return kReplacementChar;
    }

    if (i + len > s.size())
    {
        ++i;
        return kReplacementChar;
    }
    for (std::size_t k = 1; k < len; ++k)
    {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80)
        {
            ++i;
            return kReplacementChar;
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    {
        ++i;
        return kReplacementChar;
    }
    i += len;
    return cp;
}

} // namespace

std::u32string decode_utf8(std::string_view s)
{
    std::u32string out;
    out.reserve(s.size());
    std::size_t i = 0;
    while (i < s.size())
    {
        out.push_back(decode_one(s, i));
    }
    return out;
}

std::size_t utf8_length(std::string_view s)
{
    std::size_t n = 0;
    std::size_t i = 0;
    while (i < s.size())
    {
        (void)decode_one(s, i);
        ++n;
    }
    return n;
}

bool is_control(char32_t cp)
{
    return cp < 0x20 || cp == 0x7F || (cp >= 0x80 && cp < 0xA0);
}

int char_width(char32_t cp)
{
    struct Range
    {
        char32_t lo;
        char32_t hi;
    };

    static constexpr Range kCombining[] = {
        {0x0300, 0x036F},
        {0x0483, 0x0489},
        {0x0591, 0x05BD},
        {0x0610, 0x061A},
        {0x064B, 0x065F},
        {0x0E31, 0x0E31},
        {0x0E34, 0x0E3A},
        {0x1AB0, 0x1AFF},
        {0x1DC0, 0x1DFF},
        {0x200B, 0x200F},
        {0x20D0, 0x20FF},
        {0xFE00, 0xFE0F},
        {0xFE20, 0xFE2F},
    };
    static constexpr Range kWide[] = {
        {0x1100, 0x115F},
        {0x231A, 0x231B},
        {0x2329, 0x232A},
        {0x2E80, 0x303E},
        {0x3041, 0x33FF},
        {0x3400, 0x4DBF},
        {0x4E00, 0x9FFF},
        {0xA000, 0xA4CF},
        {0xAC00, 0xD7A3},
        {0xF900, 0xFAFF},
        {0xFE30, 0xFE4F},
        {0xFF00, 0xFF60},
        {0xFFE0, 0xFFE6},
        {0x1F300, 0x1F64F},
        {0x1F900, 0x1F9FF},
        {0x20000, 0x2FFFD},
        {0x30000, 0x3FFFD},
    };

    for (const Range &r : kCombining)
    {
        if (cp >= r.lo && cp <= r.hi)
            return 0;
    }
    for (const Range &r : kWide)
    {
        if (cp >= r.lo && cp <= r.hi)
            return 2;
    }
    return 1;
}

void encode_utf8(char32_t cp, std::string &out)
{
    if (cp <= 0x7F)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp <= 0x7FF)
    {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else if (cp <= 0xFFFF)
    {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    else
    {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

} // namespace morlock::util
