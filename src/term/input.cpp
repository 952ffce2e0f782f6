// src/term/input.cpp
// @brief Decode UTF-8 text, control bytes and CSI/SS3 sequences into KeyEvents.
// @invariant Bytes of an incomplete sequence remain in pending_ across feed() calls.
// @ownership InputDecoder owns pending bytes and the event queue.

#include "morlock/term/input.hpp"

#include "morlock/util/unicode.hpp"

#include <utility>

namespace morlock::term
{
namespace
{
using Code = KeyEvent::Code;

KeyEvent makeKey(Code code, unsigned mods = 0)
{
    KeyEvent ev{};
    ev.code = code;
    ev.mods = mods;
    return ev;
}

Code tildeCode(int n)
{
    switch (n)
    {
        case 1:
        case 7:
            return Code::Home;
        case 2:
            return Code::Insert;
        case 3:
            return Code::Delete;
        case 4:
        case 8:
            return Code::End;
        case 5:
            return Code::PageUp;
        case 6:
            return Code::PageDown;
        case 11:
            return Code::F1;
        case 12:
            return Code::F2;
        case 13:
            return Code::F3;
        case 14:
            return Code::F4;
        case 15:
            return Code::F5;
        case 17:
            return Code::F6;
        case 18:
            return Code::F7;
        case 19:
            return Code::F8;
        case 20:
            return Code::F9;
        case 21:
            return Code::F10;
        case 23:
            return Code::F11;
        case 24:
            return Code::F12;
        default:
            return Code::Unknown;
    }
}

Code letterCode(char terminator)
{
    switch (terminator)
    {
        case 'A':
            return Code::Up;
        case 'B':
            return Code::Down;
        case 'C':
            return Code::Right;
        case 'D':
            return Code::Left;
        case 'H':
            return Code::Home;
        case 'F':
            return Code::End;
        case 'P':
            return Code::F1;
        case 'Q':
            return Code::F2;
        case 'R':
            return Code::F3;
        case 'S':
            return Code::F4;
        default:
            return Code::Unknown;
    }
}

constexpr int kMaxParam = 9999;
constexpr unsigned kModMask = KeyEvent::Shift | KeyEvent::Alt | KeyEvent::Ctrl;

/// @brief Parse "a;b" CSI parameters; missing values default to 1.
std::pair<int, int> parseParams(std::string_view params)
{
    int values[2] = {1, 1};
    int idx = 0;
    int cur = -1;
    for (char c : params)
    {
        if (c >= '0' && c <= '9')
        {
            // Digits past kMaxParam are dropped.
            if (cur < 0)
                cur = c - '0';
            else if (cur <= kMaxParam)
                cur = cur * 10 + (c - '0');
        }
        else if (c == ';')
        {
            if (idx < 2 && cur >= 0)
                values[idx] = cur;
            ++idx;
            cur = -1;
        }
    }
    if (idx < 2 && cur >= 0)
        values[idx] = cur;
    return {values[0], values[1]};
}
} // namespace

void InputDecoder::feed(std::string_view bytes)
{
    pending_.append(bytes);
    std::size_t i = 0;
    while (i < pending_.size())
    {
        const auto b = static_cast<unsigned char>(pending_[i]);
        if (b == 0x1B)
        {
            const std::size_t n = decodeEscape(i);
            if (n == 0)
                break;
            i += n;
        }
        else if (b < 0x20 || b == 0x7F)
        {
            decodeControl(b);
            ++i;
        }
        else if (b < 0x80)
        {
            KeyEvent ev{};
            ev.codepoint = b;
            events_.push_back(ev);
            ++i;
        }
        else
        {
            const std::size_t n = decodeUtf8(i);
            if (n == 0)
                break;
            i += n;
        }
    }
    pending_.erase(0, i);
}

std::vector<KeyEvent> InputDecoder::drain()
{
    std::vector<KeyEvent> out;
    out.swap(events_);
    return out;
}

void InputDecoder::decodeControl(unsigned char b)
{
    switch (b)
    {
        case '\r':
        case '\n':
            events_.push_back(makeKey(Code::Enter));
            return;
        case '\t':
            events_.push_back(makeKey(Code::Tab));
            return;
        case 0x08:
        case 0x7F:
            events_.push_back(makeKey(Code::Backspace));
            return;
        default:
            break;
    }
    KeyEvent ev = makeKey(Code::Unknown);
    if (b >= 0x01 && b <= 0x1A)
    {
        ev.mods = KeyEvent::Ctrl;
        ev.codepoint = static_cast<uint32_t>('a' + (b - 1));
    }
    events_.push_back(ev);
}

std::size_t InputDecoder::decodeEscape(std::size_t i)
{
    if (i + 1 >= pending_.size())
    {
        events_.push_back(makeKey(Code::Esc));
        return 1;
    }
    const char next = pending_[i + 1];
    if (next == '[')
    {
        std::size_t j = i + 2;
        while (j < pending_.size())
        {
            const auto c = static_cast<unsigned char>(pending_[j]);
            if (c >= 0x40 && c <= 0x7E)
                break;
            ++j;
        }
        if (j >= pending_.size())
        {
            return 0;
        }
        const char terminator = pending_[j];
        auto [first, mod] = parseParams(std::string_view(pending_).substr(i + 2, j - (i + 2)));
        const unsigned mods = mod > 1 ? (static_cast<unsigned>(mod - 1) & kModMask) : 0U;
        if (terminator == '~')
        {
            events_.push_back(makeKey(tildeCode(first), mods));
        }
        else if (terminator == 'Z')
        {
            events_.push_back(makeKey(Code::Tab, KeyEvent::Shift));
        }
        else
        {
            events_.push_back(makeKey(letterCode(terminator), mods));
        }
        return j - i + 1;
    }
    if (next == 'O')
    {
        if (i + 2 >= pending_.size())
        {
            return 0;
        }
        events_.push_back(makeKey(letterCode(pending_[i + 2])));
        return 3;
    }
    const auto nb = static_cast<unsigned char>(next);
    if (nb >= 0x20 && nb < 0x7F)
    {
        KeyEvent ev{};
        ev.mods = KeyEvent::Alt;
        ev.codepoint = nb;
        events_.push_back(ev);
        return 2;
    }
    events_.push_back(makeKey(Code::Esc));
    return 1;
}

std::size_t InputDecoder::decodeUtf8(std::size_t i)
{
    const auto b0 = static_cast<unsigned char>(pending_[i]);
    std::size_t len = 0;
    if ((b0 & 0xE0) == 0xC0)
        len = 2;
    else if ((b0 & 0xF0) == 0xE0)
        len = 3;
    else if ((b0 & 0xF8) == 0xF0)
        len = 4;
    else
    {
        events_.push_back(makeKey(Code::Unknown));
        return 1;
    }

    for (std::size_t k = 1; k < len; ++k)
    {
        if (i + k >= pending_.size())
            return 0;
        if ((static_cast<unsigned char>(pending_[i + k]) & 0xC0) != 0x80)
        {
            events_.push_back(makeKey(Code::Unknown));
            return 1;
        }
    }

    const std::u32string cps = util::decode_utf8(std::string_view(pending_).substr(i, len));
    KeyEvent ev{};
    if (cps.size() == 1 && cps[0] != util::kReplacementChar)
    {
        ev.codepoint = static_cast<uint32_t>(cps[0]);
    }
    events_.push_back(ev);
    return len;
}

} // namespace morlock::term
