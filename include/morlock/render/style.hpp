// include/morlock/render/style.hpp
// @brief Colour tokens and cell styles shared by the layout core and the renderer.
// @invariant A default-constructed Color is Color::Default; only the renderer interprets it.
// @ownership Plain value types.
#pragma once

#include <cstdint>

namespace morlock::render
{

/// @brief 8-bit per channel colour with alpha.
struct RGBA
{
    uint8_t r{0};
    uint8_t g{0};
    uint8_t b{0};
    uint8_t a{255};

    bool operator==(const RGBA &other) const = default;
};

/// @brief Opaque colour token carried from widgets to the renderer.
/// @details A token is either the terminal default, an entry of the 256-colour
///          palette, or a 24-bit RGB value.
class Color
{
  public:
    enum class Kind : uint8_t
    {
        Default,
        Indexed,
        Rgb,
    };

    constexpr Color() = default;

    static constexpr Color indexed(uint8_t index)
    {
        Color c;
        c.kind_ = Kind::Indexed;
        c.index_ = index;
        return c;
    }

    static constexpr Color rgb(uint8_t r, uint8_t g, uint8_t b)
    {
        Color c;
        c.kind_ = Kind::Rgb;
        c.rgb_ = RGBA{r, g, b, 255};
        return c;
    }

    static constexpr Color rgb(RGBA value)
    {
        return rgb(value.r, value.g, value.b);
    }

    [[nodiscard]] constexpr Kind kind() const
    {
        return kind_;
    }

    [[nodiscard]] constexpr bool isDefault() const
    {
        return kind_ == Kind::Default;
    }

    [[nodiscard]] constexpr uint8_t index() const
    {
        return index_;
    }

    [[nodiscard]] constexpr RGBA value() const
    {
        return rgb_;
    }

    bool operator==(const Color &other) const
    {
        if (kind_ != other.kind_)
            return false;
        if (kind_ == Kind::Indexed)
            return index_ == other.index_;
        if (kind_ == Kind::Rgb)
            return rgb_ == other.rgb_;
        return true;
    }

  private:
    Kind kind_{Kind::Default};
    uint8_t index_{0};
    RGBA rgb_{};
};

/// @name Standard palette
/// @{
inline constexpr Color kDefault{};
inline constexpr Color kBlack = Color::indexed(0);
inline constexpr Color kRed = Color::indexed(1);
inline constexpr Color kGreen = Color::indexed(2);
inline constexpr Color kYellow = Color::indexed(3);
inline constexpr Color kBlue = Color::indexed(4);
inline constexpr Color kMagenta = Color::indexed(5);
inline constexpr Color kCyan = Color::indexed(6);
inline constexpr Color kWhite = Color::indexed(7);
/// @}

/// @brief Text attribute bit flags.
enum Attr : uint16_t
{
    Bold = 1 << 0,
    Faint = 1 << 1,
    Italic = 1 << 2,
    Underline = 1 << 3,
    Blink = 1 << 4,
    Reverse = 1 << 5,
    Invisible = 1 << 6,
    Strike = 1 << 7,
};

/// @brief Foreground, background and attributes of a cell.
struct Style
{
    Color fg{};
    Color bg{};
    uint16_t attrs{0};

    bool operator==(const Style &other) const = default;
};

} // namespace morlock::render
