// include/morlock/util/unicode.hpp
// @brief UTF-8 decoding, encoding and character width helpers.
// @invariant Invalid sequences decode to U+FFFD once per offending byte.
// @ownership Functions return owned strings; inputs are borrowed.
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace morlock::util
{

inline constexpr char32_t kReplacementChar = 0xFFFD;

/// @brief Decode UTF-8 @p s into code points.
std::u32string decode_utf8(std::string_view s);

/// @brief Number of code points @p s decodes to.
std::size_t utf8_length(std::string_view s);

/// @brief Whether @p cp is a C0 or C1 control character or DEL.
bool is_control(char32_t cp);

/// @brief Terminal columns occupied by @p cp: 0 for combining marks, 2 for
///        East Asian wide and fullwidth characters, 1 otherwise.
int char_width(char32_t cp);

/// @brief Append the UTF-8 encoding of @p cp to @p out.
void encode_utf8(char32_t cp, std::string &out);

} // namespace morlock::util
