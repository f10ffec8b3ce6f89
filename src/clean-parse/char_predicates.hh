#pragma once

#include <clean-parse/fwd.hh>
#include <clean-parse/utf8.hh>

// =========================================================================================================
// Element classification for the two input element kinds
// =========================================================================================================
//
// Byte elements (u8) are classified by ASCII ranges only; bytes >= 0x80 are never letters or digits.
// Code point elements (char32_t) are classified by the Unicode character database (ICU).
// Do not unify the two.
//
//   is_alpha(c)         - letter              (u8: 0x41-0x5A, 0x61-0x7A)
//   is_alphanumeric(c)  - letter or digit
//   is_digit(c)         - decimal digit       (u8: '0'-'9'; char32_t: any Nd code point)
//   is_hex_digit(c)     - hexadecimal digit
//   is_oct_digit(c)     - octal digit         (char32_t: decimal digit with value < 8)
//   is_space(c)         - space or tab
//   is_newline(c)       - '\n'
//   to_lower(c)         - ASCII lowercase for u8, simple Unicode lowercase for char32_t
//   element_width(c)    - addressing units of one element: 1 for u8, UTF-8 width for char32_t
//   as_char(c)          - widen an element to a code point (u8 is read as Latin-1)
//

namespace cp
{
// =========================================================================================================
// Byte elements
// =========================================================================================================

/// Usage:
///   cp::is_alpha(u8('a'))   // true
///   cp::is_alpha(u8(0xE9))  // false, not ASCII
[[nodiscard]] constexpr bool is_alpha(u8 c)
{
    return (0x41 <= c && c <= 0x5A) || (0x61 <= c && c <= 0x7A);
}

[[nodiscard]] constexpr bool is_digit(u8 c)
{
    return 0x30 <= c && c <= 0x39;
}

[[nodiscard]] constexpr bool is_alphanumeric(u8 c)
{
    return is_alpha(c) || is_digit(c);
}

[[nodiscard]] constexpr bool is_hex_digit(u8 c)
{
    return is_digit(c) || (0x41 <= c && c <= 0x46) || (0x61 <= c && c <= 0x66);
}

[[nodiscard]] constexpr bool is_oct_digit(u8 c)
{
    return 0x30 <= c && c <= 0x37;
}

[[nodiscard]] constexpr bool is_space(u8 c)
{
    return c == ' ' || c == '\t';
}

[[nodiscard]] constexpr bool is_newline(u8 c)
{
    return c == '\n';
}

/// Identity for everything except 'A'-'Z'.
[[nodiscard]] constexpr u8 to_lower(u8 c)
{
    return (0x41 <= c && c <= 0x5A) ? u8(c + 0x20) : c;
}

[[nodiscard]] constexpr isize element_width(u8)
{
    return 1;
}

[[nodiscard]] constexpr char32_t as_char(u8 c)
{
    return char32_t(c);
}

// =========================================================================================================
// Code point elements
// =========================================================================================================

/// Unicode "Alphabetic", e.g. 'a', U'é', U'Ж', U'中'.
[[nodiscard]] bool is_alpha(char32_t c);

[[nodiscard]] bool is_alphanumeric(char32_t c);

/// Unicode general category Nd, e.g. U'7', U'٣' (ARABIC-INDIC DIGIT THREE).
[[nodiscard]] bool is_digit(char32_t c);

/// Includes the fullwidth forms of 0-9, A-F, a-f.
[[nodiscard]] bool is_hex_digit(char32_t c);

[[nodiscard]] bool is_oct_digit(char32_t c);

[[nodiscard]] constexpr bool is_space(char32_t c)
{
    return c == U' ' || c == U'\t';
}

[[nodiscard]] constexpr bool is_newline(char32_t c)
{
    return c == U'\n';
}

/// Simple (one-to-one) lowercase mapping, no locale or context.
[[nodiscard]] char32_t to_lower(char32_t c);

[[nodiscard]] constexpr isize element_width(char32_t c)
{
    return utf8::encoded_width(c);
}

[[nodiscard]] constexpr char32_t as_char(char32_t c)
{
    return c;
}
} // namespace cp
