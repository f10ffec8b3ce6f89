#pragma once

#include <clean-parse/fwd.hh>

#include <unicode/utf8.h>

// =========================================================================================================
// UTF-8 encoding helpers (thin wrappers around ICU's unicode/utf8.h macros)
// =========================================================================================================
//
//   utf8::decode_next(s, i, size)  - decode the code point at s[i], advance i past it
//   utf8::encoded_width(c)         - number of bytes of the encoding of c (1-4)
//   utf8::is_continuation(b)       - true for 10xxxxxx bytes, i.e. b does not start a code point
//   utf8::encode(c, out)           - write the encoding of c into out, return its width
//   utf8::is_valid(s, size)        - true iff [s, s+size) is well-formed UTF-8
//
// Text views assume their content is already valid UTF-8.
// decode_next substitutes U+FFFD for ill-formed sequences instead of reading past the end.
//

namespace cp::utf8
{
/// Decodes the code point starting at s[i] and advances i past its encoding.
/// Precondition: 0 <= i < size.
template <class Byte>
[[nodiscard]] constexpr char32_t decode_next(Byte const* s, isize& i, isize size)
{
    UChar32 c = 0;
    U8_NEXT_OR_FFFD(s, i, size, c);
    return char32_t(c);
}

/// Returns 1-4 for scalar values, 0 for surrogates and values above U+10FFFF.
[[nodiscard]] constexpr isize encoded_width(char32_t c)
{
    return U8_LENGTH(c);
}

[[nodiscard]] constexpr bool is_continuation(u8 b)
{
    return U8_IS_TRAIL(b);
}

/// Writes the encoding of c into out and returns the number of bytes written.
/// Precondition: c is a Unicode scalar value.
inline isize encode(char32_t c, u8 (&out)[4])
{
    isize i = 0;
    U8_APPEND_UNSAFE(out, i, c);
    return i;
}

[[nodiscard]] inline bool is_valid(u8 const* s, isize size)
{
    isize i = 0;
    while (i < size)
    {
        UChar32 c = 0;
        U8_NEXT(s, i, size, c);
        if (c < 0)
            return false;
    }
    return true;
}
} // namespace cp::utf8
