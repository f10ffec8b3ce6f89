#pragma once

#include <clean-parse/buffer.hh>
#include <clean-parse/byte_view.hh>
#include <clean-parse/fwd.hh>
#include <clean-parse/text_view.hh>

#include <utility> // declval

// =========================================================================================================
// Accumulators for parsers that build an owned output from input fragments
// =========================================================================================================
//
//   new_accumulator(fragment)   - empty owned buffer matching the fragment's element kind
//                                 byte_view -> buffer<u8>, text_view / char32_t -> text_buffer
//   append(acc, fragment)       - grow 'acc' by the fragment's contents
//   accumulator_t<I>            - the accumulator type for input I
//
// Usage:
//   auto acc = cp::new_accumulator(in);
//   cp::append(acc, in.take(3));
//   cp::append(acc, U'\n');
//

namespace cp
{
[[nodiscard]] inline buffer<u8> new_accumulator(byte_view)
{
    return {};
}

[[nodiscard]] inline text_buffer new_accumulator(text_view)
{
    return {};
}

/// A lone code point accumulates into text.
[[nodiscard]] inline text_buffer new_accumulator(char32_t)
{
    return {};
}

template <class I>
using accumulator_t = decltype(cp::new_accumulator(std::declval<I>()));

inline void append(buffer<u8>& acc, byte_view fragment)
{
    acc.append(fragment.data(), fragment.size());
}

inline void append(buffer<u8>& acc, u8 b)
{
    acc.push_back(b);
}

/// Appends code point by code point.
inline void append(text_buffer& acc, text_view fragment)
{
    for (auto c : fragment.elements())
        acc.push_back(c);
}

/// Appends the UTF-8 encoding of c.
inline void append(text_buffer& acc, char32_t c)
{
    acc.push_back(c);
}
} // namespace cp
