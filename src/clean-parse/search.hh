#pragma once

#include <clean-parse/byte_view.hh>
#include <clean-parse/fwd.hh>
#include <clean-parse/optional.hh>
#include <clean-parse/text_view.hh>

// =========================================================================================================
// Token and substring search
// =========================================================================================================
//
//   find_token(in, token)           - true iff 'token' occurs anywhere in 'in'
//   find_substring(in, pattern)     - offset of the first occurrence of 'pattern', or nullopt
//
// Offsets are in addressing units (bytes) for both input kinds.
// An empty pattern is found at offset 0; a pattern longer than the input is never found.
//
// Mixed kinds:
//   find_token(byte_view, char32_t)   - compares each byte against the token truncated to 8 bits
//   find_token(text_view, u8)         - searches the raw UTF-8 bytes
//   find_substring(byte_view, text)   - searches for the pattern's UTF-8 bytes
//

namespace cp
{
[[nodiscard]] bool find_token(byte_view in, u8 token);
[[nodiscard]] bool find_token(byte_view in, char32_t token);
[[nodiscard]] bool find_token(text_view in, u8 token);
[[nodiscard]] bool find_token(text_view in, char32_t token);

/// Anchors on the first pattern byte with memchr and verifies the rest at each candidate.
/// Usage:
///   cp::find_substring(cp::text_view("hello world"), cp::text_view("o w")) // 4
[[nodiscard]] optional<isize> find_substring(byte_view in, byte_view pattern);

[[nodiscard]] inline optional<isize> find_substring(byte_view in, text_view pattern)
{
    return find_substring(in, pattern.as_bytes());
}

/// A valid UTF-8 pattern can only match at code point boundaries, so the result is always a valid slice index.
[[nodiscard]] inline optional<isize> find_substring(text_view in, text_view pattern)
{
    return find_substring(in.as_bytes(), pattern.as_bytes());
}
} // namespace cp
