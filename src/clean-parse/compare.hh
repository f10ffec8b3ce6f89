#pragma once

#include <clean-parse/byte_view.hh>
#include <clean-parse/char_predicates.hh>
#include <clean-parse/fwd.hh>
#include <clean-parse/text_view.hh>

// =========================================================================================================
// Prefix comparison of an input against a literal pattern
// =========================================================================================================
//
//   compare(in, pattern)          - exact, element by element
//   compare_no_case(in, pattern)  - bytes: ASCII case folding; text: simple lowercase per code point
//
// Outcome (never a bool):
//   match       - 'in' starts with 'pattern' (always the case for an empty pattern)
//   mismatch    - some paired element differs
//   incomplete  - every paired element matched, but 'in' is shorter than 'pattern'
//
// Mixed byte / text arguments compare the text's raw UTF-8 bytes.
// Case-insensitive text comparison lowercases both sides per code point; it does not apply
// special casing or full case folding (e.g. "ß" does not match "SS").
//

enum class cp::compare_result
{
    match,
    mismatch,
    incomplete,
};

namespace cp
{
[[nodiscard]] constexpr compare_result compare(byte_view in, byte_view pattern)
{
    auto const n = min(in.size(), pattern.size());
    for (isize i = 0; i < n; ++i)
        if (in[i] != pattern[i])
            return compare_result::mismatch;

    return in.size() >= pattern.size() ? compare_result::match : compare_result::incomplete;
}

[[nodiscard]] constexpr compare_result compare_no_case(byte_view in, byte_view pattern)
{
    auto const n = min(in.size(), pattern.size());
    for (isize i = 0; i < n; ++i)
        if (to_lower(in[i]) != to_lower(pattern[i]))
            return compare_result::mismatch;

    return in.size() >= pattern.size() ? compare_result::match : compare_result::incomplete;
}

[[nodiscard]] inline compare_result compare(text_view in, text_view pattern)
{
    return compare(in.as_bytes(), pattern.as_bytes());
}
[[nodiscard]] inline compare_result compare(text_view in, byte_view pattern)
{
    return compare(in.as_bytes(), pattern);
}
[[nodiscard]] inline compare_result compare(byte_view in, text_view pattern)
{
    return compare(in, pattern.as_bytes());
}

/// Pairs code points and compares their simple lowercase mappings.
/// The final length check is in bytes, so a pattern whose lowercase form has a different
/// encoded width than the input may report incomplete instead of match.
[[nodiscard]] compare_result compare_no_case(text_view in, text_view pattern);

[[nodiscard]] inline compare_result compare_no_case(text_view in, byte_view pattern)
{
    return compare_no_case(in.as_bytes(), pattern);
}
[[nodiscard]] inline compare_result compare_no_case(byte_view in, text_view pattern)
{
    return compare_no_case(in, pattern.as_bytes());
}
} // namespace cp
