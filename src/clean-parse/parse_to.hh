#pragma once

#include <clean-parse/byte_view.hh>
#include <clean-parse/fwd.hh>
#include <clean-parse/optional.hh>
#include <clean-parse/text_view.hh>
#include <clean-parse/utf8.hh>
#include <clean-parse/utility.hh>

#include <charconv>
#include <type_traits>

// =========================================================================================================
// parse_to<T>: coerce a matched input fragment into a scalar value
// =========================================================================================================
//
//   parse_to<T>(text_view)   - parse the whole text as T
//   parse_to<T>(byte_view)   - validate the bytes as UTF-8, then parse as text
//
// Supported T:
//   integers         - optional leading '+' or '-' (no '-' for unsigned), decimal digits, no whitespace
//   floating point   - decimal or scientific notation, "inf", "infinity", "nan", optional sign
//   bool             - exactly "true" or "false"
//   char32_t         - exactly one code point
//
// Any failure (invalid UTF-8, trailing characters, overflow, empty input) yields nullopt.
// Callers decide whether that is a parse error.
//

namespace cp
{
namespace impl
{
template <class T>
optional<T> parse_number(char const* first, char const* last)
{
    if (first != last && *first == '+')
    {
        ++first;
        // "+-1" is not a number
        if (first != last && *first == '-')
            return nullopt;
    }

    if (first == last)
        return nullopt;

    T value{};
    auto const [end, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || end != last)
        return nullopt;
    return value;
}
} // namespace impl

template <class T>
[[nodiscard]] optional<T> parse_to(text_view text)
{
    if constexpr (std::is_same_v<T, bool>)
    {
        if (text == text_view("true"))
            return true;
        if (text == text_view("false"))
            return false;
        return nullopt;
    }
    else if constexpr (std::is_same_v<T, char32_t>)
    {
        auto it = text.elements().begin();
        if (!(it != sentinel{}))
            return nullopt;
        auto const c = *it;
        ++it;
        if (it != sentinel{})
            return nullopt;
        return c;
    }
    else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>)
    {
        return impl::parse_number<T>(text.data(), text.data() + text.size());
    }
    else
    {
        static_assert(cp::always_false_t<T>, "T is not supported by parse_to");
    }
}

template <class T>
[[nodiscard]] optional<T> parse_to(byte_view bytes)
{
    if (!utf8::is_valid(bytes.data(), bytes.size()))
        return nullopt;
    return parse_to<T>(text_view::from_bytes(bytes));
}
} // namespace cp
