#pragma once

#include <clean-parse/error.hh>
#include <clean-parse/fwd.hh>
#include <clean-parse/optional.hh>
#include <clean-parse/pair.hh>
#include <clean-parse/result.hh>

#include <concepts>

// =========================================================================================================
// The input contract and the position-search primitives built on it
// =========================================================================================================
//
// Any type satisfying cp::input can be consumed by the same parser code:
//   size()                 - length in addressing units (bytes for byte_view and text_view alike)
//   take(n), take_from(n)  - prefix / suffix at addressing unit n
//   take_split(n)          - {suffix, prefix}
//   offset(sub)            - where 'sub' starts inside this view
//   position(pred)         - offset of the first element satisfying pred
//   slice_index(count)     - offset after 'count' elements, or the needed deficit
//   elements()             - restartable range over the elements
//   indexed_elements()     - restartable range over (offset, element) pairs
//
// Position search comes in two termination modes:
//
//   streaming                       complete
//   no match -> incomplete(1)       no match -> the whole input matched up to its end
//
// The *1 variants additionally reject a zero-length prefix with error(input, kind).
// In complete mode an empty input is also an error for the *1 variants.
//
// Generic parsers select the mode with a template parameter:
//
//   template <class Mode, cp::input I>
//   cp::parse_result<I> digits1(I in)
//   {
//       return Mode::split_at_position1(in, [](auto c) { return !cp::is_digit(c); }, cp::error_kind::digit);
//   }
//

namespace cp
{
namespace impl
{
struct any_element
{
    template <class E>
    constexpr bool operator()(E const&) const
    {
        return true;
    }
};
} // namespace impl

template <class I>
concept input = std::copyable<I> && requires(I const& in, isize n) {
    typename I::element_t;
    { in.size() } -> std::same_as<isize>;
    { in.take(n) } -> std::same_as<I>;
    { in.take_from(n) } -> std::same_as<I>;
    { in.take_split(n) } -> std::same_as<pair<I, I>>;
    { in.offset(in) } -> std::same_as<isize>;
    { in.position(impl::any_element{}) } -> std::same_as<optional<isize>>;
    { in.slice_index(n) } -> std::same_as<result<isize, needed>>;
    in.elements().begin();
    in.indexed_elements().begin();
};

// =========================================================================================================
// Streaming mode
// =========================================================================================================

/// Splits 'in' before the first element satisfying pred.
/// Returns {rest starting at the match, prefix before the match}.
/// If no element matches, the decision depends on data not seen yet: incomplete(needed::size(1)).
template <input I, class Pred>
[[nodiscard]] constexpr parse_result<I> split_at_position(I const& in, Pred&& pred)
{
    auto const pos = in.position(pred);
    if (pos.has_value())
        return in.take_split(pos.value());
    return cp::error(parse_failure<I>::incomplete(needed::size(1)));
}

/// Like split_at_position, but a match at offset 0 is error(in, kind).
template <input I, class Pred>
[[nodiscard]] constexpr parse_result<I> split_at_position1(I const& in, Pred&& pred, error_kind kind)
{
    auto const pos = in.position(pred);
    if (!pos.has_value())
        return cp::error(parse_failure<I>::incomplete(needed::size(1)));
    if (pos.value() == 0)
        return cp::error(parse_failure<I>::error(in, kind));
    return in.take_split(pos.value());
}

// =========================================================================================================
// Complete mode
// =========================================================================================================

/// Like split_at_position, but the end of the input terminates the prefix: never incomplete.
template <input I, class Pred>
[[nodiscard]] constexpr parse_result<I> split_at_position_complete(I const& in, Pred&& pred)
{
    auto const pos = in.position(pred);
    return in.take_split(pos.has_value() ? pos.value() : in.size());
}

/// Like split_at_position1, but never incomplete.
/// A match at offset 0 and an empty input are both error(in, kind).
template <input I, class Pred>
[[nodiscard]] constexpr parse_result<I> split_at_position1_complete(I const& in, Pred&& pred, error_kind kind)
{
    auto const pos = in.position(pred);
    if (pos.has_value())
    {
        if (pos.value() == 0)
            return cp::error(parse_failure<I>::error(in, kind));
        return in.take_split(pos.value());
    }

    if (in.size() == 0)
        return cp::error(parse_failure<I>::error(in, kind));
    return in.take_split(in.size());
}
} // namespace cp

// =========================================================================================================
// Mode tags
// =========================================================================================================

/// Input may be a prefix of a larger buffer: running out of data yields parse_failure::incomplete.
struct cp::streaming
{
    static constexpr bool is_partial = true;

    template <input I, class Pred>
    [[nodiscard]] static constexpr parse_result<I> split_at_position(I const& in, Pred&& pred)
    {
        return cp::split_at_position(in, pred);
    }

    template <input I, class Pred>
    [[nodiscard]] static constexpr parse_result<I> split_at_position1(I const& in, Pred&& pred, error_kind kind)
    {
        return cp::split_at_position1(in, pred, kind);
    }
};

/// Input is all remaining data: the end of input is a valid place to stop.
struct cp::complete
{
    static constexpr bool is_partial = false;

    template <input I, class Pred>
    [[nodiscard]] static constexpr parse_result<I> split_at_position(I const& in, Pred&& pred)
    {
        return cp::split_at_position_complete(in, pred);
    }

    template <input I, class Pred>
    [[nodiscard]] static constexpr parse_result<I> split_at_position1(I const& in, Pred&& pred, error_kind kind)
    {
        return cp::split_at_position1_complete(in, pred, kind);
    }
};
