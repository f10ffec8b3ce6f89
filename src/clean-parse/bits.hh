#pragma once

#include <clean-parse/assert.hh>
#include <clean-parse/error.hh>
#include <clean-parse/fwd.hh>
#include <clean-parse/pair.hh>

#include <type_traits>

// =========================================================================================================
// Bit-addressed input and error conversion between byte and bit coordinates
// =========================================================================================================
//
// A bit-level parser consumes bit_input<I>{bytes, bit_offset}, where bit_offset (0-7) counts the bits
// of the first byte that are already consumed.
// When a byte-level parser embeds a bit-level one, errors have to move between the two coordinate systems:
//
//   convert_error<parse_error<I>>(parse_error<bit_input<I>>)     - drops the bit offset
//   convert_error<parse_error<bit_input<I>>>(parse_error<I>)     - pairs the bytes with bit offset 0
//
// The same conversions exist for parse_failure (incomplete passes through unchanged)
// and for plain pair<input, error_kind> errors.
// Converting an error type to itself is the identity, which covers no_error.
//
// Usage:
//   auto const bit_err = cp::parse_error<cp::bit_input<cp::byte_view>>{{bytes, 3}, cp::error_kind::tag};
//   auto const byte_err = cp::convert_error<cp::parse_error<cp::byte_view>>(bit_err);
//

template <class I>
struct cp::bit_input
{
    using input_t = I;

    I input;
    isize bit_offset = 0;

    /// Remaining bits: input.size() * 8 - bit_offset.
    [[nodiscard]] constexpr isize size() const
    {
        CP_ASSERT(0 <= bit_offset && bit_offset < 8, "bit offset must be in [0, 8)");
        return input.size() * 8 - bit_offset;
    }

    [[nodiscard]] friend constexpr bool operator==(bit_input const&, bit_input const&) = default;
};

namespace cp
{
/// Conversion of error type From into error type To.
/// Specializations provide 'static To convert(From const&)'.
template <class From, class To>
struct error_convert;

template <class E>
struct error_convert<E, E>
{
    [[nodiscard]] static constexpr E convert(E const& e) { return e; }
};

template <class I>
struct error_convert<parse_error<bit_input<I>>, parse_error<I>>
{
    [[nodiscard]] static constexpr parse_error<I> convert(parse_error<bit_input<I>> const& e)
    {
        return {e.input.input, e.code};
    }
};

template <class I>
struct error_convert<parse_error<I>, parse_error<bit_input<I>>>
{
    [[nodiscard]] static constexpr parse_error<bit_input<I>> convert(parse_error<I> const& e)
    {
        return {bit_input<I>{e.input, 0}, e.code};
    }
};

template <class I>
struct error_convert<pair<bit_input<I>, error_kind>, pair<I, error_kind>>
{
    [[nodiscard]] static constexpr pair<I, error_kind> convert(pair<bit_input<I>, error_kind> const& e)
    {
        return {e.first.input, e.second};
    }
};

template <class I>
struct error_convert<pair<I, error_kind>, pair<bit_input<I>, error_kind>>
{
    [[nodiscard]] static constexpr pair<bit_input<I>, error_kind> convert(pair<I, error_kind> const& e)
    {
        return {bit_input<I>{e.first, 0}, e.second};
    }
};

/// Converts the carried parse_error; incomplete failures keep their needed.
template <class From, class To>
    requires(!std::is_same_v<From, To>)
struct error_convert<parse_failure<From>, parse_failure<To>>
{
    [[nodiscard]] static constexpr parse_failure<To> convert(parse_failure<From> const& f)
    {
        if (f.is_incomplete())
            return parse_failure<To>::incomplete(f.get_needed());

        auto const tag = f.is_error() ? parse_failure<To>::tag::error : parse_failure<To>::tag::failure;
        return parse_failure<To>::from_error(tag, error_convert<parse_error<From>, parse_error<To>>::convert(f.get_error()));
    }
};

template <class To, class From>
[[nodiscard]] constexpr To convert_error(From const& e)
{
    return error_convert<From, To>::convert(e);
}
} // namespace cp
