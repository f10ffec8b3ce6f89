#pragma once

#include <clean-parse/assert.hh>
#include <clean-parse/fwd.hh>
#include <clean-parse/pair.hh>
#include <clean-parse/result.hh>

// =========================================================================================================
// Parse outcome vocabulary
// =========================================================================================================
//
//   needed              - "need N more elements" or "need an unknown amount" (streaming mode only)
//   error_kind          - caller-supplied tag of a structural error
//   parse_error<I>      - (input, kind): where and why a parser step failed
//   parse_failure<I>    - incomplete(needed) | error(parse_error) | failure(parse_error)
//   parse_result<I, O>  - result<pair<remaining, output>, parse_failure<I>>
//   no_error            - unit error for callers that do not care about error details
//
// Error taxonomy:
//   incomplete - decision impossible with the data on hand; retry once more data is appended.
//                Complete-mode operations never produce it.
//   error      - definite failure; combinators may backtrack and try something else.
//   failure    - definite failure that must not be backtracked over.
//

/// The amount of data a streaming operation needs before it can decide.
/// Either a precise element deficit (> 0) or unknown.
/// Text views report unknown because the width of not-yet-seen code points is unpredictable.
struct cp::needed
{
    [[nodiscard]] static constexpr needed unknown() { return needed{}; }

    /// Precondition: n > 0.
    [[nodiscard]] static constexpr needed size(isize n)
    {
        CP_ASSERT(n > 0, "a known deficit must be positive");
        needed res;
        res._size = n;
        return res;
    }

    [[nodiscard]] constexpr bool is_known() const { return _size > 0; }
    [[nodiscard]] constexpr bool is_unknown() const { return _size == 0; }

    /// Precondition: is_known().
    [[nodiscard]] constexpr isize amount() const
    {
        CP_ASSERT(is_known(), "amount() called on an unknown deficit");
        return _size;
    }

    /// Returns a needed with the amount transformed by f (unknown stays unknown).
    template <class F>
    [[nodiscard]] constexpr needed map(F&& f) const
    {
        return is_known() ? needed::size(f(_size)) : needed::unknown();
    }

    [[nodiscard]] friend constexpr bool operator==(needed, needed) = default;

private:
    // 0 encodes "unknown"
    isize _size = 0;
};

/// Tag attached to a structural parse error.
/// The input layer itself only produces the kinds its callers hand in (split_at_position1 and friends);
/// the enumeration covers the combinators built on top of it.
enum class cp::error_kind
{
    tag,
    map_res,
    map_opt,
    alt,
    is_not,
    is_a,
    separated_list,
    many,
    many0,
    many1,
    many_till,
    many_m_n,
    count,
    take_until,
    take_while1,
    take_while_m_n,
    take_till1,
    alpha,
    digit,
    hex_digit,
    oct_digit,
    alphanumeric,
    space,
    multispace,
    char_,
    one_of,
    none_of,
    crlf,
    eof,
    escaped,
    escaped_transform,
    non_empty,
    not_,
    verify,
    fold,
    float_,
    too_large,
    complete,
    fail,
};

namespace cp
{
/// Human readable description of an error kind, e.g. "TakeWhile1".
/// The returned string has static storage duration.
[[nodiscard]] char const* to_string(error_kind kind);
} // namespace cp

/// Unit error: carries no information and converts to and from itself.
struct cp::no_error
{
    [[nodiscard]] friend constexpr bool operator==(no_error, no_error) = default;
};

/// Where and why a parser step failed.
template <class I>
struct cp::parse_error
{
    using input_t = I;

    I input;
    error_kind code = error_kind::fail;

    [[nodiscard]] friend constexpr bool operator==(parse_error const&, parse_error const&) = default;
};

/// The non-success outcome of a parser step.
/// Exactly one of incomplete / error / failure; error and failure carry a parse_error,
/// incomplete carries the deficit.
template <class I>
struct cp::parse_failure
{
    using input_t = I;

    enum class tag
    {
        incomplete,
        error,
        failure,
    };

    // factories
public:
    [[nodiscard]] static constexpr parse_failure incomplete(needed n)
    {
        parse_failure f;
        f._tag = tag::incomplete;
        f._needed = n;
        return f;
    }

    [[nodiscard]] static constexpr parse_failure error(I input, error_kind kind)
    {
        return from_error(tag::error, parse_error<I>{input, kind});
    }

    [[nodiscard]] static constexpr parse_failure failure(I input, error_kind kind)
    {
        return from_error(tag::failure, parse_error<I>{input, kind});
    }

    /// Precondition: t != tag::incomplete.
    [[nodiscard]] static constexpr parse_failure from_error(tag t, parse_error<I> e)
    {
        CP_ASSERT(t != tag::incomplete, "incomplete failures carry a needed, not a parse_error");
        parse_failure f;
        f._tag = t;
        f._error = e;
        return f;
    }

    // queries
public:
    [[nodiscard]] constexpr tag kind() const { return _tag; }
    [[nodiscard]] constexpr bool is_incomplete() const { return _tag == tag::incomplete; }
    [[nodiscard]] constexpr bool is_error() const { return _tag == tag::error; }
    [[nodiscard]] constexpr bool is_failure() const { return _tag == tag::failure; }

    /// Precondition: is_incomplete().
    [[nodiscard]] constexpr needed const& get_needed() const
    {
        CP_ASSERT(is_incomplete(), "only incomplete failures carry a needed");
        return _needed;
    }

    /// Precondition: !is_incomplete().
    [[nodiscard]] constexpr parse_error<I> const& get_error() const
    {
        CP_ASSERT(!is_incomplete(), "incomplete failures carry no parse_error");
        return _error;
    }

    [[nodiscard]] friend constexpr bool operator==(parse_failure const& lhs, parse_failure const& rhs)
    {
        if (lhs._tag != rhs._tag)
            return false;
        return lhs.is_incomplete() ? lhs._needed == rhs._needed : lhs._error == rhs._error;
    }

private:
    tag _tag = tag::error;
    needed _needed;
    parse_error<I> _error;
};

namespace cp
{
/// Outcome of a parser step over input I producing O.
/// On success: pair{remaining input, output}.
template <class I, class O = I>
using parse_result = result<pair<I, O>, parse_failure<I>>;
} // namespace cp
