#pragma once

#include <clean-parse/assert.hh>
#include <clean-parse/fwd.hh>

#include <type_traits>

/// Error alternative of a result, produced by cp::error(e).
template <class E>
struct cp::as_error_t
{
    E error;
};

namespace cp
{
/// Marks 'e' as the error of the result it initializes.
/// Usage:
///   cp::result<isize, needed> r = cp::error(needed::unknown());
///   return cp::error(parse_failure<I>::error(in, error_kind::digit));
template <class E>
[[nodiscard]] constexpr as_error_t<E> error(E e)
{
    return {e};
}
} // namespace cp

/// Either the outcome T of an input operation or the reason E it has none.
///
/// slice_index() answers result<isize, needed>, every split answers
/// parse_result<I> = result<pair<I, I>, parse_failure<I>>.
/// Nothing in the library throws, the caller branches on has_value() / has_error().
///
/// Both sides are offsets, views, counts or error tags, so only trivially copyable T and E are allowed.
/// A default-constructed result holds a default-constructed error.
template <class T, class E>
struct cp::result
{
    static_assert(std::is_trivially_copyable_v<T>, "cp::result only holds trivially copyable values");
    static_assert(std::is_trivially_copyable_v<E>, "cp::result only holds trivially copyable errors");

    using value_t = T;
    using error_t = E;

    // construction
public:
    constexpr result() : _error() {}

    /// Success, implicit so that functions can 'return in.take_split(n);'.
    constexpr result(T value) : _value(value), _has_value(true) {} // NOLINT

    /// Failure from cp::error(e).
    template <class F>
        requires std::is_convertible_v<F, E>
    constexpr result(as_error_t<F> e) : _error(e.error) // NOLINT
    {
    }

    // access
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }
    [[nodiscard]] constexpr bool has_error() const { return !_has_value; }

    /// Precondition: has_value().
    [[nodiscard]] constexpr T const& value() const
    {
        CP_ASSERT(_has_value, "result holds an error, not a value");
        return _value;
    }

    /// Precondition: has_error().
    [[nodiscard]] constexpr E const& error() const
    {
        CP_ASSERT(!_has_value, "result holds a value, not an error");
        return _error;
    }

    [[nodiscard]] constexpr T value_or(T fallback) const { return _has_value ? _value : fallback; }
    [[nodiscard]] constexpr E error_or(E fallback) const { return _has_value ? fallback : _error; }

    // comparison
public:
    [[nodiscard]] friend constexpr bool operator==(result const& lhs, result const& rhs)
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        return lhs._has_value ? lhs._value == rhs._value : lhs._error == rhs._error;
    }

private:
    union
    {
        T _value;
        E _error;
    };
    bool _has_value = false;
};
