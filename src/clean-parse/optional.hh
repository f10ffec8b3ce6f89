#pragma once

#include <clean-parse/assert.hh>
#include <clean-parse/fwd.hh>

#include <type_traits>

/// Tag of the empty state, spelled cp::nullopt.
/// Has no default constructor so that 'optional<T> o = {}' stays unambiguous.
struct cp::nullopt_t
{
    explicit constexpr nullopt_t(int) {}
};

namespace cp
{
inline constexpr nullopt_t nullopt{0};
} // namespace cp

/// An offset, code point or number that may be absent.
///
/// position(), find_substring() and parse_to() answer with it: "not found" and "not a number" are
/// ordinary outcomes, so they are nullopt rather than an error.
/// Only holds trivially copyable values, which keeps every optional a plain value itself.
///
/// Usage:
///   auto const pos = bytes.position([](cp::u8 c) { return c == ','; });
///   if (pos.has_value())
///       auto [rest, field] = bytes.take_split(pos.value());
template <class T>
struct cp::optional
{
    static_assert(std::is_trivially_copyable_v<T>, "cp::optional only holds trivially copyable values");

    // construction
public:
    constexpr optional() : _none() {}
    constexpr optional(nullopt_t) : _none() {}        // NOLINT
    constexpr optional(T value) : _value(value), _has_value(true) {} // NOLINT

    // access
public:
    [[nodiscard]] constexpr bool has_value() const { return _has_value; }

    /// Precondition: has_value().
    [[nodiscard]] constexpr T const& value() const
    {
        CP_ASSERT(_has_value, "optional is empty");
        return _value;
    }

    [[nodiscard]] constexpr T value_or(T fallback) const { return _has_value ? _value : fallback; }

    // comparison
public:
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, optional const& rhs)
    {
        if (lhs._has_value != rhs._has_value)
            return false;
        return !lhs._has_value || lhs._value == rhs._value;
    }
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, T const& rhs)
    {
        return lhs._has_value && lhs._value == rhs;
    }
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, nullopt_t) { return !lhs._has_value; }

private:
    union
    {
        char _none;
        T _value;
    };
    bool _has_value = false;
};
