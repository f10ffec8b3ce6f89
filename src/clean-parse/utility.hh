#pragma once

#include <type_traits>

// =========================================================================================================
// Small helpers shared by the views and buffers
// =========================================================================================================
//
//   move(value)              - cast to rvalue reference
//   exchange(obj, new_val)   - replace obj and return the old value (buffer moves)
//   min(a, b), max(a, b)     - by operator<
//   always_false_t<T...>     - dependent false for static_assert in if-constexpr chains
//   sentinel                 - end marker of the lazy element and count sequences
//

namespace cp
{
template <class T>
[[nodiscard]] constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

template <class T, class U = T>
[[nodiscard]] constexpr T exchange(T& obj, U new_val)
{
    T old = static_cast<T&&>(obj);
    obj = static_cast<U&&>(new_val);
    return old;
}

template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return a < b ? b : a;
}

template <class T>
[[nodiscard]] constexpr T const& min(T const& a, T const& b)
{
    return b < a ? b : a;
}

/// Usage:
///   static_assert(cp::always_false_t<T>, "T is not supported by parse_to");
template <class... E>
constexpr bool always_false_t = false;

/// Iterators of element_range, indexed_range and count sequences compare != against it.
/// The iterator alone knows when it is done.
struct sentinel
{
};
} // namespace cp
