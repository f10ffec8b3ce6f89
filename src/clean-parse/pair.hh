#pragma once

#include <clean-parse/fwd.hh>

/// Outcome of a split: 'first' is the input left over, 'second' what was split off.
///
/// Plain aggregate, so structured bindings read in parser order:
///   auto [rest, digits] = in.take_split(3);
template <class T, class U>
struct cp::pair
{
    T first;
    U second;

    [[nodiscard]] friend constexpr bool operator==(pair const&, pair const&) = default;
};
