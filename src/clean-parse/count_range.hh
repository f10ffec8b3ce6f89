#pragma once

#include <clean-parse/assert.hh>
#include <clean-parse/fwd.hh>
#include <clean-parse/utility.hh>

#include <limits>

// =========================================================================================================
// Repetition bounds for repeating parsers
// =========================================================================================================
//
// count_range describes "repeat between m and n times" in one type:
//
//   count_range::exactly(n)        n
//   count_range::half_open(m, n)   m..n     (n excluded)
//   count_range::closed(m, n)      m..=n
//   count_range::at_least(m)       m..
//   count_range::below(n)          ..n      (n excluded)
//   count_range::at_most(n)        ..=n
//   count_range::unbounded()       ..
//
// A repeating parser
//   - rejects is_inverted() ranges up front,
//   - iterates saturating_iterator() or bounded_iterator() for its loop counter,
//   - checks contains(count) once it stops.
//
// saturating_iterator() counts 0, 1, 2, ... up to the last count the upper edge admits.
// With an unbounded upper edge it never ends on its own and saturates at the maximum isize;
// the loop must have its own exit condition.
// bounded_iterator() is identical except that an unbounded upper edge stops before the maximum isize,
// so it always terminates.
//
// All bounds are non-negative.
//

enum class cp::bound_kind
{
    included,
    excluded,
    unbounded,
};

/// One edge of a count_range.
struct cp::bound
{
    [[nodiscard]] static constexpr bound included(isize v) { return {bound_kind::included, v}; }
    [[nodiscard]] static constexpr bound excluded(isize v) { return {bound_kind::excluded, v}; }
    [[nodiscard]] static constexpr bound unbounded() { return {bound_kind::unbounded, 0}; }

    [[nodiscard]] constexpr bound_kind kind() const { return _kind; }
    [[nodiscard]] constexpr bool is_unbounded() const { return _kind == bound_kind::unbounded; }

    /// Precondition: !is_unbounded().
    [[nodiscard]] constexpr isize value() const
    {
        CP_ASSERT(!is_unbounded(), "an unbounded edge has no value");
        return _value;
    }

    [[nodiscard]] friend constexpr bool operator==(bound, bound) = default;

    // members
private:
    constexpr bound(bound_kind k, isize v) : _kind(k), _value(v) {}

    bound_kind _kind = bound_kind::unbounded;
    isize _value = 0;
};

struct cp::count_range
{
    struct iterator;
    struct sequence;

    // factories
public:
    /// n
    [[nodiscard]] static constexpr count_range exactly(isize n)
    {
        CP_ASSERT(n >= 0, "repetition counts must be non-negative");
        return {bound::included(n), bound::included(n)};
    }

    /// m..n
    [[nodiscard]] static constexpr count_range half_open(isize m, isize n)
    {
        CP_ASSERT(m >= 0 && n >= 0, "repetition counts must be non-negative");
        return {bound::included(m), bound::excluded(n)};
    }

    /// m..=n
    [[nodiscard]] static constexpr count_range closed(isize m, isize n)
    {
        CP_ASSERT(m >= 0 && n >= 0, "repetition counts must be non-negative");
        return {bound::included(m), bound::included(n)};
    }

    /// m..
    [[nodiscard]] static constexpr count_range at_least(isize m)
    {
        CP_ASSERT(m >= 0, "repetition counts must be non-negative");
        return {bound::included(m), bound::unbounded()};
    }

    /// ..n
    [[nodiscard]] static constexpr count_range below(isize n)
    {
        CP_ASSERT(n >= 0, "repetition counts must be non-negative");
        return {bound::unbounded(), bound::excluded(n)};
    }

    /// ..=n
    [[nodiscard]] static constexpr count_range at_most(isize n)
    {
        CP_ASSERT(n >= 0, "repetition counts must be non-negative");
        return {bound::unbounded(), bound::included(n)};
    }

    /// ..
    [[nodiscard]] static constexpr count_range unbounded() { return {bound::unbounded(), bound::unbounded()}; }

    // queries
public:
    [[nodiscard]] constexpr bound lower() const { return _lower; }
    [[nodiscard]] constexpr bound upper() const { return _upper; }

    [[nodiscard]] constexpr bool contains(isize count) const
    {
        switch (_lower.kind())
        {
        case bound_kind::included:
            if (count < _lower.value())
                return false;
            break;
        case bound_kind::excluded:
            if (count <= _lower.value())
                return false;
            break;
        case bound_kind::unbounded: break;
        }

        switch (_upper.kind())
        {
        case bound_kind::included: return count <= _upper.value();
        case bound_kind::excluded: return count < _upper.value();
        case bound_kind::unbounded: return true;
        }

        CP_BUILTIN_UNREACHABLE;
    }

    /// True if no count can ever satisfy the lower edge before the upper edge is passed,
    /// e.g. 5..3, 3..3 or 5..=3. Ranges without a lower edge are never inverted.
    [[nodiscard]] constexpr bool is_inverted() const
    {
        if (_lower.is_unbounded() || _upper.is_unbounded())
            return false;

        if (_upper.kind() == bound_kind::excluded)
            return !(_lower.value() < _upper.value());
        return _lower.value() > _upper.value();
    }

    // iteration
public:
    /// Counts 0, 1, 2, ... through the last count admitted by the upper edge.
    /// An unbounded upper edge never terminates and repeats the maximum isize once reached.
    [[nodiscard]] constexpr sequence saturating_iterator() const;

    /// Like saturating_iterator(), but an unbounded upper edge stops after the maximum isize - 1.
    [[nodiscard]] constexpr sequence bounded_iterator() const;

    [[nodiscard]] friend constexpr bool operator==(count_range, count_range) = default;

    // members
private:
    constexpr count_range(bound lower, bound upper) : _lower(lower), _upper(upper) {}

    bound _lower;
    bound _upper;
};

struct cp::count_range::iterator
{
    isize current;
    isize last; // inclusive
    bool endless;

    [[nodiscard]] constexpr isize operator*() const { return current; }
    constexpr iterator& operator++()
    {
        if (current < std::numeric_limits<isize>::max())
            ++current;
        else if (!endless)
            last = current - 1; // an included upper edge of max isize ends here
        return *this;
    }
    [[nodiscard]] constexpr bool operator!=(sentinel) const { return endless || current <= last; }
};

/// Restartable sequence of loop counts.
struct cp::count_range::sequence
{
    isize last; // inclusive, -1 for an empty sequence
    bool endless;

    [[nodiscard]] constexpr iterator begin() const { return {0, last, endless}; }
    [[nodiscard]] constexpr sentinel end() const { return {}; }

    [[nodiscard]] constexpr bool is_empty() const { return !endless && last < 0; }
};

constexpr cp::count_range::sequence cp::count_range::saturating_iterator() const
{
    switch (_upper.kind())
    {
    case bound_kind::included: return {_upper.value(), false};
    case bound_kind::excluded: return {_upper.value() - 1, false};
    case bound_kind::unbounded: return {std::numeric_limits<isize>::max(), true};
    }

    CP_BUILTIN_UNREACHABLE;
}

constexpr cp::count_range::sequence cp::count_range::bounded_iterator() const
{
    if (_upper.is_unbounded())
        return {std::numeric_limits<isize>::max() - 1, false};
    return saturating_iterator();
}
