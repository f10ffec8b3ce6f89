#pragma once

#include <clean-parse/assert.hh>
#include <clean-parse/error.hh>
#include <clean-parse/fwd.hh>
#include <clean-parse/optional.hh>
#include <clean-parse/pair.hh>
#include <clean-parse/result.hh>
#include <clean-parse/utility.hh>


/// Non-owning input view over a contiguous sequence of bytes.
/// Element type is u8, one element per addressing unit.
/// Trivially copyable. Slicing narrows the view and never copies.
/// Does not own the underlying memory; caller must ensure the referenced data outlives every view derived from it.
struct cp::byte_view
{
    using element_t = u8;

    struct indexed_iterator;
    struct indexed_range;

    // construction
public:
    /// Default byte_view is empty: data() == nullptr, size() == 0.
    constexpr byte_view() = default;

    byte_view(nullptr_t) = delete;

    // keep triviality
    constexpr byte_view(byte_view const&) = default;
    constexpr byte_view(byte_view&&) = default;
    constexpr byte_view& operator=(byte_view const&) = default;
    constexpr byte_view& operator=(byte_view&&) = default;
    constexpr ~byte_view() = default;

    /// Creates a byte_view viewing [ptr, ptr+size).
    /// Precondition: size >= 0, and ptr must not be null unless size == 0.
    constexpr explicit byte_view(u8 const* ptr, isize size) : _data(ptr), _size(size)
    {
        CP_ASSERT(size >= 0, "byte_view size must be non-negative");
        CP_ASSERT(ptr != nullptr || size == 0, "null pointer only allowed for empty range");
    }

    /// Creates a byte_view viewing the entire array.
    template <std::size_t N>
    constexpr byte_view(u8 const (&arr)[N]) : _data(arr), _size(isize(N))
    {
    }

    /// Creates a byte_view over the bytes of [ptr, ptr+size), e.g. the characters of a string.
    /// Precondition: size >= 0.
    [[nodiscard]] static byte_view from_chars(char const* ptr, isize size)
    {
        return byte_view(reinterpret_cast<u8 const*>(ptr), size);
    }

    /// Creates a byte_view over the characters of a string literal, excluding the null terminator.
    template <std::size_t N>
    [[nodiscard]] static byte_view from_chars(char const (&str)[N])
    {
        static_assert(N > 0, "string literal must have at least a null terminator");
        return from_chars(str, isize(N) - 1);
    }

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr u8 operator[](isize i) const
    {
        CP_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr u8 const* data() const { return _data; }

    [[nodiscard]] constexpr u8 const* begin() const { return _data; }
    [[nodiscard]] constexpr u8 const* end() const { return _data + _size; }

    // queries
public:
    /// Number of bytes.
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    /// Offset of 'other' relative to this view, in bytes.
    /// Precondition: other is a subview of this view (other.data() lies within [data(), data() + size()]).
    [[nodiscard]] constexpr isize offset(byte_view other) const
    {
        auto const off = other._data - _data;
        CP_ASSERT(0 <= off && off <= _size, "offset() requires a view into the same storage");
        return off;
    }

    // slicing
public:
    /// The first n bytes.
    /// Precondition: 0 <= n <= size().
    [[nodiscard]] constexpr byte_view take(isize n) const
    {
        CP_ASSERT_ALWAYS(0 <= n && n <= _size, "cannot take past the end of the view");
        return byte_view(_data, n);
    }

    /// Everything from byte n on.
    /// Precondition: 0 <= n <= size().
    [[nodiscard]] constexpr byte_view take_from(isize n) const
    {
        CP_ASSERT_ALWAYS(0 <= n && n <= _size, "cannot take past the end of the view");
        return byte_view(_data + n, _size - n);
    }

    /// Returns {take_from(n), take(n)}: the remaining suffix comes first.
    /// Precondition: 0 <= n <= size().
    [[nodiscard]] constexpr pair<byte_view, byte_view> take_split(isize n) const
    {
        return {take_from(n), take(n)};
    }

    // element search
public:
    /// Index of the first byte for which pred returns true, or nullopt after scanning the whole view.
    template <class Pred>
    [[nodiscard]] constexpr optional<isize> position(Pred&& pred) const
    {
        for (isize i = 0; i < _size; ++i)
            if (pred(_data[i]))
                return i;
        return nullopt;
    }

    /// Converts an element count into the byte offset after that many elements.
    /// For bytes this is the identity, or the precise deficit if the view is too short.
    /// Precondition: count >= 0.
    [[nodiscard]] result<isize, needed> slice_index(isize count) const
    {
        CP_ASSERT(count >= 0, "element count must be non-negative");
        if (_size >= count)
            return count;
        return cp::error(needed::size(count - _size));
    }

    // iteration
public:
    /// The bytes of the view. Restartable: every call starts over.
    [[nodiscard]] constexpr byte_view elements() const { return *this; }

    /// (offset, byte) pairs. The offset grows by one per element.
    [[nodiscard]] constexpr indexed_range indexed_elements() const;

    // comparison operators (hidden friends)
public:
    /// Content equality.
    [[nodiscard]] friend constexpr bool operator==(byte_view lhs, byte_view rhs)
    {
        if (lhs._size != rhs._size)
            return false;
        for (isize i = 0; i < lhs._size; ++i)
            if (lhs._data[i] != rhs._data[i])
                return false;
        return true;
    }

    // members
private:
    u8 const* _data = nullptr;
    isize _size = 0;
};

struct cp::byte_view::indexed_iterator
{
    u8 const* data;
    isize size;
    isize index;

    [[nodiscard]] constexpr pair<isize, u8> operator*() const { return {index, data[index]}; }
    constexpr indexed_iterator& operator++()
    {
        ++index;
        return *this;
    }
    [[nodiscard]] constexpr bool operator!=(sentinel) const { return index < size; }
};

struct cp::byte_view::indexed_range
{
    byte_view bytes;

    [[nodiscard]] constexpr indexed_iterator begin() const { return {bytes.data(), bytes.size(), 0}; }
    [[nodiscard]] constexpr sentinel end() const { return {}; }
};

constexpr cp::byte_view::indexed_range cp::byte_view::indexed_elements() const
{
    return {*this};
}
