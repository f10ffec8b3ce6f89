#pragma once

#include <clean-parse/assert.hh>
#include <clean-parse/byte_view.hh>
#include <clean-parse/error.hh>
#include <clean-parse/fwd.hh>
#include <clean-parse/optional.hh>
#include <clean-parse/pair.hh>
#include <clean-parse/result.hh>
#include <clean-parse/utf8.hh>
#include <clean-parse/utility.hh>

/// Non-owning input view over UTF-8 encoded text.
/// Elements are code points (char32_t), but every size, offset and slice index is in BYTES of the encoding.
/// Slicing is only allowed on code point boundaries.
/// The content is assumed to be valid UTF-8; no validation is performed.
/// Trivially copyable. Slicing narrows the view and never copies.
/// Does not own the underlying memory; caller must ensure the referenced data outlives every view derived from it.
///
/// WARNING: text_view does NOT guarantee a trailing null terminator.
struct cp::text_view
{
    using element_t = char32_t;

    struct iterator;
    struct element_range;
    struct indexed_iterator;
    struct indexed_range;

    // construction
public:
    /// Default text_view is empty: data() == nullptr, size() == 0.
    constexpr text_view() = default;

    text_view(nullptr_t) = delete;

    // keep triviality
    constexpr text_view(text_view const&) = default;
    constexpr text_view(text_view&&) = default;
    constexpr text_view& operator=(text_view const&) = default;
    constexpr text_view& operator=(text_view&&) = default;
    constexpr ~text_view() = default;

    /// Creates a text_view viewing the UTF-8 bytes [ptr, ptr+size).
    /// Precondition: size >= 0, and ptr must not be null unless size == 0.
    constexpr explicit text_view(char const* ptr, isize size) : _data(ptr), _size(size)
    {
        CP_ASSERT(size >= 0, "text_view size must be non-negative");
        CP_ASSERT(ptr != nullptr || size == 0, "null pointer only allowed for empty range");
    }

    /// Creates a text_view from a string literal; size() == N - 1.
    /// Assumes the array is null-terminated at N - 1; use text_view(ptr, size) for partially filled buffers.
    template <std::size_t N>
    constexpr text_view(char const (&arr)[N]) : _data(arr), _size(isize(N) - 1)
    {
        static_assert(N > 0, "string literal must have at least a null terminator");
    }

    /// Reinterprets bytes as text.
    /// Precondition: bytes holds valid UTF-8 (see utf8::is_valid).
    [[nodiscard]] static text_view from_bytes(byte_view bytes)
    {
        return text_view(reinterpret_cast<char const*>(bytes.data()), bytes.size());
    }

    // element access
public:
    /// Pointer to the first byte of the encoding. NOT null-terminated.
    [[nodiscard]] constexpr char const* data() const { return _data; }

    /// The same storage viewed as raw bytes.
    [[nodiscard]] byte_view as_bytes() const { return byte_view(reinterpret_cast<u8 const*>(_data), _size); }

    // queries
public:
    /// Byte length of the encoding, not the number of code points.
    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    /// True iff byte offset n starts a code point or is the end of the view.
    [[nodiscard]] constexpr bool is_boundary(isize n) const
    {
        return n == _size || (0 <= n && n < _size && !utf8::is_continuation(u8(_data[n])));
    }

    /// Offset of 'other' relative to this view, in bytes.
    /// Precondition: other is a subview of this view.
    [[nodiscard]] constexpr isize offset(text_view other) const
    {
        auto const off = other._data - _data;
        CP_ASSERT(0 <= off && off <= _size, "offset() requires a view into the same storage");
        return off;
    }

    // slicing
public:
    /// The first n bytes.
    /// Precondition: 0 <= n <= size() and n is on a code point boundary.
    [[nodiscard]] constexpr text_view take(isize n) const
    {
        CP_ASSERT_ALWAYS(0 <= n && n <= _size, "cannot take past the end of the view");
        CP_ASSERT_ALWAYS(is_boundary(n), "cannot split inside a UTF-8 sequence");
        return text_view(_data, n);
    }

    /// Everything from byte n on.
    /// Precondition: 0 <= n <= size() and n is on a code point boundary.
    [[nodiscard]] constexpr text_view take_from(isize n) const
    {
        CP_ASSERT_ALWAYS(0 <= n && n <= _size, "cannot take past the end of the view");
        CP_ASSERT_ALWAYS(is_boundary(n), "cannot split inside a UTF-8 sequence");
        return text_view(_data + n, _size - n);
    }

    /// Returns {take_from(n), take(n)}: the remaining suffix comes first.
    [[nodiscard]] constexpr pair<text_view, text_view> take_split(isize n) const
    {
        return {take_from(n), take(n)};
    }

    // element search
public:
    /// Byte offset of the first code point for which pred returns true, or nullopt.
    template <class Pred>
    [[nodiscard]] constexpr optional<isize> position(Pred&& pred) const;

    /// Converts a code point count into the byte offset after that many code points.
    /// If the view holds fewer code points, the deficit is reported as needed::unknown():
    /// the width of code points that have not arrived yet cannot be known.
    /// Precondition: count >= 0.
    [[nodiscard]] result<isize, needed> slice_index(isize count) const;

    /// Number of code points (linear).
    [[nodiscard]] constexpr isize char_count() const;

    // iteration
public:
    /// Code points of the view. Restartable: every call starts over.
    [[nodiscard]] constexpr element_range elements() const;

    /// (byte offset, code point) pairs. The offset grows by the encoded width of each code point.
    [[nodiscard]] constexpr indexed_range indexed_elements() const;

    // comparison operators (hidden friends)
public:
    /// Byte-wise content equality.
    [[nodiscard]] friend constexpr bool operator==(text_view lhs, text_view rhs)
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
    char const* _data = nullptr;
    isize _size = 0;
};

// =========================================================================================================
// Iteration
// =========================================================================================================

struct cp::text_view::iterator
{
    char const* data;
    isize size;
    isize index;

    [[nodiscard]] constexpr char32_t operator*() const
    {
        auto i = index;
        return utf8::decode_next(data, i, size);
    }
    constexpr iterator& operator++()
    {
        (void)utf8::decode_next(data, index, size);
        return *this;
    }
    [[nodiscard]] constexpr bool operator!=(sentinel) const { return index < size; }
};

struct cp::text_view::element_range
{
    text_view text;

    [[nodiscard]] constexpr iterator begin() const { return {text.data(), text.size(), 0}; }
    [[nodiscard]] constexpr sentinel end() const { return {}; }
};

struct cp::text_view::indexed_iterator
{
    char const* data;
    isize size;
    isize index;

    [[nodiscard]] constexpr pair<isize, char32_t> operator*() const
    {
        auto i = index;
        return {index, utf8::decode_next(data, i, size)};
    }
    constexpr indexed_iterator& operator++()
    {
        (void)utf8::decode_next(data, index, size);
        return *this;
    }
    [[nodiscard]] constexpr bool operator!=(sentinel) const { return index < size; }
};

struct cp::text_view::indexed_range
{
    text_view text;

    [[nodiscard]] constexpr indexed_iterator begin() const { return {text.data(), text.size(), 0}; }
    [[nodiscard]] constexpr sentinel end() const { return {}; }
};

constexpr cp::text_view::element_range cp::text_view::elements() const
{
    return {*this};
}

constexpr cp::text_view::indexed_range cp::text_view::indexed_elements() const
{
    return {*this};
}

// =========================================================================================================
// Search
// =========================================================================================================

template <class Pred>
constexpr cp::optional<cp::isize> cp::text_view::position(Pred&& pred) const
{
    for (auto [i, c] : indexed_elements())
        if (pred(c))
            return i;
    return nullopt;
}

inline cp::result<cp::isize, cp::needed> cp::text_view::slice_index(isize count) const
{
    CP_ASSERT(count >= 0, "element count must be non-negative");

    isize cnt = 0;
    for (auto [i, c] : indexed_elements())
    {
        if (cnt == count)
            return i;
        ++cnt;
    }

    if (cnt == count)
        return _size;
    return cp::error(needed::unknown());
}

constexpr cp::isize cp::text_view::char_count() const
{
    isize cnt = 0;
    for (auto it = elements().begin(); it != sentinel{}; ++it)
        ++cnt;
    return cnt;
}
