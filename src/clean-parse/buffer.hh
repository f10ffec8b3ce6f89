#pragma once

#include <clean-parse/assert.hh>
#include <clean-parse/byte_view.hh>
#include <clean-parse/fwd.hh>
#include <clean-parse/text_view.hh>
#include <clean-parse/utf8.hh>
#include <clean-parse/utility.hh>

#include <cstdlib>
#include <cstring>
#include <type_traits>

/// Owned, growable, contiguous storage of trivially copyable T.
/// Used as the output of accumulating parsers (escape handling, transforms).
/// Value semantics: copying copies the elements, moving steals the allocation.
/// Growth doubles the capacity, so push_back is amortized O(1).
template <class T>
struct cp::buffer
{
    static_assert(std::is_trivially_copyable_v<T>, "buffer relocates its elements with memcpy/realloc");

    // construction
public:
    buffer() = default;

    buffer(buffer const& rhs) { append(rhs.data(), rhs.size()); }
    buffer(buffer&& rhs) noexcept
      : _data(cp::exchange(rhs._data, nullptr)), _size(cp::exchange(rhs._size, 0)), _capacity(cp::exchange(rhs._capacity, 0))
    {
    }
    buffer& operator=(buffer const& rhs)
    {
        if (this != &rhs)
        {
            clear();
            append(rhs.data(), rhs.size());
        }
        return *this;
    }
    buffer& operator=(buffer&& rhs) noexcept
    {
        if (this != &rhs)
        {
            std::free(_data);
            _data = cp::exchange(rhs._data, nullptr);
            _size = cp::exchange(rhs._size, 0);
            _capacity = cp::exchange(rhs._capacity, 0);
        }
        return *this;
    }
    ~buffer() { std::free(_data); }

    /// Empty buffer with room for at least 'capacity' elements.
    [[nodiscard]] static buffer create_with_capacity(isize capacity)
    {
        CP_ASSERT(capacity >= 0, "capacity must be non-negative");
        buffer b;
        b.reserve(capacity);
        return b;
    }

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] T& operator[](isize i)
    {
        CP_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }
    [[nodiscard]] T const& operator[](isize i) const
    {
        CP_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] T* data() { return _data; }
    [[nodiscard]] T const* data() const { return _data; }

    [[nodiscard]] T* begin() { return _data; }
    [[nodiscard]] T* end() { return _data + _size; }
    [[nodiscard]] T const* begin() const { return _data; }
    [[nodiscard]] T const* end() const { return _data + _size; }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }
    [[nodiscard]] isize capacity() const { return _capacity; }

    // modifiers
public:
    void push_back(T const& value)
    {
        if (_size == _capacity)
            grow_for(1);
        _data[_size++] = value;
    }

    /// Appends the n elements starting at p.
    /// p may point into this buffer.
    void append(T const* p, isize n)
    {
        CP_ASSERT(n >= 0, "cannot append a negative number of elements");
        if (n == 0)
            return;

        if (_capacity - _size < n)
        {
            // p may alias our storage, which grow_for would invalidate
            auto const aliased = _data != nullptr && _data <= p && p < _data + _size;
            auto const alias_offset = aliased ? p - _data : 0;
            grow_for(n);
            if (aliased)
                p = _data + alias_offset;
        }

        std::memmove(_data + _size, p, sizeof(T) * size_t(n));
        _size += n;
    }

    void reserve(isize capacity)
    {
        if (capacity > _capacity)
            reallocate(capacity);
    }

    /// Size becomes 0, capacity is kept.
    void clear() { _size = 0; }

    // comparison operators (hidden friends)
public:
    [[nodiscard]] friend bool operator==(buffer const& lhs, buffer const& rhs)
    {
        return lhs._size == rhs._size && (lhs._size == 0 || std::memcmp(lhs._data, rhs._data, sizeof(T) * size_t(lhs._size)) == 0);
    }

    // helper
private:
    void grow_for(isize count) { reallocate(cp::max(_capacity << 1, cp::max(_size + count, isize(16)))); }

    void reallocate(isize capacity)
    {
        auto const p = static_cast<T*>(std::realloc(_data, sizeof(T) * size_t(capacity)));
        CP_ASSERT_ALWAYS(p != nullptr, "out of memory");
        _data = p;
        _capacity = capacity;
    }

    // members
private:
    T* _data = nullptr;
    isize _size = 0;
    isize _capacity = 0;
};

/// Owned, growable UTF-8 text.
/// Appending a code point writes its encoding; appending a text_view copies its bytes.
struct cp::text_buffer
{
    // construction
public:
    text_buffer() = default;

    [[nodiscard]] static text_buffer create_with_capacity(isize bytes)
    {
        text_buffer t;
        t._bytes.reserve(bytes);
        return t;
    }

    // queries
public:
    /// Byte length of the encoding.
    [[nodiscard]] isize size() const { return _bytes.size(); }
    [[nodiscard]] bool empty() const { return _bytes.empty(); }

    [[nodiscard]] text_view view() const
    {
        return text_view::from_bytes(byte_view(_bytes.data(), _bytes.size()));
    }

    // modifiers
public:
    /// Precondition: c is a Unicode scalar value.
    void push_back(char32_t c)
    {
        u8 encoded[4];
        auto const width = utf8::encode(c, encoded);
        _bytes.append(encoded, width);
    }

    void append(text_view text) { _bytes.append(reinterpret_cast<u8 const*>(text.data()), text.size()); }

    void clear() { _bytes.clear(); }

    [[nodiscard]] friend bool operator==(text_buffer const&, text_buffer const&) = default;

    // members
private:
    buffer<u8> _bytes;
};
