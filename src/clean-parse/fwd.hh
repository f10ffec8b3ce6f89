#pragma once

#include <cstddef>
#include <cstdint>


namespace cp
{

//
// Primitives
//

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// signed size type
// All lengths, offsets and counts in clean-parse are isize, including the repetition counts of count_range.
// "size - 1" and "a.offset(b)" never wrap around silently; negative values are caught by CP_ASSERT.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Vocabulary
//

template <class T, class U>
struct pair;

struct nullopt_t;
template <class T>
struct optional;

template <class E>
struct as_error_t;
template <class T, class E>
struct result;

//
// Input views
//

struct byte_view;
struct text_view;

template <class I>
struct bit_input;

//
// Parse outcomes
//

enum class compare_result;
enum class error_kind;

struct needed;
struct no_error;
template <class I>
struct parse_error;
template <class I>
struct parse_failure;

// streaming / complete termination policies
struct streaming;
struct complete;

//
// Repetition bounds
//

enum class bound_kind;
struct bound;
struct count_range;

//
// Accumulators
//

template <class T>
struct buffer;
struct text_buffer;

} // namespace cp
