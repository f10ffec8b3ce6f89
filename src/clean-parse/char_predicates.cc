#include "char_predicates.hh"

#include <unicode/uchar.h>

bool cp::is_alpha(char32_t c)
{
    return u_isalpha(UChar32(c));
}

bool cp::is_alphanumeric(char32_t c)
{
    return u_isalnum(UChar32(c));
}

bool cp::is_digit(char32_t c)
{
    return u_isdigit(UChar32(c));
}

bool cp::is_hex_digit(char32_t c)
{
    return u_isxdigit(UChar32(c));
}

bool cp::is_oct_digit(char32_t c)
{
    return u_isdigit(UChar32(c)) && u_charDigitValue(UChar32(c)) < 8;
}

char32_t cp::to_lower(char32_t c)
{
    return char32_t(u_tolower(UChar32(c)));
}
