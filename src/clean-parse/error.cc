#include "error.hh"

char const* cp::to_string(error_kind kind)
{
    switch (kind)
    {
    case error_kind::tag: return "Tag";
    case error_kind::map_res: return "MapRes";
    case error_kind::map_opt: return "MapOpt";
    case error_kind::alt: return "Alt";
    case error_kind::is_not: return "IsNot";
    case error_kind::is_a: return "IsA";
    case error_kind::separated_list: return "SeparatedList";
    case error_kind::many: return "Many";
    case error_kind::many0: return "Many0";
    case error_kind::many1: return "Many1";
    case error_kind::many_till: return "ManyTill";
    case error_kind::many_m_n: return "ManyMN";
    case error_kind::count: return "Count";
    case error_kind::take_until: return "TakeUntil";
    case error_kind::take_while1: return "TakeWhile1";
    case error_kind::take_while_m_n: return "TakeWhileMN";
    case error_kind::take_till1: return "TakeTill1";
    case error_kind::alpha: return "Alphabetic";
    case error_kind::digit: return "Digit";
    case error_kind::hex_digit: return "HexDigit";
    case error_kind::oct_digit: return "OctDigit";
    case error_kind::alphanumeric: return "AlphaNumeric";
    case error_kind::space: return "Space";
    case error_kind::multispace: return "MultiSpace";
    case error_kind::char_: return "Char";
    case error_kind::one_of: return "OneOf";
    case error_kind::none_of: return "NoneOf";
    case error_kind::crlf: return "CrLf";
    case error_kind::eof: return "Eof";
    case error_kind::escaped: return "Escaped";
    case error_kind::escaped_transform: return "EscapedTransform";
    case error_kind::non_empty: return "NonEmpty";
    case error_kind::not_: return "Not";
    case error_kind::verify: return "Verify";
    case error_kind::fold: return "Fold";
    case error_kind::float_: return "Float";
    case error_kind::too_large: return "TooLarge";
    case error_kind::complete: return "Complete";
    case error_kind::fail: return "Fail";
    }

    CP_BUILTIN_UNREACHABLE;
}
