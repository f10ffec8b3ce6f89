#include "search.hh"

#include <cstring>

bool cp::find_token(byte_view in, u8 token)
{
    return !in.empty() && std::memchr(in.data(), token, size_t(in.size())) != nullptr;
}

bool cp::find_token(byte_view in, char32_t token)
{
    auto const b = u8(token);
    return in.position([b](u8 c) { return c == b; }).has_value();
}

bool cp::find_token(text_view in, u8 token)
{
    return find_token(in.as_bytes(), token);
}

bool cp::find_token(text_view in, char32_t token)
{
    return in.position([token](char32_t c) { return c == token; }).has_value();
}

cp::optional<cp::isize> cp::find_substring(byte_view in, byte_view pattern)
{
    if (pattern.size() > in.size())
        return nullopt;
    if (pattern.empty())
        return 0;

    auto const first = pattern[0];
    auto const rest = pattern.take_from(1);

    // anchors must leave room for the rest of the pattern
    auto const anchor_end = in.size() - rest.size();

    isize start = 0;
    while (start < anchor_end)
    {
        auto const p = static_cast<u8 const*>(std::memchr(in.data() + start, first, size_t(anchor_end - start)));
        if (p == nullptr)
            return nullopt;

        auto const anchor = p - in.data();
        if (rest.empty() || std::memcmp(p + 1, rest.data(), size_t(rest.size())) == 0)
            return anchor;

        start = anchor + 1;
    }

    return nullopt;
}
