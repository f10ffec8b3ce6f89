#include <clean-parse/compare.hh>

#include <nexus/test.hh>

#include <string>

TEST("compare - bytes")
{
    cp::u8 const abc[] = {1, 2, 3};
    cp::u8 const abcde[] = {1, 2, 3, 4, 5};
    cp::u8 const edcba[] = {5, 4, 3, 2, 1};

    SECTION("pattern longer than a matching input needs more data")
    {
        CHECK(cp::compare(cp::byte_view(abc), cp::byte_view(abcde)) == cp::compare_result::incomplete);
    }

    SECTION("first differing element is a mismatch")
    {
        CHECK(cp::compare(cp::byte_view(abcde), cp::byte_view(edcba)) == cp::compare_result::mismatch);
    }

    SECTION("mismatch wins over a short input")
    {
        cp::u8 const ab_x[] = {1, 9};
        CHECK(cp::compare(cp::byte_view(ab_x), cp::byte_view(abcde)) == cp::compare_result::mismatch);
    }

    SECTION("input starting with the pattern is a match")
    {
        CHECK(cp::compare(cp::byte_view(abcde), cp::byte_view(abc)) == cp::compare_result::match);
        CHECK(cp::compare(cp::byte_view(abc), cp::byte_view(abc)) == cp::compare_result::match);
    }

    SECTION("empty pattern always matches")
    {
        CHECK(cp::compare(cp::byte_view(abc), cp::byte_view{}) == cp::compare_result::match);
        CHECK(cp::compare(cp::byte_view{}, cp::byte_view{}) == cp::compare_result::match);
    }

    SECTION("empty input against a non-empty pattern needs more data")
    {
        CHECK(cp::compare(cp::byte_view{}, cp::byte_view(abc)) == cp::compare_result::incomplete);
    }
}

TEST("compare - text")
{
    CHECK(cp::compare(cp::text_view("hello world"), cp::text_view("hello")) == cp::compare_result::match);
    CHECK(cp::compare(cp::text_view("hel"), cp::text_view("hello")) == cp::compare_result::incomplete);
    CHECK(cp::compare(cp::text_view("help"), cp::text_view("hello")) == cp::compare_result::mismatch);
    CHECK(cp::compare(cp::text_view("Hello"), cp::text_view("hello")) == cp::compare_result::mismatch);
    CHECK(cp::compare(cp::text_view("€uro"), cp::text_view("€")) == cp::compare_result::match);
    CHECK(cp::compare(cp::text_view("anything"), cp::text_view("")) == cp::compare_result::match);
}

TEST("compare - mixed bytes and text use the UTF-8 encoding")
{
    auto const bytes = cp::byte_view::from_chars("€uro");

    CHECK(cp::compare(bytes, cp::text_view("€")) == cp::compare_result::match);
    CHECK(cp::compare(cp::text_view("€uro"), cp::byte_view::from_chars("€u")) == cp::compare_result::match);

    // a single byte of a multi-byte sequence is a prefix of the encoding
    CHECK(cp::compare(bytes.take(1), cp::text_view("€")) == cp::compare_result::incomplete);
}

TEST("compare - case insensitive bytes")
{
    auto const in = cp::byte_view::from_chars("HeLLo World");

    CHECK(cp::compare_no_case(in, cp::byte_view::from_chars("hello")) == cp::compare_result::match);
    CHECK(cp::compare_no_case(in, cp::byte_view::from_chars("HELLO WORLD")) == cp::compare_result::match);
    CHECK(cp::compare_no_case(in, cp::byte_view::from_chars("help")) == cp::compare_result::mismatch);
    CHECK(cp::compare_no_case(in.take(3), cp::byte_view::from_chars("hello")) == cp::compare_result::incomplete);

    // only ASCII letters fold
    CHECK(cp::compare_no_case(cp::byte_view::from_chars("@"), cp::byte_view::from_chars("`")) == cp::compare_result::mismatch);
    CHECK(cp::compare_no_case(cp::byte_view::from_chars("[]"), cp::byte_view::from_chars("{}")) == cp::compare_result::mismatch);
}

TEST("compare - case insensitive text")
{
    CHECK(cp::compare_no_case(cp::text_view("ÉCOLE"), cp::text_view("école")) == cp::compare_result::match);
    CHECK(cp::compare_no_case(cp::text_view("Привет"), cp::text_view("привет")) == cp::compare_result::match);
    CHECK(cp::compare_no_case(cp::text_view("ÉC"), cp::text_view("école")) == cp::compare_result::incomplete);
    CHECK(cp::compare_no_case(cp::text_view("ÉTÉ"), cp::text_view("école")) == cp::compare_result::mismatch);
    CHECK(cp::compare_no_case(cp::text_view("abc"), cp::text_view("")) == cp::compare_result::match);

    // simple lowercase mapping only, no special casing
    CHECK(cp::compare_no_case(cp::text_view("straße"), cp::text_view("STRASSE")) == cp::compare_result::mismatch);
}

TEST("compare - exactly one outcome")
{
    char const* const inputs[] = {"", "a", "ab", "abc", "abd", "b"};
    char const* const patterns[] = {"", "a", "ab", "abc"};

    for (auto const i : inputs)
        for (auto const p : patterns)
        {
            auto const in = cp::byte_view::from_chars(i, cp::isize(std::char_traits<char>::length(i)));
            auto const pat = cp::byte_view::from_chars(p, cp::isize(std::char_traits<char>::length(p)));
            auto const r = cp::compare(in, pat);

            auto const n_outcomes = int(r == cp::compare_result::match) + int(r == cp::compare_result::mismatch)
                                  + int(r == cp::compare_result::incomplete);
            CHECK(n_outcomes == 1);

            if (pat.empty())
                CHECK(r == cp::compare_result::match);
        }
}
