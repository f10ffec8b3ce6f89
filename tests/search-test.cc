#include <clean-parse/search.hh>

#include <nexus/test.hh>

TEST("search - find_token")
{
    SECTION("bytes")
    {
        auto const in = cp::byte_view::from_chars("hello");
        CHECK(cp::find_token(in, cp::u8('l')));
        CHECK(cp::find_token(in, cp::u8('h')));
        CHECK(cp::find_token(in, cp::u8('o')));
        CHECK(!cp::find_token(in, cp::u8('z')));
        CHECK(!cp::find_token(cp::byte_view{}, cp::u8('a')));
    }

    SECTION("text")
    {
        auto const in = cp::text_view("a€b");
        CHECK(cp::find_token(in, U'€'));
        CHECK(cp::find_token(in, U'b'));
        CHECK(!cp::find_token(in, U'¢'));
        CHECK(!cp::find_token(cp::text_view(""), U'a'));
    }

    SECTION("text searched by byte")
    {
        // 0xE2 is the lead byte of the encoding of U+20AC
        auto const in = cp::text_view("a€b");
        CHECK(cp::find_token(in, cp::u8(0xE2)));
        CHECK(cp::find_token(in, cp::u8('a')));
        CHECK(!cp::find_token(in, cp::u8('c')));
    }

    SECTION("bytes searched by code point")
    {
        auto const in = cp::byte_view::from_chars("abc");
        CHECK(cp::find_token(in, U'b'));
        CHECK(!cp::find_token(in, U'z'));
    }
}

TEST("search - find_substring")
{
    auto const hello = cp::text_view("hello world");

    SECTION("found")
    {
        CHECK(cp::find_substring(hello, cp::text_view("world")) == 6);
        CHECK(cp::find_substring(hello, cp::text_view("hello")) == 0);
        CHECK(cp::find_substring(hello, cp::text_view("o w")) == 4);
        CHECK(cp::find_substring(hello, cp::text_view("d")) == 10);
        CHECK(cp::find_substring(hello, hello) == 0);
    }

    SECTION("not found")
    {
        CHECK(!cp::find_substring(hello, cp::text_view("planet")).has_value());
        CHECK(!cp::find_substring(hello, cp::text_view("worlds")).has_value());
        CHECK(!cp::find_substring(hello, cp::text_view("x")).has_value());
    }

    SECTION("empty pattern is found at offset 0")
    {
        CHECK(cp::find_substring(hello, cp::text_view("")) == 0);
        CHECK(cp::find_substring(cp::text_view(""), cp::text_view("")) == 0);
    }

    SECTION("pattern longer than the input is never found")
    {
        CHECK(!cp::find_substring(cp::text_view("hi"), cp::text_view("hi!")).has_value());
        CHECK(!cp::find_substring(cp::text_view(""), cp::text_view("a")).has_value());
    }

    SECTION("false anchors are skipped")
    {
        CHECK(cp::find_substring(cp::text_view("aaab"), cp::text_view("ab")) == 2);
        CHECK(cp::find_substring(cp::text_view("abababc"), cp::text_view("ababc")) == 2);
        CHECK(!cp::find_substring(cp::text_view("aaaa"), cp::text_view("ab")).has_value());
    }

    SECTION("pattern at the very end")
    {
        CHECK(cp::find_substring(cp::text_view("xxab"), cp::text_view("ab")) == 2);
        CHECK(cp::find_substring(cp::text_view("xxxa"), cp::text_view("a")) == 3);
    }

    SECTION("text results are byte offsets on code point boundaries")
    {
        auto const t = cp::text_view("¡€ and €");
        auto const pos = cp::find_substring(t, cp::text_view("€"));
        REQUIRE(pos.has_value());
        CHECK(pos.value() == 2);
        CHECK(t.is_boundary(pos.value()));
        CHECK(t.take_from(pos.value()) == cp::text_view("€ and €"));
    }

    SECTION("bytes searched for text")
    {
        auto const bytes = cp::byte_view::from_chars("price: 5€");
        CHECK(cp::find_substring(bytes, cp::text_view("€")) == 8);
        CHECK(cp::find_substring(bytes, cp::byte_view::from_chars(": ")) == 5);
    }
}
