// SPDX-License-Identifier: Apache-2.0

#include <ConnStr/UnicodeConverter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>

using namespace std::string_view_literals;

namespace
{

std::u32string DecodeCodePoints(std::string_view utf8)
{
    std::u32string codePoints;
    detail::ForEachCodePoint(utf8, [&](char32_t codePoint) {
        codePoints.push_back(codePoint);
        return false;
    });
    return codePoints;
}

} // namespace

TEST_CASE("UTF-8 decoding", "[Unicode]")
{
    // U+1F600 -> 0xF0 0x9F 0x98 0x80 (UTF-8)
    CHECK(DecodeCodePoints("A\xF0\x9F\x98\x80]"sv) == U"A\U0001F600]"sv);
    CHECK(DecodeCodePoints("\xC3\xA4\xE2\x82\xAC"sv) == U"\u00E4\u20AC"sv);
    CHECK(DecodeCodePoints("\xF4\x8F\xBF\xBF"sv) == U"\U0010FFFF"sv);
}

TEST_CASE("UTF-8 decoding of ill-formed input", "[Unicode]")
{
    // stray continuation byte
    CHECK(DecodeCodePoints("a\x80z"sv) == U"a\uFFFDz"sv);

    // lead byte interrupted by an ASCII character, which must still be decoded
    CHECK(DecodeCodePoints("a\xC3z"sv) == U"a\uFFFDz"sv);

    // truncated sequence at the end
    CHECK(DecodeCodePoints("a\xE2\x82"sv) == U"a\uFFFD"sv);

    // invalid lead byte
    CHECK(DecodeCodePoints("\xFF"sv) == U"\uFFFD"sv);
}

TEST_CASE("UTF-8 decoding rejects overlong forms, surrogates and out of range code points", "[Unicode]")
{
    // overlong U+0000, U+002F and U+0085
    CHECK(DecodeCodePoints("\xC0\x80"sv) == U"\uFFFD"sv);
    CHECK(DecodeCodePoints("\xC0\xAF"sv) == U"\uFFFD"sv);
    CHECK(DecodeCodePoints("\xE0\x82\x85"sv) == U"\uFFFD"sv);
    CHECK(DecodeCodePoints("\xF0\x80\x80\x80"sv) == U"\uFFFD"sv);

    // U+D800, a surrogate
    CHECK(DecodeCodePoints("\xED\xA0\x80"sv) == U"\uFFFD"sv);

    // U+110000, beyond the Unicode range
    CHECK(DecodeCodePoints("\xF4\x90\x80\x80"sv) == U"\uFFFD"sv);

    // decoding continues normally after a rejected sequence
    CHECK(DecodeCodePoints("\xC0\x80" "a\xC2\x85"sv) == U"\uFFFDa\u0085"sv);
}

TEST_CASE("IsControlCharacter", "[Unicode]")
{
    CHECK(IsControlCharacter(U'\0'));
    CHECK(IsControlCharacter(U'\t'));
    CHECK(IsControlCharacter(U'\n'));
    CHECK(IsControlCharacter(0x1F));
    CHECK(IsControlCharacter(0x7F));
    CHECK(IsControlCharacter(0x80));
    CHECK(IsControlCharacter(0x85));
    CHECK(IsControlCharacter(0x9F));

    CHECK(!IsControlCharacter(U' '));
    CHECK(!IsControlCharacter(U'a'));
    CHECK(!IsControlCharacter(U'~'));
    CHECK(!IsControlCharacter(0xA0));
    CHECK(!IsControlCharacter(0x2028));
    CHECK(!IsControlCharacter(0xFFFD));
}

TEST_CASE("ContainsControlCharacter", "[Unicode]")
{
    CHECK(!ContainsControlCharacter(""sv));
    CHECK(!ContainsControlCharacter("plain text"sv));
    CHECK(!ContainsControlCharacter("\xC3\xA4\xF0\x9F\x98\x80"sv));

    CHECK(ContainsControlCharacter("\0"sv));
    CHECK(ContainsControlCharacter("a\0a"sv));
    CHECK(ContainsControlCharacter("line\nbreak"sv));
    CHECK(ContainsControlCharacter("del\x7F"sv));

    // U+0085 (NEXT LINE), a C1 control character, encoded as 0xC2 0x85
    CHECK(ContainsControlCharacter("a\xC2\x85"sv));

    // a control character directly following an unfinished sequence
    CHECK(ContainsControlCharacter("\xC2\x01"sv));

    // a lone 0x85 byte is ill-formed, not a control character
    CHECK(!ContainsControlCharacter("a\x85"sv));

    // overlong encodings of U+0000 and U+0085 are ill-formed, not control characters
    CHECK(!ContainsControlCharacter("\xC0\x80"sv));
    CHECK(!ContainsControlCharacter("\xE0\x82\x85"sv));
}
