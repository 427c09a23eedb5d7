#include <catch2/catch_test_macros.hpp>
#include "core/unicode.hpp"

using namespace textshield;

// ============================================================================
// Forms
// ============================================================================

TEST_CASE("Unicode: parse_form is case-insensitive", "[unicode]") {
    CHECK(unicode::parse_form("NFC") == unicode::NormalizationForm::NFC);
    CHECK(unicode::parse_form("nfkd") == unicode::NormalizationForm::NFKD);
    CHECK_FALSE(unicode::parse_form("NFX").has_value());
    CHECK_FALSE(unicode::parse_form("").has_value());
}

TEST_CASE("Unicode: form_to_string matches parse_form", "[unicode]") {
    for (const char* name : {"NFC", "NFD", "NFKC", "NFKD"}) {
        const auto form = unicode::parse_form(name);
        REQUIRE(form.has_value());
        CHECK(std::string(unicode::form_to_string(*form)) == name);
    }
}

TEST_CASE("Unicode: NFC composes and NFD decomposes", "[unicode]") {
    const std::string decomposed = "e\xCC\x81";     // e + COMBINING ACUTE
    const std::string composed = "\xC3\xA9";        // U+00E9
    CHECK(unicode::normalize(decomposed, unicode::NormalizationForm::NFC) == composed);
    CHECK(unicode::normalize(composed, unicode::NormalizationForm::NFD) == decomposed);
}

TEST_CASE("Unicode: NFKC folds compatibility characters", "[unicode]") {
    // U+FB01 LATIN SMALL LIGATURE FI
    CHECK(unicode::normalize("\xEF\xAC\x81", unicode::NormalizationForm::NFKC) == "fi");
    CHECK(unicode::normalize("\xEF\xAC\x81", unicode::NormalizationForm::NFC) == "\xEF\xAC\x81");
}

// ============================================================================
// Lengths and truncation
// ============================================================================

TEST_CASE("Unicode: length counts code points", "[unicode]") {
    CHECK(unicode::length("") == 0);
    CHECK(unicode::length("abc") == 3);
    CHECK(unicode::length("caf\xC3\xA9") == 4);
    CHECK(unicode::length("\xF0\x9F\x98\x80") == 1);     // U+1F600
    CHECK(unicode::length("a\xFF" "b") == 3);             // ill-formed byte counts once
}

TEST_CASE("Unicode: is_valid_utf8", "[unicode]") {
    CHECK(unicode::is_valid_utf8("plain"));
    CHECK(unicode::is_valid_utf8("\xE2\x82\xAC"));
    CHECK_FALSE(unicode::is_valid_utf8("\xC3"));
    CHECK_FALSE(unicode::is_valid_utf8("\xFF\xFE"));
}

TEST_CASE("Unicode: truncate keeps whole code points", "[unicode]") {
    CHECK(unicode::truncate("caf\xC3\xA9!", 4) == "caf\xC3\xA9");
    CHECK(unicode::truncate("abc", 10) == "abc");
    CHECK(unicode::truncate("abc", 0).empty());
}

TEST_CASE("Unicode: truncate_bytes never splits a sequence", "[unicode]") {
    CHECK(unicode::truncate_bytes("ab\xE2\x82\xAC", 4) == "ab");
    CHECK(unicode::truncate_bytes("ab\xE2\x82\xAC", 5) == "ab\xE2\x82\xAC");
    CHECK(unicode::truncate_bytes("abcdef", 3) == "abc");
}

TEST_CASE("Unicode: code point iteration and append", "[unicode]") {
    const std::string text = "a\xC3\xA9";
    size_t offset = 0;
    CHECK(unicode::next_code_point(text, offset) == 'a');
    CHECK(unicode::next_code_point(text, offset) == 0xE9);
    CHECK(offset == text.size());

    std::string out;
    unicode::append_code_point(out, 0x20AC);
    CHECK(out == "\xE2\x82\xAC");
}

TEST_CASE("Unicode: character classes", "[unicode]") {
    CHECK(unicode::is_word_char('_'));
    CHECK(unicode::is_word_char(0xE9));
    CHECK_FALSE(unicode::is_word_char('-'));
    CHECK(unicode::is_space(' '));
    CHECK(unicode::is_space(0x3000));   // IDEOGRAPHIC SPACE
    CHECK_FALSE(unicode::is_space('x'));
}
