#include <catch2/catch_test_macros.hpp>
#include "core/masking.hpp"
#include "core/error.hpp"
#include "patterns/pattern_library.hpp"

using namespace textshield;

// ============================================================================
// MaskingEngine::mask_email
// ============================================================================

TEST_CASE("Masking email keeps first and last local character", "[masking]") {
    CHECK(MaskingEngine::mask_email("john.doe@example.com", "*") == "j******e@example.com");
    CHECK(MaskingEngine::mask_email("abc@x.com", "*") == "a*c@x.com");
}

TEST_CASE("Masking email leaves short or malformed values unchanged", "[masking]") {
    CHECK(MaskingEngine::mask_email("ab@x.com", "*") == "ab@x.com");
    CHECK(MaskingEngine::mask_email("@x.com", "*") == "@x.com");
    CHECK(MaskingEngine::mask_email("no-at-sign", "*") == "no-at-sign");
}

TEST_CASE("Masking email works on code points", "[masking]") {
    // "jösé" has 4 code points, 6 bytes
    CHECK(MaskingEngine::mask_email("j\xC3\xB6s\xC3\xA9@x.com", "*") == "j**\xC3\xA9@x.com");
    // Multi-byte mask is emitted once per hidden character
    CHECK(MaskingEngine::mask_email("abcd@x.com", "\xE2\x80\xA2") == "a\xE2\x80\xA2\xE2\x80\xA2" "d@x.com");
}

// ============================================================================
// Phone / card
// ============================================================================

TEST_CASE("Masking phone keeps first three and last three digits", "[masking]") {
    CHECK(MaskingEngine::mask_phone("555-123-4567", "*") == "555-***-*567");
    CHECK(MaskingEngine::mask_phone("+1 (555) 123-4567", "#") == "+1 (55#) ###-#567");
}

TEST_CASE("Masking phone below seven digits is unchanged", "[masking]") {
    CHECK(MaskingEngine::mask_phone("12345", "*") == "12345");
    CHECK(MaskingEngine::mask_phone("123456", "*") == "123456");
    CHECK(MaskingEngine::mask_phone("1234567", "*") == "123*567");
}

TEST_CASE("Masking credit card keeps first four and last four digits", "[masking]") {
    CHECK(MaskingEngine::mask_credit_card("4111 1111 1111 1234", "*") == "4111 **** **** 1234");
    CHECK(MaskingEngine::mask_credit_card("4111-1111-1111-1234", "X") == "4111-XXXX-XXXX-1234");
    CHECK(MaskingEngine::mask_credit_card("4111111111111234", "*") == "4111********1234");
}

TEST_CASE("Masking credit card below eight digits is unchanged", "[masking]") {
    CHECK(MaskingEngine::mask_credit_card("1234567", "*") == "1234567");
    CHECK(MaskingEngine::mask_credit_card("12345678", "*") == "12345678");
}

// ============================================================================
// SSN
// ============================================================================

TEST_CASE("Masking SSN masks every occurrence", "[masking]") {
    const PatternLibrary lib;
    CHECK(MaskingEngine::mask_ssn("SSN 123-45-6789 and 987-65-4321", "*", lib.ssn_unbounded()) ==
          "SSN ***-**-**** and ***-**-****");
}

TEST_CASE("Masking SSN without a match is unchanged", "[masking]") {
    const PatternLibrary lib;
    CHECK(MaskingEngine::mask_ssn("no numbers here", "*", lib.ssn_unbounded()) == "no numbers here");
    CHECK(MaskingEngine::mask_ssn("123-456-789", "*", lib.ssn_unbounded()) == "123-456-789");
}

TEST_CASE("Masking SSN treats the mask literally", "[masking]") {
    const PatternLibrary lib;
    CHECK(MaskingEngine::mask_ssn("123-45-6789", "$", lib.ssn_unbounded()) == "$$$-$$-$$$$");
}

// ============================================================================
// Custom
// ============================================================================

TEST_CASE("Masking custom pattern supports back-references", "[masking]") {
    CHECK(MaskingEngine::mask_custom("Order 12345 for bob", R"((\d{3})\d+)", "$1**") ==
          "Order 123** for bob");
    CHECK(MaskingEngine::mask_custom("a-b-c", "-", "_") == "a_b_c");
}

TEST_CASE("Masking custom with an invalid pattern throws", "[masking]") {
    CHECK_THROWS_AS(MaskingEngine::mask_custom("text", "([", "x"), SanitizationError);
    CHECK_THROWS_AS(MaskingEngine::mask_custom("text", "t(?=e)", "x"), SanitizationError);
}

TEST_CASE("Masking custom replacement tokens", "[masking]") {
    CHECK(MaskingEngine::mask_custom("ab", "(a)(b)", "$2$1") == "ba");
    CHECK(MaskingEngine::mask_custom("ab", "b", "[$&]") == "a[b]");
    CHECK(MaskingEngine::mask_custom("ab", "b", "$$") == "a$");
    CHECK(MaskingEngine::mask_custom("ab", "b", "$0$5$") == "a$0$5$");
}

TEST_CASE("Masking custom over a long run", "[masking][limits]") {
    const std::string run(65536, 'x');
    CHECK(MaskingEngine::mask_custom(run, "\\w+", "#") == "#");
}
