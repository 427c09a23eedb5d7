#include <catch2/catch_test_macros.hpp>
#include "filter/content_filter.hpp"

using namespace textshield;

namespace {

ContentFilter make_filter() {
    return ContentFilter(PatternLibrary::shared_default());
}

} // namespace

// ============================================================================
// Profanity
// ============================================================================

TEST_CASE("ContentFilter: profanity is replaced whole-word and case-insensitively", "[filter]") {
    const auto f = make_filter();
    const auto r = f.filter_profanity("This badword1 is BADWORD2!", "***");
    CHECK(r.output == "This *** is ***!");
    CHECK(r.metadata.at("replacements") == "2");
}

TEST_CASE("ContentFilter: profanity inside longer words is kept", "[filter]") {
    const auto f = make_filter();
    const auto r = f.filter_profanity("badword10 and xbadword1", "***");
    CHECK(r.output == "badword10 and xbadword1");
    CHECK(r.metadata.at("replacements") == "0");
}

TEST_CASE("ContentFilter: custom replacement and word list", "[filter]") {
    PatternLibrary::Config config;
    config.profanity_words = {"darn", "heck"};
    const ContentFilter f(std::make_shared<const PatternLibrary>(config));

    const auto r = f.filter_profanity("Darn it, what the heck", "[removed]");
    CHECK(r.output == "[removed] it, what the [removed]");
}

TEST_CASE("ContentFilter: empty word list leaves text alone", "[filter]") {
    PatternLibrary::Config config;
    config.profanity_words = {};
    const ContentFilter f(std::make_shared<const PatternLibrary>(config));
    CHECK(f.filter_profanity("badword1", "***").output == "badword1");
}

// ============================================================================
// Sensitive data
// ============================================================================

TEST_CASE("ContentFilter: SSN, card and phone placeholders", "[filter]") {
    const auto f = make_filter();
    const auto r = f.filter_sensitive_data(
        "SSN 123-45-6789, card 4111 1111 1111 1111, call 555-123-4567");
    CHECK(r.output == "SSN XXX-XX-XXXX, card XXXX-XXXX-XXXX-XXXX, call XXX-XXX-XXXX");
    CHECK(r.metadata.at("ssn") == "1");
    CHECK(r.metadata.at("credit_card") == "1");
    CHECK(r.metadata.at("phone") == "1");
}

TEST_CASE("ContentFilter: text without sensitive data is unchanged", "[filter]") {
    const auto f = make_filter();
    const auto r = f.filter_sensitive_data("Meeting at 10:30 in room 42");
    CHECK(r.output == "Meeting at 10:30 in room 42");
    CHECK(r.metadata.at("ssn") == "0");
}

// ============================================================================
// Metadata
// ============================================================================

TEST_CASE("ContentFilter: comments are removed", "[filter]") {
    const auto f = make_filter();
    auto r = f.remove_metadata("a<!-- author: bob -->b<!--\nmulti\nline-->c");
    CHECK(r.output == "abc");
    CHECK(r.metadata.at("comments_removed") == "true");

    r = f.remove_metadata("no comments");
    CHECK(r.output == "no comments");
    CHECK(r.metadata.at("comments_removed") == "false");
}

// ============================================================================
// Character sets
// ============================================================================

TEST_CASE("ContentFilter: whitelist keeps order", "[filter]") {
    const auto f = make_filter();
    CHECK(f.whitelist_chars("hello, world!", "helo").output == "hellool");
    CHECK(f.whitelist_chars("abc", "").output.empty());
}

TEST_CASE("ContentFilter: blacklist removes members", "[filter]") {
    const auto f = make_filter();
    CHECK(f.blacklist_chars("a-b_c", "-_").output == "abc");
    CHECK(f.blacklist_chars("abc", "").output == "abc");
}

TEST_CASE("ContentFilter: character sets compare whole code points", "[filter]") {
    const auto f = make_filter();
    CHECK(f.whitelist_chars("caf\xC3\xA9 \xC3\xA8", "\xC3\xA9").output == "\xC3\xA9");
    CHECK(f.blacklist_chars("caf\xC3\xA9", "\xC3\xA9").output == "caf");

    const auto r = f.blacklist_chars("caf\xC3\xA9", "f");
    CHECK(r.original_length == 4);
    CHECK(r.final_length == 3);
}
