#pragma once

#include <re2/re2.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace textshield {

/**
 * @brief Compiled pattern, shared read-only between threads
 *
 * RE2 matches in time linear in the input without recursing per character,
 * so the input ceiling bounds the cost of every scan, including scans with
 * caller-supplied patterns.
 */
using Regex = std::shared_ptr<const RE2>;

/**
 * @brief Compile a pattern over raw bytes (Latin-1 mode)
 *
 * Never throws; check ok() and error() on the result. Lookaround and
 * backreferences are not supported and fail to compile.
 */
[[nodiscard]] Regex compile_regex(std::string_view pattern, bool case_insensitive = false);

/**
 * @brief A regex with a stable name reported in result metadata
 */
struct NamedPattern {
    std::string name;
    Regex regex;
};

/**
 * @brief A delimited region removed by literal scanning
 *
 * Used for element blocks whose bodies are removed together with their tags.
 * When is_tag is set, `open` and `close` are tag-name prefixes and the scan
 * extends each of them to the next '>'.
 */
struct BlockPattern {
    std::string_view name;
    std::string_view open;
    std::string_view close;
    bool is_tag = false;
    bool case_insensitive = false;
};

/**
 * @brief Pattern library - every matcher the engine uses, compiled once
 *
 * Read-only after construction; shared between threads through
 * std::shared_ptr<const PatternLibrary>.
 *
 * Groups:
 * - Format validation: email, URL, phone, IPv4, domain
 * - XSS vectors: script/iframe/object/embed blocks, javascript:, on*=, link, meta
 * - SQL injection vectors: keywords, tautologies, comments, separators
 * - Path traversal encodings: literal, percent- and double-percent-encoded
 * - Sensitive data: SSN, credit card, phone
 * - Markup: tags, event-handler attributes, comments, CDATA, PIs
 * - Profanity: configured word list as one whole-word alternation
 */
class PatternLibrary {
public:
    struct Config {
        std::vector<std::string> profanity_words = default_profanity_words();
    };

    PatternLibrary();
    explicit PatternLibrary(const Config& config);

    /**
     * @brief Library built from the default Config, created on first use
     */
    [[nodiscard]] static std::shared_ptr<const PatternLibrary> shared_default();

    [[nodiscard]] static std::vector<std::string> default_profanity_words();

    // ===== Format validation =====

    [[nodiscard]] const RE2& email() const { return *email_regex_; }
    [[nodiscard]] const RE2& url() const { return *url_regex_; }
    // Capture groups: 1 scheme, 2 host[:port], 3 path, 4 query, 5 fragment
    [[nodiscard]] const RE2& url_parts() const { return *url_parts_regex_; }
    [[nodiscard]] const RE2& phone() const { return *phone_regex_; }
    [[nodiscard]] const RE2& ipv4() const { return *ipv4_regex_; }
    [[nodiscard]] const RE2& domain() const { return *domain_regex_; }

    // ===== Security vectors =====

    [[nodiscard]] const std::vector<BlockPattern>& xss_blocks() const { return xss_blocks_; }
    [[nodiscard]] const std::vector<NamedPattern>& xss_patterns() const { return xss_patterns_; }
    [[nodiscard]] const std::vector<NamedPattern>& sql_patterns() const { return sql_patterns_; }
    [[nodiscard]] const std::vector<NamedPattern>& path_traversal_patterns() const {
        return path_traversal_patterns_;
    }

    // ===== Markup =====

    [[nodiscard]] const BlockPattern& script_block() const { return xss_blocks_.front(); }
    [[nodiscard]] const RE2& event_handler_attribute() const { return *event_handler_regex_; }
    [[nodiscard]] const RE2& javascript_scheme() const { return *javascript_regex_; }
    // Capture group 1: tag name
    [[nodiscard]] const RE2& html_tag() const { return *html_tag_regex_; }
    [[nodiscard]] const RE2& any_tag() const { return *any_tag_regex_; }
    [[nodiscard]] const std::vector<BlockPattern>& xml_blocks() const { return xml_blocks_; }
    [[nodiscard]] const BlockPattern& markup_comment() const { return xml_blocks_.back(); }

    // ===== Sensitive data =====

    [[nodiscard]] const RE2& ssn() const { return *ssn_regex_; }
    [[nodiscard]] const RE2& ssn_unbounded() const { return *ssn_unbounded_regex_; }
    [[nodiscard]] const RE2& credit_card() const { return *credit_card_regex_; }
    [[nodiscard]] const RE2& sensitive_phone() const { return *sensitive_phone_regex_; }

    // ===== Profanity =====

    // nullptr when the configured word list is empty
    [[nodiscard]] const RE2* profanity() const { return profanity_regex_.get(); }
    [[nodiscard]] const std::vector<std::string>& profanity_words() const { return profanity_words_; }

private:
    Regex email_regex_;
    Regex url_regex_;
    Regex url_parts_regex_;
    Regex phone_regex_;
    Regex ipv4_regex_;
    Regex domain_regex_;

    std::vector<BlockPattern> xss_blocks_;
    std::vector<NamedPattern> xss_patterns_;
    std::vector<NamedPattern> sql_patterns_;
    std::vector<NamedPattern> path_traversal_patterns_;

    Regex event_handler_regex_;
    Regex javascript_regex_;
    Regex html_tag_regex_;
    Regex any_tag_regex_;
    std::vector<BlockPattern> xml_blocks_;

    Regex ssn_regex_;
    Regex ssn_unbounded_regex_;
    Regex credit_card_regex_;
    Regex sensitive_phone_regex_;

    std::vector<std::string> profanity_words_;
    Regex profanity_regex_;
};

// ============================================================================
// Matching helpers
// ============================================================================

/**
 * @brief True when re matches somewhere in text
 */
[[nodiscard]] bool contains_match(std::string_view text, const RE2& re);

/**
 * @brief True when re matches the whole of text
 */
[[nodiscard]] bool matches_fully(std::string_view text, const RE2& re);

/**
 * @brief Delete every match of re
 */
[[nodiscard]] std::string remove_matches(std::string_view text, const RE2& re);

/**
 * @brief Remove every occurrence of a block pattern
 * @param matched Set to true when at least one block was removed
 *
 * An opening delimiter without a matching close is left untouched.
 */
[[nodiscard]] std::string remove_blocks(std::string_view text, const BlockPattern& block,
                                        bool* matched = nullptr);

/**
 * @brief Replace every match of re with the string returned by fn(groups)
 *
 * groups[0] is the whole match, groups[i] capture group i (empty when the
 * group did not take part). An empty match consumes nothing and the scan
 * resumes one byte later.
 */
template<typename Fn>
[[nodiscard]] std::string replace_each(std::string_view text, const RE2& re, Fn&& fn) {
    std::vector<re2::StringPiece> groups(1 + static_cast<size_t>(re.NumberOfCapturingGroups()));
    std::vector<std::string_view> views(groups.size());
    const re2::StringPiece input(text.data(), text.size());

    std::string out;
    out.reserve(text.size());
    size_t last = 0;
    size_t pos = 0;
    while (pos <= text.size() &&
           re.Match(input, pos, text.size(), RE2::UNANCHORED,
                    groups.data(), static_cast<int>(groups.size()))) {
        for (size_t i = 0; i < groups.size(); ++i) {
            views[i] = std::string_view(groups[i].data(), groups[i].size());
        }
        const size_t start = static_cast<size_t>(groups[0].data() - text.data());
        const size_t end = start + groups[0].size();
        out.append(text.substr(last, start - last));
        out += fn(views);
        last = end;
        pos = (end > start) ? end : end + 1;
    }
    out.append(text.substr(last));
    return out;
}

} // namespace textshield
