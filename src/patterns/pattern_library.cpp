#include "patterns/pattern_library.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>

namespace textshield {

namespace {

constexpr bool kIcase = true;

// Built-in patterns are fixed; a failure here is a programming error
Regex must_compile(std::string_view pattern, bool case_insensitive = false) {
    Regex re = compile_regex(pattern, case_insensitive);
    if (!re->ok()) {
        throw std::invalid_argument(
            std::format("Pattern '{}' does not compile: {}", pattern, re->error()));
    }
    return re;
}

// Case-insensitive find of an ASCII needle
size_t find_ci(std::string_view haystack, std::string_view needle, size_t from) {
    if (needle.empty()) return from;
    if (needle.size() > haystack.size()) return std::string_view::npos;
    for (size_t i = from; i + needle.size() <= haystack.size(); ++i) {
        bool match = true;
        for (size_t j = 0; j < needle.size(); ++j) {
            if (std::tolower(static_cast<unsigned char>(haystack[i + j])) !=
                std::tolower(static_cast<unsigned char>(needle[j]))) {
                match = false;
                break;
            }
        }
        if (match) return i;
    }
    return std::string_view::npos;
}

size_t find_delimiter(std::string_view haystack, std::string_view needle, size_t from,
                      bool case_insensitive) {
    return case_insensitive ? find_ci(haystack, needle, from) : haystack.find(needle, from);
}

} // anonymous namespace

std::vector<std::string> PatternLibrary::default_profanity_words() {
    return {"badword1", "badword2", "profanity1", "profanity2"};
}

PatternLibrary::PatternLibrary() : PatternLibrary(Config{}) {}

PatternLibrary::PatternLibrary(const Config& config) {
    // Format validation (always used with matches_fully, so no anchors)
    email_regex_ = must_compile(R"([a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,})");
    url_regex_ = must_compile(
        R"(https?://[-\w.]+(?::\d+)?(?:/[^?#\s]*)?(?:\?[^#\s]*)?(?:#\S*)?)", kIcase);
    url_parts_regex_ = must_compile(
        R"((https?)://([^/?#\s]+)([^?#\s]*)(?:\?([^#\s]*))?(?:#(\S*))?)", kIcase);
    phone_regex_ = must_compile(R"(\+?[1-9]?[\d\-()\s]{8,20})");
    ipv4_regex_ = must_compile(
        R"((?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3})"
        R"((?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?))");
    domain_regex_ = must_compile(
        R"((?:[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?\.)+[a-zA-Z]{2,})");

    // XSS: element blocks are removed with their content, the rest by regex.
    // script must stay first (see script_block()).
    xss_blocks_ = {
        {"script_tag", "<script", "</script", true, true},
        {"iframe_tag", "<iframe", "</iframe", true, true},
        {"object_tag", "<object", "</object", true, true},
        {"embed_tag", "<embed", "</embed", true, true},
    };
    xss_patterns_ = {
        {"javascript_scheme", must_compile(R"(javascript\s*:)", kIcase)},
        {"event_handler", must_compile(R"(on\w+\s*=)", kIcase)},
        {"link_tag", must_compile(R"(<link[^>]*>)", kIcase)},
        {"meta_tag", must_compile(R"(<meta[^>]*>)", kIcase)},
    };

    // SQL injection vectors, applied in this order
    sql_patterns_ = {
        {"sql_keyword", must_compile(
            R"(\b(?:SELECT|INSERT|UPDATE|DELETE|DROP|CREATE|ALTER|EXEC|UNION|SCRIPT)\b)", kIcase)},
        {"numeric_tautology", must_compile(R"(\b(?:OR|AND)\b\s+\d+\s*=\s*\d+)", kIcase)},
        {"string_tautology", must_compile(
            R"(\b(?:OR|AND)\b\s+['"]?\w+['"]?\s*=\s*['"]?\w+['"]?)", kIcase)},
        {"comment_marker", must_compile(R"(--|#|/\*|\*/)")},
        {"statement_separator", must_compile(R"([;|&])")},
    };

    path_traversal_patterns_ = {
        {"dot_dot_slash", must_compile(R"(\.\./)")},
        {"dot_dot_backslash", must_compile(R"(\.\.\\)")},
        {"encoded_dot_dot_slash", must_compile(R"(%2e%2e%2f)", kIcase)},
        {"encoded_dot_dot_backslash", must_compile(R"(%2e%2e%5c)", kIcase)},
        {"double_encoded_dot_dot_slash", must_compile(R"(%252e%252e%252f)", kIcase)},
        {"double_encoded_dot_dot_backslash", must_compile(R"(%252e%252e%255c)", kIcase)},
    };

    // Markup
    event_handler_regex_ = must_compile(
        R"(\bon\w+\s*=\s*(?:"[^"]*"|'[^']*'|[^\s>]+))", kIcase);
    javascript_regex_ = must_compile(R"(javascript\s*:)", kIcase);
    html_tag_regex_ = must_compile(R"(</?([a-zA-Z][a-zA-Z0-9]*)[^>]*>)");
    any_tag_regex_ = must_compile(R"(<[^>]+>)");
    // comment must stay last (see markup_comment())
    xml_blocks_ = {
        {"cdata", "<![CDATA[", "]]>", false, false},
        {"processing_instruction", "<?", "?>", false, false},
        {"comment", "<!--", "-->", false, false},
    };

    // Sensitive data
    ssn_regex_ = must_compile(R"(\b\d{3}-\d{2}-\d{4}\b)");
    ssn_unbounded_regex_ = must_compile(R"(\d{3}-\d{2}-\d{4})");
    // 13-19 digits in groups of four with optional separators
    credit_card_regex_ = must_compile(R"(\b\d{4}[\s-]?\d{4}[\s-]?\d{4}[\s-]?\d{1,7}\b)");
    sensitive_phone_regex_ = must_compile(R"(\b\d{3}[\s-]?\d{3}[\s-]?\d{4}\b)");

    // Profanity: one alternation, longest words first so prefixes never win
    for (const auto& word : config.profanity_words) {
        if (!word.empty()) profanity_words_.push_back(word);
    }
    if (!profanity_words_.empty()) {
        std::vector<std::string> ordered = profanity_words_;
        std::sort(ordered.begin(), ordered.end(),
            [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
        std::string alternation;
        for (const auto& word : ordered) {
            if (!alternation.empty()) alternation += '|';
            alternation += RE2::QuoteMeta(word);
        }
        profanity_regex_ = must_compile("\\b(?:" + alternation + ")\\b", kIcase);
    }
}

std::shared_ptr<const PatternLibrary> PatternLibrary::shared_default() {
    static const std::shared_ptr<const PatternLibrary> instance =
        std::make_shared<const PatternLibrary>();
    return instance;
}

// ============================================================================
// Matching helpers
// ============================================================================

Regex compile_regex(std::string_view pattern, bool case_insensitive) {
    RE2::Options options;
    options.set_encoding(RE2::Options::EncodingLatin1);
    options.set_case_sensitive(!case_insensitive);
    options.set_log_errors(false);
    return std::make_shared<const RE2>(re2::StringPiece(pattern.data(), pattern.size()), options);
}

bool contains_match(std::string_view text, const RE2& re) {
    return RE2::PartialMatch(re2::StringPiece(text.data(), text.size()), re);
}

bool matches_fully(std::string_view text, const RE2& re) {
    return RE2::FullMatch(re2::StringPiece(text.data(), text.size()), re);
}

std::string remove_matches(std::string_view text, const RE2& re) {
    std::string out(text);
    RE2::GlobalReplace(&out, re, "");
    return out;
}

std::string remove_blocks(std::string_view text, const BlockPattern& block, bool* matched) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;

    while (pos < text.size()) {
        const size_t open = find_delimiter(text, block.open, pos, block.case_insensitive);
        if (open == std::string_view::npos) break;

        size_t body = open + block.open.size();
        if (block.is_tag) {
            // "<script" must be followed by a tag boundary, not "<scripted"
            if (body < text.size() && std::isalnum(static_cast<unsigned char>(text[body]))) {
                out.append(text.substr(pos, body - pos));
                pos = body;
                continue;
            }
            const size_t gt = text.find('>', body);
            if (gt == std::string_view::npos) break;
            body = gt + 1;
        }

        const size_t close = find_delimiter(text, block.close, body, block.case_insensitive);
        if (close == std::string_view::npos) break;

        size_t end = close + block.close.size();
        if (block.is_tag) {
            const size_t gt = text.find('>', end);
            if (gt == std::string_view::npos) break;
            end = gt + 1;
        }

        out.append(text.substr(pos, open - pos));
        pos = end;
        if (matched) *matched = true;
    }

    out.append(text.substr(pos));
    return out;
}

} // namespace textshield
