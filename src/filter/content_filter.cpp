#include "filter/content_filter.hpp"
#include "core/unicode.hpp"

#include <unordered_set>
#include <vector>

namespace textshield {

namespace {

// Split into code points; each ill-formed byte is a unit of its own
std::vector<std::string_view> code_units(std::string_view text) {
    std::vector<std::string_view> units;
    units.reserve(text.size());
    size_t offset = 0;
    while (offset < text.size()) {
        const size_t start = offset;
        (void)unicode::next_code_point(text, offset);
        units.push_back(text.substr(start, offset - start));
    }
    return units;
}

std::string filter_chars(std::string_view text, std::string_view set, bool keep_members) {
    const auto members = code_units(set);
    const std::unordered_set<std::string_view> lookup(members.begin(), members.end());

    std::string out;
    out.reserve(text.size());
    for (const auto unit : code_units(text)) {
        if (lookup.contains(unit) == keep_members) out.append(unit);
    }
    return out;
}

std::string replace_all(std::string_view text, const RE2& re,
                        std::string_view placeholder, size_t& count) {
    return replace_each(text, re, [&](const auto&) {
        ++count;
        return std::string(placeholder);
    });
}

} // anonymous namespace

ContentFilter::ContentFilter(std::shared_ptr<const PatternLibrary> patterns)
    : patterns_(std::move(patterns)) {}

TransformResult ContentFilter::filter_profanity(const std::string& text,
                                                const std::string& replacement) const {
    size_t count = 0;
    std::string out = text;
    if (const RE2* profanity = patterns_->profanity()) {
        out = replace_all(text, *profanity, replacement, count);
    }

    auto result = TransformResult::from(text, std::move(out));
    result.metadata["replacements"] = std::to_string(count);
    return result;
}

TransformResult ContentFilter::filter_sensitive_data(const std::string& text) const {
    size_t ssn = 0;
    size_t cards = 0;
    size_t phones = 0;
    std::string out = replace_all(text, patterns_->ssn(), kSsnPlaceholder, ssn);
    out = replace_all(out, patterns_->credit_card(), kCardPlaceholder, cards);
    out = replace_all(out, patterns_->sensitive_phone(), kPhonePlaceholder, phones);

    auto result = TransformResult::from(text, std::move(out));
    result.metadata["ssn"] = std::to_string(ssn);
    result.metadata["credit_card"] = std::to_string(cards);
    result.metadata["phone"] = std::to_string(phones);
    return result;
}

TransformResult ContentFilter::remove_metadata(const std::string& text) const {
    bool removed = false;
    std::string out = remove_blocks(text, patterns_->markup_comment(), &removed);
    auto result = TransformResult::from(text, std::move(out));
    result.metadata["comments_removed"] = removed ? "true" : "false";
    return result;
}

TransformResult ContentFilter::whitelist_chars(const std::string& text,
                                               const std::string& allowed_chars) const {
    return TransformResult::from(text, filter_chars(text, allowed_chars, true));
}

TransformResult ContentFilter::blacklist_chars(const std::string& text,
                                               const std::string& forbidden_chars) const {
    return TransformResult::from(text, filter_chars(text, forbidden_chars, false));
}

} // namespace textshield
