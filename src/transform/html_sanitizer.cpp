#include "transform/html_sanitizer.hpp"
#include "core/unicode.hpp"
#include "core/utils.hpp"

#include <unordered_set>

namespace textshield {

namespace {

constexpr int32_t kReplacementChar = 0xFFFD;

// Longest numeric reference body we try to decode ("&#x10FFFF;" has 6 hex digits)
constexpr size_t kMaxReferenceDigits = 8;

// Longest reference body scanned for the terminating ';'
constexpr size_t kMaxReferenceLength = 32;

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ',';
        out += item;
    }
    return out;
}

int32_t checked_code_point(uint32_t value) {
    if (value == 0 || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
        return kReplacementChar;
    }
    return static_cast<int32_t>(value);
}

// Decode the reference starting at text[amp] ('&'). On success appends the
// decoded text and returns the index just past ';'. Returns amp when the
// sequence is not a reference we understand.
size_t decode_reference(std::string_view text, size_t amp, std::string& out) {
    const size_t rel = text.substr(amp + 1, kMaxReferenceLength + 1).find(';');
    if (rel == std::string_view::npos) return amp;
    const size_t semi = amp + 1 + rel;
    const std::string_view body = text.substr(amp + 1, rel);
    if (body.empty()) return amp;

    if (body.front() == '#') {
        const bool hex = body.size() > 1 && (body[1] == 'x' || body[1] == 'X');
        const std::string_view digits = body.substr(hex ? 2 : 1);
        if (digits.empty()) return amp;

        uint32_t value = 0;
        bool overflow = digits.size() > kMaxReferenceDigits;
        for (const char c : digits) {
            uint32_t d = 0;
            if (c >= '0' && c <= '9') d = static_cast<uint32_t>(c - '0');
            else if (hex && c >= 'a' && c <= 'f') d = static_cast<uint32_t>(c - 'a' + 10);
            else if (hex && c >= 'A' && c <= 'F') d = static_cast<uint32_t>(c - 'A' + 10);
            else return amp;
            if (!overflow) value = value * (hex ? 16 : 10) + d;
        }
        unicode::append_code_point(out, overflow ? kReplacementChar : checked_code_point(value));
        return semi + 1;
    }

    if (body == "amp") out += '&';
    else if (body == "lt") out += '<';
    else if (body == "gt") out += '>';
    else if (body == "quot") out += '"';
    else if (body == "apos") out += '\'';
    else if (body == "nbsp") unicode::append_code_point(out, 0xA0);
    else return amp;
    return semi + 1;
}

} // anonymous namespace

HtmlSanitizer::HtmlSanitizer(std::shared_ptr<const PatternLibrary> patterns,
                             std::vector<std::string> default_allowed_tags)
    : patterns_(std::move(patterns)),
      default_allowed_tags_(std::move(default_allowed_tags)) {}

std::string HtmlSanitizer::remove_scripts(std::string_view html, bool* removed) const {
    std::string current(html);
    bool matched = true;
    while (matched) {
        matched = false;
        current = remove_blocks(current, patterns_->script_block(), &matched);
        if (matched && removed) *removed = true;
    }
    return current;
}

TransformResult HtmlSanitizer::sanitize_html(
    const std::string& html,
    const std::optional<std::vector<std::string>>& allowed_tags) const {

    const std::vector<std::string>& tags = allowed_tags ? *allowed_tags : default_allowed_tags_;
    std::unordered_set<std::string> allowed;
    for (const auto& tag : tags) {
        allowed.insert(utils::to_lower(utils::trim(tag)));
    }

    // 1. Script blocks, content included
    bool scripts_removed = false;
    std::string out = remove_scripts(html, &scripts_removed);

    // 2. Event-handler attributes, only inside tags
    out = replace_each(out, patterns_->any_tag(), [&](const auto& m) {
        return remove_matches(m[0], patterns_->event_handler_attribute());
    });

    // 3. javascript: URLs anywhere
    out = remove_matches(out, patterns_->javascript_scheme());

    // 4. Tag allow-list; the tag goes, its inner text stays
    out = replace_each(out, patterns_->html_tag(), [&](const auto& m) {
        return allowed.contains(utils::to_lower(m[1])) ? std::string(m[0]) : std::string();
    });

    auto result = TransformResult::from(html, std::move(out));
    result.metadata["allowed_tags"] = join(tags);
    result.metadata["scripts_removed"] = utils::booltostr(scripts_removed);
    return result;
}

TransformResult HtmlSanitizer::strip_html(const std::string& html) const {
    return TransformResult::from(html, remove_matches(html, patterns_->any_tag()));
}

TransformResult HtmlSanitizer::sanitize_xml(const std::string& xml) const {
    std::string out = xml;
    std::vector<std::string> removed;
    for (const auto& block : patterns_->xml_blocks()) {
        bool matched = false;
        out = remove_blocks(out, block, &matched);
        if (matched) removed.emplace_back(block.name);
    }

    auto result = TransformResult::from(xml, std::move(out));
    result.metadata["removed"] = join(removed);
    return result;
}

std::string HtmlSanitizer::escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + text.size() / 8);
    for (const char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default:   out += c;
        }
    }
    return out;
}

std::string HtmlSanitizer::unescape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '&') {
            const size_t next = decode_reference(text, i, out);
            if (next != i) {
                i = next;
                continue;
            }
        }
        out += text[i++];
    }
    return out;
}

} // namespace textshield
