#include "security/injection_guard.hpp"
#include "transform/html_sanitizer.hpp"
#include "encoding/encoders.hpp"
#include "core/error.hpp"
#include "core/unicode.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <format>

namespace textshield {

namespace {

// Percent-decoding rounds applied when looking for hidden traversal
constexpr int kMaxDecodeRounds = 4;

// Removal + normalization rounds before REWRITE gives up
constexpr int kMaxRewriteRounds = 16;

constexpr std::string_view kReservedFilenameChars = "<>:\"|?*/\\";

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ',';
        out += item;
    }
    return out;
}

void add_unique(std::vector<std::string>& names, const std::string& name) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
}

bool has_parent_segment(std::string_view path) {
    size_t start = 0;
    while (start <= path.size()) {
        const size_t end = path.find_first_of("/\\", start);
        const size_t stop = (end == std::string_view::npos) ? path.size() : end;
        if (path.substr(start, stop - start) == "..") return true;
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return false;
}

bool is_control(int32_t cp) {
    return cp < 0x20 || cp == 0x7F || (cp >= 0x80 && cp <= 0x9F);
}

} // anonymous namespace

std::optional<PathTraversalMode> parse_path_traversal_mode(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "reject") return PathTraversalMode::REJECT;
    if (lower == "rewrite") return PathTraversalMode::REWRITE;
    return std::nullopt;
}

const char* path_traversal_mode_to_string(PathTraversalMode mode) {
    switch (mode) {
        case PathTraversalMode::REJECT: return "reject";
        case PathTraversalMode::REWRITE: return "rewrite";
    }
    return "reject";
}

InjectionGuard::InjectionGuard(std::shared_ptr<const PatternLibrary> patterns)
    : patterns_(std::move(patterns)) {}

// ============================================================================
// XSS
// ============================================================================

TransformResult InjectionGuard::prevent_xss(const std::string& content) const {
    std::vector<std::string> fired;
    std::string out = content;

    for (const auto& block : patterns_->xss_blocks()) {
        bool matched = false;
        out = remove_blocks(out, block, &matched);
        if (matched) fired.emplace_back(block.name);
    }
    for (const auto& pattern : patterns_->xss_patterns()) {
        if (!contains_match(out, *pattern.regex)) continue;
        fired.push_back(pattern.name);
        out = remove_matches(out, *pattern.regex);
    }

    auto result = TransformResult::from(content, HtmlSanitizer::escape(out));
    result.metadata["vectors"] = join(fired);
    return result;
}

// ============================================================================
// SQL injection
// ============================================================================

TransformResult InjectionGuard::prevent_sql_injection(const std::string& content) const {
    std::vector<std::string> fired;
    std::string out = content;

    for (const auto& pattern : patterns_->sql_patterns()) {
        if (!contains_match(out, *pattern.regex)) continue;
        fired.push_back(pattern.name);
        out = remove_matches(out, *pattern.regex);
    }

    std::string quoted;
    quoted.reserve(out.size());
    for (const char c : out) {
        quoted += c;
        if (c == '\'') quoted += '\'';
    }

    auto result = TransformResult::from(content, std::move(quoted));
    result.metadata["vectors"] = join(fired);
    return result;
}

// ============================================================================
// Path traversal
// ============================================================================

std::string InjectionGuard::normalize_path(std::string_view path) {
    std::string generic(path);
    std::replace(generic.begin(), generic.end(), '\\', '/');
    if (generic.empty()) return generic;

    std::string normal = std::filesystem::path(generic).lexically_normal().generic_string();

    // A relative path keeps its leading ".." after lexical normalization
    while (true) {
        if (normal == "..") {
            normal.clear();
        } else if (normal.starts_with("../")) {
            normal.erase(0, 3);
            continue;
        }
        break;
    }
    return normal;
}

std::vector<std::string> InjectionGuard::detect_path_traversal(const std::string& path) const {
    std::vector<std::string> fired;

    std::string form = path;
    for (int round = 0; round <= kMaxDecodeRounds; ++round) {
        for (const auto& pattern : patterns_->path_traversal_patterns()) {
            if (contains_match(form, *pattern.regex)) add_unique(fired, pattern.name);
        }
        if (has_parent_segment(form)) add_unique(fired, "parent_segment");

        std::string decoded = encoding::url_decode(form);
        if (decoded == form) break;
        form = std::move(decoded);
    }
    return fired;
}

TransformResult InjectionGuard::prevent_path_traversal(const std::string& path,
                                                       PathTraversalMode mode) const {
    const std::vector<std::string> fired = detect_path_traversal(path);

    std::string out;
    switch (mode) {
        case PathTraversalMode::REJECT:
            if (!fired.empty()) {
                throw SanitizationError(
                    std::format("Path traversal detected: {}", join(fired)));
            }
            out = normalize_path(path);
            break;

        case PathTraversalMode::REWRITE: {
            std::string current = path;
            for (int round = 0; round < kMaxDecodeRounds; ++round) {
                std::string decoded = encoding::url_decode(current);
                if (decoded == current) break;
                current = std::move(decoded);
            }

            bool stable = false;
            for (int round = 0; round < kMaxRewriteRounds && !stable; ++round) {
                std::string next = current;
                for (const auto& pattern : patterns_->path_traversal_patterns()) {
                    next = remove_matches(next, *pattern.regex);
                }
                next = normalize_path(next);
                stable = (next == current);
                current = std::move(next);
            }
            if (!stable || has_parent_segment(current)) {
                throw SanitizationError("Path traversal could not be neutralized");
            }
            out = std::move(current);
            break;
        }
    }

    auto result = TransformResult::from(path, std::move(out));
    result.metadata["mode"] = path_traversal_mode_to_string(mode);
    result.metadata["vectors"] = join(fired);
    return result;
}

// ============================================================================
// Filenames
// ============================================================================

TransformResult InjectionGuard::sanitize_filename(const std::string& filename) const {
    std::string cleaned;
    cleaned.reserve(filename.size());

    size_t offset = 0;
    while (offset < filename.size()) {
        const size_t start = offset;
        const int32_t cp = unicode::next_code_point(filename, offset);
        if (cp < 0 || is_control(cp)) continue;
        if (cp < 0x80 && kReservedFilenameChars.find(static_cast<char>(cp)) != std::string_view::npos) {
            cleaned += '_';
            continue;
        }
        cleaned.append(filename, start, offset - start);
    }

    bool truncated = false;
    if (cleaned.size() > kMaxFilenameBytes) {
        truncated = true;
        const auto dot = cleaned.rfind('.');
        const size_t ext_size = (dot == std::string::npos || dot == 0) ? 0 : cleaned.size() - dot;
        if (ext_size > 0 && ext_size < kMaxFilenameBytes) {
            const std::string ext = cleaned.substr(dot);
            cleaned = unicode::truncate_bytes(std::string_view(cleaned).substr(0, dot),
                                              kMaxFilenameBytes - ext_size) + ext;
        } else {
            cleaned = unicode::truncate_bytes(cleaned, kMaxFilenameBytes);
        }
    }

    auto result = TransformResult::from(filename, std::move(cleaned));
    result.metadata["truncated"] = utils::booltostr(truncated);
    return result;
}

} // namespace textshield
