#include "validation/validators.hpp"
#include "validation/ipv4.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <openssl/crypto.h>
#include <pugixml.hpp>

#include <format>
#include <unordered_map>

namespace textshield {

namespace {

// RFC 1035 total length limit
constexpr size_t kMaxDomainLength = 253;

ValidationResult invalid() {
    return ValidationResult{};
}

} // anonymous namespace

Validators::Validators(std::shared_ptr<const PatternLibrary> patterns)
    : patterns_(std::move(patterns)) {}

ValidationResult Validators::validate_email(const std::string& email) const {
    ValidationResult result;
    result.valid = matches_fully(email, patterns_->email());
    if (const auto at = email.find('@'); at != std::string::npos) {
        result.attributes["domain"] = email.substr(at + 1);
    }
    return result;
}

ValidationResult Validators::validate_url(const std::string& url) const {
    if (!matches_fully(url, patterns_->url())) return invalid();

    std::string scheme, host, path, query, fragment;
    if (!RE2::FullMatch(url, patterns_->url_parts(), &scheme, &host, &path, &query, &fragment)) {
        return invalid();
    }

    ValidationResult result;
    result.valid = true;
    result.attributes["scheme"] = utils::to_lower(scheme);

    if (const auto colon = host.rfind(':'); colon != std::string::npos) {
        result.attributes["port"] = host.substr(colon + 1);
        host.resize(colon);
    }
    result.attributes["host"] = host;
    result.attributes["path"] = std::move(path);
    result.attributes["query"] = std::move(query);
    result.attributes["fragment"] = std::move(fragment);
    return result;
}

ValidationResult Validators::validate_phone(const std::string& phone) const {
    if (!matches_fully(phone, patterns_->phone())) return invalid();

    std::string normalized;
    normalized.reserve(phone.size());
    for (const char c : phone) {
        if ((c >= '0' && c <= '9') || c == '+') normalized += c;
    }

    ValidationResult result;
    result.valid = true;
    result.normalized_value = std::move(normalized);
    return result;
}

ValidationResult Validators::validate_ip(const std::string& ip) const {
    uint32_t addr = 0;
    if (!matches_fully(ip, patterns_->ipv4()) || !Ipv4::parse_ip(ip, addr)) {
        return invalid();
    }

    ValidationResult result;
    result.valid = true;
    result.attributes["type"] = "ipv4";
    result.attributes["scope"] = Ipv4::scope(addr);
    return result;
}

ValidationResult Validators::validate_domain(const std::string& domain) const {
    if (domain.size() > kMaxDomainLength || !matches_fully(domain, patterns_->domain())) {
        return invalid();
    }

    ValidationResult result;
    result.valid = true;
    result.attributes["tld"] = domain.substr(domain.rfind('.') + 1);
    return result;
}

// ============================================================================
// File type
// ============================================================================

std::string Validators::extension_of(const std::string& filename) {
    const auto sep = filename.find_last_of("/\\");
    const std::string base = (sep == std::string::npos) ? filename : filename.substr(sep + 1);

    const auto dot = base.rfind('.');
    // Leading dot names a hidden file, trailing dot has no suffix
    if (dot == std::string::npos || dot == 0 || dot + 1 == base.size()) return "";
    return utils::to_lower(base.substr(dot));
}

std::string Validators::guess_mime_type(const std::string& extension) {
    static const std::unordered_map<std::string, std::string> kMimeTypes = {
        {".txt",  "text/plain"},
        {".csv",  "text/csv"},
        {".html", "text/html"},
        {".htm",  "text/html"},
        {".css",  "text/css"},
        {".js",   "text/javascript"},
        {".json", "application/json"},
        {".xml",  "application/xml"},
        {".pdf",  "application/pdf"},
        {".zip",  "application/zip"},
        {".gz",   "application/gzip"},
        {".tar",  "application/x-tar"},
        {".doc",  "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls",  "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".png",  "image/png"},
        {".jpg",  "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif",  "image/gif"},
        {".svg",  "image/svg+xml"},
        {".webp", "image/webp"},
        {".mp3",  "audio/mpeg"},
        {".wav",  "audio/wav"},
        {".mp4",  "video/mp4"},
        {".exe",  "application/vnd.microsoft.portable-executable"},
        {".sh",   "application/x-sh"},
    };

    const auto it = kMimeTypes.find(extension);
    return (it != kMimeTypes.end()) ? it->second : "application/octet-stream";
}

ValidationResult Validators::validate_file_type(
    const std::string& filename,
    const std::vector<std::string>& allowed_types) const {

    const std::string extension = extension_of(filename);

    ValidationResult result;
    result.attributes["extension"] = extension;
    result.attributes["mime_type"] = guess_mime_type(extension);
    if (extension.empty()) return result;

    for (const auto& allowed : allowed_types) {
        std::string candidate = utils::to_lower(utils::trim(allowed));
        if (candidate.empty()) continue;
        if (candidate.front() != '.') candidate.insert(candidate.begin(), '.');
        if (candidate == extension) {
            result.valid = true;
            break;
        }
    }
    return result;
}

// ============================================================================
// Structured data
// ============================================================================

ValidationResult Validators::validate_json(const std::string& text) const {
    ValidationResult result;
    try {
        const JsonValue parsed = JsonValue::parse(text);
        result.valid = true;
        result.attributes["parsed_type"] = parsed.kind_name();
    } catch (const JsonValue::parse_error& e) {
        result.attributes["error"] = e.what();
    }
    return result;
}

ValidationResult Validators::validate_xml(const std::string& text) const {
    ValidationResult result;

    pugi::xml_document doc;
    const pugi::xml_parse_result parsed = doc.load_buffer(text.data(), text.size());
    if (!parsed) {
        result.attributes["error"] = std::format("{} at offset {}",
            parsed.description(), static_cast<long long>(parsed.offset));
        return result;
    }

    // pugixml accepts fragments; a document has exactly one root element
    size_t roots = 0;
    pugi::xml_node root;
    for (const auto& node : doc.children()) {
        if (node.type() == pugi::node_element) {
            if (roots++ == 0) root = node;
        } else if (node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata) {
            result.attributes["error"] = "Text content outside the root element";
            return result;
        }
    }
    if (roots != 1) {
        result.attributes["error"] = roots == 0 ? "No root element" : "Multiple root elements";
        return result;
    }

    size_t children = 0;
    for (const auto& child : root.children()) {
        if (child.type() == pugi::node_element) ++children;
    }

    result.valid = true;
    result.attributes["parsed_type"] = "xml";
    result.attributes["root_tag"] = root.name();
    result.attributes["children_count"] = std::to_string(children);
    return result;
}

// ============================================================================
// CSRF
// ============================================================================

ValidationResult Validators::validate_csrf_token(
    const std::string& token,
    const std::string& expected_token) const {

    ValidationResult result;
    if (expected_token.empty() || token.size() != expected_token.size()) return result;

    result.valid = CRYPTO_memcmp(token.data(), expected_token.data(), token.size()) == 0;
    return result;
}

} // namespace textshield
