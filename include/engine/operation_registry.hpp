#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace textshield {

// ============================================================================
// Operation catalogue
// ============================================================================

/**
 * @brief Every operation the engine exposes
 *
 * The enum, kOperations and the dispatch switch in SanitizationProcessor
 * must stay in 1:1 correspondence. A static_assert checks table order and
 * -Werror=switch rejects a missing handler.
 */
enum class Operation : size_t {
    // Validation
    VALIDATE_EMAIL,
    VALIDATE_URL,
    VALIDATE_PHONE,
    VALIDATE_IP,
    VALIDATE_DOMAIN,
    VALIDATE_FILE_TYPE,
    VALIDATE_JSON,
    VALIDATE_XML,

    // HTML / XML
    SANITIZE_HTML,
    STRIP_HTML,
    ESCAPE_HTML,
    UNESCAPE_HTML,
    SANITIZE_XML,

    // Security
    PREVENT_XSS,
    PREVENT_SQL_INJECTION,
    PREVENT_PATH_TRAVERSAL,
    SANITIZE_FILENAME,
    VALIDATE_CSRF_TOKEN,

    // Content filtering
    FILTER_PROFANITY,
    FILTER_SENSITIVE_DATA,
    REMOVE_METADATA,
    WHITELIST_CHARS,
    BLACKLIST_CHARS,

    // Masking
    MASK_EMAIL,
    MASK_PHONE,
    MASK_CREDIT_CARD,
    MASK_SSN,
    MASK_CUSTOM,

    // Encoding
    URL_ENCODE,
    URL_DECODE,
    BASE64_ENCODE,
    BASE64_DECODE,
    NORMALIZE_UNICODE,
    CLEAN_WHITESPACE,
    EXTRACT_SAFE_TEXT,

    // Advanced
    BATCH_SANITIZE,
    POLICY_ENFORCE,
};

inline constexpr size_t kOperationCount = static_cast<size_t>(Operation::POLICY_ENFORCE) + 1;

// ============================================================================
// Parameter contract
// ============================================================================

enum class ParamType {
    STRING,
    STRING_LIST,
    ARRAY,      // Any JSON array (batch items are checked one by one)
    OBJECT
};

[[nodiscard]] constexpr const char* param_type_to_string(ParamType type) {
    switch (type) {
        case ParamType::STRING: return "a string";
        case ParamType::STRING_LIST: return "an array of strings";
        case ParamType::ARRAY: return "an array";
        case ParamType::OBJECT: return "an object";
    }
    return "a value";
}

struct ParamSpec {
    std::string_view name;      // Empty marks an unused slot
    ParamType type = ParamType::STRING;
    bool required = false;
};

inline constexpr size_t kMaxParams = 3;

enum class ContentKind {
    TEXT,       // Reads content_alias, then "content"
    NONE        // batch_sanitize: works on "items"
};

struct OperationDescriptor {
    Operation op;
    std::string_view name;
    std::string_view content_alias;     // Empty: only "content"
    ContentKind content = ContentKind::TEXT;
    bool batchable = true;
    std::array<ParamSpec, kMaxParams> params{};
};

namespace detail {

constexpr ParamSpec required_string(std::string_view name) { return {name, ParamType::STRING, true}; }
constexpr ParamSpec optional_string(std::string_view name) { return {name, ParamType::STRING, false}; }
constexpr ParamSpec optional_list(std::string_view name) { return {name, ParamType::STRING_LIST, false}; }

} // namespace detail

// clang-format off
inline constexpr std::array<OperationDescriptor, kOperationCount> kOperations = {{
    {Operation::VALIDATE_EMAIL,         "validate_email",         "email"},
    {Operation::VALIDATE_URL,           "validate_url",           "url"},
    {Operation::VALIDATE_PHONE,         "validate_phone",         "phone"},
    {Operation::VALIDATE_IP,            "validate_ip",            "ip"},
    {Operation::VALIDATE_DOMAIN,        "validate_domain",        "domain"},
    {Operation::VALIDATE_FILE_TYPE,     "validate_file_type",     "filename", ContentKind::TEXT, true,
        {detail::optional_list("allowed_types")}},
    {Operation::VALIDATE_JSON,          "validate_json",          "json_str"},
    {Operation::VALIDATE_XML,           "validate_xml",           "xml_str"},

    {Operation::SANITIZE_HTML,          "sanitize_html",          "", ContentKind::TEXT, true,
        {detail::optional_list("allowed_tags")}},
    {Operation::STRIP_HTML,             "strip_html",             ""},
    {Operation::ESCAPE_HTML,            "escape_html",            ""},
    {Operation::UNESCAPE_HTML,          "unescape_html",          ""},
    {Operation::SANITIZE_XML,           "sanitize_xml",           ""},

    {Operation::PREVENT_XSS,            "prevent_xss",            ""},
    {Operation::PREVENT_SQL_INJECTION,  "prevent_sql_injection",  ""},
    {Operation::PREVENT_PATH_TRAVERSAL, "prevent_path_traversal", "path", ContentKind::TEXT, true,
        {detail::optional_string("mode")}},
    {Operation::SANITIZE_FILENAME,      "sanitize_filename",      "filename"},
    {Operation::VALIDATE_CSRF_TOKEN,    "validate_csrf_token",    "token", ContentKind::TEXT, true,
        {detail::required_string("expected_token")}},

    {Operation::FILTER_PROFANITY,       "filter_profanity",       "", ContentKind::TEXT, true,
        {detail::optional_string("replacement")}},
    {Operation::FILTER_SENSITIVE_DATA,  "filter_sensitive_data",  ""},
    {Operation::REMOVE_METADATA,        "remove_metadata",        ""},
    {Operation::WHITELIST_CHARS,        "whitelist_chars",        "", ContentKind::TEXT, true,
        {detail::required_string("allowed_chars")}},
    {Operation::BLACKLIST_CHARS,        "blacklist_chars",        "", ContentKind::TEXT, true,
        {detail::required_string("forbidden_chars")}},

    {Operation::MASK_EMAIL,             "mask_email",             "email", ContentKind::TEXT, true,
        {detail::optional_string("mask_char")}},
    {Operation::MASK_PHONE,             "mask_phone",             "phone", ContentKind::TEXT, true,
        {detail::optional_string("mask_char")}},
    {Operation::MASK_CREDIT_CARD,       "mask_credit_card",       "card_number", ContentKind::TEXT, true,
        {detail::optional_string("mask_char")}},
    {Operation::MASK_SSN,               "mask_ssn",               "ssn", ContentKind::TEXT, true,
        {detail::optional_string("mask_char")}},
    {Operation::MASK_CUSTOM,            "mask_custom",            "", ContentKind::TEXT, true,
        {detail::required_string("pattern"), detail::required_string("replacement")}},

    {Operation::URL_ENCODE,             "url_encode",             ""},
    {Operation::URL_DECODE,             "url_decode",             ""},
    {Operation::BASE64_ENCODE,          "base64_encode",          ""},
    {Operation::BASE64_DECODE,          "base64_decode",          ""},
    {Operation::NORMALIZE_UNICODE,      "normalize_unicode",      "", ContentKind::TEXT, true,
        {detail::optional_string("form")}},
    {Operation::CLEAN_WHITESPACE,       "clean_whitespace",       ""},
    {Operation::EXTRACT_SAFE_TEXT,      "extract_safe_text",      ""},

    {Operation::BATCH_SANITIZE,         "batch_sanitize",         "", ContentKind::NONE, false,
        {ParamSpec{"items", ParamType::ARRAY, true}, detail::required_string("batch_operation")}},
    {Operation::POLICY_ENFORCE,         "policy_enforce",         "", ContentKind::TEXT, false,
        {ParamSpec{"policy", ParamType::OBJECT, false}, detail::optional_string("policy_name")}},
}};
// clang-format on

namespace detail {

constexpr bool table_matches_enum() {
    for (size_t i = 0; i < kOperations.size(); ++i) {
        if (static_cast<size_t>(kOperations[i].op) != i) return false;
        if (kOperations[i].name.empty()) return false;
    }
    return true;
}

} // namespace detail

static_assert(detail::table_matches_enum(), "kOperations must list every Operation in enum order");

[[nodiscard]] constexpr const OperationDescriptor& descriptor(Operation op) {
    return kOperations[static_cast<size_t>(op)];
}

[[nodiscard]] constexpr std::string_view operation_name(Operation op) {
    return descriptor(op).name;
}

[[nodiscard]] constexpr std::optional<Operation> parse_operation(std::string_view name) {
    for (const auto& d : kOperations) {
        if (d.name == name) return d.op;
    }
    return std::nullopt;
}

} // namespace textshield
