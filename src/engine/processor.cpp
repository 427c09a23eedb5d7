#include "engine/processor.hpp"
#include "core/error.hpp"
#include "core/masking.hpp"
#include "core/unicode.hpp"
#include "encoding/encoders.hpp"

#include <format>

namespace textshield {

namespace {

std::optional<std::string> optional_string(const JsonValue& params, std::string_view key) {
    return params.string_at(key);
}

std::optional<std::vector<std::string>> optional_string_list(const JsonValue& params,
                                                             std::string_view key) {
    const JsonValue list = params[key];
    if (!list.is_array()) return std::nullopt;
    std::vector<std::string> out;
    out.reserve(list.size());
    for (const auto& item : list.elements()) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

std::string required_string(const JsonValue& params, std::string_view key) {
    auto value = params.string_at(key);
    if (!value) {
        throw SanitizationError(std::format("Missing required parameter: {}", key));
    }
    return std::move(*value);
}

TransformResult transformed(const std::string& input, std::string output) {
    return TransformResult::from(input, std::move(output));
}

} // anonymous namespace

SanitizationProcessor::Settings SanitizationProcessor::Settings::from_config(const EngineConfig& config) {
    Settings settings;
    settings.default_allowed_tags = config.content.default_allowed_tags;
    settings.profanity_replacement = config.content.profanity_replacement;
    settings.mask_char = config.content.mask_char;
    settings.path_traversal_mode = config.security.path_traversal_mode;
    return settings;
}

SanitizationProcessor::SanitizationProcessor(std::shared_ptr<const PatternLibrary> patterns,
                                             Settings settings)
    : patterns_(std::move(patterns)),
      settings_(std::move(settings)),
      validators_(patterns_),
      html_(patterns_, settings_.default_allowed_tags),
      guard_(patterns_),
      filter_(patterns_) {}

std::string SanitizationProcessor::mask_char(const JsonValue& params) const {
    return optional_string(params, "mask_char").value_or(settings_.mask_char);
}

std::optional<std::string> SanitizationProcessor::check_parameter_values(
    Operation op, const JsonValue& params) {

    switch (op) {
        case Operation::NORMALIZE_UNICODE:
            if (const auto form = params.string_at("form"); form && !unicode::parse_form(*form)) {
                return std::format("Unknown normalization form '{}' (expected NFC, NFD, NFKC or NFKD)", *form);
            }
            return std::nullopt;

        case Operation::PREVENT_PATH_TRAVERSAL:
            if (const auto mode = params.string_at("mode"); mode && !parse_path_traversal_mode(*mode)) {
                return std::format("Unknown path traversal mode '{}' (expected reject or rewrite)", *mode);
            }
            return std::nullopt;

        case Operation::MASK_EMAIL:
        case Operation::MASK_PHONE:
        case Operation::MASK_CREDIT_CARD:
        case Operation::MASK_SSN:
            if (const auto mask = params.string_at("mask_char"); mask && mask->empty()) {
                return "mask_char must not be empty";
            }
            return std::nullopt;

        default:
            return std::nullopt;
    }
}

ItemPayload SanitizationProcessor::run(Operation op, const std::string& content,
                                       const JsonValue& params) const {
    switch (op) {
        // ===== Validation =====
        case Operation::VALIDATE_EMAIL:
            return validators_.validate_email(content);
        case Operation::VALIDATE_URL:
            return validators_.validate_url(content);
        case Operation::VALIDATE_PHONE:
            return validators_.validate_phone(content);
        case Operation::VALIDATE_IP:
            return validators_.validate_ip(content);
        case Operation::VALIDATE_DOMAIN:
            return validators_.validate_domain(content);
        case Operation::VALIDATE_FILE_TYPE:
            return validators_.validate_file_type(
                content, optional_string_list(params, "allowed_types").value_or(std::vector<std::string>{}));
        case Operation::VALIDATE_JSON:
            return validators_.validate_json(content);
        case Operation::VALIDATE_XML:
            return validators_.validate_xml(content);

        // ===== HTML / XML =====
        case Operation::SANITIZE_HTML:
            return html_.sanitize_html(content, optional_string_list(params, "allowed_tags"));
        case Operation::STRIP_HTML:
            return html_.strip_html(content);
        case Operation::ESCAPE_HTML:
            return transformed(content, HtmlSanitizer::escape(content));
        case Operation::UNESCAPE_HTML:
            return transformed(content, HtmlSanitizer::unescape(content));
        case Operation::SANITIZE_XML:
            return html_.sanitize_xml(content);

        // ===== Security =====
        case Operation::PREVENT_XSS:
            return guard_.prevent_xss(content);
        case Operation::PREVENT_SQL_INJECTION:
            return guard_.prevent_sql_injection(content);
        case Operation::PREVENT_PATH_TRAVERSAL: {
            PathTraversalMode mode = settings_.path_traversal_mode;
            if (const auto name = optional_string(params, "mode")) {
                const auto parsed = parse_path_traversal_mode(*name);
                if (!parsed) throw SanitizationError(std::format("Unknown path traversal mode '{}'", *name));
                mode = *parsed;
            }
            return guard_.prevent_path_traversal(content, mode);
        }
        case Operation::SANITIZE_FILENAME:
            return guard_.sanitize_filename(content);
        case Operation::VALIDATE_CSRF_TOKEN:
            return validators_.validate_csrf_token(content, required_string(params, "expected_token"));

        // ===== Content filtering =====
        case Operation::FILTER_PROFANITY:
            return filter_.filter_profanity(
                content, optional_string(params, "replacement").value_or(settings_.profanity_replacement));
        case Operation::FILTER_SENSITIVE_DATA:
            return filter_.filter_sensitive_data(content);
        case Operation::REMOVE_METADATA:
            return filter_.remove_metadata(content);
        case Operation::WHITELIST_CHARS:
            return filter_.whitelist_chars(content, required_string(params, "allowed_chars"));
        case Operation::BLACKLIST_CHARS:
            return filter_.blacklist_chars(content, required_string(params, "forbidden_chars"));

        // ===== Masking =====
        case Operation::MASK_EMAIL:
            return transformed(content, MaskingEngine::mask_email(content, mask_char(params)));
        case Operation::MASK_PHONE:
            return transformed(content, MaskingEngine::mask_phone(content, mask_char(params)));
        case Operation::MASK_CREDIT_CARD:
            return transformed(content, MaskingEngine::mask_credit_card(content, mask_char(params)));
        case Operation::MASK_SSN:
            return transformed(content,
                MaskingEngine::mask_ssn(content, mask_char(params), patterns_->ssn_unbounded()));
        case Operation::MASK_CUSTOM:
            return transformed(content, MaskingEngine::mask_custom(
                content, required_string(params, "pattern"), required_string(params, "replacement")));

        // ===== Encoding =====
        case Operation::URL_ENCODE:
            return transformed(content, encoding::url_encode(content));
        case Operation::URL_DECODE:
            return transformed(content, encoding::url_decode(content));
        case Operation::BASE64_ENCODE:
            return transformed(content, encoding::base64_encode(content));
        case Operation::BASE64_DECODE: {
            auto decoded = encoding::try_base64_decode(content);
            const bool ok = decoded.has_value();
            auto result = transformed(content, ok ? std::move(*decoded) : content);
            result.metadata["decoded"] = ok ? "true" : "false";
            return result;
        }
        case Operation::NORMALIZE_UNICODE: {
            const std::string form_name = optional_string(params, "form").value_or("NFC");
            const auto form = unicode::parse_form(form_name);
            if (!form) throw SanitizationError(std::format("Unknown normalization form '{}'", form_name));
            auto result = transformed(content, encoding::normalize_unicode(content, *form));
            result.metadata["form"] = unicode::form_to_string(*form);
            return result;
        }
        case Operation::CLEAN_WHITESPACE:
            return transformed(content, encoding::clean_whitespace(content));
        case Operation::EXTRACT_SAFE_TEXT:
            return transformed(content, encoding::extract_safe_text(content));

        // ===== Advanced (handled by the dispatcher) =====
        case Operation::BATCH_SANITIZE:
        case Operation::POLICY_ENFORCE:
            throw SanitizationError(
                std::format("{} is not a single-item operation", operation_name(op)));
    }
    throw SanitizationError("Unhandled operation");
}

} // namespace textshield
