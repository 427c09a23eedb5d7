#pragma once

#include "core/types.hpp"
#include "patterns/pattern_library.hpp"

#include <memory>
#include <string>
#include <vector>

namespace textshield {

/**
 * @brief Format-correctness checks
 *
 * Every check returns a ValidationResult; malformed input yields
 * valid == false and never throws. Attributes are only informational.
 */
class Validators {
public:
    explicit Validators(std::shared_ptr<const PatternLibrary> patterns);

    // Attribute "domain" whenever the input contains '@'
    [[nodiscard]] ValidationResult validate_email(const std::string& email) const;

    // Attributes scheme, host, path, query, fragment (and port when given) on success
    [[nodiscard]] ValidationResult validate_url(const std::string& url) const;

    // normalized_value keeps only digits and '+'
    [[nodiscard]] ValidationResult validate_phone(const std::string& phone) const;

    // Attributes type=ipv4 and scope on success
    [[nodiscard]] ValidationResult validate_ip(const std::string& ip) const;

    // Attribute tld on success
    [[nodiscard]] ValidationResult validate_domain(const std::string& domain) const;

    /**
     * @brief Check the final-component extension against an allow-list
     *
     * Entries match with or without a leading dot, case-insensitively.
     * The mime_type attribute is a table lookup for diagnostics; it is not
     * derived from the file content.
     */
    [[nodiscard]] ValidationResult validate_file_type(
        const std::string& filename,
        const std::vector<std::string>& allowed_types) const;

    // parsed_type is the root kind; error carries the parser message on failure
    [[nodiscard]] ValidationResult validate_json(const std::string& text) const;

    // Requires exactly one root element; attributes root_tag, children_count
    [[nodiscard]] ValidationResult validate_xml(const std::string& text) const;

    /**
     * @brief Constant-time token comparison
     *
     * An empty expected token never validates. The token is not copied into
     * the result.
     */
    [[nodiscard]] ValidationResult validate_csrf_token(
        const std::string& token,
        const std::string& expected_token) const;

    /**
     * @brief Lowercase extension of the last path component, with its dot
     *
     * Empty when the name has no suffix (".bashrc" has none).
     */
    [[nodiscard]] static std::string extension_of(const std::string& filename);

    // "application/octet-stream" for unknown extensions
    [[nodiscard]] static std::string guess_mime_type(const std::string& extension);

private:
    std::shared_ptr<const PatternLibrary> patterns_;
};

} // namespace textshield
