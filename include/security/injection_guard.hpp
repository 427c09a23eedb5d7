#pragma once

#include "core/types.hpp"
#include "patterns/pattern_library.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textshield {

enum class PathTraversalMode {
    REJECT,     // Fail the call on any detected traversal
    REWRITE     // Remove traversal sequences and normalize to a fixpoint
};

[[nodiscard]] std::optional<PathTraversalMode> parse_path_traversal_mode(std::string_view name);
[[nodiscard]] const char* path_traversal_mode_to_string(PathTraversalMode mode);

/**
 * @brief Removal of XSS, SQL-injection and path-traversal vectors
 *
 * Every result lists the vectors that fired in metadata["vectors"].
 */
class InjectionGuard {
public:
    static constexpr size_t kMaxFilenameBytes = 255;

    explicit InjectionGuard(std::shared_ptr<const PatternLibrary> patterns);

    /**
     * @brief Remove every XSS vector, then HTML-escape what is left
     *
     * Must be the last transform before the text is rendered as HTML.
     */
    [[nodiscard]] TransformResult prevent_xss(const std::string& content) const;

    /**
     * @brief Remove SQL keywords, tautologies, comments and separators,
     *        then double every single quote
     *
     * Defense in depth for text that is logged or displayed. It is NOT a
     * substitute for parameterized queries and must never be used to build
     * SQL by concatenation.
     */
    [[nodiscard]] TransformResult prevent_sql_injection(const std::string& content) const;

    /**
     * @brief Names of the traversal vectors found in the path
     *
     * Scans the raw path and every percent-decoded form of it, so double
     * encoding cannot hide a sequence. A bare ".." segment counts too.
     */
    [[nodiscard]] std::vector<std::string> detect_path_traversal(const std::string& path) const;

    /**
     * @brief Lexically normalized path with no parent-directory segment
     * @throws SanitizationError in REJECT mode when traversal is detected,
     *         or in REWRITE mode when no fixpoint is reached
     */
    [[nodiscard]] TransformResult prevent_path_traversal(const std::string& path,
                                                         PathTraversalMode mode) const;

    /**
     * @brief Replace separators and reserved characters with '_', drop
     *        control characters and cap the name at 255 bytes, keeping the
     *        extension when it fits
     */
    [[nodiscard]] TransformResult sanitize_filename(const std::string& filename) const;

    /**
     * @brief Lexical normalization: '\' becomes '/', "." and "dir/.."
     *        collapse and leading ".." segments are dropped
     */
    [[nodiscard]] static std::string normalize_path(std::string_view path);

private:
    std::shared_ptr<const PatternLibrary> patterns_;
};

} // namespace textshield
