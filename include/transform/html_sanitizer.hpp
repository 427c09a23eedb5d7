#pragma once

#include "core/types.hpp"
#include "patterns/pattern_library.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textshield {

/**
 * @brief Pattern-based HTML/XML sanitizer
 *
 * Best-effort tag stripping, not a conformant parser: nested or malformed
 * markup may survive. Callers with a hard security boundary must not rely
 * on sanitize_html alone; prevent_xss is the last step before rendering.
 */
class HtmlSanitizer {
public:
    static constexpr std::string_view kDefaultAllowedTags[] = {
        "p", "br", "strong", "em", "u", "i", "b", "span", "div"};

    HtmlSanitizer(std::shared_ptr<const PatternLibrary> patterns,
                  std::vector<std::string> default_allowed_tags);

    /**
     * @brief Remove scripts, event handlers and javascript: URLs, then
     *        drop every tag whose name is not allowed (inner text stays)
     * @param allowed_tags nullopt uses the configured default list; an
     *        empty list strips every tag
     */
    [[nodiscard]] TransformResult sanitize_html(
        const std::string& html,
        const std::optional<std::vector<std::string>>& allowed_tags) const;

    // Idempotent
    [[nodiscard]] TransformResult strip_html(const std::string& html) const;

    [[nodiscard]] TransformResult sanitize_xml(const std::string& xml) const;

    // & < > " '  →  &amp; &lt; &gt; &quot; &#x27;
    [[nodiscard]] static std::string escape(std::string_view text);

    /**
     * @brief Decode named (amp, lt, gt, quot, apos, nbsp), decimal and hex
     *        references. Out-of-range code points decode to U+FFFD; unknown
     *        or unterminated entities are kept verbatim.
     */
    [[nodiscard]] static std::string unescape(std::string_view text);

    /**
     * @brief Remove <script>…</script> blocks until none remain
     * @param removed Set to true when anything was removed
     */
    [[nodiscard]] std::string remove_scripts(std::string_view html, bool* removed = nullptr) const;

private:
    std::shared_ptr<const PatternLibrary> patterns_;
    std::vector<std::string> default_allowed_tags_;
};

} // namespace textshield
