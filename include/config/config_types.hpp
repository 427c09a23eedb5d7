#pragma once

#include "core/utils.hpp"
#include "patterns/pattern_library.hpp"
#include "policy/policy_types.hpp"
#include "security/injection_guard.hpp"
#include "transform/html_sanitizer.hpp"

#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

namespace textshield {

// ============================================================================
// [limits]
// ============================================================================

struct LimitsConfig {
    // Content larger than this is rejected before any pattern runs
    size_t max_input_bytes = 65536;
    size_t max_batch_items = 10000;
};

// ============================================================================
// [security]
// ============================================================================

struct SecurityConfig {
    PathTraversalMode path_traversal_mode = PathTraversalMode::REJECT;
};

// ============================================================================
// [batch]
// ============================================================================

struct BatchConfig {
    size_t parallel_threshold = 256;    // Items; smaller batches run inline
    size_t max_workers = 4;
};

// ============================================================================
// [content]
// ============================================================================

struct ContentConfig {
    std::vector<std::string> profanity_words = PatternLibrary::default_profanity_words();
    std::string profanity_replacement = "***";
    std::vector<std::string> default_allowed_tags = {
        std::begin(HtmlSanitizer::kDefaultAllowedTags), std::end(HtmlSanitizer::kDefaultAllowedTags)};
    std::string mask_char = "*";
};

// ============================================================================
// [logging]
// ============================================================================

struct LoggingConfig {
    utils::log::Level level = utils::log::Level::INFO;
};

// ============================================================================
// Engine Config (root)
// ============================================================================

struct EngineConfig {
    LimitsConfig limits;
    SecurityConfig security;
    BatchConfig batch;
    ContentConfig content;
    LoggingConfig logging;
    std::vector<Policy> policies;   // [[policies]], looked up by name
};

} // namespace textshield
