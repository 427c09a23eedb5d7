#pragma once

#include "core/error.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace textshield {

// ============================================================================
// Operation Results
// ============================================================================

/**
 * @brief Outcome of a format check. valid == false is a normal result.
 */
struct ValidationResult {
    bool valid = false;
    std::optional<std::string> normalized_value;
    std::map<std::string, std::string> attributes;

    [[nodiscard]] std::optional<std::string> attribute(const std::string& key) const {
        const auto it = attributes.find(key);
        if (it == attributes.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * @brief Output of a pure string transform. Lengths are in code points.
 */
struct TransformResult {
    std::string output;
    size_t original_length = 0;
    size_t final_length = 0;
    std::map<std::string, std::string> metadata;

    // Fills both lengths from the texts
    [[nodiscard]] static TransformResult from(std::string_view input, std::string output);
};

struct PolicyResult {
    std::string sanitized_content;
    std::vector<std::string> violations;
    bool compliant = true;
    size_t original_length = 0;
    size_t final_length = 0;
};

// What a single-item operation produces
using ItemPayload = std::variant<ValidationResult, TransformResult>;

struct BatchItemResult {
    size_t index = 0;
    bool success = false;
    std::string input;
    std::optional<ItemPayload> result;
    std::string error;
};

struct BatchResult {
    std::string operation;
    size_t total = 0;
    size_t successful = 0;
    size_t failed = 0;
    std::vector<BatchItemResult> items;
};

using Payload = std::variant<ValidationResult, TransformResult, PolicyResult, BatchResult>;

// ============================================================================
// Envelope (always returned by the dispatcher)
// ============================================================================

struct Envelope {
    bool success = false;
    std::string operation;
    std::optional<Payload> result;
    double processing_time_seconds = 0.0;
    std::string timestamp;
    std::optional<std::string> error;
    ErrorCategory error_category = ErrorCategory::NONE;     // Not serialized

    [[nodiscard]] const char* status() const { return success ? "success" : "error"; }
};

} // namespace textshield
