#include "engine/envelope.hpp"
#include "core/utils.hpp"

#include <format>
#include <map>
#include <variant>

namespace textshield {

namespace {

std::string quoted(std::string_view s) {
    return std::format("\"{}\"", utils::escape_json(s));
}

std::string string_map(const std::map<std::string, std::string>& values) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : values) {
        if (!first) out += ',';
        first = false;
        out += std::format("{}:{}", quoted(key), quoted(value));
    }
    out += '}';
    return out;
}

std::string item_payload(const ItemPayload& payload) {
    return std::visit([](const auto& r) { return to_json(r); }, payload);
}

} // anonymous namespace

std::string to_json(const ValidationResult& result) {
    return std::format(R"({{"valid":{},"normalized_value":{},"attributes":{}}})",
        utils::booltostr(result.valid),
        result.normalized_value ? quoted(*result.normalized_value) : "null",
        string_map(result.attributes));
}

std::string to_json(const TransformResult& result) {
    return std::format(R"({{"output":{},"original_length":{},"final_length":{},"metadata":{}}})",
        quoted(result.output), result.original_length, result.final_length,
        string_map(result.metadata));
}

std::string to_json(const PolicyResult& result) {
    std::string violations = "[";
    for (size_t i = 0; i < result.violations.size(); ++i) {
        if (i > 0) violations += ',';
        violations += quoted(result.violations[i]);
    }
    violations += ']';

    return std::format(
        R"({{"sanitized_content":{},"violations":{},"compliant":{},"original_length":{},"final_length":{}}})",
        quoted(result.sanitized_content), violations, utils::booltostr(result.compliant),
        result.original_length, result.final_length);
}

std::string to_json(const BatchResult& result) {
    std::string items = "[";
    for (size_t i = 0; i < result.items.size(); ++i) {
        const auto& item = result.items[i];
        if (i > 0) items += ',';
        if (item.success && item.result) {
            items += std::format(R"({{"index":{},"status":"success","input":{},"result":{}}})",
                item.index, quoted(item.input), item_payload(*item.result));
        } else {
            items += std::format(R"({{"index":{},"status":"error","input":{},"error":{}}})",
                item.index, quoted(item.input), quoted(item.error));
        }
    }
    items += ']';

    return std::format(
        R"({{"operation":{},"total":{},"successful":{},"failed":{},"results":{}}})",
        quoted(result.operation), result.total, result.successful, result.failed, items);
}

std::string to_json(const Envelope& envelope) {
    const std::string result = envelope.result
        ? std::visit([](const auto& r) { return to_json(r); }, *envelope.result)
        : std::string("null");

    return std::format(
        R"({{"status":"{}","operation":{},"result":{},"processing_time_seconds":{:.6f},"timestamp":{},"error":{}}})",
        envelope.status(), quoted(envelope.operation), result,
        envelope.processing_time_seconds, quoted(envelope.timestamp),
        envelope.error ? quoted(*envelope.error) : "null");
}

} // namespace textshield
