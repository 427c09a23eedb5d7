#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/json.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "engine/batch_runner.hpp"
#include "engine/operation_registry.hpp"
#include "engine/processor.hpp"
#include "patterns/pattern_library.hpp"
#include "policy/policy_enforcer.hpp"
#include "policy/policy_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace textshield {

/**
 * @brief A validated call, built per request and never persisted
 */
struct SanitizationRequest {
    struct Batch {
        Operation operation;
        std::vector<JsonValue> items;
    };

    Operation operation = Operation::VALIDATE_EMAIL;
    std::string content;
    JsonValue parameters;
    std::optional<Policy> policy;       // policy_enforce only
    std::optional<Batch> batch;         // batch_sanitize only
};

/**
 * @brief Engine entry point
 *
 * Looks the operation up, validates its parameters against the descriptor
 * table, enforces the input ceilings, runs the handler and wraps the
 * outcome in an Envelope. Never throws: request errors and handler
 * failures both come back as error envelopes.
 *
 * execute() is const and safe to call from many threads.
 */
class Dispatcher {
public:
    Dispatcher();
    explicit Dispatcher(EngineConfig config);

    [[nodiscard]] Envelope execute(Operation op, const JsonValue& params) const;
    [[nodiscard]] Envelope execute(std::string_view operation, const JsonValue& params) const;

    /**
     * @brief Run a request document: {"operation": "...", ...parameters}
     */
    [[nodiscard]] Envelope execute_json(const std::string& request_json) const;

    /**
     * @brief Validate parameters and assemble the request
     * @return REQUEST_ERROR result naming the first problem found
     */
    [[nodiscard]] Result<SanitizationRequest> build_request(Operation op,
                                                            const JsonValue& params) const;

    [[nodiscard]] const EngineConfig& config() const { return config_; }

private:
    [[nodiscard]] Payload dispatch(const SanitizationRequest& request) const;

    [[nodiscard]] std::optional<std::string> extract_content(const OperationDescriptor& desc,
                                                             const JsonValue& params,
                                                             std::string& content) const;
    [[nodiscard]] Result<Policy> resolve_policy(const JsonValue& params) const;
    [[nodiscard]] const Policy* find_policy(std::string_view name) const;

    [[nodiscard]] Envelope make_error(std::string operation, ErrorCategory category,
                                      std::string message, const utils::Timer& timer) const;

    EngineConfig config_;
    std::shared_ptr<const PatternLibrary> patterns_;
    std::shared_ptr<const SanitizationProcessor> processor_;
    BatchRunner batch_;
    PolicyEnforcer enforcer_;
};

} // namespace textshield
