#include "engine/dispatcher.hpp"
#include "policy/policy_loader.hpp"

#include <format>
#include <variant>

namespace textshield {

// ============================================================================
// Parameter checks
// ============================================================================

namespace {

bool matches_type(const JsonValue& value, ParamType type) {
    switch (type) {
        case ParamType::STRING:
            return value.is_string();
        case ParamType::STRING_LIST:
            if (!value.is_array()) return false;
            for (const auto& item : value.elements()) {
                if (!item.is_string()) return false;
            }
            return true;
        case ParamType::ARRAY:
            return value.is_array();
        case ParamType::OBJECT:
            return value.is_object();
    }
    return false;
}

// Checks every declared parameter except the content field
std::optional<std::string> check_param_types(const OperationDescriptor& desc,
                                             const JsonValue& params) {
    for (const auto& param : desc.params) {
        if (param.name.empty()) continue;

        const JsonValue value = params[param.name];
        if (value.is_null()) {
            if (param.required) {
                return std::format("Missing required parameter: {}", param.name);
            }
            continue;
        }
        if (!matches_type(value, param.type)) {
            return std::format("Parameter '{}' must be {}, got {}",
                               param.name, param_type_to_string(param.type), value.kind_name());
        }
    }
    return std::nullopt;
}

std::shared_ptr<const PatternLibrary> make_patterns(const EngineConfig& config) {
    PatternLibrary::Config patterns_config;
    patterns_config.profanity_words = config.content.profanity_words;
    return std::make_shared<const PatternLibrary>(patterns_config);
}

BatchRunner::Settings batch_settings(const EngineConfig& config) {
    BatchRunner::Settings settings;
    settings.parallel_threshold = config.batch.parallel_threshold;
    settings.max_workers = config.batch.max_workers;
    settings.max_input_bytes = config.limits.max_input_bytes;
    return settings;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Dispatcher::Dispatcher() : Dispatcher(EngineConfig{}) {}

Dispatcher::Dispatcher(EngineConfig config)
    : config_(std::move(config)),
      patterns_(make_patterns(config_)),
      processor_(std::make_shared<const SanitizationProcessor>(
          patterns_, SanitizationProcessor::Settings::from_config(config_))),
      batch_(processor_, batch_settings(config_)),
      enforcer_(patterns_) {}

// ============================================================================
// Request building
// ============================================================================

std::optional<std::string> Dispatcher::extract_content(const OperationDescriptor& desc,
                                                       const JsonValue& params,
                                                       std::string& content) const {
    if (desc.content == ContentKind::NONE) return std::nullopt;

    std::string_view key = "content";
    if (!desc.content_alias.empty() && !params[desc.content_alias].is_null()) {
        key = desc.content_alias;
    }

    const JsonValue value = params[key];
    if (value.is_null()) {
        return std::format("Missing required parameter: {}",
                           desc.content_alias.empty() ? std::string_view("content") : desc.content_alias);
    }
    if (!value.is_string()) {
        return std::format("Parameter '{}' must be a string, got {}", key, value.kind_name());
    }

    content = value.get<std::string>();
    if (content.size() > config_.limits.max_input_bytes) {
        return std::format("Content exceeds maximum input size of {} bytes",
                           config_.limits.max_input_bytes);
    }
    return std::nullopt;
}

const Policy* Dispatcher::find_policy(std::string_view name) const {
    for (const auto& policy : config_.policies) {
        if (policy.name == name) return &policy;
    }
    return nullptr;
}

Result<Policy> Dispatcher::resolve_policy(const JsonValue& params) const {
    const JsonValue inline_policy = params["policy"];
    if (!inline_policy.is_null()) {
        return PolicyLoader::from_json(inline_policy);
    }

    if (const auto name = params.string_at("policy_name")) {
        if (const Policy* policy = find_policy(*name)) {
            return Result<Policy>::ok(*policy);
        }
        return Result<Policy>::error(ErrorCategory::REQUEST_ERROR,
            std::format("Unknown policy: {}", *name));
    }

    return Result<Policy>::error(ErrorCategory::REQUEST_ERROR,
        "Missing required parameter: policy or policy_name");
}

Result<SanitizationRequest> Dispatcher::build_request(Operation op, const JsonValue& params) const {
    using R = Result<SanitizationRequest>;

    if (!params.is_null() && !params.is_object()) {
        return R::error(ErrorCategory::REQUEST_ERROR,
            std::format("Parameters must be an object, got {}", params.kind_name()));
    }

    const auto& desc = descriptor(op);

    SanitizationRequest request;
    request.operation = op;
    request.parameters = params.is_null() ? JsonValue::object() : params;

    if (auto err = extract_content(desc, request.parameters, request.content)) {
        return R::error(ErrorCategory::REQUEST_ERROR, std::move(*err));
    }
    if (auto err = check_param_types(desc, request.parameters)) {
        return R::error(ErrorCategory::REQUEST_ERROR, std::move(*err));
    }
    if (auto err = SanitizationProcessor::check_parameter_values(op, request.parameters)) {
        return R::error(ErrorCategory::REQUEST_ERROR, std::move(*err));
    }

    if (op == Operation::POLICY_ENFORCE) {
        auto policy = resolve_policy(request.parameters);
        if (policy.is_error()) {
            return R::error(policy.error_category(), policy.error_message());
        }
        request.policy = std::move(policy.value());
    }

    if (op == Operation::BATCH_SANITIZE) {
        const std::string inner_name = *request.parameters.string_at("batch_operation");
        const auto inner = parse_operation(inner_name);
        if (!inner) {
            return R::error(ErrorCategory::REQUEST_ERROR,
                std::format("Unknown batch operation: {}", inner_name));
        }
        if (!descriptor(*inner).batchable) {
            return R::error(ErrorCategory::REQUEST_ERROR,
                std::format("Operation '{}' cannot be used in batch_sanitize", inner_name));
        }

        auto items = request.parameters["items"].elements();
        if (items.size() > config_.limits.max_batch_items) {
            return R::error(ErrorCategory::REQUEST_ERROR,
                std::format("Batch of {} items exceeds maximum of {}",
                            items.size(), config_.limits.max_batch_items));
        }

        // Shared parameters must satisfy the inner operation's contract
        if (auto err = check_param_types(descriptor(*inner), request.parameters)) {
            return R::error(ErrorCategory::REQUEST_ERROR, std::move(*err));
        }
        if (auto err = SanitizationProcessor::check_parameter_values(*inner, request.parameters)) {
            return R::error(ErrorCategory::REQUEST_ERROR, std::move(*err));
        }

        request.batch = SanitizationRequest::Batch{*inner, std::move(items)};
    }

    return R::ok(std::move(request));
}

// ============================================================================
// Execution
// ============================================================================

Payload Dispatcher::dispatch(const SanitizationRequest& request) const {
    switch (request.operation) {
        case Operation::BATCH_SANITIZE:
            return batch_.run(request.batch->operation, request.batch->items, request.parameters);
        case Operation::POLICY_ENFORCE:
            return enforcer_.enforce(request.content, *request.policy);
        default:
            return std::visit([](auto&& item) -> Payload { return std::move(item); },
                              processor_->run(request.operation, request.content, request.parameters));
    }
}

Envelope Dispatcher::make_error(std::string operation, ErrorCategory category,
                                std::string message, const utils::Timer& timer) const {
    Envelope envelope;
    envelope.success = false;
    envelope.operation = std::move(operation);
    envelope.error_category = category;
    envelope.error = std::move(message);
    envelope.processing_time_seconds = timer.elapsed_seconds();
    envelope.timestamp = utils::format_timestamp(utils::now());
    return envelope;
}

Envelope Dispatcher::execute(Operation op, const JsonValue& params) const {
    const utils::Timer timer;
    const std::string name(operation_name(op));

    auto request = build_request(op, params);
    if (request.is_error()) {
        utils::log::warn(std::format("Rejected {} request ({}): {}", name,
            error_category_to_string(request.error_category()), request.error_message()));
        return make_error(name, request.error_category(), request.error_message(), timer);
    }

    Envelope envelope;
    envelope.operation = name;
    try {
        envelope.result = dispatch(request.value());
        envelope.success = true;
    } catch (const SanitizationError& e) {
        utils::log::error(std::format("Operation {} failed ({}): {}", name,
            error_category_to_string(ErrorCategory::HANDLER_ERROR), e.what()));
        return make_error(name, ErrorCategory::HANDLER_ERROR, e.what(), timer);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Operation {} failed ({}): {}", name,
            error_category_to_string(ErrorCategory::INTERNAL_ERROR), e.what()));
        return make_error(name, ErrorCategory::INTERNAL_ERROR,
                          std::format("Internal error: {}", e.what()), timer);
    }

    envelope.processing_time_seconds = timer.elapsed_seconds();
    envelope.timestamp = utils::format_timestamp(utils::now());

    const auto& req = request.value();
    if (req.batch) {
        utils::log::debug(std::format("{} completed in {:.3f} ms ({} items)",
            name, envelope.processing_time_seconds * 1000.0, req.batch->items.size()));
    } else {
        utils::log::debug(std::format("{} completed in {:.3f} ms ({} input bytes)",
            name, envelope.processing_time_seconds * 1000.0, req.content.size()));
    }
    return envelope;
}

Envelope Dispatcher::execute(std::string_view operation, const JsonValue& params) const {
    const auto op = parse_operation(operation);
    if (!op) {
        const utils::Timer timer;
        utils::log::warn(std::format("Rejected request for unknown operation '{}'", operation));
        return make_error(std::string(operation), ErrorCategory::REQUEST_ERROR,
                          std::format("Unknown operation: {}", operation), timer);
    }
    return execute(*op, params);
}

Envelope Dispatcher::execute_json(const std::string& request_json) const {
    const utils::Timer timer;

    JsonValue request;
    try {
        request = JsonValue::parse(request_json);
    } catch (const JsonValue::parse_error& e) {
        utils::log::warn("Rejected request with invalid JSON");
        return make_error("", ErrorCategory::REQUEST_ERROR,
                          std::format("Invalid request JSON: {}", e.what()), timer);
    }

    if (!request.is_object()) {
        return make_error("", ErrorCategory::REQUEST_ERROR,
                          std::format("Request must be an object, got {}", request.kind_name()), timer);
    }
    const auto operation = request.string_at("operation");
    if (!operation) {
        return make_error("", ErrorCategory::REQUEST_ERROR,
                          "Missing required parameter: operation", timer);
    }
    return execute(std::string_view(*operation), request);
}

} // namespace textshield
