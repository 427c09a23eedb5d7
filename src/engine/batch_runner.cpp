#include "engine/batch_runner.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>
#include <future>

namespace textshield {

BatchRunner::BatchRunner(std::shared_ptr<const SanitizationProcessor> processor, Settings settings)
    : processor_(std::move(processor)), settings_(settings) {}

BatchItemResult BatchRunner::run_item(Operation op, size_t index, const JsonValue& item,
                                      const JsonValue& params) const {
    BatchItemResult record;
    record.index = index;

    if (!item.is_string()) {
        record.error = std::format("Item must be a string, got {}", item.kind_name());
        return record;
    }

    record.input = item.get<std::string>();
    if (record.input.size() > settings_.max_input_bytes) {
        record.error = std::format("Item exceeds maximum input size of {} bytes",
                                   settings_.max_input_bytes);
        return record;
    }

    try {
        record.result = processor_->run(op, record.input, params);
        record.success = true;
    } catch (const std::exception& e) {
        record.error = e.what();
    }
    return record;
}

BatchResult BatchRunner::run(Operation op, const std::vector<JsonValue>& items,
                             const JsonValue& params) const {
    BatchResult result;
    result.operation = std::string(operation_name(op));
    result.total = items.size();
    result.items.resize(items.size());

    // Each index is written by exactly one worker
    auto run_range = [&](size_t start, size_t end) {
        for (size_t i = start; i < end; ++i) {
            result.items[i] = run_item(op, i, items[i], params);
        }
    };

    const size_t num_items = items.size();
    const size_t num_workers = std::min(settings_.max_workers, num_items);

    if (num_items >= settings_.parallel_threshold && num_workers > 1) {
        const size_t chunk = (num_items + num_workers - 1) / num_workers;

        std::vector<std::future<void>> futures;
        futures.reserve(num_workers);

        for (size_t w = 0; w < num_workers; ++w) {
            const size_t start = w * chunk;
            const size_t end = std::min(start + chunk, num_items);
            if (start >= end) break;
            futures.push_back(std::async(std::launch::async, run_range, start, end));
        }
        for (auto& f : futures) f.get();
    } else {
        run_range(0, num_items);
    }

    for (const auto& item : result.items) {
        if (item.success) {
            ++result.successful;
        } else {
            ++result.failed;
        }
    }
    return result;
}

} // namespace textshield
