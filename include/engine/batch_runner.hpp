#pragma once

#include "core/json.hpp"
#include "core/types.hpp"
#include "engine/operation_registry.hpp"
#include "engine/processor.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace textshield {

/**
 * @brief Applies one single-item operation to every element of a list
 *
 * Each item is isolated: a non-string item, an item above the input
 * ceiling or a handler failure becomes an error record at that index and
 * the remaining items still run. items[i] always describes input i.
 *
 * Batches of at least parallel_threshold items are split into contiguous
 * chunks processed with std::async; each worker writes only its own slots.
 */
class BatchRunner {
public:
    struct Settings {
        size_t parallel_threshold = 256;
        size_t max_workers = 4;
        size_t max_input_bytes = 65536;
    };

    BatchRunner(std::shared_ptr<const SanitizationProcessor> processor, Settings settings);

    /**
     * @param op Inner operation; must be batchable
     * @param params Shared parameters passed to every item
     */
    [[nodiscard]] BatchResult run(Operation op, const std::vector<JsonValue>& items,
                                  const JsonValue& params) const;

    [[nodiscard]] const Settings& settings() const { return settings_; }

private:
    [[nodiscard]] BatchItemResult run_item(Operation op, size_t index, const JsonValue& item,
                                           const JsonValue& params) const;

    std::shared_ptr<const SanitizationProcessor> processor_;
    Settings settings_;
};

} // namespace textshield
