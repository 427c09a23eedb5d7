#pragma once

#include "core/types.hpp"

#include <string>

namespace textshield {

/**
 * @brief Serialize results to compact JSON
 *
 * Envelope layout:
 * {"status":"success"|"error","operation":"...","result":{...}|null,
 *  "processing_time_seconds":0.000123,"timestamp":"...","error":"..."|null}
 */
[[nodiscard]] std::string to_json(const ValidationResult& result);
[[nodiscard]] std::string to_json(const TransformResult& result);
[[nodiscard]] std::string to_json(const PolicyResult& result);
[[nodiscard]] std::string to_json(const BatchResult& result);
[[nodiscard]] std::string to_json(const Envelope& envelope);

} // namespace textshield
