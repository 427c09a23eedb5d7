#include "core/types.hpp"
#include "core/unicode.hpp"

namespace textshield {

TransformResult TransformResult::from(std::string_view input, std::string output) {
    TransformResult result;
    result.original_length = unicode::length(input);
    result.final_length = unicode::length(output);
    result.output = std::move(output);
    return result;
}

} // namespace textshield
