/**
 * @file Document.hpp
 * @brief Guarded parsing of raw JSON text
 *
 * The single entry point through which raw text becomes a Value. The
 * checks run cheapest first:
 * 1. byte size (validate_limits)
 * 2. empty / whitespace-only text
 * 3. nesting depth scan (scan_nesting_depth)
 * 4. nlohmann::json parse
 */

#ifndef JSONOPS_DOCUMENT_HPP
#define JSONOPS_DOCUMENT_HPP

#include "jsonops/Value.hpp"
#include "jsonops/Limits.hpp"
#include <string>
#include <string_view>

namespace jsonops {

/**
 * @brief Parse raw JSON text into a Value under the given limits
 *
 * @param raw Raw JSON text
 * @param name Role of the input, used in error messages ("data", "base", ...)
 * @param limits Size and depth bounds
 * @return Parsed Value, guaranteed to satisfy `limits`
 * @throws InputTooLarge if raw exceeds limits.max_input_bytes
 * @throws EmptyInput if raw is empty or whitespace only
 * @throws NestingTooDeep if nesting exceeds limits.max_depth
 * @throws ParseError if raw is not valid JSON
 *
 * Example:
 * ```cpp
 * Value v = parse_document(R"({"a": [1, 2]})");
 * parse_document("   ", "base");   // Throws EmptyInput("base")
 * ```
 */
Value parse_document(std::string_view raw, const std::string& name = "data",
                     const Limits& limits = {});

} // namespace jsonops

#endif // JSONOPS_DOCUMENT_HPP
