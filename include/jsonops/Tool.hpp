/**
 * @file Tool.hpp
 * @brief Text-in, response-out wrappers around the engine
 *
 * Each operation takes raw JSON text, runs it through the Limit Guard and
 * the parser, applies one engine operation, and returns a response
 * document. Engine errors never escape; they become
 * `{"error": "<message>"}` responses.
 *
 * Response shapes:
 * - transform: {"success": true, "expression", "result", "result_type"}
 * - merge:     {"success": true, "result"}
 * - diff:      {"equal", "differences", "difference_count"}
 * - format:    {"success": true, "result", "minified"}
 */

#ifndef JSONOPS_TOOL_HPP
#define JSONOPS_TOOL_HPP

#include "jsonops/Value.hpp"
#include "jsonops/Limits.hpp"
#include <string>

namespace jsonops {
namespace tool {

/**
 * @brief Extract the value addressed by a path expression
 *
 * An empty (or whitespace-only) expression is an error response.
 */
Value transform(const std::string& data, const std::string& expression,
                const Limits& limits = {});

/**
 * @brief Deep merge two JSON objects, override taking precedence
 *
 * Both documents must be JSON objects at the top level.
 */
Value merge(const std::string& base, const std::string& override_text,
            const Limits& limits = {});

/**
 * @brief Structural diff of two documents
 */
Value diff(const std::string& first, const std::string& second,
           const Limits& limits = {});

/**
 * @brief Pretty print (indent 1-8) or minify (indent 0) a document
 */
Value format(const std::string& data, int indent = 2, bool sort_keys = false,
             const Limits& limits = {});

/**
 * @brief Build an {"error": message} response
 */
Value error_response(const std::string& message);

/**
 * @brief True if a response document carries an "error" member
 */
bool is_error(const Value& response);

} // namespace tool
} // namespace jsonops

#endif // JSONOPS_TOOL_HPP
