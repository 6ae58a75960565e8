/**
 * @file Format.hpp
 * @brief Canonical text rendering of a Value
 */

#ifndef JSONOPS_FORMAT_HPP
#define JSONOPS_FORMAT_HPP

#include "jsonops/Value.hpp"
#include <string>

namespace jsonops {

/**
 * @brief Render a Value as JSON text
 *
 * - indent == 0: minified, no insignificant whitespace, no trailing newline
 * - indent > 0: one member per line, `indent` spaces per level, ": " after
 *   keys; empty containers render as {} and []
 *
 * Object keys keep their stored order unless sort_keys is set, in which
 * case every object is rendered with keys in ascending byte order.
 * Integers never gain a ".0"; floats use the shortest representation
 * that reads back to the same double. Output is locale independent and
 * UTF-8; invalid UTF-8 in strings is replaced by U+FFFD.
 *
 * @param value Value to render
 * @param indent Spaces per nesting level, 0 for minified
 * @param sort_keys Render object keys sorted
 * @throws InvalidArgument if indent is negative
 */
std::string format(const Value& value, int indent, bool sort_keys = false);

/**
 * @brief Copy of a Value with the keys of every object sorted
 */
Value sorted_keys(const Value& value);

} // namespace jsonops

#endif // JSONOPS_FORMAT_HPP
