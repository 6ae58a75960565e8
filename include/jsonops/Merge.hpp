/**
 * @file Merge.hpp
 * @brief Deep merge of JSON values
 *
 * Merging rules:
 * - Both objects: keys from both are combined, shared keys merged recursively
 * - Anything else: the override value replaces the base value outright,
 *   whatever the two types are (null and arrays included)
 * - Arrays are never merged element by element
 *
 * Key order of a merged object: the base keys first, in base order, then
 * the keys only present in override, in override order.
 */

#ifndef JSONOPS_MERGE_HPP
#define JSONOPS_MERGE_HPP

#include "jsonops/Value.hpp"
#include <vector>

namespace jsonops {

/**
 * @brief Deep merge two values into a new one
 *
 * Neither input is modified. Never throws for values of the JSON model.
 *
 * @param base Base value (lower precedence)
 * @param override_val Override value (higher precedence)
 * @return Merged result
 *
 * Examples:
 * ```cpp
 * Value base = {{"a", 1}, {"nested", {{"x", 1}, {"y", 2}}}};
 * Value over = {{"b", 2}, {"nested", {{"y", 99}}}};
 * auto result = deep_merge(base, over);
 * // Result: {"a": 1, "nested": {"x": 1, "y": 99}, "b": 2}
 *
 * Value base2 = {{"port", 5432}};
 * Value over2 = {{"port", {1, 2}}};
 * deep_merge(base2, over2);
 * // Result: {"port": [1, 2]}
 * ```
 */
Value deep_merge(const Value& base, const Value& override_val);

/**
 * @brief Deep merge several values in order
 *
 * Applies each source from lowest to highest precedence.
 *
 * @param sources Values to merge (in precedence order)
 * @return Merged result, or an empty object when `sources` is empty
 */
Value deep_merge_all(const std::vector<Value>& sources);

} // namespace jsonops

#endif // JSONOPS_MERGE_HPP
