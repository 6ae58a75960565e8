/**
 * @file Diff.hpp
 * @brief Structural diff of two JSON values
 *
 * Walks two values in lock-step and records every difference as a
 * ChangeRecord addressed by canonical path ("$", "$.a.b", "$.a[0]").
 *
 * Traversal order, which is the order of the returned records:
 * - Objects: keys of the first value in its order (removed or recursed),
 *   then keys only present in the second value, in its order (added).
 * - Arrays: shared indices in ascending order, then the tail of the longer
 *   array in ascending order (added or removed).
 * - A variant change (e.g., string vs number) is one TypeChanged record;
 *   the differ does not descend below it.
 */

#ifndef JSONOPS_DIFF_HPP
#define JSONOPS_DIFF_HPP

#include "jsonops/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace jsonops {

/**
 * @brief Kind of a detected difference
 */
enum class ChangeKind {
    Added,
    Removed,
    Changed,
    TypeChanged
};

/**
 * @brief Wire name of a ChangeKind ("added", "removed", "changed", "type_changed")
 */
const char* to_string(ChangeKind kind) noexcept;

/**
 * @brief One difference between two values
 *
 * old_value is set for Removed, Changed and TypeChanged; new_value for
 * Added, Changed and TypeChanged.
 */
struct ChangeRecord {
    std::string path;
    ChangeKind kind = ChangeKind::Changed;
    std::optional<Value> old_value;
    std::optional<Value> new_value;
};

/**
 * @brief Compute the differences between two values
 *
 * Pure: inputs are only read. Numbers compare by numeric value, so 1 and
 * 1.0 are equal.
 *
 * @param first Value before the change
 * @param second Value after the change
 * @return Change records in traversal order; empty when the values are equal
 *
 * Example:
 * ```cpp
 * diff({{"a", 1}, {"b", 2}}, {{"a", 1}, {"b", 3}, {"c", 4}});
 * // [{"$.b", Changed}, {"$.c", Added}]
 * ```
 */
std::vector<ChangeRecord> diff(const Value& first, const Value& second);

/**
 * @brief Serialize a record as {"path": ..., "type": ..., <snapshots>}
 *
 * Snapshot members by kind:
 * - added:        "value" (new value)
 * - removed:      "value" (old value)
 * - changed:      "old_value", "new_value"
 * - type_changed: "from", "to" (variant names), "old_value", "new_value"
 */
Value to_json(const ChangeRecord& record);

/**
 * @brief Serialize a record sequence as a JSON array
 */
Value to_json(const std::vector<ChangeRecord>& records);

} // namespace jsonops

#endif // JSONOPS_DIFF_HPP
