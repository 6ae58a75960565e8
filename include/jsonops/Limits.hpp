/**
 * @file Limits.hpp
 * @brief Size and nesting depth guards
 *
 * Every raw input is checked against these bounds before parsing, and
 * every Value built outside the parser can be checked with check_depth()
 * before it reaches the recursive algorithms.
 *
 * Depth convention: a scalar has depth 0 and each Array/Object boundary
 * crossed from the root adds one, so the root container itself is at
 * depth 1. `[[1]]` has depth 2.
 */

#ifndef JSONOPS_LIMITS_HPP
#define JSONOPS_LIMITS_HPP

#include "jsonops/Value.hpp"
#include <cstddef>
#include <string_view>

namespace jsonops {

/// Default maximum raw input size: 1 MiB
constexpr std::size_t DEFAULT_MAX_INPUT_BYTES = 1048576;

/// Default maximum container nesting depth
constexpr std::size_t DEFAULT_MAX_DEPTH = 50;

/**
 * @brief Bounds enforced before any recursive algorithm runs
 */
struct Limits {
    std::size_t max_input_bytes = DEFAULT_MAX_INPUT_BYTES;
    std::size_t max_depth = DEFAULT_MAX_DEPTH;
};

/**
 * @brief Reject raw input larger than limits.max_input_bytes
 *
 * @param raw Raw input text
 * @param limits Bounds to apply
 * @throws InputTooLarge if raw.size() > limits.max_input_bytes
 */
void validate_limits(std::string_view raw, const Limits& limits = {});

/**
 * @brief Scan raw JSON text for container nesting depth
 *
 * Counts `{` and `[` outside string literals (escape aware). Stops at the
 * first opening that crosses the limit. The text is not otherwise
 * validated.
 *
 * @return Maximum depth reached
 * @throws NestingTooDeep as soon as depth exceeds limits.max_depth
 */
std::size_t scan_nesting_depth(std::string_view raw, const Limits& limits = {});

/**
 * @brief Container nesting depth of a Value
 */
std::size_t nesting_depth(const Value& value);

/**
 * @brief Reject a Value nested deeper than limits.max_depth
 *
 * The walk gives up as soon as the limit is crossed, so its own recursion
 * never goes deeper than max_depth + 1.
 *
 * @throws NestingTooDeep
 */
void check_depth(const Value& value, const Limits& limits = {});

} // namespace jsonops

#endif // JSONOPS_LIMITS_HPP
