/**
 * @file Limits.cpp
 * @brief Implementation of size and nesting depth guards
 */

#include "jsonops/Limits.hpp"
#include "jsonops/Errors.hpp"
#include <algorithm>

namespace jsonops {

namespace {
    /**
     * @brief Depth walk that stops once `limit` is crossed
     * @return true if value (seen at `depth`) stays within the limit
     */
    bool within_depth(const Value& value, std::size_t depth, std::size_t limit) {
        if (!is_container(value)) {
            return true;
        }
        const std::size_t inner = depth + 1;
        if (inner > limit) {
            return false;
        }
        for (const auto& child : value) {
            if (!within_depth(child, inner, limit)) {
                return false;
            }
        }
        return true;
    }
}

void validate_limits(std::string_view raw, const Limits& limits) {
    if (raw.size() > limits.max_input_bytes) {
        throw InputTooLarge(raw.size(), limits.max_input_bytes);
    }
}

std::size_t scan_nesting_depth(std::string_view raw, const Limits& limits) {
    std::size_t depth = 0;
    std::size_t deepest = 0;
    bool in_string = false;
    bool escape = false;

    for (char ch : raw) {
        if (escape) {
            escape = false;
            continue;
        }
        if (in_string) {
            if (ch == '\\') {
                escape = true;
            } else if (ch == '"') {
                in_string = false;
            }
            continue;
        }

        switch (ch) {
            case '"':
                in_string = true;
                break;
            case '{':
            case '[':
                ++depth;
                if (depth > limits.max_depth) {
                    throw NestingTooDeep(limits.max_depth);
                }
                deepest = std::max(deepest, depth);
                break;
            case '}':
            case ']':
                // Unbalanced closers are left for the parser to report
                if (depth > 0) --depth;
                break;
            default:
                break;
        }
    }
    return deepest;
}

std::size_t nesting_depth(const Value& value) {
    if (!is_container(value)) {
        return 0;
    }
    std::size_t deepest_child = 0;
    for (const auto& child : value) {
        deepest_child = std::max(deepest_child, nesting_depth(child));
    }
    return deepest_child + 1;
}

void check_depth(const Value& value, const Limits& limits) {
    if (!within_depth(value, 0, limits.max_depth)) {
        throw NestingTooDeep(limits.max_depth);
    }
}

} // namespace jsonops
