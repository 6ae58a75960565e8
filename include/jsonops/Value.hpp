/**
 * @file Value.hpp
 * @brief Value type for JSON documents
 *
 * Uses nlohmann::ordered_json as the underlying value model:
 * - Null
 * - Bool (true | false)
 * - Number (int64_t, uint64_t or double, representation preserved)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, insertion ordered)
 */

#ifndef JSONOPS_VALUE_HPP
#define JSONOPS_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace jsonops {

/**
 * @brief JSON value type
 *
 * Alias for nlohmann::ordered_json. Objects keep their members in
 * insertion order, which is the order every algorithm in this library
 * iterates and emits them in.
 *
 * See nlohmann::json documentation for the complete API.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief The closed set of JSON variants
 *
 * Integer, unsigned and floating storage all map to Number.
 */
enum class Kind {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object
};

/**
 * @brief Classify a Value into its Kind
 * @throws UnsupportedValue for binary or discarded storage
 */
Kind kind_of(const Value& val);

/**
 * @brief Lowercase name of a Kind ("null", "boolean", "number", ...)
 */
const char* kind_name(Kind kind) noexcept;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string ("null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
std::string type_name(const Value& val);

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/**
 * @brief Structural equality that ignores number representation
 *
 * Objects compare equal when they hold the same keys with equal values,
 * regardless of member order. Numbers compare by numeric value.
 */
bool structurally_equal(const Value& a, const Value& b);

} // namespace jsonops

#endif // JSONOPS_VALUE_HPP
