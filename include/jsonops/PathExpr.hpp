/**
 * @file PathExpr.hpp
 * @brief Path expressions for nested value access
 *
 * Expressions address a position in a Value with dot-separated keys and
 * bracketed array indices: "users[0].name", "config.db.host",
 * "matrix[1][2]", "users[*].email".
 *
 * Grammar:
 *   expression := segment ('.' segment)*
 *   segment    := identifier suffix* | suffix+      (bare suffixes: first segment only)
 *   suffix     := '[' digits ']' | '[*]'
 *   identifier := one or more characters other than '.', '[' and ']'
 *
 * Rules:
 * - An expression is parsed completely before any lookup, so syntax
 *   errors are always reported as InvalidPathSyntax.
 * - A first segment made only of digits ("0.name") is rejected; index the
 *   root with "[0].name" instead.
 * - Resolution is all-or-nothing: either the addressed Value or an error.
 *
 * Canonical paths (used in errors and diff output) are rooted at "$":
 *   "$", "$.users", "$.users[0]", "$.users[0].name"
 */

#ifndef JSONOPS_PATHEXPR_HPP
#define JSONOPS_PATHEXPR_HPP

#include "jsonops/Value.hpp"
#include "jsonops/Errors.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace jsonops {

/// Canonical path of the root value
constexpr const char* ROOT_PATH = "$";

/**
 * @brief One step of a parsed path expression
 */
struct Segment {
    enum class Type {
        Key,        ///< Object member access
        Index,      ///< Array element access
        Wildcard    ///< Every element of an array
    };

    Type type = Type::Key;
    std::string key;
    std::size_t index = 0;

    static Segment make_key(std::string name) {
        Segment s;
        s.type = Type::Key;
        s.key = std::move(name);
        return s;
    }

    static Segment make_index(std::size_t n) {
        Segment s;
        s.type = Type::Index;
        s.index = n;
        return s;
    }

    static Segment make_wildcard() {
        Segment s;
        s.type = Type::Wildcard;
        return s;
    }

    bool operator==(const Segment& other) const {
        return type == other.type && key == other.key && index == other.index;
    }
    bool operator!=(const Segment& other) const { return !(*this == other); }
};

using PathExpression = std::vector<Segment>;

/**
 * @brief Parse a textual expression into segments
 *
 * Surrounding whitespace is ignored.
 *
 * @param expression Expression text like "users[0].name"
 * @return Non-empty segment sequence
 * @throws InvalidPathSyntax on empty expression, empty segment, unmatched
 *         bracket, empty or non-numeric index, or a leading bare integer
 *
 * Examples:
 * - "users[0].name" → [Key(users), Index(0), Key(name)]
 * - "[1].id"        → [Index(1), Key(id)]
 * - "items[*].sku"  → [Key(items), Wildcard, Key(sku)]
 * - "a..b"          → throws InvalidPathSyntax
 */
PathExpression parse_path(const std::string& expression);

/**
 * @brief Render segments as a canonical "$"-rooted path
 *
 * - [] → "$"
 * - [Key(users), Index(0), Key(name)] → "$.users[0].name"
 */
std::string render_path(const PathExpression& path);

/**
 * @brief Canonical path of an object member: "$.a" + "b" → "$.a.b"
 */
std::string child_path(const std::string& parent, const std::string& key);

/**
 * @brief Canonical path of an array element: "$.a" + 2 → "$.a[2]"
 */
std::string child_path(const std::string& parent, std::size_t index);

/**
 * @brief Resolve an expression against a Value
 *
 * @param root Value to read from (never modified)
 * @param expression Path expression text
 * @return Copy of the addressed Value; for wildcard expressions an Array
 *         of the per-element results
 * @throws InvalidPathSyntax if the expression is malformed
 * @throws KeyNotFound if an object lacks the requested member
 * @throws IndexOutOfRange if an array is shorter than the requested index
 * @throws TypeMismatch if a key meets a non-object or an index a non-array
 *
 * Examples:
 * ```cpp
 * Value doc = Value::parse(R"({"users":[{"name":"Alice"},{"name":"Bob"}]})");
 * resolve(doc, "users[0].name");   // "Alice"
 * resolve(doc, "users[*].name");   // ["Alice", "Bob"]
 * resolve(doc, "users[5].name");   // Throws IndexOutOfRange("$.users", 5, 2)
 * resolve(doc, "users.name");      // Throws TypeMismatch("$.users", "object", "array")
 * ```
 */
Value resolve(const Value& root, const std::string& expression);

/**
 * @brief Resolve an already parsed expression
 */
Value resolve(const Value& root, const PathExpression& path);

/**
 * @brief Resolve to a pointer into `root` without copying
 *
 * @return Pointer to the addressed Value, valid while root is alive
 * @throws InvalidArgument if the expression contains a wildcard
 * @throws PathError as resolve()
 */
const Value* resolve_ptr(const Value& root, const std::string& expression);

/**
 * @brief Check whether an expression addresses an existing Value
 *
 * @return false for a missing key or an index past the end
 * @throws InvalidPathSyntax if the expression is malformed
 * @throws TypeMismatch if traversal meets the wrong kind of container
 */
bool contains_path(const Value& root, const std::string& expression);

} // namespace jsonops

#endif // JSONOPS_PATHEXPR_HPP
