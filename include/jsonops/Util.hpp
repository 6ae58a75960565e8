#ifndef JSONOPS_UTIL_HPP
#define JSONOPS_UTIL_HPP

#include "jsonops/Value.hpp"
#include <string>
#include <utility>
#include <vector>

namespace jsonops {

// Build {"a": {"b": {"c": leaf}}} from "a.b.c". Empty segments are skipped.
Value nest_dotted(const std::string& dotted, Value leaf);

// Strip "PREFIX_" from an environment variable name (case-insensitive).
// Returns "" when the name does not carry the prefix.
std::string strip_prefix(const std::string& var_name, const std::string& prefix);

// Map an env name to a dotted key: lowercase, "_" -> ".", "__" -> "_".
//   LIMITS_MAX__DEPTH -> limits.max_depth
std::string transform_env_name(const std::string& name);

// Parse an --overrides string: "k1:json, k2:json, ..."
// Pairs are kept in the order given.
std::vector<std::pair<std::string, Value>> parse_overrides(const std::string& s);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

// Try parsing string as JSON, otherwise return it as a string.
Value parse_json_or_string(const std::string& raw);

// Helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);
std::vector<std::string> split(const std::string& s, char delim);

} // namespace jsonops

#endif // JSONOPS_UTIL_HPP
