/**
 * @file Format.cpp
 * @brief Implementation of canonical formatting
 */

#include "jsonops/Format.hpp"
#include "jsonops/Errors.hpp"
#include <algorithm>
#include <vector>

namespace jsonops {

Value sorted_keys(const Value& value) {
    if (value.is_array()) {
        Value out = Value::array();
        for (const auto& elem : value) {
            out.push_back(sorted_keys(elem));
        }
        return out;
    }
    if (!value.is_object()) {
        return value;
    }

    std::vector<std::string> keys;
    keys.reserve(value.size());
    for (auto it = value.begin(); it != value.end(); ++it) {
        keys.push_back(it.key());
    }
    std::sort(keys.begin(), keys.end());

    Value out = Value::object();
    for (const auto& key : keys) {
        out[key] = sorted_keys(value.at(key));
    }
    return out;
}

std::string format(const Value& value, int indent, bool sort_keys) {
    if (indent < 0) {
        throw InvalidArgument("indent must be non-negative, got " + std::to_string(indent));
    }

    // nlohmann treats indent 0 as "newlines, no spaces"; -1 is compact
    const int dump_indent = indent == 0 ? -1 : indent;
    const auto handler = Value::error_handler_t::replace;

    if (sort_keys) {
        return sorted_keys(value).dump(dump_indent, ' ', false, handler);
    }
    return value.dump(dump_indent, ' ', false, handler);
}

} // namespace jsonops
