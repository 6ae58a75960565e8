/**
 * @file Merge.cpp
 * @brief Implementation of deep merge
 */

#include "jsonops/Merge.hpp"

namespace jsonops {

Value deep_merge(const Value& base, const Value& override_val) {
    // Non-object on either side: override wins, whatever its type
    if (!base.is_object() || !override_val.is_object()) {
        return override_val;
    }

    Value result = Value::object();

    // Base keys keep their position; shared keys merge recursively
    for (auto it = base.begin(); it != base.end(); ++it) {
        auto over = override_val.find(it.key());
        if (over == override_val.end()) {
            result[it.key()] = it.value();
        } else {
            result[it.key()] = deep_merge(it.value(), *over);
        }
    }

    // Keys only in override are appended in override order
    for (auto it = override_val.begin(); it != override_val.end(); ++it) {
        if (!base.contains(it.key())) {
            result[it.key()] = it.value();
        }
    }

    return result;
}

Value deep_merge_all(const std::vector<Value>& sources) {
    if (sources.empty()) {
        return Value::object();
    }

    Value result = sources[0];
    for (size_t i = 1; i < sources.size(); ++i) {
        result = deep_merge(result, sources[i]);
    }

    return result;
}

} // namespace jsonops
