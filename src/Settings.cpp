#include "jsonops/Settings.hpp"
#include "jsonops/Errors.hpp"
#include "jsonops/Loader.hpp"
#include "jsonops/Merge.hpp"
#include "jsonops/PathExpr.hpp"
#include "jsonops/Util.hpp"
#include <cstdint>

namespace jsonops {

namespace {
    // Value at a dotted settings key, or nullptr when absent
    const Value* find_setting(const Value& tree, const std::string& key) {
        try {
            if (!contains_path(tree, key)) return nullptr;
            return resolve_ptr(tree, key);
        } catch (const TypeMismatch& e) {
            throw SettingsError("Invalid settings layout: " + std::string(e.what()));
        }
    }

    std::size_t read_size(const Value& tree, const std::string& key, std::size_t fallback) {
        const Value* v = find_setting(tree, key);
        if (!v) return fallback;
        if (v->is_number_unsigned()) return v->get<std::size_t>();
        if (v->is_number_integer() && v->get<std::int64_t>() >= 0) {
            return static_cast<std::size_t>(v->get<std::int64_t>());
        }
        throw SettingsError(key + " must be a non-negative integer, got " + type_name(*v));
    }

    int read_indent(const Value& tree, const std::string& key, int fallback) {
        const Value* v = find_setting(tree, key);
        if (!v) return fallback;
        if (!v->is_number_integer()) {
            throw SettingsError(key + " must be an integer, got " + type_name(*v));
        }
        const auto n = v->get<std::int64_t>();
        if (n < 0 || n > MAX_INDENT) {
            throw SettingsError(key + " must be 0-" + std::to_string(MAX_INDENT));
        }
        return static_cast<int>(n);
    }

    bool read_bool(const Value& tree, const std::string& key, bool fallback) {
        const Value* v = find_setting(tree, key);
        if (!v) return fallback;
        if (!v->is_boolean()) {
            throw SettingsError(key + " must be a boolean, got " + type_name(*v));
        }
        return v->get<bool>();
    }
}

Settings Settings::load(const LoadOptions& opts) {
    // 1) built-in values, then caller defaults
    Value merged = deep_merge(Settings{}.to_value(), opts.defaults);

    // 2) file
    if (opts.file_path.has_value()) {
        merged = deep_merge(merged, load_settings_file(*opts.file_path));
    }

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        merged = deep_merge(merged, env_layer(*opts.prefix));
    }

    // 4) overrides
    for (const auto& [key, value] : opts.overrides) {
        merged = deep_merge(merged, nest_dotted(key, value));
    }

    return from_value(merged);
}

Settings Settings::from_value(const Value& tree) {
    if (!tree.is_object()) {
        throw SettingsError("Settings must be an object, got " + type_name(tree));
    }

    Settings s;
    s.limits.max_input_bytes = read_size(tree, "limits.max_input_bytes", s.limits.max_input_bytes);
    s.limits.max_depth = read_size(tree, "limits.max_depth", s.limits.max_depth);
    s.indent = read_indent(tree, "format.indent", s.indent);
    s.sort_keys = read_bool(tree, "format.sort_keys", s.sort_keys);

    // Settings may tighten the guards, never relax them
    if (s.limits.max_depth == 0 || s.limits.max_depth > DEFAULT_MAX_DEPTH) {
        throw SettingsError("limits.max_depth must be 1-" + std::to_string(DEFAULT_MAX_DEPTH));
    }
    if (s.limits.max_input_bytes > DEFAULT_MAX_INPUT_BYTES) {
        throw SettingsError("limits.max_input_bytes must be at most " +
                            std::to_string(DEFAULT_MAX_INPUT_BYTES));
    }
    return s;
}

Value Settings::to_value() const {
    Value out = Value::object();
    out["limits"]["max_input_bytes"] = limits.max_input_bytes;
    out["limits"]["max_depth"] = limits.max_depth;
    out["format"]["indent"] = indent;
    out["format"]["sort_keys"] = sort_keys;
    return out;
}

Value Settings::env_layer(const std::string& prefix) {
    Value layer = Value::object();
    for (const auto& [name, value] : enumerate_environment()) {
        const std::string rest = strip_prefix(name, prefix);
        if (rest.empty()) continue;

        const std::string key = transform_env_name(rest);
        if (key.empty()) continue;
        layer = deep_merge(layer, nest_dotted(key, parse_json_or_string(value)));
    }
    return layer;
}

} // namespace jsonops
