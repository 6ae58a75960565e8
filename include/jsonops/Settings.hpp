#ifndef JSONOPS_SETTINGS_HPP
#define JSONOPS_SETTINGS_HPP

#include "jsonops/Value.hpp"
#include "jsonops/Limits.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jsonops {

/// Environment variable prefix used by the command-line tool
constexpr const char* DEFAULT_ENV_PREFIX = "JSONOPS";

/// Largest indent accepted from settings and by the tool facade
constexpr int MAX_INDENT = 8;

/**
 * @brief Options for loading Settings from multiple sources.
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix; // Environment variable prefix, e.g. "JSONOPS"
    std::vector<std::pair<std::string, Value>> overrides; // final precedence, dotted keys
    Value defaults = Value::object();
};

/**
 * @brief Runtime settings for the tool and CLI.
 *
 * Settings tree layout:
 * ```json
 * {
 *   "limits": {"max_input_bytes": 1048576, "max_depth": 50},
 *   "format": {"indent": 2, "sort_keys": false}
 * }
 * ```
 * Unknown keys are ignored.
 */
struct Settings {
    Limits limits;
    int indent = 2;
    bool sort_keys = false;

    // Load using the precedence: built-in -> defaults -> file -> env (prefix) -> overrides
    static Settings load(const LoadOptions& opts);

    // Build from a settings tree; missing keys keep their built-in value.
    // Throws SettingsError for wrongly typed or out-of-range values.
    static Settings from_value(const Value& tree);

    Value to_value() const;

    // Settings layer from PREFIX_* environment variables:
    //   JSONOPS_LIMITS_MAX__DEPTH=10 -> {"limits": {"max_depth": 10}}
    static Value env_layer(const std::string& prefix);
};

} // namespace jsonops

#endif // JSONOPS_SETTINGS_HPP
