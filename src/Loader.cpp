/**
 * @file Loader.cpp
 * @brief File loading implementation
 *
 * Documents always pass through parse_document(). Settings files are
 * parsed without the Limit Guard.
 */

#include "jsonops/Loader.hpp"
#include "jsonops/Document.hpp"
#include "jsonops/Errors.hpp"
#include "jsonops/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <type_traits>

namespace fs = std::filesystem;

namespace jsonops {

// ============================================================================
// TOML conversion
// ============================================================================

namespace {

// TOML tables and arrays map onto objects and arrays; dates and times have
// no JSON counterpart and are kept as their TOML text
Value from_toml(const toml::node& node) {
    return node.visit([](const auto& n) -> Value {
        using node_t = std::decay_t<decltype(n)>;
        if constexpr (toml::is_table<node_t>) {
            Value obj = Value::object();
            for (const auto& [key, child] : n) {
                obj[std::string(key.str())] = from_toml(child);
            }
            return obj;
        } else if constexpr (toml::is_array<node_t>) {
            Value arr = Value::array();
            for (const auto& child : n) {
                arr.push_back(from_toml(child));
            }
            return arr;
        } else if constexpr (toml::is_date<node_t> || toml::is_time<node_t> ||
                             toml::is_date_time<node_t>) {
            std::ostringstream text;
            text << n;
            return Value(text.str());
        } else {
            return Value(n.get());
        }
    });
}

} // anonymous namespace

// ============================================================================
// Raw text
// ============================================================================

std::string read_stream(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string read_text_file(const std::string& path) {
    if (path == "-") {
        return read_stream(std::cin);
    }
    std::error_code ec;
    std::ifstream in;
    if (fs::is_regular_file(path, ec)) {
        in.open(path, std::ios::binary);
    }
    if (!in.is_open()) {
        throw FileNotFoundError(path);
    }
    return read_stream(in);
}

// ============================================================================
// Documents
// ============================================================================

Value load_document_file(const std::string& path, const std::string& name, const Limits& limits) {
    const std::string content = read_text_file(path);
    return parse_document(content, name, limits);
}

// ============================================================================
// Settings files
// ============================================================================

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Value parse_toml(const std::string& text, const std::string& source) {
    try {
        toml::table table = toml::parse(text, source);
        return from_toml(table);
    } catch (const toml::parse_error& e) {
        std::ostringstream oss;
        oss << "Parse error in '" << source << "' at line " << e.source().begin.line
            << ", column " << e.source().begin.column << ": " << e.description();
        throw SettingsError(oss.str());
    }
}

Value load_settings_file(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext != ".json" && ext != ".toml") {
        throw SettingsError(
            "Unsupported settings file type: " + ext + " (expected .json or .toml)"
        );
    }

    const std::string content = read_text_file(path);

    if (ext == ".toml") {
        return parse_toml(content, path);
    }

    try {
        return Value::parse(content);
    } catch (const Value::parse_error& e) {
        throw SettingsError("Parse error in '" + path + "': " + e.what());
    }
}

} // namespace jsonops
