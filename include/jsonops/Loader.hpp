/**
 * @file Loader.hpp
 * @brief File loading utilities
 *
 * Implements loading of:
 * - JSON documents, guarded by the Limit Guard (using nlohmann::json)
 * - settings files in JSON or TOML (using toml++)
 */

#ifndef JSONOPS_LOADER_HPP
#define JSONOPS_LOADER_HPP

#include "jsonops/Value.hpp"
#include "jsonops/Limits.hpp"
#include <istream>
#include <string>

namespace jsonops {

// ============================================================================
// Raw text
// ============================================================================

/**
 * @brief Read a whole file, or standard input when path is "-"
 *
 * @throws FileNotFoundError if the file doesn't exist or can't be opened
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Read a whole stream into a string
 */
std::string read_stream(std::istream& in);

// ============================================================================
// Documents
// ============================================================================

/**
 * @brief Load a JSON document from a file ("-" for stdin)
 *
 * The text goes through parse_document(), so size, depth and syntax are
 * all checked.
 *
 * @param path Path to the JSON file
 * @param name Role of the document in error messages
 * @param limits Size and depth bounds
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentError, LimitError as parse_document()
 */
Value load_document_file(const std::string& path, const std::string& name,
                         const Limits& limits = {});

// ============================================================================
// Settings files
// ============================================================================

/**
 * @brief Load a settings file, detecting the format by extension
 *
 * - ".json": nlohmann::json
 * - ".toml": toml++, tables become objects, dates and times become strings
 *
 * @param path Path to the settings file
 * @return Settings tree (object)
 * @throws FileNotFoundError if file doesn't exist
 * @throws SettingsError on syntax errors or an unsupported extension
 */
Value load_settings_file(const std::string& path);

/**
 * @brief Parse TOML text into a Value
 * @param text TOML document
 * @param source Name used in error messages
 * @throws SettingsError on TOML syntax errors
 */
Value parse_toml(const std::string& text, const std::string& source = "<string>");

/**
 * @brief Lowercase extension of a path including the dot (".json")
 */
std::string get_file_extension(const std::string& path);

} // namespace jsonops

#endif // JSONOPS_LOADER_HPP
