/**
 * @file Errors.hpp
 * @brief Exception types for jsonops
 *
 * Error taxonomy:
 * - Error: Base class
 * - LimitError: InputTooLarge, NestingTooDeep
 * - DocumentError: EmptyInput, ParseError
 * - PathError: InvalidPathSyntax, KeyNotFound, IndexOutOfRange, TypeMismatch
 * - UnsupportedValue, InvalidArgument
 * - FileNotFoundError, SettingsError
 */

#ifndef JSONOPS_ERRORS_HPP
#define JSONOPS_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace jsonops {

/**
 * @brief Base class for all jsonops exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Limit Guard
// ============================================================================

/**
 * @brief Base class for size and depth limit violations
 */
class LimitError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Raw input exceeds the maximum accepted byte size
 */
class InputTooLarge : public LimitError {
public:
    /**
     * @brief Construct with actual size and limit
     * @param size Byte length of the rejected input
     * @param limit Maximum accepted byte length
     */
    InputTooLarge(std::size_t size, std::size_t limit)
        : LimitError("Input of " + std::to_string(size) +
                     " bytes exceeds maximum size of " +
                     std::to_string(limit) + " bytes")
        , size_(size)
        , limit_(limit)
    {}

    std::size_t size() const noexcept { return size_; }
    std::size_t limit() const noexcept { return limit_; }

private:
    std::size_t size_;
    std::size_t limit_;
};

/**
 * @brief Document nests containers deeper than allowed
 */
class NestingTooDeep : public LimitError {
public:
    /**
     * @brief Construct with the configured depth limit
     * @param limit Maximum accepted nesting depth
     */
    explicit NestingTooDeep(std::size_t limit)
        : LimitError("Exceeds maximum nesting depth of " + std::to_string(limit))
        , limit_(limit)
    {}

    std::size_t limit() const noexcept { return limit_; }

private:
    std::size_t limit_;
};

// ============================================================================
// Document parsing
// ============================================================================

/**
 * @brief Base class for errors turning raw text into a Value
 */
class DocumentError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Input text is empty or whitespace only
 */
class EmptyInput : public DocumentError {
public:
    /**
     * @param name Role of the input (e.g., "data", "base")
     */
    explicit EmptyInput(std::string name)
        : DocumentError(name + " cannot be empty")
        , name_(std::move(name))
    {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

/**
 * @brief Input text is not valid JSON
 */
class ParseError : public DocumentError {
public:
    /**
     * @brief Construct with input role and error details
     * @param name Role of the input (e.g., "data", "base")
     * @param details Detailed error message from parser
     */
    ParseError(std::string name, std::string details)
        : DocumentError("Invalid JSON in " + name + ": " + details)
        , name_(std::move(name))
        , details_(std::move(details))
    {}

    const std::string& name() const noexcept { return name_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string name_;
    std::string details_;
};

// ============================================================================
// Path resolution
// ============================================================================

/**
 * @brief Base class for path expression errors
 */
class PathError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Path expression does not match the path grammar
 */
class InvalidPathSyntax : public PathError {
public:
    /**
     * @brief Construct with expression, offending offset and reason
     * @param expression The full expression text
     * @param position Zero-based offset where parsing failed
     * @param reason Short description (e.g., "unmatched '['")
     */
    InvalidPathSyntax(std::string expression, std::size_t position, std::string reason)
        : PathError("Invalid path syntax at position " + std::to_string(position) +
                    " in '" + expression + "': " + reason)
        , expression_(std::move(expression))
        , position_(position)
        , reason_(std::move(reason))
    {}

    const std::string& expression() const noexcept { return expression_; }
    std::size_t position() const noexcept { return position_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string expression_;
    std::size_t position_;
    std::string reason_;
};

/**
 * @brief Object member not found during path resolution
 */
class KeyNotFound : public PathError {
public:
    /**
     * @brief Construct with location, missing key and the keys that exist
     * @param path Canonical path of the object being indexed (e.g., "$.db")
     * @param key The member that does not exist
     * @param available Keys present in the object, in stored order
     */
    KeyNotFound(std::string path, std::string key, std::vector<std::string> available = {})
        : PathError(format_message(path, key, available))
        , path_(std::move(path))
        , key_(std::move(key))
        , available_(std::move(available))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& key() const noexcept { return key_; }
    const std::vector<std::string>& available() const noexcept { return available_; }

private:
    std::string path_;
    std::string key_;
    std::vector<std::string> available_;

    static std::string format_message(const std::string& path, const std::string& key,
                                      const std::vector<std::string>& available) {
        std::ostringstream oss;
        oss << "Key '" << key << "' not found at '" << path << "'. Available keys: [";
        for (std::size_t i = 0; i < available.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << available[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief Array index beyond the end of the array
 */
class IndexOutOfRange : public PathError {
public:
    /**
     * @param path Canonical path of the array being indexed
     * @param index Requested index
     * @param length Actual array length
     */
    IndexOutOfRange(std::string path, std::size_t index, std::size_t length)
        : PathError("Index [" + std::to_string(index) + "] out of range at '" + path +
                    "' (length " + std::to_string(length) + ")")
        , path_(std::move(path))
        , index_(index)
        , length_(length)
    {}

    const std::string& path() const noexcept { return path_; }
    std::size_t index() const noexcept { return index_; }
    std::size_t length() const noexcept { return length_; }

private:
    std::string path_;
    std::size_t index_;
    std::size_t length_;
};

/**
 * @brief Path step applied to the wrong kind of value
 *
 * Raised when a key is applied to a non-object or an index to a non-array.
 */
class TypeMismatch : public PathError {
public:
    /**
     * @brief Construct with path, expected type, and actual type
     * @param path Canonical path of the value being indexed
     * @param expected Expected type (e.g., "object")
     * @param actual Actual type encountered (e.g., "integer")
     */
    TypeMismatch(std::string path, std::string expected, std::string actual)
        : PathError("Expected " + expected + " at '" + path + "', got " + actual)
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

// ============================================================================
// Miscellaneous
// ============================================================================

/**
 * @brief Value holds storage outside the JSON model (binary, discarded)
 */
class UnsupportedValue : public Error {
public:
    explicit UnsupportedValue(const std::string& type)
        : Error("Unsupported value type: " + type)
    {}
};

/**
 * @brief Argument outside its accepted domain
 */
class InvalidArgument : public Error {
public:
    using Error::Error;
};

/**
 * @brief Input or settings file not found
 */
class FileNotFoundError : public Error {
public:
    /**
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : Error("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Settings source unreadable or holding a wrongly typed value
 */
class SettingsError : public Error {
public:
    using Error::Error;
};

} // namespace jsonops

#endif // JSONOPS_ERRORS_HPP
