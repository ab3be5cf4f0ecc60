/**
 * @file Errors.hpp
 * @brief Exception types for tomlcli
 *
 * Error taxonomy:
 * - TomlCliError: Base class
 * - PathSyntaxError: Malformed key path
 * - NotFoundError: Key path does not resolve
 * - TypeConflictError: Traversal through, or overwrite of, a non-table
 * - DocumentParseError: TOML syntax errors reported by toml11
 * - IoError / FileNotFoundError: File read/write failures
 * - EncodeError: Value cannot be rendered in the requested format
 * - InvalidValueError: Value given to `set` cannot be stored in TOML
 * - UsageError: Invalid command line
 */

#ifndef TOMLCLI_ERRORS_HPP
#define TOMLCLI_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace tomlcli {

/**
 * @brief Base class for all tomlcli exceptions
 */
class TomlCliError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Key path string does not follow the TOML key grammar
 */
class PathSyntaxError : public TomlCliError {
public:
    /**
     * @brief Construct with the raw input and the offending position
     * @param input The key path as supplied by the user
     * @param column 1-based column of the offending character
     * @param details What was expected at that column
     */
    PathSyntaxError(std::string input, std::size_t column, std::string details)
        : TomlCliError("Invalid key path '" + input + "' at column " +
                       std::to_string(column) + ": " + details)
        , input_(std::move(input))
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& input() const noexcept { return input_; }
    std::size_t column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string input_;
    std::size_t column_;
    std::string details_;
};

/**
 * @brief Key not found during key path traversal
 *
 * Raised when a segment of the path does not exist in `get` mode.
 */
class NotFoundError : public TomlCliError {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Canonical key path being accessed (e.g., "database.host")
     * @param segment The specific segment that doesn't exist (e.g., "host")
     */
    NotFoundError(std::string path, std::string segment)
        : TomlCliError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Path treats a value as a table, or a table as a value
 *
 * Raised when traversing into a scalar, array or inline table
 * (e.g., "key.sub" where key = "value"), or when `set` would replace
 * a standard table with a scalar.
 */
class TypeConflictError : public TomlCliError {
public:
    /**
     * @brief Construct with path, segment, expected type, and actual type
     * @param path Canonical key path being accessed
     * @param segment Segment at which the conflict occurred
     * @param expected Expected node type (e.g., "table")
     * @param actual Node type encountered (e.g., "string")
     */
    TypeConflictError(std::string path, std::string segment,
                      std::string expected, std::string actual)
        : TomlCliError("Type conflict at '" + segment + "' in path '" + path +
                       "': expected " + expected + ", found " + actual)
        , path_(std::move(path))
        , segment_(std::move(segment))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& segment() const noexcept { return segment_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::string segment_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Document is not valid TOML
 */
class DocumentParseError : public TomlCliError {
public:
    /**
     * @brief Construct with source name, position and parser message
     * @param file Path (or pseudo-name) of the document
     * @param line 1-based line reported by the parser (0 if unknown)
     * @param column 1-based column reported by the parser (0 if unknown)
     * @param details Error description from toml11
     */
    DocumentParseError(std::string file, std::size_t line, std::size_t column,
                       std::string details)
        : TomlCliError("Parse error in '" + file + "' at line " +
                       std::to_string(line) + ", column " +
                       std::to_string(column) + ": " + details)
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    std::size_t line() const noexcept { return line_; }
    std::size_t column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    std::size_t line_;
    std::size_t column_;
    std::string details_;
};

/**
 * @brief File could not be read, written or replaced
 */
class IoError : public TomlCliError {
public:
    IoError(std::string path, const std::string& details)
        : TomlCliError(details + ": " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path involved in the failure
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document file does not exist
 */
class FileNotFoundError : public IoError {
public:
    explicit FileNotFoundError(std::string path)
        : IoError(std::move(path), "File not found")
    {}
};

/**
 * @brief Value cannot be rendered in the requested output format
 *
 * Raised for `get --raw` on anything other than a string.
 */
class EncodeError : public TomlCliError {
public:
    EncodeError(std::string path, std::string actual)
        : TomlCliError("Cannot print " + actual + " at '" + path +
                       "' as raw text (only strings are supported)")
        , path_(std::move(path))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::string actual_;
};

/**
 * @brief Command-line value cannot be stored in a TOML document
 *
 * TOML files are UTF-8, so `set` refuses bytes that are not.
 */
class InvalidValueError : public TomlCliError {
public:
    /**
     * @param offset Byte offset of the first invalid sequence
     */
    explicit InvalidValueError(std::size_t offset)
        : TomlCliError("Invalid value: not valid UTF-8 (byte " +
                       std::to_string(offset + 1) + ")")
        , offset_(offset)
    {}

    std::size_t offset() const noexcept { return offset_; }

private:
    std::size_t offset_;
};

/**
 * @brief Command line is malformed
 */
class UsageError : public TomlCliError {
public:
    using TomlCliError::TomlCliError;
};

} // namespace tomlcli

#endif // TOMLCLI_ERRORS_HPP
