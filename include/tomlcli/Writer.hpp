/**
 * @file Writer.hpp
 * @brief Serialize a Document back to TOML text
 *
 * Serialization is done by toml11 (`toml::format`), which keeps key order,
 * comments and the way each table was written. The writer re-emits the
 * whole tree rather than patching the source text, and applies a few
 * output rules on top of toml11:
 *
 * - No blank lines; every line ends with '\n'.
 * - Multi-line strings are re-encoded as basic strings (`"..."`).
 * - A table that only existed implicitly (`[a.b]` without `[a]`) gets its
 *   own header once it holds values.
 */

#ifndef TOMLCLI_WRITER_HPP
#define TOMLCLI_WRITER_HPP

#include "tomlcli/Document.hpp"
#include <ostream>
#include <string>

namespace tomlcli {

/**
 * @brief Serialize a table as a complete TOML document
 *
 * Any container table can be written this way; its own header is not
 * part of the output.
 *
 * @return Document text; empty string for an empty table
 * @throws TomlCliError if toml11 cannot serialize the tree
 */
std::string write_document(const Value& root);

/**
 * @brief Stream variant of write_document()
 */
void write_document(std::ostream& os, const Value& root);

/**
 * @brief Render a value as an inline TOML literal
 *
 * Tables of either kind are rendered as inline tables and arrays of
 * tables as arrays of inline tables.
 *
 * Examples:
 * - "a\"b" → "a\"b"
 * - 17 → 17
 * - [1, "x"] → [1, "x"]
 */
std::string format_value(const Value& value);

} // namespace tomlcli

#endif // TOMLCLI_WRITER_HPP
