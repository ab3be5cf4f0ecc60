/**
 * @file Loader.hpp
 * @brief Load TOML text into the Document model
 *
 * Parsing is delegated to toml11 with toml::ordered_type_config, which
 * keeps every table in document order together with its comments and
 * formatting hints.
 */

#ifndef TOMLCLI_LOADER_HPP
#define TOMLCLI_LOADER_HPP

#include "tomlcli/Document.hpp"
#include <string>
#include <string_view>

namespace tomlcli {

/**
 * @brief Parse TOML text into a root table.
 *
 * @param text UTF-8 TOML document
 * @param source_name Name used in error messages (usually the file path)
 * @return Root table value with keys in document order
 * @throws DocumentParseError if toml11 rejects the text
 */
Value parse_document(std::string_view text, const std::string& source_name = "<input>");

/**
 * @brief Read an entire file into memory.
 *
 * @param path File to read
 * @return File contents, byte for byte
 * @throws FileNotFoundError if the path does not name a regular file
 * @throws IoError if the file cannot be read
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Read and parse a TOML file.
 *
 * @throws FileNotFoundError, IoError, DocumentParseError
 */
Value load_document(const std::string& path);

} // namespace tomlcli

#endif // TOMLCLI_LOADER_HPP
