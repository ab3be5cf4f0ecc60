/**
 * @file Codec.hpp
 * @brief Conversions between Document values and external text
 *
 * Output (`get`):
 * - json: JSON rendering via nlohmann::ordered_json (default)
 * - raw: bare string content, strings only
 * - toml: TOML literal, or a document fragment for tables
 *
 * Input (`set`): command-line text always becomes a TOML string.
 */

#ifndef TOMLCLI_CODEC_HPP
#define TOMLCLI_CODEC_HPP

#include "tomlcli/Document.hpp"
#include "tomlcli/KeyPath.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace tomlcli {

enum class OutputFormat { json, raw, toml };

/**
 * @brief Convert a value to its structurally equivalent JSON value
 *
 * Strings, integers, floats and booleans map to their JSON counterparts;
 * datetimes become strings of their TOML text; arrays become arrays;
 * tables become objects with key order preserved.
 */
nlohmann::ordered_json to_json(const Value& value);

/**
 * @brief Render a resolved value for `get`
 *
 * @param value The resolved value
 * @param format Output format
 * @param path Path the value was found at (for diagnostics)
 * @return Rendered text followed by a single newline. Tables under the
 *         toml format are rendered as a document and may be empty.
 * @throws EncodeError for the raw format on a non-string value
 *
 * Examples:
 * ```cpp
 * encode_value(Value("value"), OutputFormat::json, p); // "\"value\"\n"
 * encode_value(Value("value"), OutputFormat::raw, p);  // "value\n"
 * encode_value(Value(17), OutputFormat::json, p);      // "17\n"
 * encode_value(Value(17), OutputFormat::raw, p);       // throws EncodeError
 * ```
 */
std::string encode_value(const Value& value, OutputFormat format, const KeyPath& path);

/**
 * @brief Convert a command-line value for `set`
 *
 * Values are always stored as TOML strings: "123" stays the string "123".
 *
 * @throws InvalidValueError if the text is not valid UTF-8
 */
Value coerce_value(const std::string& literal);

} // namespace tomlcli

#endif // TOMLCLI_CODEC_HPP
