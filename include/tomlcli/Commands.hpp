/**
 * @file Commands.hpp
 * @brief The `get` and `set` command pipelines
 *
 * Each command runs one pass: parse key path → open document → resolve
 * (and mutate) → encode or serialize. The text-based variants do the same
 * against an in-memory document.
 */

#ifndef TOMLCLI_COMMANDS_HPP
#define TOMLCLI_COMMANDS_HPP

#include "tomlcli/Codec.hpp"
#include <string>
#include <string_view>

namespace tomlcli {

/**
 * @brief Options for `toml get`
 */
struct GetOptions {
    std::string file;
    std::string key_path;
    OutputFormat format = OutputFormat::json;
};

/**
 * @brief Options for `toml set`
 */
struct SetOptions {
    std::string file;
    std::string key_path;
    std::string value;
    bool print_only = false; // print the result instead of rewriting file
};

/**
 * @brief Resolve a value in a file and render it
 * @return Text to print on stdout (with trailing newline)
 */
std::string run_get(const GetOptions& opts);

/**
 * @brief Store a value in a file
 *
 * The file is rewritten only after the whole mutation has succeeded.
 *
 * @return The updated document when print_only is set, otherwise empty
 */
std::string run_set(const SetOptions& opts);

/**
 * @brief `get` against TOML text instead of a file
 */
std::string get_in_text(std::string_view toml_text, std::string_view key_path,
                        OutputFormat format = OutputFormat::json);

/**
 * @brief `set` against TOML text instead of a file
 * @return The updated document
 */
std::string set_in_text(std::string_view toml_text, std::string_view key_path,
                        const std::string& value);

} // namespace tomlcli

#endif // TOMLCLI_COMMANDS_HPP
