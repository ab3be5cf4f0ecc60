/**
 * @file Document.hpp
 * @brief In-memory TOML document model
 *
 * Documents are toml11 values built with toml::ordered_type_config, so
 * every table keeps its keys in source order and new keys are appended at
 * the end. The root of a document is always a table.
 *
 * toml11 also records how each table was written:
 * - multiline: `[name]` section (standard table)
 * - implicit: created by a deeper header such as `[a.b]`
 * - dotted: created by a dotted key such as `y.yy = 1`
 * - oneline / multiline_oneline: inline table `{ ... }`
 *
 * Inline tables are values. Every other table is a container that key
 * paths may walk through.
 */

#ifndef TOMLCLI_DOCUMENT_HPP
#define TOMLCLI_DOCUMENT_HPP

#include <toml.hpp>

namespace tomlcli {

using Value = toml::ordered_value;
using Table = toml::ordered_table;
using Array = toml::ordered_array;

/**
 * @brief Node type tag used for exhaustive dispatch
 */
enum class NodeType {
    empty,
    string,
    integer,
    floating_point,
    boolean,
    datetime,
    array,
    inline_table,
    table
};

/**
 * @brief Classify a value, separating inline tables from container tables
 */
NodeType node_type(const Value& value) noexcept;

/**
 * @brief True for tables a key path may descend into
 */
inline bool is_container_table(const Value& value) noexcept {
    return node_type(value) == NodeType::table;
}

/**
 * @brief Get human-readable type name
 * @return "string", "integer", "float", "boolean", "datetime", "array",
 *         "inline table", "table" or "empty"
 */
const char* type_name(NodeType type) noexcept;

inline const char* type_name(const Value& value) noexcept {
    return type_name(node_type(value));
}

} // namespace tomlcli

#endif // TOMLCLI_DOCUMENT_HPP
