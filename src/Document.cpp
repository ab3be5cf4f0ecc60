/**
 * @file Document.cpp
 * @brief Type classification for document values
 */

#include "tomlcli/Document.hpp"

namespace tomlcli {

NodeType node_type(const Value& value) noexcept {
    switch (value.type()) {
        case toml::value_t::string: return NodeType::string;
        case toml::value_t::integer: return NodeType::integer;
        case toml::value_t::floating: return NodeType::floating_point;
        case toml::value_t::boolean: return NodeType::boolean;
        case toml::value_t::offset_datetime:
        case toml::value_t::local_datetime:
        case toml::value_t::local_date:
        case toml::value_t::local_time: return NodeType::datetime;
        case toml::value_t::array: return NodeType::array;
        case toml::value_t::table: {
            const auto fmt = value.as_table_fmt(std::nothrow).fmt;
            if (fmt == toml::table_format::oneline ||
                fmt == toml::table_format::multiline_oneline) {
                return NodeType::inline_table;
            }
            return NodeType::table;
        }
        case toml::value_t::empty: break;
    }
    return NodeType::empty;
}

const char* type_name(NodeType type) noexcept {
    switch (type) {
        case NodeType::empty: return "empty";
        case NodeType::string: return "string";
        case NodeType::integer: return "integer";
        case NodeType::floating_point: return "float";
        case NodeType::boolean: return "boolean";
        case NodeType::datetime: return "datetime";
        case NodeType::array: return "array";
        case NodeType::inline_table: return "inline table";
        case NodeType::table: return "table";
    }
    return "unknown";
}

} // namespace tomlcli
