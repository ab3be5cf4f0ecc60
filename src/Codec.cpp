/**
 * @file Codec.cpp
 * @brief Implementation of value encoding
 */

#include "tomlcli/Codec.hpp"
#include "tomlcli/Errors.hpp"
#include "tomlcli/Util.hpp"
#include "tomlcli/Writer.hpp"

namespace tomlcli {

nlohmann::ordered_json to_json(const Value& value) {
    using nlohmann::ordered_json;

    switch (node_type(value)) {
        case NodeType::string:
            return ordered_json(value.as_string());
        case NodeType::integer:
            return ordered_json(value.as_integer());
        case NodeType::floating_point:
            return ordered_json(value.as_floating());
        case NodeType::boolean:
            return ordered_json(value.as_boolean());
        case NodeType::datetime:
            return ordered_json(toml::format(value));
        case NodeType::array: {
            ordered_json arr = ordered_json::array();
            for (const Value& item : value.as_array()) {
                arr.push_back(to_json(item));
            }
            return arr;
        }
        case NodeType::inline_table:
        case NodeType::table: {
            ordered_json obj = ordered_json::object();
            for (const auto& kv : value.as_table()) {
                obj[kv.first] = to_json(kv.second);
            }
            return obj;
        }
        case NodeType::empty:
            break;
    }
    return ordered_json();
}

std::string encode_value(const Value& value, OutputFormat format, const KeyPath& path) {
    switch (format) {
        case OutputFormat::json:
            return to_json(value).dump(-1, ' ', false,
                                       nlohmann::ordered_json::error_handler_t::replace) + "\n";
        case OutputFormat::raw:
            if (value.is_string()) {
                return value.as_string() + "\n";
            }
            throw EncodeError(path.to_string(), type_name(value));
        case OutputFormat::toml:
            if (is_container_table(value)) {
                Value section = value;
                section.comments().clear();
                return write_document(section);
            }
            return format_value(value) + "\n";
    }
    return {};
}

Value coerce_value(const std::string& literal) {
    const std::size_t bad = find_invalid_utf8(literal);
    if (bad != std::string::npos) {
        throw InvalidValueError(bad);
    }
    return Value(literal);
}

} // namespace tomlcli
