/**
 * @file Mutator.cpp
 * @brief Implementation of document mutation
 */

#include "tomlcli/Mutator.hpp"
#include "tomlcli/Log.hpp"

namespace tomlcli {

namespace {

Value& append(Value& table, const std::string& key, Value value) {
    Table& entries = table.as_table();
    entries.emplace(key, std::move(value));
    return entries.at(key);
}

// A new table under a dotted-key table stays dotted. Anywhere else it is
// header-less until it holds values of its own.
Value new_table_under(const Value& parent) {
    toml::table_format_info fmt;
    fmt.fmt = parent.as_table_fmt().fmt == toml::table_format::dotted
                  ? toml::table_format::dotted
                  : toml::table_format::implicit;
    return Value(Table{}, fmt);
}

} // anonymous namespace

Value& apply_set(const Resolution& resolution, const KeyPath& path, Value value) {
    if (resolution.leaf != nullptr) {
        logger().debug("replacing {} at '{}'", type_name(*resolution.leaf), path.to_string());
        value.comments() = resolution.leaf->comments();
        *resolution.leaf = std::move(value);
        return *resolution.leaf;
    }

    Value* current = resolution.parent;
    for (std::size_t i = resolution.next_segment; i + 1 < path.size(); ++i) {
        logger().debug("creating table '{}'", join_key_path(path, i + 1));
        current = &append(*current, path[i].name, new_table_under(*current));
    }

    logger().debug("appending '{}'", path.to_string());
    return append(*current, path.back().name, std::move(value));
}

Value& set_path(Value& root, const KeyPath& path, Value value) {
    const Resolution resolution = resolve(root, path, ResolveMode::set);
    return apply_set(resolution, path, std::move(value));
}

} // namespace tomlcli
