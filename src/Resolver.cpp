/**
 * @file Resolver.cpp
 * @brief Implementation of key path resolution
 */

#include "tomlcli/Resolver.hpp"
#include "tomlcli/Log.hpp"

namespace tomlcli {

namespace {

[[noreturn]] void throw_not_traversable(const KeyPath& path, std::size_t index,
                                        const Value& node) {
    throw TypeConflictError(path.to_string(), join_key_path(path, index + 1),
                            "table", type_name(node));
}

template <typename V>
V* find_child(V& table, const std::string& key) {
    auto& entries = table.as_table();
    auto it = entries.find(key);
    return it == entries.end() ? nullptr : &it->second;
}

} // anonymous namespace

const Value& resolve_get(const Value& root, const KeyPath& path) {
    const Value* current = &root;

    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        const Value* child = find_child(*current, path[i].name);
        if (child == nullptr) {
            throw NotFoundError(path.to_string(), join_key_path(path, i + 1));
        }
        if (!is_container_table(*child)) {
            throw_not_traversable(path, i, *child);
        }
        current = child;
    }

    const Value* leaf = find_child(*current, path.back().name);
    if (leaf == nullptr) {
        throw NotFoundError(path.to_string(), path.to_string());
    }
    return *leaf;
}

Resolution resolve(Value& root, const KeyPath& path, ResolveMode mode) {
    Resolution r;
    r.parent = &root;

    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        Value* child = find_child(*r.parent, path[i].name);
        if (child == nullptr) {
            if (mode == ResolveMode::get) {
                throw NotFoundError(path.to_string(), join_key_path(path, i + 1));
            }
            // Everything from here down is new.
            r.next_segment = i;
            logger().debug("'{}' is missing; {} table(s) will be created",
                           join_key_path(path, i + 1), path.size() - 1 - i);
            return r;
        }
        if (!is_container_table(*child)) {
            throw_not_traversable(path, i, *child);
        }
        r.parent = child;
    }

    r.next_segment = path.size() - 1;
    r.leaf = find_child(*r.parent, path.back().name);

    if (mode == ResolveMode::get) {
        if (r.leaf == nullptr) {
            throw NotFoundError(path.to_string(), path.to_string());
        }
    } else if (r.leaf != nullptr && is_container_table(*r.leaf)) {
        throw TypeConflictError(path.to_string(), path.to_string(),
                                "value", type_name(*r.leaf));
    }
    return r;
}

} // namespace tomlcli
