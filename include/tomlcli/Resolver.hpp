/**
 * @file Resolver.hpp
 * @brief Key path resolution against a Document
 *
 * Resolution rules:
 * - Intermediate segments must name container tables (standard, implicit
 *   or dotted). Scalars, arrays and inline tables raise TypeConflictError
 *   in every mode.
 * - get: any missing segment raises NotFoundError; the final segment may
 *   name a node of any type.
 * - set: a missing segment stops the walk; it and every later segment are
 *   created by the Mutator. An existing final node is replaced in place
 *   unless it is a container table (TypeConflictError).
 *
 * Resolution never modifies the document.
 */

#ifndef TOMLCLI_RESOLVER_HPP
#define TOMLCLI_RESOLVER_HPP

#include "tomlcli/Document.hpp"
#include "tomlcli/Errors.hpp"
#include "tomlcli/KeyPath.hpp"
#include <cstddef>

namespace tomlcli {

enum class ResolveMode { get, set };

/**
 * @brief Outcome of a successful resolution
 *
 * `parent` is the deepest table value reached by the walk. `next_segment` is
 * the index of the first path segment not present under `parent`; it is
 * `path.size() - 1` when every intermediate table exists. `leaf` points
 * to the existing final node, or is null when it must be created.
 */
struct Resolution {
    Value* parent = nullptr;
    std::size_t next_segment = 0;
    Value* leaf = nullptr;

    /**
     * @brief True when the Mutator has intermediate tables to create
     */
    bool creates_tables(const KeyPath& path) const noexcept {
        return next_segment + 1 < path.size();
    }
};

/**
 * @brief Walk a path from the root table
 *
 * @param root Document root (a table value)
 * @param path Parsed key path
 * @param mode get (everything must exist) or set (missing keys allowed)
 * @return Resolution describing the leaf or the insertion point
 * @throws NotFoundError in get mode when a segment is missing
 * @throws TypeConflictError when traversing through a non-table, or when
 *         set mode targets an existing container table
 */
Resolution resolve(Value& root, const KeyPath& path, ResolveMode mode);

/**
 * @brief Read-only lookup of an existing node
 *
 * Examples:
 * ```cpp
 * // key = "value"
 * // [foo]
 * // y.yy = "foo-yy"
 * resolve_get(root, parse_key_path("foo.y.yy"));  // "foo-yy"
 * resolve_get(root, parse_key_path("nosuchkey")); // throws NotFoundError
 * resolve_get(root, parse_key_path("key.x"));     // throws TypeConflictError
 * ```
 */
const Value& resolve_get(const Value& root, const KeyPath& path);

} // namespace tomlcli

#endif // TOMLCLI_RESOLVER_HPP
