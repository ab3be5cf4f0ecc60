/**
 * @file Mutator.hpp
 * @brief Apply `set` operations to a Document
 */

#ifndef TOMLCLI_MUTATOR_HPP
#define TOMLCLI_MUTATOR_HPP

#include "tomlcli/Document.hpp"
#include "tomlcli/KeyPath.hpp"
#include "tomlcli/Resolver.hpp"

namespace tomlcli {

/**
 * @brief Store a value at a resolved location
 *
 * Missing intermediate tables are appended to their parents as implicit
 * tables (no header of their own until they hold values; dotted keys
 * under a dotted-key table), then the leaf
 * is either replaced in place, keeping its position and comments, or
 * appended to the end of its table.
 *
 * @param resolution Result of resolve(root, path, ResolveMode::set)
 * @param path The path that was resolved
 * @param value New leaf value
 * @return Reference to the stored node
 */
Value& apply_set(const Resolution& resolution, const KeyPath& path, Value value);

/**
 * @brief Resolve @p path in set mode and store @p value there
 *
 * The document is only modified once resolution has succeeded.
 *
 * Examples:
 * ```cpp
 * // [x]
 * // y = "z"
 * set_path(root, parse_key_path("x.y"), Value("new")); // y = "new"
 * set_path(root, parse_key_path("x.z"), Value("123")); // z = "123" appended
 * set_path(root, parse_key_path("x.y.w"), Value("1")); // throws TypeConflictError
 * ```
 *
 * @throws TypeConflictError as described in resolve()
 */
Value& set_path(Value& root, const KeyPath& path, Value value);

} // namespace tomlcli

#endif // TOMLCLI_MUTATOR_HPP
