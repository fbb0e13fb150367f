/**
 * @file DotPath.hpp
 * @brief Dot-notation paths over Value trees
 *
 * Violation paths, schema entries and configuration overrides are all
 * written as dot-separated paths like "database.port" or "items.0.name".
 * Lookups only ever follow entries a container holds itself.
 */

#ifndef MERGEGUARD_DOTPATH_HPP
#define MERGEGUARD_DOTPATH_HPP

#include "mergeguard/Value.hpp"
#include "mergeguard/Errors.hpp"
#include <string>
#include <vector>

namespace mergeguard {

/**
 * @brief Split a dot-path into segments
 *
 * Examples:
 * - "database.host" → ["database", "host"]
 * - "items.0.name" → ["items", "0", "name"]
 * - "" → []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Get value from nested structure using dot-path
 *
 * @return Pointer to value at path; the root for an empty path
 * @throws KeyError if any segment not found
 * @throws TypeError if traversal hits a scalar before the final segment
 *
 * ```cpp
 * Value cfg = {{"db", {{"port", 5432}}}};
 * get_by_dot(cfg, "db.port");    // points to 5432
 * get_by_dot(cfg, "db.host");    // throws KeyError
 * get_by_dot(cfg, "db.port.x");  // throws TypeError
 * ```
 */
const Value* get_by_dot(const Value& data, const std::string& path);

/**
 * @brief Set value in nested structure using dot-path
 *
 * Missing intermediate segments become mappings; intermediate scalars are
 * replaced by mappings. Sequences are not traversed.
 *
 * ```cpp
 * Value cfg = Value::object();
 * set_by_dot(cfg, "field_schema.timeout", "number");
 * // {"field_schema": {"timeout": "number"}}
 * ```
 */
void set_by_dot(Value& data, const std::string& path, const Value& value);

} // namespace mergeguard

#endif // MERGEGUARD_DOTPATH_HPP
