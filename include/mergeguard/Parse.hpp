/**
 * @file Parse.hpp
 * @brief String parsing for environment variables and CLI arguments
 *
 * parse_value() types a raw string (first match wins):
 * - Boolean ("true", "false" - case insensitive)
 * - Null ("null" - case insensitive)
 * - Integer (matches ^-?[0-9]+$)
 * - Float (matches ^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - JSON compound ({...} or [...])
 * - Quoted string ("...")
 * - Raw string (fallback)
 *
 * These helpers only ever run on operator-supplied configuration. Data
 * being merged is never parsed from strings: a "10" in a source stays a
 * String.
 */

#ifndef MERGEGUARD_PARSE_HPP
#define MERGEGUARD_PARSE_HPP

#include "mergeguard/Value.hpp"
#include "mergeguard/Policy.hpp"
#include <optional>
#include <set>
#include <string>

namespace mergeguard {

/**
 * @brief Parse string value to appropriate type
 *
 * ```cpp
 * parse_value("true")       // → true
 * parse_value("42")         // → 42
 * parse_value("3.14")       // → 3.14
 * parse_value("[\"a\"]")    // → ["a"]
 * parse_value("\"42\"")     // → "42"
 * parse_value("hello")      // → "hello"
 * ```
 */
Value parse_value(const std::string& str);

/**
 * @brief Parse a type name as written in policy documents
 *
 * Accepts "null", "boolean", "number", "string", "sequence", "mapping"
 * and the JSON spellings "bool", "integer", "float", "array", "object".
 * Case-insensitive.
 *
 * @return The kind, or nullopt if the name is not recognized
 */
std::optional<ValueKind> parse_kind(const std::string& name);

/**
 * @brief Parse a comma-separated key list ("a, b,c" → {"a", "b", "c"})
 *
 * Whitespace around keys is trimmed and empty entries are dropped.
 */
std::set<std::string> parse_key_list(const std::string& str);

/**
 * @brief Parse a schema argument ("timeout:number, debug:boolean")
 *
 * @throws PolicyError listing every malformed entry or unknown type name
 */
FieldSchema parse_schema_list(const std::string& str);

} // namespace mergeguard

#endif // MERGEGUARD_PARSE_HPP
