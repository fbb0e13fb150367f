/**
 * @file Value.hpp
 * @brief Structural value type shared by targets, sources and policies
 *
 * Uses nlohmann::json as the underlying value model:
 * - Null
 * - Boolean
 * - Number (integer, unsigned and float all count as one kind)
 * - String (std::string, UTF-8)
 * - Sequence ([Value, ...])
 * - Mapping ({String: Value, ...})
 *
 * A Value owns its children, so every tree is acyclic by construction.
 */

#ifndef MERGEGUARD_VALUE_HPP
#define MERGEGUARD_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace mergeguard {

/**
 * @brief JSON-like structural value
 *
 * Alias for nlohmann::json. Iterating a mapping with items() only ever
 * yields the entries the mapping itself holds; there is no inherited
 * lookup path in this model.
 */
using Value = nlohmann::json;

/**
 * @brief Runtime tag of a structural value
 */
enum class ValueKind {
    Null,
    Boolean,
    Number,
    String,
    Sequence,
    Mapping
};

/**
 * @brief Get the runtime tag of a value
 *
 * Integer, unsigned and floating point json numbers all report Number.
 */
inline ValueKind kind_of(const Value& val) {
    if (val.is_boolean()) return ValueKind::Boolean;
    if (val.is_number()) return ValueKind::Number;
    if (val.is_string()) return ValueKind::String;
    if (val.is_array()) return ValueKind::Sequence;
    if (val.is_object()) return ValueKind::Mapping;
    return ValueKind::Null;
}

/**
 * @brief Human-readable name of a kind ("null", "boolean", "number",
 *        "string", "sequence", "mapping")
 */
inline std::string kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null: return "null";
        case ValueKind::Boolean: return "boolean";
        case ValueKind::Number: return "number";
        case ValueKind::String: return "string";
        case ValueKind::Sequence: return "sequence";
        case ValueKind::Mapping: return "mapping";
    }
    return "unknown";
}

/**
 * @brief Get human-readable type name for a Value
 */
inline std::string type_name(const Value& val) {
    return kind_name(kind_of(val));
}

/**
 * @brief Check if value is a container (sequence or mapping)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace mergeguard

#endif // MERGEGUARD_VALUE_HPP
