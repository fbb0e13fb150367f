/**
 * @file SchemaValidator.hpp
 * @brief Exact runtime-type checks for schema-governed fields
 *
 * No coercion is performed: "10" is a String even when a Number is
 * expected, and 1 is a Number even when a Boolean is expected.
 */

#ifndef MERGEGUARD_SCHEMA_VALIDATOR_HPP
#define MERGEGUARD_SCHEMA_VALIDATOR_HPP

#include "mergeguard/Policy.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mergeguard {

/**
 * @brief A schema entry that the value did not satisfy
 */
struct TypeMismatch {
    std::string field;   ///< Dotted path of the field
    ValueKind expected;
    ValueKind actual;

    /// e.g. "'timeout' must be number, got string"
    std::string describe() const;
};

/**
 * @brief Validate a top-level field
 *
 * @return nullopt if the field has no schema entry or the value matches
 */
std::optional<TypeMismatch> validate(const std::string& key, const Value& value,
                                     const MergePolicy& policy);

/**
 * @brief Validate a field at a nested path
 *
 * @param path Path segments from the merge root, the last one being the key
 */
std::optional<TypeMismatch> validate_at(const std::vector<std::string>& path,
                                        const Value& value,
                                        const MergePolicy& policy);

} // namespace mergeguard

#endif // MERGEGUARD_SCHEMA_VALIDATOR_HPP
