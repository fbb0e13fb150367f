/**
 * @file SchemaValidator.cpp
 * @brief Implementation of schema type checks
 */

#include "mergeguard/SchemaValidator.hpp"
#include "mergeguard/DotPath.hpp"

namespace mergeguard {

std::string TypeMismatch::describe() const {
    return "'" + field + "' must be " + kind_name(expected) + ", got " + kind_name(actual);
}

std::optional<TypeMismatch> validate(const std::string& key, const Value& value,
                                     const MergePolicy& policy) {
    return validate_at({key}, value, policy);
}

std::optional<TypeMismatch> validate_at(const std::vector<std::string>& path,
                                        const Value& value,
                                        const MergePolicy& policy) {
    if (policy.field_schema().empty()) {
        return std::nullopt;
    }

    const std::string field = join_dot_path(path);
    const auto expected = policy.expected_type(field);
    if (!expected) {
        return std::nullopt;
    }

    const ValueKind actual = kind_of(value);
    if (actual == *expected) {
        return std::nullopt;
    }
    return TypeMismatch{field, *expected, actual};
}

} // namespace mergeguard
