/**
 * @file Merge.hpp
 * @brief Sanitizing deep merge of untrusted input into trusted data
 *
 * Merging rules:
 * - Only the source's own entries are visited
 * - Every key is classified first; denied keys are skipped without
 *   looking at their value
 * - Schema-governed fields must match their expected type exactly
 * - Mapping into mapping: recursive merge
 * - Mapping into anything else: replaced by a fresh mapping, then merged
 * - Sequence: replaces the target value; mapping elements are sanitized
 * - Scalar: replaces the target value
 * - Nesting deeper than max_depth is rejected for that branch
 *
 * Any violation rejects the whole merge. The caller's target is never
 * modified; the merged value is returned inside the outcome.
 */

#ifndef MERGEGUARD_MERGE_HPP
#define MERGEGUARD_MERGE_HPP

#include "mergeguard/Outcome.hpp"
#include "mergeguard/Policy.hpp"
#include "mergeguard/Value.hpp"
#include <vector>

namespace mergeguard {

/**
 * @brief Merge source into a copy of target under policy
 *
 * Both arguments must be mappings; otherwise the outcome is rejected with
 * a TypeMismatch at the root.
 *
 * Examples:
 * ```cpp
 * Value target = {{"timeout", 30}, {"retries", 3}};
 * auto policy = build_policy({}, std::nullopt, {{"timeout", ValueKind::Number}});
 *
 * auto ok = merge(target, {{"timeout", 10}}, policy);
 * // ok.value() == {"timeout": 10, "retries": 3}
 *
 * auto bad = merge(target, Value::parse(R"({"__proto__": {"isAdmin": true}})"), policy);
 * // bad.violations()[0].kind == ViolationKind::ForbiddenKey
 * ```
 */
MergeOutcome merge(const Value& target, const Value& source, const MergePolicy& policy);

/**
 * @brief Merge several sources onto base in precedence order
 *
 * Each layer is merged onto the result of the accepted layers before it.
 * A rejected layer contributes nothing, but later layers are still checked
 * so the report is complete. Violation details name the layer index.
 *
 * Example:
 * ```cpp
 * auto out = merge_layers(defaults, {file_layer, env_layer}, policy);
 * ```
 */
MergeOutcome merge_layers(const Value& base, const std::vector<Value>& layers,
                          const MergePolicy& policy);

} // namespace mergeguard

#endif // MERGEGUARD_MERGE_HPP
