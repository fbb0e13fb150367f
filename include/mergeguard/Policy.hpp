/**
 * @file Policy.hpp
 * @brief Immutable merge policy: deny-list, allow-list, field schema, depth bound
 *
 * A policy is built once and shared read-only by every merge call that
 * uses it. The canonical denied keys (the three names that alias the
 * shared ancestor in the host object model) are always part of the
 * deny-list; callers may add keys but cannot remove them.
 *
 * Policy document format (JSON or TOML):
 * ```json
 * {
 *   "denied_keys": ["secret"],
 *   "allowed_keys": ["displayName", "email"],
 *   "field_schema": {"timeout": "number", "database.port": "number"},
 *   "max_depth": 8
 * }
 * ```
 */

#ifndef MERGEGUARD_POLICY_HPP
#define MERGEGUARD_POLICY_HPP

#include "mergeguard/Value.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace mergeguard {

/// Expected runtime tag of a schema-governed field
using ExpectedType = ValueKind;

/// Field schema keyed by dotted path ("timeout", "database.port")
using FieldSchema = std::map<std::string, ExpectedType>;

/**
 * @brief The keys that alias the ambient namespace: "__proto__",
 *        "constructor" and "prototype"
 */
const std::set<std::string>& canonical_denied_keys();

/// Depth bound used when a policy does not name one
constexpr std::size_t kDefaultMaxDepth = 32;

class MergePolicy;

/**
 * @brief Build an immutable policy
 *
 * @param denied Extra keys to deny, merged with canonical_denied_keys()
 * @param allowed Optional allow-list; absent means "no allow-list"
 * @param schema Expected type per dotted field path
 * @param max_depth Maximum nesting depth below the merge root (>= 1)
 * @throws PolicyError if max_depth is 0, a key is empty, or an allowed
 *         key is also denied
 *
 * Example:
 * ```cpp
 * auto policy = build_policy({}, std::nullopt,
 *                            {{"timeout", ValueKind::Number}}, 8);
 * ```
 */
MergePolicy build_policy(const std::set<std::string>& denied,
                         std::optional<std::set<std::string>> allowed,
                         FieldSchema schema,
                         std::size_t max_depth = kDefaultMaxDepth);

/**
 * @brief Immutable configuration governing one or more merge calls
 *
 * Construct through build_policy() or policy_from_json().
 */
class MergePolicy {
public:
    /// Deny-list, lower-cased; always a superset of canonical_denied_keys()
    const std::set<std::string>& denied_keys() const noexcept { return denied_keys_; }

    /// Allow-list, if any
    const std::optional<std::set<std::string>>& allowed_keys() const noexcept { return allowed_keys_; }

    const FieldSchema& field_schema() const noexcept { return field_schema_; }

    std::size_t max_depth() const noexcept { return max_depth_; }

    /// Case-insensitive deny-list membership
    bool is_denied(const std::string& key) const;

    /// True when there is no allow-list or the key is on it
    bool is_allowed(const std::string& key) const;

    /// Schema entry for the full dotted path, else for its last segment
    std::optional<ExpectedType> expected_type(const std::string& dotted_path) const;

    /// Policy document equivalent of this policy
    Value to_json() const;

private:
    friend MergePolicy build_policy(const std::set<std::string>&,
                                    std::optional<std::set<std::string>>,
                                    FieldSchema,
                                    std::size_t);

    MergePolicy(std::set<std::string> denied,
                std::optional<std::set<std::string>> allowed,
                FieldSchema schema,
                std::size_t max_depth);

    std::set<std::string> denied_keys_;
    std::optional<std::set<std::string>> allowed_keys_;
    FieldSchema field_schema_;
    std::size_t max_depth_;
};

/**
 * @brief Canonical deny-list only, no allow-list, no schema, default depth
 */
MergePolicy default_policy();

/**
 * @brief Build a policy from a policy document
 *
 * Missing members take their defaults. Unknown members, unknown type
 * names and wrongly typed members are collected and reported together.
 *
 * @throws PolicyError listing every problem found
 */
MergePolicy policy_from_json(const Value& doc);

/**
 * @brief Load a JSON or TOML policy document and build the policy
 *
 * @throws FileNotFoundError, DocumentParseError, PolicyError
 */
MergePolicy load_policy_file(const std::string& path);

} // namespace mergeguard

#endif // MERGEGUARD_POLICY_HPP
