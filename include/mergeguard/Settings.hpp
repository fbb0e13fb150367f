/**
 * @file Settings.hpp
 * @brief Layered policy configuration
 *
 * Precedence (lowest to highest):
 * 1. Built-in defaults (default_settings_document())
 * 2. Policy file (JSON or TOML)
 * 3. Environment variables with the configured prefix
 * 4. Explicit overrides (dot-path → value)
 *
 * Every layer is applied with the sanitizing merge() under a fixed
 * settings policy, so a hostile file or environment cannot pollute the
 * configuration any more than a request body can pollute data.
 *
 * denied_keys is the exception to replace-by-layer: the effective list is
 * the union of every layer's list. Other sequences are replaced.
 *
 * Environment names map with the underscore rule, then are matched
 * against the keys the defaults define:
 * - MERGEGUARD_MAX_DEPTH → max_depth
 * - MERGEGUARD_FIELD_SCHEMA_TIMEOUT → field_schema.timeout
 * - MERGEGUARD_LOG__LEVEL → log_level
 */

#ifndef MERGEGUARD_SETTINGS_HPP
#define MERGEGUARD_SETTINGS_HPP

#include "mergeguard/Outcome.hpp"
#include "mergeguard/Policy.hpp"
#include "mergeguard/Value.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace mergeguard {

/**
 * @brief Policy document plus "log_level", with every member present
 */
Value default_settings_document();

/**
 * @brief Policy used to merge configuration layers
 */
const MergePolicy& settings_policy();

/**
 * @brief Transform an environment variable name (prefix already removed)
 *
 * Lower-cases, then "__" → "_" and "_" → ".":
 * - MAX_DEPTH → max.depth
 * - FIELD__SCHEMA_TIMEOUT → field_schema.timeout
 */
std::string transform_env_name(const std::string& name);

/**
 * @brief Match a transformed env path against the keys defined in base
 *
 * Adjacent segments are rejoined with "_" until they name an existing
 * member: "max.depth" → "max_depth", "field.schema.timeout" →
 * "field_schema.timeout" (the tail under a mapping member is kept as one
 * key).
 *
 * @return Remapped dot-path, or nullopt if nothing in base matches
 */
std::optional<std::string> remap_env_key(const std::string& dot_path, const Value& base);

/**
 * @brief Collect NAME=VALUE pairs whose name starts with "<prefix>_"
 *        (case-insensitive)
 */
std::vector<std::pair<std::string, std::string>> collect_env_vars(const std::string& prefix);

/**
 * @brief Build the nested environment layer for a prefix
 *
 * Unmatched variables are skipped and logged at debug level.
 */
Value env_layer(const std::string& prefix, const Value& base);

/**
 * @brief Options for Settings::load()
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> env_prefix = std::string("MERGEGUARD");
    std::map<std::string, Value> overrides;  ///< dot-path → value, final precedence
    Value defaults = default_settings_document();
};

/**
 * @brief Resolved configuration: the effective policy and log level
 */
class Settings {
public:
    /**
     * @brief Load and layer all configuration sources
     *
     * @throws FileNotFoundError, DocumentParseError for the policy file
     * @throws PolicyError if any layer is rejected or the result is not a
     *         valid policy
     */
    static Settings load(const LoadOptions& opts);

    explicit Settings(Value document);

    const Value& document() const noexcept { return document_; }

    /// The effective merge policy
    const MergePolicy& policy() const noexcept { return policy_; }

    std::string log_level() const;

private:
    Value document_;
    MergePolicy policy_;
};

/**
 * @brief Apply a log level name ("debug", "info", "warn", "error", "off")
 *        to spdlog's default logger
 *
 * @throws PolicyError for unknown names
 */
void apply_log_level(const std::string& level);

} // namespace mergeguard

#endif // MERGEGUARD_SETTINGS_HPP
