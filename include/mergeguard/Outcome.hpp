/**
 * @file Outcome.hpp
 * @brief Violation records and the merged/rejected outcome of a merge
 */

#ifndef MERGEGUARD_OUTCOME_HPP
#define MERGEGUARD_OUTCOME_HPP

#include "mergeguard/Value.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace mergeguard {

enum class ViolationKind {
    ForbiddenKey,    ///< Deny-listed key, or key missing from the allow-list
    TypeMismatch,    ///< Schema-governed field held the wrong runtime type
    DepthExceeded,   ///< Nesting passed the policy's max_depth
    StructuralCycle  ///< Reserved for hosts whose values can alias; never produced for Value trees
};

/// "ForbiddenKey", "TypeMismatch", "DepthExceeded", "StructuralCycle"
std::string to_string(ViolationKind kind);

/**
 * @brief One rejected key or branch
 */
struct Violation {
    std::vector<std::string> path;  ///< Segments from the merge root
    ViolationKind kind;
    std::string detail;

    /// Path joined with dots, "" for the root
    std::string dotted_path() const;

    /// {"path": "a.b", "segments": [...], "kind": "...", "detail": "..."}
    Value to_json() const;
};

/**
 * @brief Counters collected during one merge
 */
struct MergeStats {
    std::size_t keys_written = 0;        ///< Scalar leaves assigned
    std::size_t containers_created = 0;  ///< Containers from the ContainerFactory
    std::size_t deepest_level = 0;       ///< Deepest mapping level visited
};

/**
 * @brief Either Merged(value) or Rejected(violations)
 *
 * A rejected outcome never carries a partially merged value.
 */
class MergeOutcome {
public:
    static MergeOutcome merged(Value value, MergeStats stats = {});
    static MergeOutcome rejected(std::vector<Violation> violations, MergeStats stats = {});

    bool is_merged() const noexcept { return violations_.empty(); }
    bool is_rejected() const noexcept { return !violations_.empty(); }

    /**
     * @brief The merged value
     * @throws std::logic_error if the outcome is rejected
     */
    const Value& value() const;

    const std::vector<Violation>& violations() const noexcept { return violations_; }
    const MergeStats& stats() const noexcept { return stats_; }

    /**
     * @brief Report suitable for a host's response body
     *
     * Merged:   {"status": "merged", "result": {...}}
     * Rejected: {"status": "rejected", "violations": [{...}, ...]}
     */
    Value to_json() const;

private:
    MergeOutcome(Value value, std::vector<Violation> violations, MergeStats stats);

    Value value_;
    std::vector<Violation> violations_;
    MergeStats stats_;
};

} // namespace mergeguard

#endif // MERGEGUARD_OUTCOME_HPP
