/**
 * @file KeyClassifier.hpp
 * @brief Per-key allow/deny decision
 */

#ifndef MERGEGUARD_KEY_CLASSIFIER_HPP
#define MERGEGUARD_KEY_CLASSIFIER_HPP

#include "mergeguard/Policy.hpp"
#include <string>

namespace mergeguard {

enum class KeyDisposition {
    Allowed,
    Denied
};

enum class DenyReason {
    None,
    DenyListed,     ///< Key matched the deny-list (case-insensitive)
    NotInAllowList  ///< An allow-list exists and the key is not on it
};

struct Classification {
    KeyDisposition disposition = KeyDisposition::Allowed;
    DenyReason reason = DenyReason::None;

    bool allowed() const noexcept { return disposition == KeyDisposition::Allowed; }
};

std::string to_string(KeyDisposition disposition);
std::string to_string(DenyReason reason);

/**
 * @brief Classify a key against a policy
 *
 * Pure function. The deny-list wins over the allow-list and applies the
 * same way at every nesting depth, so callers pass the bare key, never
 * its path.
 */
Classification classify(const std::string& key, const MergePolicy& policy);

} // namespace mergeguard

#endif // MERGEGUARD_KEY_CLASSIFIER_HPP
