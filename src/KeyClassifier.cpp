/**
 * @file KeyClassifier.cpp
 * @brief Implementation of key classification
 */

#include "mergeguard/KeyClassifier.hpp"

namespace mergeguard {

std::string to_string(KeyDisposition disposition) {
    return disposition == KeyDisposition::Allowed ? "allowed" : "denied";
}

std::string to_string(DenyReason reason) {
    switch (reason) {
        case DenyReason::None: return "none";
        case DenyReason::DenyListed: return "deny-listed";
        case DenyReason::NotInAllowList: return "not in allow-list";
    }
    return "unknown";
}

Classification classify(const std::string& key, const MergePolicy& policy) {
    if (policy.is_denied(key)) {
        return {KeyDisposition::Denied, DenyReason::DenyListed};
    }
    if (!policy.is_allowed(key)) {
        return {KeyDisposition::Denied, DenyReason::NotInAllowList};
    }
    return {KeyDisposition::Allowed, DenyReason::None};
}

} // namespace mergeguard
