/**
 * @file Outcome.cpp
 * @brief Violation and MergeOutcome implementation
 */

#include "mergeguard/Outcome.hpp"
#include "mergeguard/DotPath.hpp"

#include <stdexcept>

namespace mergeguard {

std::string to_string(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::ForbiddenKey: return "ForbiddenKey";
        case ViolationKind::TypeMismatch: return "TypeMismatch";
        case ViolationKind::DepthExceeded: return "DepthExceeded";
        case ViolationKind::StructuralCycle: return "StructuralCycle";
    }
    return "Unknown";
}

std::string Violation::dotted_path() const {
    return join_dot_path(path);
}

Value Violation::to_json() const {
    return {
        {"path", dotted_path()},
        {"segments", path},
        {"kind", to_string(kind)},
        {"detail", detail}
    };
}

MergeOutcome::MergeOutcome(Value value, std::vector<Violation> violations, MergeStats stats)
    : value_(std::move(value))
    , violations_(std::move(violations))
    , stats_(stats)
{}

MergeOutcome MergeOutcome::merged(Value value, MergeStats stats) {
    return MergeOutcome(std::move(value), {}, stats);
}

MergeOutcome MergeOutcome::rejected(std::vector<Violation> violations, MergeStats stats) {
    if (violations.empty()) {
        throw std::logic_error("a rejected merge outcome needs at least one violation");
    }
    return MergeOutcome(Value(), std::move(violations), stats);
}

const Value& MergeOutcome::value() const {
    if (is_rejected()) {
        throw std::logic_error("rejected merge outcome has no value");
    }
    return value_;
}

Value MergeOutcome::to_json() const {
    if (is_merged()) {
        return {{"status", "merged"}, {"result", value_}};
    }
    Value list = Value::array();
    for (const auto& v : violations_) {
        list.push_back(v.to_json());
    }
    return {{"status", "rejected"}, {"violations", std::move(list)}};
}

} // namespace mergeguard
