/**
 * @file Merge.cpp
 * @brief Implementation of the sanitizing deep merge
 */

#include "mergeguard/Merge.hpp"
#include "mergeguard/Ambient.hpp"
#include "mergeguard/ContainerFactory.hpp"
#include "mergeguard/DotPath.hpp"
#include "mergeguard/KeyClassifier.hpp"
#include "mergeguard/SchemaValidator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <string>

namespace mergeguard {

namespace {

/**
 * @brief Pushes a path segment for the lifetime of the scope
 */
class PathScope {
public:
    PathScope(std::vector<std::string>& path, std::string segment) : path_(path) {
        path_.push_back(std::move(segment));
    }
    ~PathScope() { path_.pop_back(); }

    PathScope(const PathScope&) = delete;
    PathScope& operator=(const PathScope&) = delete;

private:
    std::vector<std::string>& path_;
};

/**
 * @brief State of one merge call: current path, factory, findings
 */
class MergeWalk {
public:
    explicit MergeWalk(const MergePolicy& policy) : policy_(policy) {}

    void merge_mapping(Value& target, const Value& source, std::size_t depth);
    void fill_sequence(Value& target, const Value& source, std::size_t depth);

    // Used when the root itself is unusable.
    void reject_root(const std::string& detail) {
        record(ViolationKind::TypeMismatch, detail);
    }

    bool clean() const noexcept { return violations_.empty(); }

    MergeOutcome finish(Value merged) {
        stats_.containers_created = factory_.created();
        if (!violations_.empty()) {
            return MergeOutcome::rejected(std::move(violations_), stats_);
        }
        return MergeOutcome::merged(std::move(merged), stats_);
    }

private:
    bool depth_exceeded(std::size_t depth);
    void record(ViolationKind kind, std::string detail);

    const MergePolicy& policy_;
    ContainerFactory factory_;
    std::vector<std::string> path_;
    std::vector<Violation> violations_;
    MergeStats stats_;
};

void MergeWalk::record(ViolationKind kind, std::string detail) {
    spdlog::warn("Blocked {} at '{}': {}", to_string(kind), join_dot_path(path_), detail);
    violations_.push_back(Violation{path_, kind, std::move(detail)});
}

bool MergeWalk::depth_exceeded(std::size_t depth) {
    if (depth <= policy_.max_depth()) {
        stats_.deepest_level = std::max(stats_.deepest_level, depth);
        return false;
    }
    record(ViolationKind::DepthExceeded,
           "nesting depth " + std::to_string(depth) + " exceeds limit " +
           std::to_string(policy_.max_depth()));
    return true;
}

void MergeWalk::merge_mapping(Value& target, const Value& source, std::size_t depth) {
    if (depth_exceeded(depth)) {
        return;
    }

    // items() yields the entries the source holds itself, nothing else.
    for (const auto& entry : source.items()) {
        const std::string& key = entry.key();
        const Value& value = entry.value();
        PathScope scope(path_, key);

        const Classification verdict = classify(key, policy_);
        if (!verdict.allowed()) {
            record(ViolationKind::ForbiddenKey, "key '" + key + "' is " + to_string(verdict.reason));
            continue;
        }

        if (auto mismatch = validate_at(path_, value, policy_)) {
            record(ViolationKind::TypeMismatch, mismatch->describe());
            continue;
        }

        if (value.is_object()) {
            Value& slot = target[key];
            if (!slot.is_object()) {
                slot = factory_.new_mapping();
            }
            merge_mapping(slot, value, depth + 1);
        } else if (value.is_array()) {
            Value fresh = factory_.new_sequence();
            fill_sequence(fresh, value, depth + 1);
            target[key] = std::move(fresh);
        } else {
            target[key] = value;
            ++stats_.keys_written;
        }
    }
}

void MergeWalk::fill_sequence(Value& target, const Value& source, std::size_t depth) {
    if (depth_exceeded(depth)) {
        return;
    }

    for (std::size_t i = 0; i < source.size(); ++i) {
        const Value& element = source[i];
        PathScope scope(path_, std::to_string(i));

        if (element.is_object()) {
            Value fresh = factory_.new_mapping();
            merge_mapping(fresh, element, depth + 1);
            target.push_back(std::move(fresh));
        } else if (element.is_array()) {
            Value fresh = factory_.new_sequence();
            fill_sequence(fresh, element, depth + 1);
            target.push_back(std::move(fresh));
        } else {
            target.push_back(element);
            ++stats_.keys_written;
        }
    }
}

void warn_if_unguarded() {
    static std::atomic<bool> warned{false};
    if (!ambient().installed() && !warned.exchange(true)) {
        spdlog::warn("merge() called before install_ambient_guard(); "
                     "the ambient namespace is still writable");
    }
}

} // anonymous namespace

MergeOutcome merge(const Value& target, const Value& source, const MergePolicy& policy) {
    warn_if_unguarded();

    MergeWalk walk(policy);
    if (!target.is_object()) {
        walk.reject_root("merge target must be a mapping, got " + type_name(target));
    }
    if (!source.is_object()) {
        walk.reject_root("merge source must be a mapping, got " + type_name(source));
    }
    if (!walk.clean()) {
        return walk.finish(Value());
    }

    Value result = target;
    walk.merge_mapping(result, source, 0);

    MergeOutcome outcome = walk.finish(std::move(result));
    spdlog::debug("merge {}: {} key(s) written, {} container(s) created, depth {}",
                  outcome.is_merged() ? "accepted" : "rejected",
                  outcome.stats().keys_written,
                  outcome.stats().containers_created,
                  outcome.stats().deepest_level);
    return outcome;
}

MergeOutcome merge_layers(const Value& base, const std::vector<Value>& layers,
                          const MergePolicy& policy) {
    Value current = base;
    std::vector<Violation> violations;
    MergeStats totals;

    for (std::size_t i = 0; i < layers.size(); ++i) {
        MergeOutcome step = merge(current, layers[i], policy);
        totals.keys_written += step.stats().keys_written;
        totals.containers_created += step.stats().containers_created;
        totals.deepest_level = std::max(totals.deepest_level, step.stats().deepest_level);

        if (step.is_merged()) {
            current = step.value();
            continue;
        }
        for (const auto& v : step.violations()) {
            violations.push_back(Violation{v.path, v.kind,
                                           "layer " + std::to_string(i) + ": " + v.detail});
        }
    }

    if (!violations.empty()) {
        return MergeOutcome::rejected(std::move(violations), totals);
    }
    if (!current.is_object()) {
        return MergeOutcome::rejected(
            {Violation{{}, ViolationKind::TypeMismatch,
                       "merge target must be a mapping, got " + type_name(current)}},
            totals);
    }
    return MergeOutcome::merged(std::move(current), totals);
}

} // namespace mergeguard
