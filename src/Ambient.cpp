/**
 * @file Ambient.cpp
 * @brief Ambient namespace and guard implementation
 */

#include "mergeguard/Ambient.hpp"
#include "mergeguard/Errors.hpp"
#include "mergeguard/Policy.hpp"

#include <spdlog/spdlog.h>

namespace mergeguard {

void AmbientNamespace::install() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (installed_.load(std::memory_order_relaxed)) {
        return;
    }
    if (!slots_.empty()) {
        spdlog::warn("Ambient namespace already holds {} slot(s) at install: {}",
                     slots_.size(), slots_.dump());
    }
    installed_.store(true, std::memory_order_release);
    spdlog::info("Ambient namespace frozen");
}

void AmbientNamespace::set(const std::string& key, Value value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (installed_.load(std::memory_order_relaxed)) {
        spdlog::error("Blocked write to frozen ambient namespace: '{}'", key);
        throw AmbientFrozenError(key);
    }
    slots_[key] = std::move(value);
}

void AmbientNamespace::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (installed_.load(std::memory_order_relaxed)) {
        spdlog::error("Blocked erase on frozen ambient namespace: '{}'", key);
        throw AmbientFrozenError(key);
    }
    slots_.erase(key);
}

std::optional<Value> AmbientNamespace::lookup(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    if (it == slots_.end()) {
        return std::nullopt;
    }
    return *it;
}

bool AmbientNamespace::verify_clean(const std::set<std::string>& keys) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& slot : slots_.items()) {
        const bool named = canonical_denied_keys().count(slot.key()) > 0 ||
                           keys.count(slot.key()) > 0;
        if (named) {
            spdlog::error("Ambient namespace slot '{}' (denied name) is set to {}",
                          slot.key(), slot.value().dump());
        } else {
            spdlog::warn("Ambient namespace slot '{}' is set to {}",
                         slot.key(), slot.value().dump());
        }
    }
    return slots_.empty();
}

std::size_t AmbientNamespace::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

Value AmbientNamespace::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_;
}

AmbientNamespace& ambient() {
    static AmbientNamespace instance;
    return instance;
}

void install_ambient_guard() {
    ambient().install();
}

bool verify_ambient_clean(const std::set<std::string>& keys) {
    return ambient().verify_clean(keys);
}

std::optional<Value> resolve_inherited(const Value& mapping, const std::string& key,
                                       const AmbientNamespace& ns) {
    if (mapping.is_object()) {
        auto it = mapping.find(key);
        if (it != mapping.end()) {
            return *it;
        }
    }
    return ns.lookup(key);
}

} // namespace mergeguard
