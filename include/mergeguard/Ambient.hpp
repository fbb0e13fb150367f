/**
 * @file Ambient.hpp
 * @brief The ambient namespace and its guard
 *
 * Some host object models give every mapping an implicit, process-wide
 * parent that lookups fall back to. mergeguard models that parent as an
 * explicit AmbientNamespace: a mapping of slots that can be frozen once
 * at startup and probed afterwards.
 *
 * Value trees themselves never link to the namespace. The only way to
 * read through it is resolve_inherited(), which host code (and the
 * permissive merge) use on purpose.
 *
 * Lifecycle:
 * 1. Host startup calls install_ambient_guard() before any merge.
 * 2. Any later set()/erase() throws AmbientFrozenError.
 * 3. Health checks call verify_ambient_clean() at any time.
 */

#ifndef MERGEGUARD_AMBIENT_HPP
#define MERGEGUARD_AMBIENT_HPP

#include "mergeguard/Value.hpp"
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace mergeguard {

class AmbientNamespace {
public:
    AmbientNamespace() = default;
    AmbientNamespace(const AmbientNamespace&) = delete;
    AmbientNamespace& operator=(const AmbientNamespace&) = delete;

    /**
     * @brief Freeze the namespace. Idempotent.
     */
    void install();

    bool installed() const noexcept { return installed_.load(std::memory_order_acquire); }

    /**
     * @brief Write a slot
     * @throws AmbientFrozenError once install() has run
     */
    void set(const std::string& key, Value value);

    /**
     * @brief Remove a slot
     * @throws AmbientFrozenError once install() has run
     */
    void erase(const std::string& key);

    /// Current value of a slot, if set
    std::optional<Value> lookup(const std::string& key) const;

    /**
     * @brief Read-only diagnostic
     *
     * Every slot counts as pollution. Slots named by @p keys or by the
     * canonical denied keys are logged at error level, the rest at warn.
     *
     * @return true if the namespace holds no slot at all
     */
    bool verify_clean(const std::set<std::string>& keys = {}) const;

    std::size_t size() const;

    /// Copy of all slots as a mapping
    Value snapshot() const;

private:
    mutable std::mutex mutex_;
    std::atomic<bool> installed_{false};
    Value slots_ = Value::object();
};

/**
 * @brief The process-wide namespace
 */
AmbientNamespace& ambient();

/**
 * @brief Install the guard on the process-wide namespace. Idempotent.
 *
 * Must run under the host's startup ordering, before concurrent merges.
 */
void install_ambient_guard();

/**
 * @brief verify_clean() on the process-wide namespace
 */
bool verify_ambient_clean(const std::set<std::string>& keys = {});

/**
 * @brief Host-model lookup: own entry first, then the ambient namespace
 *
 * This is the chain-following lookup that makes ambient pollution
 * dangerous. Security decisions must use own entries only.
 *
 * @param mapping The mapping to look in (non-mappings have no own entries)
 */
std::optional<Value> resolve_inherited(const Value& mapping, const std::string& key,
                                       const AmbientNamespace& ns);

} // namespace mergeguard

#endif // MERGEGUARD_AMBIENT_HPP
