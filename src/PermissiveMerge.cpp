/**
 * @file PermissiveMerge.cpp
 * @brief The unsanitized legacy merge
 */

#include "mergeguard/PermissiveMerge.hpp"

#include <spdlog/spdlog.h>

namespace mergeguard {

namespace {

std::size_t merge_into(Value& target, const Value& source, AmbientNamespace& ns);

// Writes every entry of source onto the shared ancestor itself.
std::size_t merge_into_ambient(const Value& source, AmbientNamespace& ns) {
    std::size_t writes = 0;
    for (const auto& entry : source.items()) {
        const Value& value = entry.value();
        if (value.is_object()) {
            Value slot = ns.lookup(entry.key()).value_or(Value::object());
            if (!slot.is_object()) {
                slot = Value::object();
            }
            writes += merge_into(slot, value, ns);
            ns.set(entry.key(), std::move(slot));
        } else {
            ns.set(entry.key(), value);
        }
        ++writes;
        spdlog::debug("permissive merge wrote ambient slot '{}'", entry.key());
    }
    return writes;
}

std::size_t merge_into(Value& target, const Value& source, AmbientNamespace& ns) {
    std::size_t writes = 0;
    for (const auto& entry : source.items()) {
        const std::string& key = entry.key();
        const Value& value = entry.value();

        if (value.is_object() && key == "__proto__") {
            // target.__proto__ resolves to the shared ancestor
            writes += merge_into_ambient(value, ns);
            continue;
        }

        if (value.is_object() && key == "constructor") {
            // target.constructor.prototype is the shared ancestor as well
            Value rest = Value::object();
            for (const auto& inner : value.items()) {
                if (inner.key() == "prototype" && inner.value().is_object()) {
                    writes += merge_into_ambient(inner.value(), ns);
                } else {
                    rest[inner.key()] = inner.value();
                }
            }
            if (!rest.empty()) {
                Value& slot = target[key];
                if (!slot.is_object()) {
                    slot = Value::object();
                }
                writes += merge_into(slot, rest, ns);
            }
            continue;
        }

        if (value.is_object()) {
            Value& slot = target[key];
            if (!slot.is_object()) {
                slot = Value::object();
            }
            writes += merge_into(slot, value, ns);
        } else {
            target[key] = value;
        }
    }
    return writes;
}

} // anonymous namespace

std::size_t permissive_merge(Value& target, const Value& source, AmbientNamespace& ns) {
    if (!target.is_object()) {
        target = Value::object();
    }
    if (!source.is_object()) {
        return 0;
    }
    return merge_into(target, source, ns);
}

} // namespace mergeguard
