/**
 * @file Settings.cpp
 * @brief Layered policy configuration
 */

#include "mergeguard/Settings.hpp"
#include "mergeguard/DotPath.hpp"
#include "mergeguard/Errors.hpp"
#include "mergeguard/Loader.hpp"
#include "mergeguard/Merge.hpp"
#include "mergeguard/Parse.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

#ifndef _WIN32
extern char** environ;
#endif

namespace mergeguard {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return s;
}

std::string join_segments(const std::vector<std::string>& segments, size_t from, size_t to,
                          char sep) {
    std::string out;
    for (size_t i = from; i < to; ++i) {
        if (i > from) out += sep;
        out += segments[i];
    }
    return out;
}

// The policy members of a settings document.
Value policy_document(const Value& settings) {
    Value doc = settings;
    doc.erase("log_level");
    return doc;
}

// Deny lists accumulate across layers: a later layer adds keys but never
// drops one that an earlier layer denied.
Value accumulated_denied_keys(const Value& defaults, const std::vector<Value>& layers) {
    Value keys = Value::array();
    auto collect = [&keys](const Value& layer) {
        auto it = layer.find("denied_keys");
        if (it == layer.end() || !it->is_array()) {
            return;
        }
        for (const auto& key : *it) {
            if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
                keys.push_back(key);
            }
        }
    };

    collect(defaults);
    for (const auto& layer : layers) {
        collect(layer);
    }
    return keys;
}

} // anonymous namespace

Value default_settings_document() {
    return {
        {"denied_keys", Value::array()},
        {"allowed_keys", nullptr},
        {"field_schema", Value::object()},
        {"max_depth", kDefaultMaxDepth},
        {"log_level", "warn"}
    };
}

const MergePolicy& settings_policy() {
    static const MergePolicy policy = build_policy(
        {},
        std::nullopt,
        {
            {"denied_keys", ValueKind::Sequence},
            {"allowed_keys", ValueKind::Sequence},
            {"field_schema", ValueKind::Mapping},
            {"max_depth", ValueKind::Number},
            {"log_level", ValueKind::String}
        },
        4);
    return policy;
}

std::string transform_env_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (size_t i = 0; i < name.size(); ++i) {
        const char c = name[i];
        if (c == '_' && i + 1 < name.size() && name[i + 1] == '_') {
            out += '_';
            ++i;
        } else if (c == '_') {
            out += '.';
        } else {
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

std::optional<std::string> remap_env_key(const std::string& dot_path, const Value& base) {
    const auto segments = split_dot_path(dot_path);
    if (segments.empty() || !base.is_object()) {
        return std::nullopt;
    }

    for (size_t i = segments.size(); i >= 1; --i) {
        const std::string head = join_segments(segments, 0, i, '_');
        auto it = base.find(head);
        if (it == base.end()) {
            continue;
        }
        if (i == segments.size()) {
            return head;
        }
        if (it->is_object()) {
            return head + "." + join_segments(segments, i, segments.size(), '_');
        }
    }
    return std::nullopt;
}

std::vector<std::pair<std::string, std::string>> collect_env_vars(const std::string& prefix) {
    std::vector<std::pair<std::string, std::string>> result;
    const std::string wanted = to_upper(prefix) + "_";

#ifndef _WIN32
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
        const std::string entry(*env);
        const auto eq = entry.find('=');
        if (eq == std::string::npos) continue;

        std::string name = entry.substr(0, eq);
        if (name.size() <= wanted.size() || to_upper(name.substr(0, wanted.size())) != wanted) {
            continue;
        }
        result.emplace_back(std::move(name), entry.substr(eq + 1));
    }
#endif

    std::sort(result.begin(), result.end());
    return result;
}

Value env_layer(const std::string& prefix, const Value& base) {
    Value layer = Value::object();
    const size_t strip = prefix.size() + 1;

    for (const auto& [name, raw] : collect_env_vars(prefix)) {
        const std::string dotted = transform_env_name(name.substr(strip));
        const auto key = remap_env_key(dotted, base);
        if (!key) {
            spdlog::debug("Ignoring environment variable {}: no setting named '{}'", name, dotted);
            continue;
        }
        set_by_dot(layer, *key, parse_value(raw));
    }
    return layer;
}

Settings::Settings(Value document)
    : document_(std::move(document))
    , policy_(policy_from_json(policy_document(document_)))
{}

Settings Settings::load(const LoadOptions& opts) {
    std::vector<Value> layers;

    if (opts.file_path) {
        layers.push_back(load_document(*opts.file_path));
    }

    if (opts.env_prefix && !opts.env_prefix->empty()) {
        Value env = env_layer(*opts.env_prefix, opts.defaults);
        if (!env.empty()) {
            layers.push_back(std::move(env));
        }
    }

    if (!opts.overrides.empty()) {
        Value overrides = Value::object();
        for (const auto& [path, value] : opts.overrides) {
            set_by_dot(overrides, path, value);
        }
        layers.push_back(std::move(overrides));
    }

    MergeOutcome outcome = merge_layers(opts.defaults, layers, settings_policy());
    if (outcome.is_rejected()) {
        std::vector<std::string> problems;
        for (const auto& v : outcome.violations()) {
            problems.push_back(v.dotted_path() + ": " + v.detail);
        }
        throw PolicyError(std::move(problems));
    }

    Value document = outcome.value();
    document["denied_keys"] = accumulated_denied_keys(opts.defaults, layers);
    return Settings(std::move(document));
}

std::string Settings::log_level() const {
    auto it = document_.find("log_level");
    if (it != document_.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "warn";
}

void apply_log_level(const std::string& level) {
    if (level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else if (level == "off") {
        spdlog::set_level(spdlog::level::off);
    } else {
        throw PolicyError("unknown log level '" + level + "'");
    }
}

} // namespace mergeguard
