/**
 * @file Policy.cpp
 * @brief Merge policy construction and policy documents
 */

#include "mergeguard/Policy.hpp"
#include "mergeguard/Errors.hpp"
#include "mergeguard/Loader.hpp"
#include "mergeguard/Parse.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <vector>

namespace mergeguard {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

// Reads a sequence of strings, reporting each bad element.
std::set<std::string> read_key_list(const Value& node, const std::string& member,
                                    std::vector<std::string>& problems) {
    std::set<std::string> keys;
    if (!node.is_array()) {
        problems.push_back("'" + member + "' must be a sequence of strings, got " + type_name(node));
        return keys;
    }
    for (size_t i = 0; i < node.size(); ++i) {
        if (!node[i].is_string()) {
            problems.push_back("'" + member + "[" + std::to_string(i) + "]' must be a string, got " +
                               type_name(node[i]));
            continue;
        }
        keys.insert(node[i].get<std::string>());
    }
    return keys;
}

} // anonymous namespace

const std::set<std::string>& canonical_denied_keys() {
    static const std::set<std::string> keys = {"__proto__", "constructor", "prototype"};
    return keys;
}

MergePolicy::MergePolicy(std::set<std::string> denied,
                         std::optional<std::set<std::string>> allowed,
                         FieldSchema schema,
                         std::size_t max_depth)
    : denied_keys_(std::move(denied))
    , allowed_keys_(std::move(allowed))
    , field_schema_(std::move(schema))
    , max_depth_(max_depth)
{}

bool MergePolicy::is_denied(const std::string& key) const {
    return denied_keys_.count(to_lower(key)) > 0;
}

bool MergePolicy::is_allowed(const std::string& key) const {
    return !allowed_keys_ || allowed_keys_->count(key) > 0;
}

std::optional<ExpectedType> MergePolicy::expected_type(const std::string& dotted_path) const {
    auto it = field_schema_.find(dotted_path);
    if (it == field_schema_.end()) {
        // fall back to the bare key name
        const auto dot = dotted_path.rfind('.');
        if (dot == std::string::npos) {
            return std::nullopt;
        }
        it = field_schema_.find(dotted_path.substr(dot + 1));
        if (it == field_schema_.end()) {
            return std::nullopt;
        }
    }
    return it->second;
}

Value MergePolicy::to_json() const {
    Value doc = Value::object();
    doc["denied_keys"] = Value(denied_keys_);
    if (allowed_keys_) {
        doc["allowed_keys"] = Value(*allowed_keys_);
    }
    Value schema = Value::object();
    for (const auto& [field, kind] : field_schema_) {
        schema[field] = kind_name(kind);
    }
    doc["field_schema"] = std::move(schema);
    doc["max_depth"] = max_depth_;
    return doc;
}

MergePolicy build_policy(const std::set<std::string>& denied,
                         std::optional<std::set<std::string>> allowed,
                         FieldSchema schema,
                         std::size_t max_depth) {
    std::vector<std::string> problems;

    if (max_depth == 0) {
        problems.push_back("max_depth must be at least 1");
    }

    std::set<std::string> deny = canonical_denied_keys();
    for (const auto& key : denied) {
        if (key.empty()) {
            problems.push_back("denied key must not be empty");
            continue;
        }
        deny.insert(to_lower(key));
    }

    if (allowed) {
        for (const auto& key : *allowed) {
            if (key.empty()) {
                problems.push_back("allowed key must not be empty");
            } else if (deny.count(to_lower(key))) {
                problems.push_back("allowed key '" + key + "' is also denied");
            }
        }
    }

    for (const auto& entry : schema) {
        if (entry.first.empty()) {
            problems.push_back("schema field name must not be empty");
        }
    }

    if (!problems.empty()) {
        throw PolicyError(std::move(problems));
    }

    return MergePolicy(std::move(deny), std::move(allowed), std::move(schema), max_depth);
}

MergePolicy default_policy() {
    return build_policy({}, std::nullopt, {});
}

MergePolicy policy_from_json(const Value& doc) {
    if (!doc.is_object()) {
        throw PolicyError("policy document must be a mapping, got " + type_name(doc));
    }

    std::vector<std::string> problems;
    std::set<std::string> denied;
    std::optional<std::set<std::string>> allowed;
    FieldSchema schema;
    std::size_t max_depth = kDefaultMaxDepth;

    for (const auto& entry : doc.items()) {
        const std::string& member = entry.key();
        const Value& node = entry.value();

        if (member == "denied_keys") {
            denied = read_key_list(node, member, problems);
        } else if (member == "allowed_keys") {
            if (!node.is_null()) {
                allowed = read_key_list(node, member, problems);
            }
        } else if (member == "field_schema") {
            if (!node.is_object()) {
                problems.push_back("'field_schema' must be a mapping, got " + type_name(node));
                continue;
            }
            for (const auto& field : node.items()) {
                const auto kind = field.value().is_string()
                    ? parse_kind(field.value().get<std::string>())
                    : std::nullopt;
                if (!kind) {
                    problems.push_back("'field_schema." + field.key() + "' has unknown type " +
                                       field.value().dump());
                    continue;
                }
                schema[field.key()] = *kind;
            }
        } else if (member == "max_depth") {
            if (!node.is_number_integer() || node.get<std::int64_t>() < 1) {
                problems.push_back("'max_depth' must be a positive integer, got " + node.dump());
                continue;
            }
            max_depth = static_cast<std::size_t>(node.get<std::int64_t>());
        } else {
            problems.push_back("unknown policy member '" + member + "'");
        }
    }

    if (!problems.empty()) {
        throw PolicyError(std::move(problems));
    }

    return build_policy(denied, std::move(allowed), std::move(schema), max_depth);
}

MergePolicy load_policy_file(const std::string& path) {
    return policy_from_json(load_document(path));
}

} // namespace mergeguard
