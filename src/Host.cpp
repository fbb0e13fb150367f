/**
 * @file Host.cpp
 * @brief Transport-free request handlers built on merge()
 */

#include "mergeguard/Host.hpp"
#include "mergeguard/DotPath.hpp"
#include "mergeguard/Merge.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>

namespace mergeguard {

namespace {

std::string escape_html(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c; break;
        }
    }
    return out;
}

Response error_response(int status, const std::string& error) {
    return Response{status, {{"error", error}}};
}

// Integers stay integers while the product fits in int64; anything larger
// is computed in double.
Value to_millis(const Value& seconds) {
    constexpr std::int64_t kLimit = std::numeric_limits<std::int64_t>::max() / 1000;
    if (seconds.is_number_unsigned()) {
        const auto v = seconds.get<std::uint64_t>();
        if (v <= static_cast<std::uint64_t>(kLimit)) {
            return static_cast<std::int64_t>(v) * 1000;
        }
    } else if (seconds.is_number_integer()) {
        const auto v = seconds.get<std::int64_t>();
        if (v >= -kLimit && v <= kLimit) {
            return v * 1000;
        }
    }
    return seconds.get<double>() * 1000.0;
}

} // anonymous namespace

Response rejection_response(const MergeOutcome& outcome, const std::string& error) {
    Value details = Value::array();
    for (const auto& v : outcome.violations()) {
        details.push_back(v.to_json());
    }
    return Response{400, {{"error", error}, {"details", std::move(details)}}};
}

ProfileStore::ProfileStore()
    : ProfileStore(Value{
          {"alice", {{"username", "alice"}, {"role", "user"}}},
          {"bob", {{"username", "bob"}, {"role", "user"}}}
      })
{}

ProfileStore::ProfileStore(Value users) : users_(std::move(users)) {
    if (!users_.is_object()) {
        users_ = Value::object();
    }
}

const MergePolicy& ProfileStore::profile_policy() {
    static const MergePolicy policy = build_policy(
        {},
        std::set<std::string>{"displayName", "email", "bio", "avatar"},
        {
            {"displayName", ValueKind::String},
            {"email", ValueKind::String},
            {"bio", ValueKind::String},
            {"avatar", ValueKind::String}
        },
        1);
    return policy;
}

Response ProfileStore::update_profile(const std::string& username, const Value& updates) {
    auto it = users_.find(username);
    if (username.empty() || it == users_.end()) {
        return error_response(404, "User not found");
    }
    if (!updates.is_object()) {
        return error_response(400, "Profile updates must be a mapping");
    }

    MergeOutcome outcome = merge(*it, updates, profile_policy());
    if (outcome.is_rejected()) {
        spdlog::warn("Rejected profile update for '{}' ({} violation(s))",
                     username, outcome.violations().size());
        return rejection_response(outcome, "Invalid input");
    }

    *it = outcome.value();
    return Response{200, {{"message", "Profile updated"}, {"user", *it}}};
}

Response ProfileStore::admin_check(const std::string& username) const {
    auto it = users_.find(username);
    if (it != users_.end() && it->is_object()) {
        auto role = it->find("role");
        if (role != it->end() && *role == "admin") {
            return Response{200, {{"access", "GRANTED"}, {"message", "Welcome, Admin!"}}};
        }
    }
    return Response{403, {{"access", "DENIED"}, {"message", "You are not an admin."}}};
}

Value default_settings() {
    return {{"timeout", 30}, {"retries", 3}, {"debug", false}};
}

const MergePolicy& settings_update_policy() {
    static const MergePolicy policy = build_policy(
        {},
        std::nullopt,
        {
            {"timeout", ValueKind::Number},
            {"retries", ValueKind::Number},
            {"debug", ValueKind::Boolean}
        },
        4);
    return policy;
}

Response apply_settings(const Value& body) {
    MergeOutcome outcome = merge(default_settings(), body, settings_update_policy());
    if (outcome.is_rejected()) {
        return rejection_response(outcome, "Invalid settings");
    }

    // timeout passed the schema, so it is a number
    const Value millis = to_millis(*get_by_dot(outcome.value(), "timeout"));

    return Response{200, {{"message", "Settings applied"}, {"timeout", millis}}};
}

Response render_template(const std::string& name) {
    const std::string page = name.empty() ? "index" : name;
    return Response{200, Value("<html><body><h1>Page: " + escape_html(page) + "</h1></body></html>")};
}

} // namespace mergeguard
