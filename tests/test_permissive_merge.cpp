/**
 * @file test_permissive_merge.cpp
 * @brief The legacy merge as a negative control
 *
 * Each test uses its own uninstalled namespace, so the pollution the
 * permissive merge causes stays local to the test.
 */

#include <gtest/gtest.h>
#include "mergeguard/Merge.hpp"
#include "mergeguard/PermissiveMerge.hpp"

using namespace mergeguard;

TEST(PermissiveMerge, BehavesLikeDeepMergeOnOrdinaryKeys) {
    AmbientNamespace ns;
    Value target = {{"db", {{"host", "a"}, {"port", 1}}}};
    const auto writes = permissive_merge(target, Value::parse(R"({"db": {"port": 2}, "x": [1]})"), ns);

    EXPECT_EQ(writes, 0u);
    EXPECT_EQ(target["db"]["host"], "a");
    EXPECT_EQ(target["db"]["port"], 2);
    EXPECT_EQ(target["x"], Value::array({1}));
    EXPECT_EQ(ns.size(), 0u);
}

TEST(PermissiveMerge, ProtoPayloadEscalatesPrivilege) {
    AmbientNamespace ns;
    Value profile = {{"username", "alice"}};
    const auto writes = permissive_merge(
        profile, Value::parse(R"({"__proto__": {"isAdmin": true, "role": "admin"}})"), ns);

    EXPECT_EQ(writes, 2u);
    EXPECT_FALSE(profile.contains("isAdmin"));

    // Any other mapping now inherits the flag.
    const Value fresh_user = Value::object();
    auto inherited = resolve_inherited(fresh_user, "isAdmin", ns);
    ASSERT_TRUE(inherited.has_value());
    EXPECT_EQ(*inherited, true);
    EXPECT_FALSE(ns.verify_clean({"isAdmin"}));
}

TEST(PermissiveMerge, ConstructorPrototypeReachesNamespace) {
    AmbientNamespace ns;
    Value target = Value::object();
    permissive_merge(target, Value::parse(R"({"constructor": {"prototype": {"isAdmin": true}}})"), ns);
    EXPECT_EQ(*ns.lookup("isAdmin"), true);
}

TEST(PermissiveMerge, TypeConfusionOfSharedSetting) {
    AmbientNamespace ns;
    Value body = Value::object();
    permissive_merge(body, Value::parse(R"({"__proto__": {"timeout": "CORRUPTED"}})"), ns);

    auto timeout = resolve_inherited(Value::object(), "timeout", ns);
    ASSERT_TRUE(timeout.has_value());
    EXPECT_TRUE(timeout->is_string());
}

TEST(PermissiveMerge, NestedAmbientObjectsMerged) {
    AmbientNamespace ns;
    Value target = Value::object();
    permissive_merge(target, Value::parse(R"({"__proto__": {"options": {"a": 1}}})"), ns);
    permissive_merge(target, Value::parse(R"({"__proto__": {"options": {"b": 2}}})"), ns);
    EXPECT_EQ(*ns.lookup("options"), (Value{{"a", 1}, {"b", 2}}));
}

TEST(PermissiveMerge, SanitizingMergeBlocksTheSamePayloads) {
    AmbientNamespace ns;
    const char* payloads[] = {
        R"({"__proto__": {"isAdmin": true}})",
        R"({"constructor": {"prototype": {"isAdmin": true}}})"
    };
    for (const char* payload : payloads) {
        Value legacy_target = Value::object();
        permissive_merge(legacy_target, Value::parse(payload), ns);

        auto out = merge(Value::object(), Value::parse(payload), default_policy());
        EXPECT_TRUE(out.is_rejected()) << payload;
    }
    EXPECT_FALSE(ns.verify_clean({"isAdmin"}));
    EXPECT_TRUE(verify_ambient_clean({"isAdmin"}));
}
