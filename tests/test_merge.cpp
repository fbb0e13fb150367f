/**
 * @file test_merge.cpp
 * @brief Tests for the sanitizing merge
 */

#include <gtest/gtest.h>
#include "mergeguard/Ambient.hpp"
#include "mergeguard/Merge.hpp"

using namespace mergeguard;

namespace {

MergePolicy timeout_policy() {
    return build_policy({}, std::nullopt,
                        {{"timeout", ValueKind::Number}, {"retries", ValueKind::Number}});
}

} // namespace

// ============================================================================
// Clean merges
// ============================================================================

TEST(Merge, BothEmpty) {
    auto out = merge(Value::object(), Value::object(), default_policy());
    ASSERT_TRUE(out.is_merged());
    EXPECT_TRUE(out.value().is_object());
    EXPECT_TRUE(out.value().empty());
}

TEST(Merge, SourceReplacesScalarsAndAddsKeys) {
    Value target = {{"a", 1}, {"b", 2}};
    Value source = {{"b", 3}, {"c", 4}};
    auto out = merge(target, source, default_policy());
    ASSERT_TRUE(out.is_merged());
    EXPECT_EQ(out.value(), (Value{{"a", 1}, {"b", 3}, {"c", 4}}));
}

TEST(Merge, SettingsOverrideKeepsOtherFields) {
    Value target = {{"timeout", 30}, {"retries", 3}};
    auto out = merge(target, {{"timeout", 10}}, timeout_policy());
    ASSERT_TRUE(out.is_merged());
    EXPECT_EQ(out.value(), (Value{{"timeout", 10}, {"retries", 3}}));
}

TEST(Merge, NestedMappingsMerged) {
    Value target = {{"db", {{"host", "a"}, {"port", 1}}}};
    Value source = {{"db", {{"port", 2}}}};
    auto out = merge(target, source, default_policy());
    ASSERT_TRUE(out.is_merged());
    EXPECT_EQ(out.value()["db"]["host"], "a");
    EXPECT_EQ(out.value()["db"]["port"], 2);
    EXPECT_EQ(out.stats().containers_created, 0u);
}

TEST(Merge, MappingReplacesScalarThroughFactory) {
    Value target = {{"db", "string"}};
    Value source = {{"db", {{"host", "localhost"}}}};
    auto out = merge(target, source, default_policy());
    ASSERT_TRUE(out.is_merged());
    EXPECT_EQ(out.value()["db"], (Value{{"host", "localhost"}}));
    EXPECT_EQ(out.stats().containers_created, 1u);
}

TEST(Merge, ScalarReplacesMapping) {
    Value target = {{"db", {{"host", "a"}}}};
    auto out = merge(target, {{"db", 42}}, default_policy());
    ASSERT_TRUE(out.is_merged());
    EXPECT_EQ(out.value()["db"], 42);
}

TEST(Merge, NullIsWrittenLikeAnyScalar) {
    auto out = merge({{"a", 1}}, {{"a", nullptr}}, default_policy());
    ASSERT_TRUE(out.is_merged());
    EXPECT_TRUE(out.value()["a"].is_null());
}

TEST(Merge, SequenceReplacesTargetValue) {
    Value target = {{"items", {1, 2, 3}}};
    auto out = merge(target, {{"items", {4}}}, default_policy());
    ASSERT_TRUE(out.is_merged());
    EXPECT_EQ(out.value()["items"], Value::array({4}));
}

TEST(Merge, SequenceOfMappingsCopied) {
    Value source = Value::parse(R"({"items": [{"name": "x"}, [1, 2], "s"]})");
    auto out = merge(Value::object(), source, default_policy());
    ASSERT_TRUE(out.is_merged());
    EXPECT_EQ(out.value(), source);
}

TEST(Merge, CallerTargetIsNeverModified) {
    const Value target = {{"timeout", 30}};
    const Value before = target;
    auto out = merge(target, {{"timeout", 10}}, timeout_policy());
    ASSERT_TRUE(out.is_merged());
    EXPECT_EQ(target, before);
}

TEST(Merge, SameInputTwiceGivesEqualResults) {
    Value target = {{"db", {{"host", "a"}}}, {"timeout", 30}};
    Value source = Value::parse(R"({"db": {"port": 5432, "tags": ["x"]}, "timeout": 5})");
    Value copy_a = target;
    Value copy_b = target;
    auto first = merge(copy_a, source, timeout_policy());
    auto second = merge(copy_b, source, timeout_policy());
    ASSERT_TRUE(first.is_merged());
    ASSERT_TRUE(second.is_merged());
    EXPECT_EQ(first.value(), second.value());
}

// ============================================================================
// Forbidden keys
// ============================================================================

TEST(MergeForbidden, ProtoPayloadRejectedAndTargetUnchanged) {
    const Value target = {{"username", "alice"}};
    Value source = Value::parse(R"({"__proto__": {"isAdmin": true}})");
    auto out = merge(target, source, default_policy());

    ASSERT_TRUE(out.is_rejected());
    ASSERT_EQ(out.violations().size(), 1u);
    EXPECT_EQ(out.violations()[0].kind, ViolationKind::ForbiddenKey);
    EXPECT_EQ(out.violations()[0].dotted_path(), "__proto__");
    EXPECT_EQ(target, (Value{{"username", "alice"}}));
    EXPECT_TRUE(verify_ambient_clean({"isAdmin"}));
}

TEST(MergeForbidden, DeniedKeyAtDepthHasFullPath) {
    Value source = Value::parse(R"({"a": {"b": {"__proto__": {"x": 1}}}})");
    auto out = merge(Value::object(), source, default_policy());

    ASSERT_TRUE(out.is_rejected());
    ASSERT_EQ(out.violations().size(), 1u);
    const auto& v = out.violations()[0];
    EXPECT_EQ(v.kind, ViolationKind::ForbiddenKey);
    EXPECT_EQ(v.path, (std::vector<std::string>{"a", "b", "__proto__"}));
    EXPECT_EQ(v.dotted_path(), "a.b.__proto__");
}

TEST(MergeForbidden, ConstructorPrototypeRejectedWithoutDescent) {
    Value source = Value::parse(R"({"constructor": {"prototype": {"isAdmin": true}}})");
    auto out = merge(Value::object(), source, default_policy());

    ASSERT_TRUE(out.is_rejected());
    ASSERT_EQ(out.violations().size(), 1u);
    EXPECT_EQ(out.violations()[0].dotted_path(), "constructor");
}

TEST(MergeForbidden, CasingDoesNotMatter) {
    auto out = merge(Value::object(), {{"__PROTO__", 1}, {"Prototype", 2}}, default_policy());
    ASSERT_TRUE(out.is_rejected());
    EXPECT_EQ(out.violations().size(), 2u);
}

TEST(MergeForbidden, DeniedKeyInsideSequenceElement) {
    Value source = Value::parse(R"({"items": [{"name": "ok"}, {"constructor": {"prototype": {}}}]})");
    auto out = merge(Value::object(), source, default_policy());

    ASSERT_TRUE(out.is_rejected());
    ASSERT_EQ(out.violations().size(), 1u);
    EXPECT_EQ(out.violations()[0].dotted_path(), "items.1.constructor");
}

TEST(MergeForbidden, AllowListAppliesAtEveryDepth) {
    auto policy = build_policy({}, std::set<std::string>{"profile", "name"}, {});
    Value source = {{"profile", {{"name", "x"}, {"role", "admin"}}}};
    auto out = merge(Value::object(), source, policy);

    ASSERT_TRUE(out.is_rejected());
    ASSERT_EQ(out.violations().size(), 1u);
    EXPECT_EQ(out.violations()[0].dotted_path(), "profile.role");
    EXPECT_NE(out.violations()[0].detail.find("not in allow-list"), std::string::npos);
}

TEST(MergeForbidden, CallerDeniedKeysApply) {
    auto policy = build_policy({"isAdmin"}, std::nullopt, {});
    auto out = merge(Value::object(), {{"user", {{"isadmin", true}}}}, policy);
    ASSERT_TRUE(out.is_rejected());
    EXPECT_EQ(out.violations()[0].dotted_path(), "user.isadmin");
}

// ============================================================================
// Type mismatches
// ============================================================================

TEST(MergeTypes, StringForNumberRejectedWithoutPartialWrite) {
    const Value target = {{"timeout", 30}, {"retries", 3}};
    auto out = merge(target, {{"timeout", "CORRUPTED"}, {"retries", 5}}, timeout_policy());

    ASSERT_TRUE(out.is_rejected());
    ASSERT_EQ(out.violations().size(), 1u);
    EXPECT_EQ(out.violations()[0].kind, ViolationKind::TypeMismatch);
    EXPECT_EQ(out.violations()[0].dotted_path(), "timeout");
    EXPECT_EQ(target["timeout"], 30);
    EXPECT_EQ(target["retries"], 3);
}

TEST(MergeTypes, NumericStringIsNotCoerced) {
    auto out = merge({{"timeout", 30}}, {{"timeout", "10"}}, timeout_policy());
    ASSERT_TRUE(out.is_rejected());
    EXPECT_EQ(out.violations()[0].detail, "'timeout' must be number, got string");
}

TEST(MergeTypes, MappingForNumberRejected) {
    auto out = merge({{"timeout", 30}}, {{"timeout", {{"value", 1}}}}, timeout_policy());
    ASSERT_TRUE(out.is_rejected());
    EXPECT_EQ(out.violations()[0].kind, ViolationKind::TypeMismatch);
}

TEST(MergeTypes, NestedSchemaPath) {
    auto policy = build_policy({}, std::nullopt, {{"database.port", ValueKind::Number}});
    auto bad = merge(Value::object(), {{"database", {{"port", "5432"}}}}, policy);
    ASSERT_TRUE(bad.is_rejected());
    EXPECT_EQ(bad.violations()[0].dotted_path(), "database.port");

    auto good = merge(Value::object(), {{"database", {{"port", 5432}}}}, policy);
    EXPECT_TRUE(good.is_merged());
}

TEST(MergeTypes, BareKeyEntryAppliesAtAnyDepth) {
    auto nested = merge(Value::object(), Value::parse(R"({"server": {"timeout": "CORRUPTED"}})"),
                        timeout_policy());
    ASSERT_TRUE(nested.is_rejected());
    ASSERT_EQ(nested.violations().size(), 1u);
    EXPECT_EQ(nested.violations()[0].kind, ViolationKind::TypeMismatch);
    EXPECT_EQ(nested.violations()[0].dotted_path(), "server.timeout");

    auto in_sequence = merge(Value::object(), Value::parse(R"({"items": [{"timeout": true}]})"),
                             timeout_policy());
    ASSERT_TRUE(in_sequence.is_rejected());
    EXPECT_EQ(in_sequence.violations()[0].dotted_path(), "items.0.timeout");

    auto good = merge(Value::object(), Value::parse(R"({"server": {"timeout": 5}})"),
                      timeout_policy());
    EXPECT_TRUE(good.is_merged());
}

TEST(MergeTypes, DottedEntryWinsOverBareKey) {
    auto policy = build_policy({}, std::nullopt,
                               {{"port", ValueKind::Number}, {"proxy.port", ValueKind::String}});
    auto out = merge(Value::object(), Value::parse(R"({"proxy": {"port": "8080"}, "port": 80})"),
                     policy);
    EXPECT_TRUE(out.is_merged());
}

TEST(MergeTypes, UnschemaedFieldsPassThrough) {
    auto out = merge({{"timeout", 30}}, {{"label", 7}, {"flag", "yes"}}, timeout_policy());
    ASSERT_TRUE(out.is_merged());
    EXPECT_EQ(out.value()["label"], 7);
}

// ============================================================================
// Depth bound
// ============================================================================

TEST(MergeDepth, BranchBeyondLimitRejected) {
    auto policy = build_policy({}, std::nullopt, {}, 1);
    Value source = Value::parse(R"({"a": {"b": {"c": 1}}})");
    auto out = merge(Value::object(), source, policy);

    ASSERT_TRUE(out.is_rejected());
    ASSERT_EQ(out.violations().size(), 1u);
    EXPECT_EQ(out.violations()[0].kind, ViolationKind::DepthExceeded);
    EXPECT_EQ(out.violations()[0].dotted_path(), "a.b");
}

TEST(MergeDepth, SiblingsStillChecked) {
    auto policy = build_policy({}, std::nullopt, {}, 1);
    Value source = Value::parse(R"({"a": {"b": {"c": 1}}, "z": {"__proto__": 1}})");
    auto out = merge(Value::object(), source, policy);

    ASSERT_TRUE(out.is_rejected());
    ASSERT_EQ(out.violations().size(), 2u);
    EXPECT_EQ(out.violations()[0].kind, ViolationKind::DepthExceeded);
    EXPECT_EQ(out.violations()[1].kind, ViolationKind::ForbiddenKey);
    EXPECT_EQ(out.violations()[1].dotted_path(), "z.__proto__");
}

TEST(MergeDepth, WithinLimitAccepted) {
    auto policy = build_policy({}, std::nullopt, {}, 2);
    Value source = Value::parse(R"({"a": {"b": {"c": 1}}})");
    auto out = merge(Value::object(), source, policy);
    ASSERT_TRUE(out.is_merged());
    EXPECT_EQ(out.stats().deepest_level, 2u);
}

TEST(MergeDepth, DeeplyNestedSequencesBounded) {
    auto policy = build_policy({}, std::nullopt, {}, 3);
    Value deep = 1;
    for (int i = 0; i < 10; ++i) {
        deep = Value::array({deep});
    }
    auto out = merge(Value::object(), {{"x", deep}}, policy);
    ASSERT_TRUE(out.is_rejected());
    EXPECT_EQ(out.violations()[0].kind, ViolationKind::DepthExceeded);
}

// ============================================================================
// Aggregation and reporting
// ============================================================================

TEST(MergeReport, AllViolationsCollected) {
    Value source = Value::parse(
        R"({"__proto__": {}, "constructor": {}, "ok": 1, "timeout": "x"})");
    auto out = merge({{"timeout", 30}}, source, timeout_policy());

    ASSERT_TRUE(out.is_rejected());
    ASSERT_EQ(out.violations().size(), 3u);
    EXPECT_EQ(out.violations()[0].dotted_path(), "__proto__");
    EXPECT_EQ(out.violations()[1].dotted_path(), "constructor");
    EXPECT_EQ(out.violations()[2].kind, ViolationKind::TypeMismatch);
}

TEST(MergeReport, RejectedOutcomeHasNoValue) {
    auto out = merge(Value::object(), {{"__proto__", 1}}, default_policy());
    EXPECT_THROW(out.value(), std::logic_error);
}

TEST(MergeReport, JsonReport) {
    auto out = merge(Value::object(), Value::parse(R"({"a": {"prototype": 1}})"), default_policy());
    Value report = out.to_json();
    EXPECT_EQ(report["status"], "rejected");
    ASSERT_EQ(report["violations"].size(), 1u);
    EXPECT_EQ(report["violations"][0]["path"], "a.prototype");
    EXPECT_EQ(report["violations"][0]["kind"], "ForbiddenKey");
    EXPECT_EQ(report["violations"][0]["segments"], (Value{"a", "prototype"}));

    auto ok = merge(Value::object(), {{"a", 1}}, default_policy());
    EXPECT_EQ(ok.to_json(), (Value{{"status", "merged"}, {"result", {{"a", 1}}}}));
}

TEST(MergeReport, NonMappingRootRejected) {
    auto out = merge(Value::array(), {{"a", 1}}, default_policy());
    ASSERT_TRUE(out.is_rejected());
    EXPECT_TRUE(out.violations()[0].path.empty());

    auto out2 = merge(Value::object(), "text", default_policy());
    ASSERT_TRUE(out2.is_rejected());
    EXPECT_EQ(out2.violations()[0].kind, ViolationKind::TypeMismatch);
}

TEST(MergeReport, AdversarialMergesLeaveAmbientClean) {
    const char* payloads[] = {
        R"({"__proto__": {"isAdmin": true}})",
        R"({"constructor": {"prototype": {"isAdmin": true}}})",
        R"({"a": {"__proto__": {"timeout": "CORRUPTED"}}})",
        R"({"list": [{"__proto__": {"dangerousOption": "x"}}]})"
    };
    for (const char* payload : payloads) {
        auto out = merge(Value::object(), Value::parse(payload), default_policy());
        EXPECT_TRUE(out.is_rejected()) << payload;
    }
    EXPECT_TRUE(verify_ambient_clean({"isAdmin", "timeout", "dangerousOption"}));
    EXPECT_EQ(ambient().size(), 0u);
}

// ============================================================================
// merge_layers
// ============================================================================

TEST(MergeLayers, AppliedInOrder) {
    Value defaults = {{"a", 1}, {"b", {{"c", 2}}}};
    std::vector<Value> layers = {
        Value::parse(R"({"b": {"c": 3}})"),
        Value::parse(R"({"d": 4})"),
        Value::parse(R"({"a": 5})")
    };
    auto out = merge_layers(defaults, layers, default_policy());
    ASSERT_TRUE(out.is_merged());
    EXPECT_EQ(out.value(), (Value{{"a", 5}, {"b", {{"c", 3}}}, {"d", 4}}));
}

TEST(MergeLayers, NoLayersReturnsBase) {
    auto out = merge_layers({{"a", 1}}, {}, default_policy());
    ASSERT_TRUE(out.is_merged());
    EXPECT_EQ(out.value(), (Value{{"a", 1}}));
}

TEST(MergeLayers, EveryRejectedLayerReported) {
    std::vector<Value> layers = {
        Value::parse(R"({"__proto__": {"x": 1}})"),
        Value::parse(R"({"timeout": 5})"),
        Value::parse(R"({"timeout": "bad"})")
    };
    auto out = merge_layers({{"timeout", 30}}, layers, timeout_policy());

    ASSERT_TRUE(out.is_rejected());
    ASSERT_EQ(out.violations().size(), 2u);
    EXPECT_EQ(out.violations()[0].detail.rfind("layer 0: ", 0), 0u);
    EXPECT_EQ(out.violations()[1].detail.rfind("layer 2: ", 0), 0u);
}
