/**
 * @file test_parse.cpp
 * @brief Unit tests for string parsing helpers (GoogleTest)
 *
 * parse_value() types environment and command line strings; the list and
 * schema helpers feed the --deny, --allow and --schema options.
 */

#include <gtest/gtest.h>
#include "mergeguard/Errors.hpp"
#include "mergeguard/Parse.hpp"

using namespace mergeguard;

// ============================================================================
// parse_value
// ============================================================================

TEST(ParseValue, Booleans) {
    EXPECT_EQ(parse_value("true"), true);
    EXPECT_EQ(parse_value("FALSE"), false);
    // "1" and "0" stay integers
    EXPECT_EQ(parse_value("1"), 1);
    EXPECT_EQ(parse_value("0"), 0);
}

TEST(ParseValue, Null) {
    EXPECT_TRUE(parse_value("null").is_null());
    EXPECT_TRUE(parse_value("Null").is_null());
}

TEST(ParseValue, Integers) {
    EXPECT_EQ(parse_value("42"), 42);
    EXPECT_EQ(parse_value("-17"), -17);
    EXPECT_TRUE(parse_value("007").is_number_integer());
    EXPECT_EQ(parse_value("007"), 7);
}

TEST(ParseValue, IntegerOverflowStaysString) {
    Value v = parse_value("99999999999999999999999");
    ASSERT_TRUE(v.is_string());
    EXPECT_EQ(v, "99999999999999999999999");
}

TEST(ParseValue, Floats) {
    EXPECT_DOUBLE_EQ(parse_value("3.14").get<double>(), 3.14);
    EXPECT_DOUBLE_EQ(parse_value("-0.5").get<double>(), -0.5);
    EXPECT_DOUBLE_EQ(parse_value("1.5e-3").get<double>(), 1.5e-3);
}

TEST(ParseValue, Compound) {
    Value arr = parse_value(R"(["a", "b"])");
    ASSERT_TRUE(arr.is_array());
    EXPECT_EQ(arr.size(), 2u);

    Value obj = parse_value(R"({"timeout": "number"})");
    ASSERT_TRUE(obj.is_object());
    EXPECT_EQ(obj["timeout"], "number");
}

TEST(ParseValue, MalformedCompoundStaysString) {
    EXPECT_EQ(parse_value("[1, 2"), "[1, 2");
    EXPECT_EQ(parse_value("{not json}"), "{not json}");
}

TEST(ParseValue, QuotedString) {
    EXPECT_EQ(parse_value(R"("42")"), "42");
    EXPECT_TRUE(parse_value(R"("42")").is_string());
}

TEST(ParseValue, PlainStrings) {
    EXPECT_EQ(parse_value(""), "");
    EXPECT_EQ(parse_value("debug"), "debug");
    EXPECT_EQ(parse_value("1.2.3"), "1.2.3");
}

// ============================================================================
// parse_kind
// ============================================================================

TEST(ParseKind, CanonicalNames) {
    EXPECT_EQ(parse_kind("null"), ValueKind::Null);
    EXPECT_EQ(parse_kind("boolean"), ValueKind::Boolean);
    EXPECT_EQ(parse_kind("number"), ValueKind::Number);
    EXPECT_EQ(parse_kind("string"), ValueKind::String);
    EXPECT_EQ(parse_kind("sequence"), ValueKind::Sequence);
    EXPECT_EQ(parse_kind("mapping"), ValueKind::Mapping);
}

TEST(ParseKind, AliasesAndCase) {
    EXPECT_EQ(parse_kind("Array"), ValueKind::Sequence);
    EXPECT_EQ(parse_kind("OBJECT"), ValueKind::Mapping);
    EXPECT_EQ(parse_kind(" bool "), ValueKind::Boolean);
    EXPECT_EQ(parse_kind("integer"), ValueKind::Number);
}

TEST(ParseKind, Unknown) {
    EXPECT_FALSE(parse_kind("date").has_value());
    EXPECT_FALSE(parse_kind("").has_value());
}

// ============================================================================
// Option lists
// ============================================================================

TEST(ParseKeyList, TrimsAndSkipsEmpty) {
    auto keys = parse_key_list(" secret, token ,,password ");
    EXPECT_EQ(keys, (std::set<std::string>{"password", "secret", "token"}));
    EXPECT_TRUE(parse_key_list("").empty());
}

TEST(ParseSchemaList, Entries) {
    auto schema = parse_schema_list("timeout:number, debug:boolean,database.port:number");
    EXPECT_EQ(schema.size(), 3u);
    EXPECT_EQ(schema.at("timeout"), ValueKind::Number);
    EXPECT_EQ(schema.at("debug"), ValueKind::Boolean);
    EXPECT_EQ(schema.at("database.port"), ValueKind::Number);
}

TEST(ParseSchemaList, MalformedEntries) {
    try {
        parse_schema_list("timeout, :number, retries:whole");
        FAIL() << "expected PolicyError";
    } catch (const PolicyError& e) {
        EXPECT_EQ(e.problems().size(), 3u);
    }
}
