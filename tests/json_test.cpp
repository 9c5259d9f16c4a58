//! # JSON Unit Tests
//!
//! Parser acceptance and error positions, value access, and the compact and
//! pretty serializers used for snapshots and reports.

#include "maplint/json/json_parser.hpp"
#include "maplint/json/json_value.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace maplint;
using namespace maplint::json;

class JsonParserTest : public ::testing::Test {
protected:
    JsonValue parse_ok(std::string_view text) {
        auto result = parse_json(text);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        if (is_err(result)) {
            return json_null();
        }
        return std::move(unwrap(result));
    }

    JsonError parse_err(std::string_view text) {
        auto result = parse_json(text);
        EXPECT_TRUE(is_err(result));
        if (is_ok(result)) {
            return JsonError::make("unexpectedly parsed");
        }
        return unwrap_err(result);
    }
};

TEST_F(JsonParserTest, Scalars) {
    EXPECT_TRUE(parse_ok("null").is_null());
    EXPECT_TRUE(parse_ok("true").as_bool());
    EXPECT_FALSE(parse_ok("false").as_bool());
    EXPECT_EQ(parse_ok("42").as_number().try_as_i64().value_or(-1), 42);
    EXPECT_DOUBLE_EQ(parse_ok("-1.5e2").as_number().as_f64(), -150.0);
    EXPECT_EQ(parse_ok("\"text\"").as_string(), "text");
}

TEST_F(JsonParserTest, NestedObject) {
    auto value = parse_ok(R"({"name": "Source", "members": [{"name": "Age", "type": "int"}]})");
    ASSERT_TRUE(value.is_object());

    const auto* name = value.get("name");
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(name->as_string(), "Source");

    const auto* members = value.get("members");
    ASSERT_NE(members, nullptr);
    ASSERT_EQ(members->as_array().size(), 1u);
    EXPECT_EQ(members->as_array()[0].get("type")->as_string(), "int");
    EXPECT_EQ(value.get("missing"), nullptr);
}

TEST_F(JsonParserTest, StringEscapes) {
    auto value = parse_ok(R"("a\"b\\c\ndA\/")");
    EXPECT_EQ(value.as_string(), "a\"b\\c\ndA/");
}

TEST_F(JsonParserTest, UnicodeEscapeEncodesUtf8) {
    auto value = parse_ok(R"("\u00e9")");
    EXPECT_EQ(value.as_string(), "\xC3\xA9");
}

TEST_F(JsonParserTest, TrailingContentIsError) {
    auto err = parse_err("{} {}");
    EXPECT_NE(err.message.find("unexpected content"), std::string::npos);
}

TEST_F(JsonParserTest, TrailingCommaIsError) {
    parse_err("[1, 2,]");
    parse_err(R"({"a": 1,})");
}

TEST_F(JsonParserTest, ErrorCarriesLineAndColumn) {
    auto err = parse_err("{\n  \"a\": tru\n}");
    EXPECT_EQ(err.line, 2u);
    EXPECT_GT(err.column, 1u);
    EXPECT_NE(err.to_string().find("line 2"), std::string::npos);
}

TEST_F(JsonParserTest, UnterminatedString) {
    auto err = parse_err("\"abc");
    EXPECT_NE(err.message.find("unterminated"), std::string::npos);
}

TEST_F(JsonParserTest, DepthLimit) {
    std::string deep(JsonParser::MAX_DEPTH + 1, '[');
    deep += std::string(JsonParser::MAX_DEPTH + 1, ']');
    auto err = parse_err(deep);
    EXPECT_NE(err.message.find("nesting depth"), std::string::npos);
}

TEST_F(JsonParserTest, DuplicateKeyKeepsLast) {
    auto value = parse_ok(R"({"a": 1, "a": 2})");
    EXPECT_EQ(value.get("a")->as_number().try_as_i64().value_or(-1), 2);
}

// ============================================================================
// Serialization
// ============================================================================

TEST(JsonSerializerTest, CompactOutputSortsKeys) {
    auto obj = json_object();
    obj.set("zeta", json_int(1));
    obj.set("alpha", json_string("x"));
    auto arr = json_array();
    arr.push(json_bool(true));
    arr.push(json_null());
    obj.set("list", std::move(arr));

    EXPECT_EQ(obj.to_string(), R"({"alpha":"x","list":[true,null],"zeta":1})");
}

TEST(JsonSerializerTest, PrettyOutput) {
    auto obj = json_object();
    obj.set("name", json_string("Age"));
    obj.set("members", json_array());

    EXPECT_EQ(obj.to_string_pretty(), "{\n  \"members\": [],\n  \"name\": \"Age\"\n}");
}

TEST(JsonSerializerTest, EscapesControlCharacters) {
    EXPECT_EQ(json_string("a\"b\n\x01").to_string(), R"("a\"b\n\u0001")");
}

TEST(JsonSerializerTest, DoublesStayDoubles) {
    EXPECT_EQ(json_float(2.0).to_string(), "2.0");
    EXPECT_EQ(json_int(2).to_string(), "2");
}

TEST(JsonSerializerTest, ReparseIsEqual) {
    auto text = R"({"units": [{"name": "P", "declarations": []}], "types": []})";
    auto first = parse_json(text);
    ASSERT_TRUE(is_ok(first));
    auto second = parse_json(unwrap(first).to_string_pretty());
    ASSERT_TRUE(is_ok(second));
    EXPECT_TRUE(unwrap(first) == unwrap(second));
}
