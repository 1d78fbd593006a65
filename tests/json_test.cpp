#include "simdbuild/json/json.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace simdbuild;
using namespace simdbuild::json;

// ============================================================================
// Scalars
// ============================================================================

TEST(JsonParserTest, Scalars) {
    auto null_value = parse_json("null");
    ASSERT_TRUE(is_ok(null_value));
    EXPECT_TRUE(unwrap(null_value).is_null());

    auto t = parse_json(" true ");
    ASSERT_TRUE(is_ok(t));
    EXPECT_TRUE(unwrap(t).as_bool());

    auto n = parse_json("-42");
    ASSERT_TRUE(is_ok(n));
    ASSERT_TRUE(unwrap(n).is_integer());
    EXPECT_EQ(unwrap(n).as_i64(), -42);

    auto d = parse_json("2.5e2");
    ASSERT_TRUE(is_ok(d));
    EXPECT_FALSE(unwrap(d).is_integer());
    EXPECT_DOUBLE_EQ(unwrap(d).as_f64(), 250.0);
}

TEST(JsonParserTest, IntegerOverflowBecomesDouble) {
    auto big = parse_json("18446744073709551616");
    ASSERT_TRUE(is_ok(big));
    EXPECT_FALSE(unwrap(big).is_integer());
    EXPECT_TRUE(unwrap(big).is_number());
}

TEST(JsonParserTest, StringEscapes) {
    auto s = parse_json(R"("a\"b\\c\né😀")");
    ASSERT_TRUE(is_ok(s));
    EXPECT_EQ(unwrap(s).as_string(), "a\"b\\c\n\xC3\xA9\xF0\x9F\x98\x80");
}

// ============================================================================
// Containers
// ============================================================================

TEST(JsonParserTest, NestedObject) {
    auto result = parse_json(R"({
        "kind": "FunctionDecl",
        "name": "add",
        "variadic": true,
        "inner": [{"kind": "ParmVarDecl", "name": "a"}, {"kind": "ParmVarDecl"}]
    })");
    ASSERT_TRUE(is_ok(result));
    const auto& node = unwrap(result);

    EXPECT_EQ(node.get_string("kind"), "FunctionDecl");
    EXPECT_EQ(node.get_string("missing"), "");
    EXPECT_TRUE(node.get_bool("variadic"));
    EXPECT_FALSE(node.get_bool("isImplicit"));
    EXPECT_TRUE(node.get_bool("isImplicit", true));
    ASSERT_EQ(node.get_array("inner").size(), 2u);
    EXPECT_EQ(node.get_array("inner")[0].get_string("name"), "a");
    EXPECT_TRUE(node.get_array("nothing").empty());
    EXPECT_EQ(node.get("absent"), nullptr);
}

TEST(JsonParserTest, CopyIsDeep) {
    auto result = parse_json(R"({"a": [1, 2, 3]})");
    ASSERT_TRUE(is_ok(result));
    JsonValue copy = unwrap(result);
    unwrap(result) = JsonValue();
    ASSERT_NE(copy.get("a"), nullptr);
    EXPECT_EQ(copy.get_array("a").size(), 3u);
}

// ============================================================================
// Errors
// ============================================================================

TEST(JsonParserTest, ReportsLineAndColumn) {
    auto result = parse_json("{\n  \"a\": [1, 2,\n  }");
    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.line, 3u);
    EXPECT_FALSE(error.message.empty());
    EXPECT_NE(error.to_string().find("3"), std::string::npos);
}

TEST(JsonParserTest, RejectsTrailingData) {
    EXPECT_TRUE(is_err(parse_json("{} {}")));
    EXPECT_TRUE(is_err(parse_json("")));
    EXPECT_TRUE(is_err(parse_json("[1,]")));
    EXPECT_TRUE(is_err(parse_json("\"unterminated")));
}

TEST(JsonParserTest, DepthIsBounded) {
    std::string deep(5000, '[');
    deep += std::string(5000, ']');
    EXPECT_TRUE(is_err(parse_json(deep)));
}
