#include <gtest/gtest.h>

#include "ChurnServeExceptions.h"
#include "JsonValue.h"

#include <cmath>
#include <limits>

TEST(JsonValueTest, ParsesNestedDocument) {
    const JsonValue root = parseJsonText(R"({"a": [1, 2.5, -3e2], "b": {"c": "x\ny"}, "d": null, "e": true})");
    ASSERT_TRUE(root.isObject());

    const JsonValue* a = root.find("a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->isArray());
    ASSERT_EQ(a->arrayValue.size(), 3u);
    EXPECT_DOUBLE_EQ(a->arrayValue[2].numberValue, -300.0);

    const JsonValue* b = root.find("b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->find("c")->stringValue, "x\ny");
    EXPECT_TRUE(root.find("d")->isNull());
    EXPECT_TRUE(root.find("e")->booleanValue);
    EXPECT_EQ(root.find("missing"), nullptr);
}

TEST(JsonValueTest, DecodesUnicodeEscapes) {
    const JsonValue value = parseJsonText(R"("caf\u00e9 \ud83d\ude00")");
    EXPECT_EQ(value.stringValue, "caf\xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JsonValueTest, RejectsMalformedInput) {
    EXPECT_THROW(parseJsonText("{\"a\": 1,}"), ChurnServe::JsonException);
    EXPECT_THROW(parseJsonText("[1, 2"), ChurnServe::JsonException);
    EXPECT_THROW(parseJsonText("{} extra"), ChurnServe::JsonException);
    EXPECT_THROW(parseJsonText(""), ChurnServe::JsonException);
}

TEST(JsonValueTest, RejectsExcessiveNesting) {
    const std::string deep = std::string(1000, '[') + std::string(1000, ']');
    EXPECT_THROW(parseJsonText(deep), ChurnServe::JsonException);
}

TEST(JsonValueTest, MissingFileIsAnIOError) {
    EXPECT_THROW(parseJsonFile("/nonexistent/churnserve.json"), ChurnServe::IOException);
}

TEST(JsonValueTest, FormatsNumbersForRoundTrip) {
    EXPECT_EQ(formatJsonNumber(0.5), "0.5");
    EXPECT_EQ(formatJsonNumber(std::numeric_limits<double>::quiet_NaN()), "null");
    EXPECT_EQ(formatJsonNumber(std::numeric_limits<double>::infinity()), "null");

    const double value = 0.1 + 0.2;
    const JsonValue parsed = parseJsonText(formatJsonNumber(value));
    EXPECT_EQ(parsed.numberValue, value);
}

TEST(JsonValueTest, EscapesControlCharacters) {
    EXPECT_EQ(escapeJsonString("a\"b\\c\n"), "a\\\"b\\\\c\\n");
}
