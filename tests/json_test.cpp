#include <gtest/gtest.h>
#include "io/json_reader.hpp"
#include "io/json_writer.hpp"

#include <limits>
#include <sstream>

namespace commplan {
namespace {

class JsonTest : public ::testing::Test {};

TEST_F(JsonTest, ParsesNestedDocument) {
    const JsonValue root = JsonReader::parse(R"({
        "id": "M-1",
        "count": 3,
        "flag": true,
        "list": [1, 2.5, "three"],
        "nested": {"inner": null}
    })");

    EXPECT_EQ(root["id"].as_string(), "M-1");
    EXPECT_EQ(root["count"].as_int(), 3);
    EXPECT_TRUE(root["flag"].as_bool());
    ASSERT_EQ(root["list"].size(), 3u);
    EXPECT_DOUBLE_EQ(root["list"][1].as_number(), 2.5);
    EXPECT_EQ(root["list"][2].as_string(), "three");
    EXPECT_TRUE(root["nested"]["inner"].is_null());
    EXPECT_TRUE(root.has("nested"));
    EXPECT_FALSE(root.has("absent"));
}

TEST_F(JsonTest, MissingMembersReadAsNull) {
    const JsonValue root = JsonReader::parse(R"({"a": 1})");
    EXPECT_TRUE(root["b"].is_null());
    EXPECT_TRUE(root["b"]["c"].is_null());
    EXPECT_EQ(root["b"].get_string("fallback"), "fallback");
    EXPECT_FALSE(root["b"].get_optional_number().has_value());
    EXPECT_DOUBLE_EQ(*root["a"].get_optional_number(), 1.0);
}

TEST_F(JsonTest, DecodesStringEscapes) {
    const JsonValue v = JsonReader::parse(R"("line\nbreak \"quoted\" \u00e9")");
    EXPECT_EQ(v.as_string(), "line\nbreak \"quoted\" \xC3\xA9");
}

TEST_F(JsonTest, StrictAccessorsThrowOnTypeMismatch) {
    const JsonValue root = JsonReader::parse(R"({"n": "not a number"})");
    EXPECT_THROW(root["n"].as_number(), JsonError);
    EXPECT_THROW(root["n"].as_array(), JsonError);
}

TEST_F(JsonTest, MalformedInputThrows) {
    EXPECT_THROW(JsonReader::parse("{\"a\": }"), JsonError);
    EXPECT_THROW(JsonReader::parse("[1, 2"), JsonError);
    EXPECT_THROW(JsonReader::parse("{} trailing"), JsonError);
}

TEST_F(JsonTest, MalformedInputIsAConfigurationError) {
    EXPECT_THROW(JsonReader::parse("nope"), ConfigurationError);
}

TEST_F(JsonTest, MissingFileThrows) {
    EXPECT_THROW(JsonReader::parse_file("/nonexistent/commplan/route.json"), JsonError);
}

TEST_F(JsonTest, WriterProducesParseableOutput) {
    std::ostringstream out;
    JsonWriter w(out);
    w.begin_object();
    w.kv("mission_id", "M-1");
    w.kv("duration", 7200.0);
    w.key("reasons").begin_array();
    w.value("Safety-of-Flight (takeoff)");
    w.value("quote \" inside");
    w.end_array();
    w.end_object();

    const JsonValue back = JsonReader::parse(out.str());
    EXPECT_EQ(back["mission_id"].as_string(), "M-1");
    EXPECT_DOUBLE_EQ(back["duration"].as_number(), 7200.0);
    ASSERT_EQ(back["reasons"].size(), 2u);
    EXPECT_EQ(back["reasons"][1].as_string(), "quote \" inside");
}

TEST_F(JsonTest, WriterEmitsNullForNonFinite) {
    std::ostringstream out;
    JsonWriter w(out, 0);
    w.begin_array();
    w.value(std::numeric_limits<double>::quiet_NaN());
    w.end_array();
    EXPECT_EQ(out.str(), "[null]");
}

} // namespace
} // namespace commplan
