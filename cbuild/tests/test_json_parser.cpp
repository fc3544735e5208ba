#include <gtest/gtest.h>

#include <fstream>

#include "json_parser.h"
#include "test_helpers.h"

using namespace profile_export;

TEST(JsonParser, ParsesNestedDocument) {
    json::Value v = json::parse(R"({
        "page": 3,
        "session_id": "1234567890-EBGMJNA",
        "results": [
            {"$distinct_id": "u1", "$properties": {"active": true, "score": -1.5e2, "tag": null}}
        ]
    })");

    ASSERT_TRUE(v.is_object());
    EXPECT_EQ(v["page"].number, 3.0);
    EXPECT_EQ(v["session_id"].string, "1234567890-EBGMJNA");
    ASSERT_TRUE(v["results"].is_array());
    ASSERT_EQ(v["results"].array.size(), 1u);

    const json::Value& props = v["results"][0]["$properties"];
    EXPECT_TRUE(props["active"].boolean);
    EXPECT_DOUBLE_EQ(props["score"].number, -150.0);
    EXPECT_TRUE(props["tag"].is_null());
}

TEST(JsonParser, FindReturnsNullForMissingKeys) {
    json::Value v = json::parse(R"({"a": 1})");
    EXPECT_NE(v.find("a"), nullptr);
    EXPECT_EQ(v.find("b"), nullptr);
    EXPECT_EQ(json::parse("[1]").find("a"), nullptr);
    EXPECT_TRUE(v.has_key("a"));
    EXPECT_THROW(v["b"], std::runtime_error);
}

TEST(JsonParser, DecodesEscapesAndUnicode) {
    json::Value v = json::parse(R"(["line\nbreak", "tab\t", "\"q\"", "caf\u00e9", "\ud83d\ude00", "a\/b"])");
    EXPECT_EQ(v[0].string, "line\nbreak");
    EXPECT_EQ(v[1].string, "tab\t");
    EXPECT_EQ(v[2].string, "\"q\"");
    EXPECT_EQ(v[3].string, "caf\xc3\xa9");
    EXPECT_EQ(v[4].string, "\xf0\x9f\x98\x80");
    EXPECT_EQ(v[5].string, "a/b");
}

TEST(JsonParser, LastDuplicateKeyWins) {
    json::Value v = json::parse(R"({"plan": "free", "plan": "pro"})");
    EXPECT_EQ(v["plan"].string, "pro");
    EXPECT_EQ(v.object.size(), 1u);
}

TEST(JsonParser, RejectsMalformedInput) {
    EXPECT_THROW(json::parse(""), std::runtime_error);
    EXPECT_THROW(json::parse("{\"a\": }"), std::runtime_error);
    EXPECT_THROW(json::parse("[1, 2"), std::runtime_error);
    EXPECT_THROW(json::parse("\"unterminated"), std::runtime_error);
    EXPECT_THROW(json::parse("{} extra"), std::runtime_error);
    EXPECT_THROW(json::parse(R"("\x")"), std::runtime_error);
}

TEST(JsonParser, SerializesCompactWithSortedKeys) {
    json::Value v = json::parse(R"({"zeta": [1, 2.50, true], "alpha": {"b": null, "a": "x\"y"}})");
    EXPECT_EQ(json::serialize(v), R"({"alpha":{"a":"x\"y","b":null},"zeta":[1,2.50,true]})");
}

TEST(JsonParser, SerializesBuiltValues) {
    json::Value obj = json::Value::make_object();
    obj.object["count"] = json::Value::make_number(42);
    obj.object["name"] = json::Value::make_string("tab\there");
    obj.object["ok"] = json::Value::make_bool(false);
    obj.object["list"] = json::Value::make_array();
    EXPECT_EQ(json::serialize(obj), R"({"count":42,"list":[],"name":"tab\there","ok":false})");
}

TEST(JsonParser, ReparsedValueIsEqual) {
    const std::string text = R"({"$distinct_id":"u1","$properties":{"n":12345678901234567,"s":"\u00e9"}})";
    json::Value first = json::parse(text);
    json::Value second = json::parse(json::serialize(first));
    EXPECT_EQ(first, second);
    EXPECT_EQ(second["$properties"]["n"].number_text, "12345678901234567");
}

TEST(JsonParser, ParseFileReadsDocument) {
    testing_support::TempDir dir;
    auto path = dir.path() / "config.json";
    {
        std::ofstream out(path);
        out << R"({"workers": 3})";
    }
    json::Value v = json::parse_file(path.string());
    EXPECT_EQ(v["workers"].number, 3.0);
    EXPECT_THROW(json::parse_file((dir.path() / "missing.json").string()), std::runtime_error);
}
