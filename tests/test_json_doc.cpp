#include <gtest/gtest.h>
#include <projhost/store/json_doc.hpp>

using namespace projhost;

TEST(JsonDoc, WriteEmpty) {
    EXPECT_EQ(json::write_document({}), "{}\n");
}

TEST(JsonDoc, WriteAndParseRecord) {
    json::Document doc;
    doc["alpha"]["name"] = json::Scalar::string("alpha");
    doc["alpha"]["pid"] = json::Scalar::number(1234);
    doc["alpha"]["cmd"] = json::Scalar::string("python3 \"main.py\"\n\ttab\\");
    std::string text = json::write_document(doc);
    EXPECT_NE(text.find("\"pid\": 1234"), std::string::npos);
    std::string err;
    auto back = json::parse_document(text, err);
    ASSERT_TRUE(back) << err;
    ASSERT_EQ(back->size(), 1u);
    auto& rec = back->at("alpha");
    EXPECT_EQ(rec.at("name").text, "alpha");
    EXPECT_EQ(rec.at("pid").kind, json::Scalar::Kind::Number);
    EXPECT_EQ(rec.at("pid").text, "1234");
    EXPECT_EQ(rec.at("cmd").text, "python3 \"main.py\"\n\ttab\\");
}

TEST(JsonDoc, UnicodeEscapes) {
    std::string err;
    auto doc = json::parse_document(R"({"a": {"s": "caf\u00e9 \ud83d\ude00", "b": true, "n": null}})", err);
    ASSERT_TRUE(doc) << err;
    auto& rec = doc->at("a");
    EXPECT_EQ(rec.at("s").text, "caf\xC3\xA9 \xF0\x9F\x98\x80");
    EXPECT_EQ(rec.at("b").kind, json::Scalar::Kind::Bool);
    EXPECT_EQ(rec.at("n").kind, json::Scalar::Kind::Null);
}

TEST(JsonDoc, ControlCharsEscaped) {
    EXPECT_EQ(json::escape(std::string("a\x01z")), "a\\u0001z");
}

TEST(JsonDoc, RejectsMalformed) {
    std::string err;
    EXPECT_FALSE(json::parse_document("{\"a\": {\"x\": [1,2]}}", err));
    EXPECT_NE(err.find("nested"), std::string::npos);
    EXPECT_FALSE(json::parse_document("{\"a\": 3}", err));
    EXPECT_FALSE(json::parse_document("{\"a\": {}} junk", err));
    EXPECT_FALSE(json::parse_document("{\"a\": {\"x\": \"open", err));
    EXPECT_NE(err.find("offset"), std::string::npos);
}
