// File: tests/unit/test_support_sha256_json.cpp
// Purpose: Check the SHA-256 digest against published vectors and the JSON
//          reader/writer used by the artifact format.
// Key invariants: Digests are lowercase hex; object members keep insertion
//                 order when written.
// Ownership/Lifetime: Standalone unit test executable.
// Links: src/support/sha256.cpp, src/support/json.cpp

#include "support/json.hpp"
#include "support/sha256.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace fusion::support;

TEST(Sha256, KnownVectors)
{
    EXPECT_EQ(sha256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256Hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(Sha256, IncrementalUpdatesMatchOneShot)
{
    const std::string text(1000, 'a');
    Sha256 h;
    for (size_t i = 0; i < text.size(); i += 7)
        h.update(std::string_view(text).substr(i, 7));
    EXPECT_EQ(h.finishHex(), sha256Hex(text));
}

TEST(Json, ParsesNestedDocument)
{
    auto doc = json::parse(R"({"a": [1, 2.5, "x\nA", true, null], "b": {"c": -3}})");
    ASSERT_TRUE(doc.hasValue());
    const json::Value &root = doc.value();
    ASSERT_TRUE(root.isObject());

    const json::Value *a = root.find("a");
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(a->asArray().size(), 5u);
    EXPECT_EQ(a->asArray()[0].asInt(), 1);
    EXPECT_DOUBLE_EQ(a->asArray()[1].asFloat(), 2.5);
    EXPECT_EQ(a->asArray()[2].asString(), "x\nA");
    EXPECT_TRUE(a->asArray()[3].asBool());
    EXPECT_TRUE(a->asArray()[4].isNull());

    const json::Value *b = root.find("b");
    ASSERT_NE(b, nullptr);
    ASSERT_NE(b->find("c"), nullptr);
    EXPECT_EQ(b->find("c")->asInt(), -3);
}

TEST(Json, RejectsMalformedText)
{
    EXPECT_FALSE(json::parse("{\"a\": }").hasValue());
    EXPECT_FALSE(json::parse("[1, 2").hasValue());
    EXPECT_FALSE(json::parse("{} trailing").hasValue());
}

TEST(Json, WriterKeepsMemberOrderAndEscapes)
{
    json::Value obj = json::Value::object();
    obj.set("zeta", 1);
    obj.set("alpha", std::string("tab\there"));
    EXPECT_EQ(json::write(obj, 0), "{\"zeta\":1,\"alpha\":\"tab\\there\"}\n");

    auto back = json::parse(json::write(obj));
    ASSERT_TRUE(back.hasValue());
    EXPECT_TRUE(back.value() == obj);
}
