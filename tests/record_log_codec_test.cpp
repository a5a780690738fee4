#include "store/record_log_codec.hpp"

#include "test_util.hpp"

#include <string>

#include <gtest/gtest.h>

namespace kvcache::store {

// ── Fixture ───────────────────────────────────────────────────────────────────

class RecordLogCodecTest : public ::testing::Test {
protected:
    Store decode(const std::string& text) { return codec_.decode(text, *log_); }

    RecordLogCodec codec_;
    test::CapturingLogger log_;
};

// ── decode ────────────────────────────────────────────────────────────────────

TEST_F(RecordLogCodecTest, LoadsSingleRecord) {
    auto store = decode("[\"default\",\"k\",42]\n");

    const auto* t = store.find("default");
    ASSERT_NE(t, nullptr);
    ASSERT_NE(t->find("k"), nullptr);
    EXPECT_EQ(*t->find("k"), 42);
}

TEST_F(RecordLogCodecTest, LaterRecordWins) {
    auto store = decode(
        "[\"t\",\"k\",1]\n"
        "[\"t\",\"other\",true]\n"
        "[\"t\",\"k\",{\"v\":2}]\n");

    const auto* t = store.find("t");
    ASSERT_EQ(t->size(), 2u);
    EXPECT_EQ(*t->find("k"), (Value{{"v", 2}}));
}

TEST_F(RecordLogCodecTest, SkipsMalformedLinesWithWarning) {
    auto store = decode(
        "[\"t\",\"a\",1]\n"
        "not json at all\n"
        "[\"t\",\"b\"]\n"
        "{\"t\":1}\n"
        "[1,\"c\",3]\n"
        "[\"t\",\"d\",4]\n");

    const auto* t = store.find("t");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->size(), 2u);
    EXPECT_EQ(*t->find("a"), 1);
    EXPECT_EQ(*t->find("d"), 4);
    EXPECT_TRUE(log_.contains("warning failed to parse cache record 2"));
    EXPECT_TRUE(log_.contains("failed to parse cache record 5"));
}

TEST_F(RecordLogCodecTest, RejectsRecordsThatNeedCoercion) {
    auto store = decode(
        "[\"t\",7,1]\n"
        "[\"t\",\"k\",1,\"extra\"]\n"
        "[null,\"k\",2]\n"
        "[\"t\",\"ok\",3]\n");

    const auto* t = store.find("t");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->size(), 1u);
    EXPECT_EQ(*t->find("ok"), 3);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_TRUE(log_.contains("failed to parse cache record 1: expected [table, key, value]"));
    EXPECT_TRUE(log_.contains("failed to parse cache record 2: expected [table, key, value]"));
    EXPECT_TRUE(log_.contains("failed to parse cache record 3: expected [table, key, value]"));
}

TEST_F(RecordLogCodecTest, IgnoresBlankLinesAndCrLf) {
    auto store = decode("\r\n[\"t\",\"a\",null]\r\n\r\n   \n[\"u\",\"b\",\"x\"]");

    EXPECT_EQ(store.size(), 2u);
    EXPECT_TRUE(store.find("t")->find("a")->is_null());
    EXPECT_EQ(*store.find("u")->find("b"), "x");
    EXPECT_FALSE(log_.contains("warning"));
}

// ── encode ────────────────────────────────────────────────────────────────────

TEST_F(RecordLogCodecTest, EncodesOneLinePerLiveKey) {
    Store store;
    store.get_or_create("default").insert_or_assign("k", 42);
    store.get_or_create("other").insert_or_assign("s", "a\nb");
    store.get_or_create("empty");

    EXPECT_EQ(codec_.encode(store),
              "[\"default\",\"k\",42]\n"
              "[\"other\",\"s\",\"a\\nb\"]\n");
}

TEST_F(RecordLogCodecTest, CompactsRepeatedRecords) {
    auto store = decode("[\"default\",\"k\",1]\n[\"default\",\"k\",42]\n");
    EXPECT_EQ(codec_.encode(store), "[\"default\",\"k\",42]\n");
}

TEST_F(RecordLogCodecTest, RoundTripsStructuredValues) {
    Store store;
    auto& t = store.get_or_create("t");
    t.insert_or_assign("float", -0.5);
    t.insert_or_assign("nested", Value{{"list", {1, nullptr, "x"}}, {"ok", true}});
    t.insert_or_assign("key with spaces = and ]", "v");
    store.get_or_create("second").insert_or_assign("", 0);

    EXPECT_EQ(decode(codec_.encode(store)), store);
}

TEST_F(RecordLogCodecTest, NameIsTxt) {
    EXPECT_EQ(codec_.name(), "txt");
}

} // namespace kvcache::store
