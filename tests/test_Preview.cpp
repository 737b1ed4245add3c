#include <gtest/gtest.h>
#include "../src/utils/Preview.h"

TEST(PreviewTest, ShortTextUnchanged) {
    EXPECT_EQ(Preview::truncate("hello"), "hello");
    EXPECT_EQ(Preview::truncate(std::string(200, 'a')), std::string(200, 'a'));
}

TEST(PreviewTest, LongTextCutWithEllipsis) {
    std::string cut = Preview::truncate(std::string(500, 'a'));
    EXPECT_EQ(cut.size(), 203u);
    EXPECT_EQ(cut.substr(200), "...");
}

TEST(PreviewTest, CutNeverSplitsUtf8Sequence) {
    std::string text;
    for (int i = 0; i < 10; ++i) text += "场景";

    std::string cut = Preview::truncate(text, 5);
    // 5 characters of 3 bytes each, then the ellipsis
    EXPECT_EQ(cut, "场景场景场...");
}

TEST(PreviewTest, ArrayResultSummarizedByCount) {
    EXPECT_EQ(Preview::result(nlohmann::json::array({1, 2, 3})), "3 items");
}

TEST(PreviewTest, CollectionObjectSummarizedByCount) {
    nlohmann::json listing = {{"path", "game"}, {"entries", {"a", "b"}}};
    EXPECT_EQ(Preview::result(listing), "entries: 2 items");

    nlohmann::json search = {{"matches", nlohmann::json::array()}};
    EXPECT_EQ(Preview::result(search), "matches: 0 items");
}

TEST(PreviewTest, OtherObjectsShowCappedKeyList) {
    nlohmann::json small = {{"a", 1}, {"b", 2}};
    EXPECT_EQ(Preview::result(small), "{a, b}");

    nlohmann::json wide;
    for (char c = 'a'; c <= 'j'; ++c) wide[std::string(1, c)] = std::string(10000, c);
    std::string summary = Preview::result(wide);
    EXPECT_EQ(summary, "{a, b, c, d, e, f, ...}");
}

TEST(PreviewTest, ScalarsAndStrings) {
    EXPECT_EQ(Preview::result("plain"), "plain");
    EXPECT_EQ(Preview::result(42), "42");
    EXPECT_EQ(Preview::result(nullptr), "(empty)");
    EXPECT_EQ(Preview::result(std::string(300, 'z')).size(), 203u);
}

TEST(PreviewTest, ArgumentsRenderedCompactly) {
    EXPECT_EQ(Preview::arguments({{"path", "game"}}), "{\"path\":\"game\"}");
    EXPECT_EQ(Preview::arguments(nullptr), "{}");
    EXPECT_EQ(Preview::arguments({{"content", std::string(1000, 'x')}}).size(), 203u);
}
