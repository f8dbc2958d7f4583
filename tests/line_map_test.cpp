#include <gtest/gtest.h>
#include <Marginalia/LineMap.hpp>

using namespace Marginalia;

TEST(LineMapTest, OffsetsToLinesAndColumns) {
    LineMap map("ab\ncde\n\nf");
    EXPECT_EQ(map.getLineCount(), 4);
    EXPECT_EQ(map.offsetToLineColumn(0), (LineColumn{1, 1}));
    EXPECT_EQ(map.offsetToLineColumn(2), (LineColumn{1, 3}));
    EXPECT_EQ(map.offsetToLineColumn(3), (LineColumn{2, 1}));
    EXPECT_EQ(map.offsetToLineColumn(7), (LineColumn{3, 1}));
    EXPECT_EQ(map.offsetToLineColumn(8), (LineColumn{4, 1}));
    // clamped
    EXPECT_EQ(map.offsetToLineColumn(-4), (LineColumn{1, 1}));
    EXPECT_EQ(map.offsetToLineColumn(100), (LineColumn{4, 2}));
}

TEST(LineMapTest, LinesAndColumnsToOffsets) {
    LineMap map("ab\ncde\n\nf");
    EXPECT_EQ(map.lineColumnToOffset({2, 1}), 3);
    EXPECT_EQ(map.lineColumnToOffset({2, 3}), 5);
    EXPECT_EQ(map.lineColumnToOffset({2, 50}), 6);
    EXPECT_EQ(map.lineColumnToOffset({0, 1}), 0);
    EXPECT_EQ(map.lineColumnToOffset({9, 1}), 8);
    EXPECT_EQ(map.getLineStart(3), 7);
}

TEST(LineMapTest, GetLineStripsNewline) {
    LineMap map("first\nsecond\n");
    EXPECT_EQ(map.getLineCount(), 3);
    EXPECT_EQ(map.getLine(1), "first");
    EXPECT_EQ(map.getLine(2), "second");
    EXPECT_EQ(map.getLine(3), "");
    EXPECT_EQ(map.getLine(4), "");
    EXPECT_EQ(map.getText(), "first\nsecond\n");
}

TEST(LineMapTest, EmptyDocumentHasOneLine) {
    LineMap map("");
    EXPECT_EQ(map.getLineCount(), 1);
    EXPECT_EQ(map.offsetToLineColumn(0), (LineColumn{1, 1}));
}

TEST(LineMapTest, ComputeTextEditFindsMinimalReplacement) {
    auto edit = computeTextEdit("The quick fox", "The slow fox");
    ASSERT_TRUE(edit.has_value());
    EXPECT_EQ(edit->offset, 4);
    EXPECT_EQ(edit->deleteCount, 5);
    EXPECT_EQ(edit->insertText, "slow");

    auto insert = computeTextEdit("aaa", "aaaa");
    ASSERT_TRUE(insert.has_value());
    EXPECT_EQ(insert->deleteCount, 0);
    EXPECT_EQ(insert->insertLength(), 1);

    EXPECT_FALSE(computeTextEdit("same", "same").has_value());
}

TEST(LineMapTest, AdjustOffset) {
    TextEdit edit{5, 3, "ab"};
    EXPECT_EQ(adjustOffset(2, edit), 2);
    EXPECT_EQ(adjustOffset(5, edit), 5);
    EXPECT_EQ(adjustOffset(6, edit), 5);
    EXPECT_EQ(adjustOffset(10, edit), 9);
}

TEST(LineMapTest, FindExactPositionSearchesNearbyLinesFirst) {
    const std::string text = "alpha\nbeta word\ngamma\ndelta word\nepsilon";
    // exact hit
    EXPECT_EQ(*findExactPosition(text, "beta", 6, 2), Range(6, 10));
    // wrong offset, right line
    EXPECT_EQ(*findExactPosition(text, "word", 0, 2), Range(11, 15));
    // a neighbouring line wins over the first global match
    EXPECT_EQ(*findExactPosition(text, "word", 0, 5), Range(28, 32));
    EXPECT_FALSE(findExactPosition(text, "zeta", 0, 1).has_value());
}
