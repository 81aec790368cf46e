#include <gtest/gtest.h>
#include "../src/edit/CursorModel.h"
#include "TabTestUtils.h"

using namespace edit;
using model::Position;
using model::TabDocument;

class CursorModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Lines 1-6 and 8-13 are staves of four cells
        doc.setText("title\n" + testutil::blankStaff(4) + "\n\n" + testutil::blankStaff(4) + "\nend");
    }

    TabDocument doc;
};

TEST_F(CursorModelTest, OutsideTabResolvesToNothing) {
    EXPECT_FALSE(CursorModel::resolve(doc, Position{0, 2}).has_value());
    EXPECT_FALSE(CursorModel::resolve(doc, Position{7, 0}).has_value());
    EXPECT_FALSE(CursorModel::resolve(doc, Position{14, 1}).has_value());
    EXPECT_FALSE(CursorModel::resolve(doc, Position{99, 0}).has_value());
}

TEST_F(CursorModelTest, ResolvesStaffStringAndCell) {
    auto ctx = CursorModel::resolve(doc, Position{3, 11});
    ASSERT_TRUE(ctx.has_value());
    EXPECT_EQ(ctx->staffIndex, 0);
    EXPECT_EQ(ctx->stringIndex, 2);
    EXPECT_EQ(ctx->cellIndex, 2);
    EXPECT_EQ(ctx->firstLine, 1);
    EXPECT_EQ(ctx->column(), 11);

    auto second = CursorModel::resolve(doc, Position{13, 5});
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->staffIndex, 1);
    EXPECT_EQ(second->stringIndex, 5);
}

TEST_F(CursorModelTest, SnapsColumnsToCellStarts) {
    // In the prefix or margin: first cell
    EXPECT_EQ(CursorModel::resolve(doc, Position{2, 0})->cellIndex, 0);
    EXPECT_EQ(CursorModel::resolve(doc, Position{2, 4})->cellIndex, 0);

    // Inside a cell: back to its start
    EXPECT_EQ(CursorModel::resolve(doc, Position{2, 7})->column(), 5);
    EXPECT_EQ(CursorModel::resolve(doc, Position{2, 10})->column(), 8);

    // Beyond the line: last cell
    EXPECT_EQ(CursorModel::resolve(doc, Position{2, 60})->cellIndex, 3);
}

TEST_F(CursorModelTest, ResolveIsIdempotent) {
    for (int column = 0; column < 20; ++column) {
        auto first = CursorModel::resolve(doc, Position{4, column});
        ASSERT_TRUE(first.has_value());
        auto again = CursorModel::resolve(doc, first->position());
        ASSERT_TRUE(again.has_value());
        EXPECT_EQ(*first, *again) << "column " << column;
    }
}

TEST_F(CursorModelTest, ResolvesRawOffsets) {
    // "title\n" then the first string line
    auto ctx = CursorModel::resolve(doc, 6 + 8);
    ASSERT_TRUE(ctx.has_value());
    EXPECT_EQ(ctx->stringIndex, 0);
    EXPECT_EQ(ctx->cellIndex, 1);
}

TEST_F(CursorModelTest, AdvanceStopsAtLineEnds) {
    auto ctx = *CursorModel::at(doc, 0, 0, 3);
    EXPECT_FALSE(CursorModel::advance(doc, ctx, 1).has_value());

    auto back = CursorModel::advance(doc, ctx, -3);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->cellIndex, 0);
    EXPECT_FALSE(CursorModel::advance(doc, *back, -1).has_value());
}

TEST_F(CursorModelTest, MoveStringsStaysInStaff) {
    auto top = *CursorModel::at(doc, 0, 0, 1);
    EXPECT_FALSE(CursorModel::moveStrings(top, -1).has_value());
    EXPECT_EQ(CursorModel::moveStrings(top, 5)->stringIndex, 5);
    EXPECT_FALSE(CursorModel::moveStrings(top, 6).has_value());
}

TEST_F(CursorModelTest, CycleStringWraps) {
    auto ctx = *CursorModel::at(doc, 0, 5, 0);
    EXPECT_EQ(CursorModel::cycleString(ctx, 1).stringIndex, 0);
    EXPECT_EQ(CursorModel::cycleString(ctx, 13).stringIndex, 0);

    ctx.stringIndex = 0;
    EXPECT_EQ(CursorModel::cycleString(ctx, -1).stringIndex, 5);
}

TEST_F(CursorModelTest, MoveStaffFindsNeighbours) {
    auto ctx = *CursorModel::at(doc, 0, 3, 2);

    auto next = CursorModel::moveStaff(doc, ctx, Direction::Forward);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->staffIndex, 1);
    EXPECT_EQ(next->stringIndex, 0);
    EXPECT_EQ(next->cellIndex, 2);
    EXPECT_EQ(next->line(), 8);

    EXPECT_FALSE(CursorModel::moveStaff(doc, ctx, Direction::Backward).has_value());
    EXPECT_FALSE(CursorModel::moveStaff(doc, *next, Direction::Forward).has_value());
    EXPECT_EQ(CursorModel::moveStaff(doc, *next, Direction::Backward)->staffIndex, 0);
}
