// Google Test for Board (construction, canonical hash, winning predicate)
#include <gtest/gtest.h>
#include <stdexcept>

#include "board.hpp"

TEST(BoardTest, HashSortsBlocksById) {
    Board board(2, 3, false);
    board.add_block(Block(1, 1, 1, 0, 0));
    board.add_block(Block(2, 1, 1, 1, 0));

    EXPECT_EQ(board.get_hash(), "1:0,0;2:1,0;");
}

TEST(BoardTest, HashIgnoresInsertionOrder) {
    Board a(4, 4, false);
    a.add_block(Block(3, 1, 1, 3, 3));
    a.add_block(Block(1, 2, 1, 0, 0));
    a.add_block(Block(2, 1, 2, 0, 1));

    Board b(4, 4, false);
    b.add_block(Block(2, 1, 2, 0, 1));
    b.add_block(Block(3, 1, 1, 3, 3));
    b.add_block(Block(1, 2, 1, 0, 0));

    EXPECT_EQ(a.get_hash(), b.get_hash());
    EXPECT_EQ(a.get_hash(), "1:0,0;2:0,1;3:3,3;");
}

TEST(BoardTest, HashDistinguishesPositions) {
    Board a(3, 3, false);
    a.add_block(Block(1, 1, 1, 0, 0));
    a.add_block(Block(2, 1, 1, 2, 2));

    Board b(3, 3, false);
    b.add_block(Block(1, 1, 1, 2, 2));
    b.add_block(Block(2, 1, 1, 0, 0));

    EXPECT_NE(a.get_hash(), b.get_hash());
}

TEST(BoardTest, CloneIsIndependentAndKeepsOrder) {
    Board board(3, 3, true);
    board.set_winning_block_id(7);
    board.set_winning_position(1, 2);
    board.set_exit_width(2);
    board.add_block(Block(7, 1, 1, 0, 0));
    board.add_block(Block(2, 1, 1, 2, 0));

    Board copy = board.clone();
    ASSERT_EQ(copy.get_blocks().size(), 2u);
    EXPECT_EQ(copy.get_blocks()[0].get_id(), 7);
    EXPECT_EQ(copy.get_blocks()[1].get_id(), 2);
    EXPECT_EQ(copy.get_winning_block_id(), board.get_winning_block_id());
    EXPECT_EQ(copy.get_winning_x(), board.get_winning_x());
    EXPECT_EQ(copy.get_winning_y(), board.get_winning_y());
    EXPECT_EQ(copy.get_exit_width(), 2);
    EXPECT_TRUE(copy.get_pins_enabled());

    // Moving a block in a successor leaves the source untouched.
    auto next = board.get_next_states();
    ASSERT_FALSE(next.empty());
    EXPECT_EQ(board.get_hash(), "2:2,0;7:0,0;");
}

TEST(BoardTest, WinningRequiresExactPosition) {
    Board board(3, 3, false);
    board.set_winning_block_id(1);
    board.set_winning_position(1, 1);
    board.add_block(Block(1, 1, 1, 1, 1));
    EXPECT_TRUE(board.is_winning());

    Board off(3, 3, false);
    off.set_winning_block_id(1);
    off.set_winning_position(1, 1);
    off.add_block(Block(1, 1, 1, 1, 0));
    EXPECT_FALSE(off.is_winning());
}

TEST(BoardTest, WinningFalseWithoutMetadata) {
    Board no_target(3, 3, false);
    no_target.set_winning_block_id(1);
    no_target.add_block(Block(1, 1, 1, 0, 0));
    EXPECT_FALSE(no_target.is_winning());

    Board no_block_id(3, 3, false);
    no_block_id.set_winning_position(0, 0);
    no_block_id.add_block(Block(1, 1, 1, 0, 0));
    EXPECT_FALSE(no_block_id.is_winning());

    Board missing_block(3, 3, false);
    missing_block.set_winning_block_id(9);
    missing_block.set_winning_position(0, 0);
    missing_block.add_block(Block(1, 1, 1, 0, 0));
    EXPECT_FALSE(missing_block.is_winning());
}

TEST(BoardTest, InvalidDimensionsThrow) {
    EXPECT_THROW(Board(0, 3, false), std::invalid_argument);
    EXPECT_THROW(Board(3, -1, false), std::invalid_argument);
}

TEST(BoardTest, InvalidBlocksThrow) {
    Board board(3, 3, false);
    board.add_block(Block(1, 1, 1, 0, 0));
    EXPECT_THROW(board.add_block(Block(1, 1, 1, 2, 2)), std::invalid_argument);
    EXPECT_THROW(board.add_block(Block(2, 0, 1, 2, 2)), std::invalid_argument);
    EXPECT_THROW(board.set_exit_width(0), std::invalid_argument);
    EXPECT_EQ(board.get_exit_width(), 1);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
