/// @file test_types.cpp
/// Tests for Position helpers.

#include "types.hpp"

#include <gtest/gtest.h>

namespace {

constexpr const char *kBlackToMove = "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq - 0 1";

TEST(MakePositionTest, PicksAlternative) {
    EXPECT_TRUE(std::holds_alternative<Startpos>(make_position(std::nullopt, {})));

    Position p = make_position(std::nullopt, {"e2e4", "e7e5"});
    ASSERT_TRUE(std::holds_alternative<StartposAndMoves>(p));
    EXPECT_EQ(std::get<StartposAndMoves>(p).moves, "e2e4 e7e5");

    p = make_position(std::string(kBlackToMove), {});
    ASSERT_TRUE(std::holds_alternative<Fen>(p));
    EXPECT_EQ(std::get<Fen>(p).fen, kBlackToMove);

    p = make_position(std::string(kBlackToMove), {"c7c5"});
    ASSERT_TRUE(std::holds_alternative<FenAndMoves>(p));
    EXPECT_EQ(std::get<FenAndMoves>(p).fen, kBlackToMove);
    EXPECT_EQ(std::get<FenAndMoves>(p).moves, "c7c5");
}

TEST(SideToMoveTest, Startpos) {
    EXPECT_EQ(side_to_move(Startpos{}), Color::WHITE);
    EXPECT_EQ(side_to_move(StartposAndMoves{"e2e4"}), Color::BLACK);
    EXPECT_EQ(side_to_move(StartposAndMoves{"e2e4 e7e5"}), Color::WHITE);
}

TEST(SideToMoveTest, FromFen) {
    EXPECT_EQ(side_to_move(Fen{kBlackToMove}), Color::BLACK);
    EXPECT_EQ(side_to_move(FenAndMoves{kBlackToMove, "c7c5"}), Color::WHITE);
    EXPECT_EQ(side_to_move(FenAndMoves{kBlackToMove, "c7c5  g1f3"}), Color::BLACK);
}

TEST(SideToMoveTest, MalformedFenDefaultsToWhite) {
    EXPECT_EQ(side_to_move(Fen{"8/8/8"}), Color::WHITE);
}

}  // namespace
