/// @file test_protocol.cpp
/// Tests for UCI command formatting and bestmove parsing.

#include "protocol.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

// ── Position command ────────────────────────────────────────────────────────

TEST(PositionCommandTest, Startpos) {
    EXPECT_EQ(position_command(Startpos{}), "position startpos");
}

TEST(PositionCommandTest, Fen) {
    EXPECT_EQ(position_command(Fen{"8/8/8/8/8/8/8/K6k w - - 0 1"}),
              "position fen 8/8/8/8/8/8/8/K6k w - - 0 1");
}

TEST(PositionCommandTest, StartposWithMoves) {
    EXPECT_EQ(position_command(StartposAndMoves{"e2e4 e7e5"}),
              "position startpos moves e2e4 e7e5");
}

TEST(PositionCommandTest, FenWithMoves) {
    EXPECT_EQ(position_command(FenAndMoves{"8/8/8/8/8/8/8/K6k w - - 0 1", "a1a2"}),
              "position fen 8/8/8/8/8/8/8/K6k w - - 0 1 moves a1a2");
}

// ── Go command ──────────────────────────────────────────────────────────────

TEST(GoCommandTest, NoOptionsIsBareGo) {
    EXPECT_EQ(go_command({}), "go");
}

TEST(GoCommandTest, SingleOption) {
    EXPECT_EQ(go_command({{"depth", "12"}}), "go depth 12");
}

TEST(GoCommandTest, MultipleOptionsInAnyOrder) {
    std::string cmd = go_command({{"wtime", "1000"}, {"btime", "2000"}});
    EXPECT_TRUE(cmd == "go wtime 1000 btime 2000" || cmd == "go btime 2000 wtime 1000") << cmd;
}

// ── Full command sequence ───────────────────────────────────────────────────

TEST(GoCommandTest, FlagWithoutValue) {
    EXPECT_EQ(go_command({{"infinite", ""}}), "go infinite");
}

TEST(SearchCommandsTest, StartposWithoutOptions) {
    SearchJob job;
    std::vector<std::string> expected = {"position startpos", "go"};
    EXPECT_EQ(search_commands(job), expected);
}

TEST(SearchCommandsTest, SetoptionsComeFirstThenPositionThenGo) {
    SearchJob job;
    job.set_engine_option("Hash", "64")
        .set_engine_option("Threads", "2")
        .set_position(StartposAndMoves{"e2e4"})
        .set_go_option("movetime", "500");

    auto commands = search_commands(job);
    ASSERT_EQ(commands.size(), 4U);
    std::vector<std::string> setoptions(commands.begin(), commands.begin() + 2);
    std::sort(setoptions.begin(), setoptions.end());
    EXPECT_EQ(setoptions[0], "setoption name Hash value 64");
    EXPECT_EQ(setoptions[1], "setoption name Threads value 2");
    EXPECT_EQ(commands[2], "position startpos moves e2e4");
    EXPECT_EQ(commands[3], "go movetime 500");
}

TEST(SearchCommandsTest, RepeatedOptionKeySentOnceWithLastValue) {
    SearchJob job;
    job.set_engine_option("Hash", "16").set_engine_option("Hash", "128");

    auto commands = search_commands(job);
    auto setoptions = std::count_if(commands.begin(), commands.end(), [](const std::string &c) {
        return c.rfind("setoption", 0) == 0;
    });
    EXPECT_EQ(setoptions, 1);
    EXPECT_EQ(commands.front(), "setoption name Hash value 128");
}

TEST(SearchCommandsTest, OptionValueWithSpaces) {
    EXPECT_EQ(setoption_command("SyzygyPath", "/tb/a b"),
              "setoption name SyzygyPath value /tb/a b");
}

// ── Result lines ────────────────────────────────────────────────────────────

TEST(BestmoveLineTest, RecognizesPrefix) {
    EXPECT_TRUE(is_bestmove_line("bestmove e2e4"));
    EXPECT_TRUE(is_bestmove_line("bestmove e2e4 ponder e7e5"));
    EXPECT_TRUE(is_bestmove_line("bestmove"));
}

TEST(BestmoveLineTest, RejectsOtherLines) {
    EXPECT_FALSE(is_bestmove_line("info depth 12 score cp 34 pv e2e4"));
    EXPECT_FALSE(is_bestmove_line("info string bestmove soon"));
    EXPECT_FALSE(is_bestmove_line("best"));
    EXPECT_FALSE(is_bestmove_line(""));
    EXPECT_FALSE(is_bestmove_line(" bestmove e2e4"));
}

TEST(BestmoveLineTest, ComparesRawBytes) {
    EXPECT_TRUE(is_bestmove_line("bestmove \xc3\xa9\xff"));
    EXPECT_FALSE(is_bestmove_line("\xc3\xa9stmove e2e4"));
}

TEST(ParseBestmoveTest, MoveAndPonder) {
    SearchResult r = parse_bestmove("bestmove e2e4 ponder e7e5");
    ASSERT_TRUE(r.best_move.has_value());
    ASSERT_TRUE(r.ponder_move.has_value());
    EXPECT_EQ(*r.best_move, "e2e4");
    EXPECT_EQ(*r.ponder_move, "e7e5");
}

TEST(ParseBestmoveTest, MoveOnly) {
    SearchResult r = parse_bestmove("bestmove e2e4");
    ASSERT_TRUE(r.best_move.has_value());
    EXPECT_EQ(*r.best_move, "e2e4");
    EXPECT_FALSE(r.ponder_move.has_value());
}

TEST(ParseBestmoveTest, BareKeywordHasNoMoves) {
    SearchResult r = parse_bestmove("bestmove");
    EXPECT_FALSE(r.best_move.has_value());
    EXPECT_FALSE(r.ponder_move.has_value());
}

TEST(ParseBestmoveTest, DanglingPonderKeyword) {
    SearchResult r = parse_bestmove("bestmove g1f3 ponder");
    EXPECT_EQ(r.best_move.value_or(""), "g1f3");
    EXPECT_FALSE(r.ponder_move.has_value());
}

TEST(ParseBestmoveTest, MovesAreOpaque) {
    SearchResult r = parse_bestmove("bestmove (none)");
    EXPECT_EQ(r.best_move.value_or(""), "(none)");
}

}  // namespace
