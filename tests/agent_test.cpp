#include "agent.h"
#include "notation.h"
#include <gtest/gtest.h>

using namespace xiangqi;

namespace {

Board board_from(const char *fen) {
    Board board;
    EXPECT_TRUE(board.parse_fen(fen)) << fen;
    return board;
}

SearchLimits limits_with(int max_depth, int64_t time_budget_ms) {
    SearchLimits limits;
    limits.max_depth = max_depth;
    limits.time_budget_ms = time_budget_ms;
    return limits;
}

} // namespace

// ==================== EVALUATION ====================

TEST(AgentTest, OpeningIsBalanced) {
    Board board = board_from(XQ_INITIAL_FEN);
    EXPECT_EQ(Agent::evaluate_board(board), 0);

    board.set_turn(XQ_SIDE_BLACK);
    EXPECT_EQ(Agent::evaluate_board(board), 0);
}

TEST(AgentTest, ScoreIsFromTheMoverPerspective) {
    Board board = board_from("R8/9/9/9/9/9/9/9/9/9 w");
    // Material plus seventeen open squares, edge file
    EXPECT_EQ(Agent::evaluate_board(board), XQ_CHARIOT_VALUE + 17 * XQ_CHARIOT_MOBILITY_BONUS);

    board.set_turn(XQ_SIDE_BLACK);
    EXPECT_EQ(Agent::evaluate_board(board), -(XQ_CHARIOT_VALUE + 17 * XQ_CHARIOT_MOBILITY_BONUS));

    Agent agent(&board);
    EXPECT_EQ(agent.evaluate(), Agent::evaluate_board(board));
}

TEST(AgentTest, CrossedSoldierEarnsBonus) {
    Board home = board_from("9/9/9/9/9/4P4/9/9/9/9 w");
    Board crossed = board_from("9/9/9/9/4P4/9/9/9/9/9 w");
    EXPECT_EQ(Agent::evaluate_board(crossed) - Agent::evaluate_board(home), XQ_SOLDIER_CROSSED_BONUS);

    Board black_home = board_from("9/9/9/9/4p4/9/9/9/9/9 b");
    Board black_crossed = board_from("9/9/9/9/9/4p4/9/9/9/9 b");
    EXPECT_EQ(Agent::evaluate_board(black_crossed) - Agent::evaluate_board(black_home), XQ_SOLDIER_CROSSED_BONUS);
}

TEST(AgentTest, CentralFilesScoreHigher) {
    Board center = board_from("9/9/9/9/9/9/4P4/9/9/9 w");
    Board edge = board_from("9/9/9/9/9/9/P8/9/9/9 w");
    EXPECT_EQ(Agent::evaluate_board(center) - Agent::evaluate_board(edge), 4 * XQ_CENTER_FILE_BONUS);
}

TEST(AgentTest, PieceValues) {
    EXPECT_EQ(Agent::get_piece_value(XQ_PIECE_GENERAL), 10000);
    EXPECT_EQ(Agent::get_piece_value(XQ_PIECE_CHARIOT), 900);
    EXPECT_EQ(Agent::get_piece_value(XQ_PIECE_CANNON), 450);
    EXPECT_EQ(Agent::get_piece_value(XQ_PIECE_HORSE), 400);
    EXPECT_EQ(Agent::get_piece_value(XQ_PIECE_ELEPHANT), 200);
    EXPECT_EQ(Agent::get_piece_value(XQ_PIECE_ADVISOR), 200);
    EXPECT_EQ(Agent::get_piece_value(XQ_PIECE_SOLDIER), 100);
    EXPECT_EQ(Agent::get_piece_value(XQ_PIECE_NONE), 0);
}

// ==================== SEARCH ====================

TEST(AgentTest, ShallowOpeningSearchReturnsLegalMove) {
    Board board = board_from(XQ_INITIAL_FEN);
    Agent agent(&board);

    SearchResult result = agent.search(limits_with(1, 3000));
    ASSERT_TRUE(result.best_move.has_value());
    EXPECT_EQ(result.depth, 1);
    EXPECT_GT(result.nodes, 0u);
    EXPECT_TRUE(BoardRules::is_valid_move(board, *result.best_move));
}

TEST(AgentTest, TakesHangingChariot) {
    Board board = board_from("3k5/9/9/9/9/r8/9/9/9/R3K4 w");
    Agent agent(&board);

    SearchResult result = agent.search(limits_with(2, 3000));
    ASSERT_TRUE(result.best_move.has_value());
    EXPECT_EQ(move_to_code(*result.best_move), "a9a5");
    EXPECT_EQ(result.depth, 2);
}

TEST(AgentTest, FindsFlyingGeneralMate) {
    for (int max_depth = 3; max_depth <= 4; max_depth++) {
        Board board = board_from("4k4/9/9/9/9/9/9/9/9/4K4 w");
        Agent agent(&board);

        SearchResult result = agent.search(limits_with(max_depth, 3000));
        ASSERT_TRUE(result.best_move.has_value());
        EXPECT_EQ(move_to_code(*result.best_move), "e9e0");
        EXPECT_EQ(result.score, XQ_MATE_SCORE + 1);
        // Stops as soon as the mate is seen
        EXPECT_EQ(result.depth, 2);
        EXPECT_EQ(format_score(result.score, result.depth), "mate in 1");
    }
}

TEST(AgentTest, NoMovesMeansNoBestMove) {
    Board board = board_from("4k4/9/9/9/9/9/9/9/9/9 w");
    Agent agent(&board);

    SearchResult result = agent.search(limits_with(3, 3000));
    EXPECT_FALSE(result.best_move.has_value());
    EXPECT_LE(result.score, -XQ_MATE_SCORE);
    EXPECT_EQ(result.depth, 0);
}

TEST(AgentTest, SearchRestoresTheBoard) {
    Board board = board_from("r1bakab1r/9/1cn3nc1/p1p1p1p1p/9/2P6/P3P1P1P/1C2C1N2/9/RNBAKAB1R b - - 0 1");
    Board original = board;
    Agent agent(&board);

    agent.search(limits_with(3, 3000));
    EXPECT_EQ(board, original);
}

TEST(AgentTest, ZeroBudgetStillYieldsMove) {
    Board board = board_from(XQ_INITIAL_FEN);
    Agent agent(&board);

    SearchResult result = agent.search(limits_with(6, 0));
    ASSERT_TRUE(result.best_move.has_value());
    EXPECT_GE(result.depth, 1);
    EXPECT_LT(result.depth, 6);
    EXPECT_TRUE(BoardRules::is_valid_move(board, *result.best_move));
}

TEST(AgentTest, UnboundAgentReturnsEmptyResult) {
    Agent agent;
    SearchResult result = agent.search(SearchLimits());
    EXPECT_FALSE(result.best_move.has_value());
    EXPECT_EQ(result.nodes, 0u);
    EXPECT_EQ(agent.evaluate(), 0);
}

// ==================== ANALYZER ====================

TEST(AgentTest, AnalyzeLeavesBoundBoardAlone) {
    Board board = board_from(XQ_INITIAL_FEN);
    Board original = board;
    Agent agent(&board);

    PositionAnalyzer &analyzer = agent;
    SearchResult result = analyzer.analyze("3k5/9/9/9/9/r8/9/9/9/R3K4 w - - 0 1", limits_with(2, 3000));

    ASSERT_TRUE(result.best_move.has_value());
    EXPECT_EQ(move_to_code(*result.best_move), "a9a5");
    EXPECT_EQ(board, original);
    EXPECT_EQ(agent.get_board(), &board);
}

TEST(AgentTest, AnalyzeOfUnparseableFenHasNoMove) {
    Agent agent;
    SearchResult result = agent.analyze("xyz/9 w", limits_with(2, 3000));
    EXPECT_FALSE(result.best_move.has_value());
}

// ==================== TIME BUDGET ====================

namespace {

const char *CHARIOT_FEN = "3k5/9/9/9/9/r8/9/9/9/R3K4 w";

// Completed-iteration totals with a clock that never advances
SearchResult search_without_time_pressure(int max_depth) {
    Board board = board_from(CHARIOT_FEN);
    Agent agent(&board);
    agent.set_clock([]() -> int64_t { return 0; });
    return agent.search(limits_with(max_depth, 1000));
}

} // namespace

TEST(AgentTest, SkipsNextIterationPastHalfBudget) {
    SearchResult two_plies = search_without_time_pressure(2);
    ASSERT_EQ(two_plies.depth, 2);

    Board board = board_from(CHARIOT_FEN);
    Agent agent(&board);
    uint64_t threshold = two_plies.nodes;

    // 600ms have passed once depth 2 is done: over half of 1000, under all of it
    agent.set_clock([&agent, threshold]() -> int64_t {
        return agent.get_nodes_searched() >= threshold ? 600 : 0;
    });
    SearchResult result = agent.search(limits_with(4, 1000));

    EXPECT_EQ(result.depth, 2);
    EXPECT_EQ(result.nodes, two_plies.nodes);
    ASSERT_TRUE(result.best_move.has_value());
    EXPECT_EQ(move_to_code(*result.best_move), move_to_code(*two_plies.best_move));
}

TEST(AgentTest, ContinuesUnderHalfBudget) {
    SearchResult two_plies = search_without_time_pressure(2);

    Board board = board_from(CHARIOT_FEN);
    Agent agent(&board);
    uint64_t threshold = two_plies.nodes;

    agent.set_clock([&agent, threshold]() -> int64_t {
        return agent.get_nodes_searched() >= threshold ? 400 : 0;
    });
    SearchResult result = agent.search(limits_with(3, 1000));

    EXPECT_EQ(result.depth, 3);
    EXPECT_GT(result.nodes, two_plies.nodes);
}

TEST(AgentTest, DiscardsIterationAbandonedMidRootLoop) {
    SearchResult two_plies = search_without_time_pressure(2);
    ASSERT_TRUE(two_plies.best_move.has_value());

    Board board = board_from(CHARIOT_FEN);
    Board original = board;
    Agent agent(&board);
    uint64_t threshold = two_plies.nodes;

    // The budget runs out after the first root move of depth 3
    agent.set_clock([&agent, threshold]() -> int64_t {
        return agent.get_nodes_searched() > threshold ? 5000 : 0;
    });
    SearchResult result = agent.search(limits_with(3, 1000));

    EXPECT_EQ(result.depth, 2);
    EXPECT_EQ(result.score, two_plies.score);
    ASSERT_TRUE(result.best_move.has_value());
    EXPECT_EQ(move_to_code(*result.best_move), move_to_code(*two_plies.best_move));
    EXPECT_GT(result.nodes, two_plies.nodes);
    EXPECT_EQ(board, original);
}

TEST(AgentTest, KeepsAbandonedFirstIteration) {
    Board board = board_from(CHARIOT_FEN);
    Agent agent(&board);

    agent.set_clock([&agent]() -> int64_t {
        return agent.get_nodes_searched() > 0 ? 5000 : 0;
    });
    SearchResult result = agent.search(limits_with(3, 1000));

    EXPECT_EQ(result.depth, 1);
    ASSERT_TRUE(result.best_move.has_value());
    EXPECT_TRUE(BoardRules::is_valid_move(board, *result.best_move));
}
