#ifndef XIANGQI_AGENT_H
#define XIANGQI_AGENT_H

#include "board.h"
#include "board_rules.h"
#include "position_analyzer.h"
#include <chrono>
#include <cstdint>
#include <functional>

// ==================== EVALUATION CONSTANTS ====================

// Terminal scores sit above any material sum: XQ_MATE_SCORE + remaining depth
#define XQ_MATE_SCORE 100000
#define XQ_INFINITY   1000000

// Piece values
#define XQ_GENERAL_VALUE  10000
#define XQ_CHARIOT_VALUE  900
#define XQ_CANNON_VALUE   450
#define XQ_HORSE_VALUE    400
#define XQ_ELEPHANT_VALUE 200
#define XQ_ADVISOR_VALUE  200
#define XQ_SOLDIER_VALUE  100

// Positional terms
#define XQ_SOLDIER_CROSSED_BONUS 80
#define XQ_CHARIOT_MOBILITY_BONUS 5   // Per empty square in the four straight lines
#define XQ_CENTER_FILE_BONUS 3        // Per column closer to the middle file

namespace xiangqi {

inline bool is_mate_score(int score) {
    return score >= XQ_MATE_SCORE || score <= -XQ_MATE_SCORE;
}

class Agent : public PositionAnalyzer {
private:
    // ==================== BOARD REFERENCE ====================
    Board *board;  // Mutated in place by make/unmake during search

    // ==================== SEARCH STATE ====================
    uint64_t nodes_searched;
    int64_t search_start_ms;

    // Monotonic milliseconds; steady_clock when unset
    std::function<int64_t()> clock;

    int64_t now_ms() const;
    int64_t elapsed_ms() const;

    int negamax(int depth, int alpha, int beta);

public:
    Agent();
    explicit Agent(Board *p_board);

    // ==================== BOARD BINDING ====================
    void set_board(Board *p_board) { board = p_board; }
    Board *get_board() const { return board; }

    void set_clock(std::function<int64_t()> p_clock) { clock = p_clock; }
    uint64_t get_nodes_searched() const { return nodes_searched; }

    // ==================== EVALUATION ====================
    // Score of the bound board for the side to move (positive favors the mover)
    int evaluate() const;
    static int evaluate_board(const Board &board);
    static int get_piece_value(uint8_t piece_type);

    // ==================== SEARCH INTERFACE ====================
    // Iterative-deepening negamax on the bound board
    SearchResult search(const SearchLimits &limits);

    // Searches a private board built from `fen`; the bound board is untouched.
    SearchResult analyze(const std::string &fen, const SearchLimits &limits) override;
};

} // namespace xiangqi

#endif // XIANGQI_AGENT_H
