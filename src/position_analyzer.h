#ifndef XIANGQI_POSITION_ANALYZER_H
#define XIANGQI_POSITION_ANALYZER_H

#include "board.h"
#include <cstdint>
#include <optional>
#include <string>

namespace xiangqi {

struct SearchLimits {
    int max_depth = 4;
    int64_t time_budget_ms = 3000;  // Soft: checked between root moves and iterations only
};

struct SearchResult {
    std::optional<Move> best_move;  // Absent when the side to move has no moves
    int score = 0;                  // From the side to move's perspective
    int depth = 0;                  // Last iteration that produced the best move
    uint64_t nodes = 0;
    int64_t elapsed_ms = 0;
};

// Anything that can recommend a move for a FEN position: the built-in search,
// or an adapter around an external UCI engine process.
class PositionAnalyzer {
public:
    virtual ~PositionAnalyzer() {}

    virtual SearchResult analyze(const std::string &fen, const SearchLimits &limits) = 0;
};

} // namespace xiangqi

#endif // XIANGQI_POSITION_ANALYZER_H
