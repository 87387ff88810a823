#include "agent.h"
#include "log.h"
#include "notation.h"
#include <algorithm>
#include <cstdlib>

namespace xiangqi {

static const int ORTHOGONAL_DELTAS[4][2] = {
    {-1, 0}, {1, 0}, {0, -1}, {0, 1}
};

// ==================== CONSTRUCTOR ====================

Agent::Agent() {
    board = nullptr;
    nodes_searched = 0;
    search_start_ms = 0;
}

Agent::Agent(Board *p_board) {
    board = p_board;
    nodes_searched = 0;
    search_start_ms = 0;
}

int64_t Agent::now_ms() const {
    if (clock) return clock();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

int64_t Agent::elapsed_ms() const {
    return now_ms() - search_start_ms;
}

// ==================== EVALUATION ====================

int Agent::get_piece_value(uint8_t piece_type) {
    switch (piece_type) {
        case XQ_PIECE_GENERAL:  return XQ_GENERAL_VALUE;
        case XQ_PIECE_CHARIOT:  return XQ_CHARIOT_VALUE;
        case XQ_PIECE_CANNON:   return XQ_CANNON_VALUE;
        case XQ_PIECE_HORSE:    return XQ_HORSE_VALUE;
        case XQ_PIECE_ELEPHANT: return XQ_ELEPHANT_VALUE;
        case XQ_PIECE_ADVISOR:  return XQ_ADVISOR_VALUE;
        case XQ_PIECE_SOLDIER:  return XQ_SOLDIER_VALUE;
        default:                return 0;
    }
}

int Agent::evaluate_board(const Board &board) {
    int score = 0;
    const uint8_t *squares = board.get_squares();

    for (int sq = 0; sq < XQ_SQUARES; sq++) {
        uint8_t piece = squares[sq];
        if (XQ_IS_EMPTY(piece)) continue;

        uint8_t type = XQ_GET_PIECE_TYPE(piece);
        uint8_t color = XQ_GET_COLOR(piece);
        int row = XQ_ROW_OF(sq);
        int col = XQ_COL_OF(sq);
        int value = get_piece_value(type);

        if (type == XQ_PIECE_SOLDIER && BoardRules::has_crossed_river(row, color)) {
            value += XQ_SOLDIER_CROSSED_BONUS;
        }

        if (type == XQ_PIECE_CHARIOT) {
            int mobility = 0;
            for (int dir = 0; dir < 4; dir++) {
                int r = row + ORTHOGONAL_DELTAS[dir][0];
                int c = col + ORTHOGONAL_DELTAS[dir][1];
                while (XQ_ON_BOARD(r, c) && XQ_IS_EMPTY(board.get_piece(r, c))) {
                    mobility++;
                    r += ORTHOGONAL_DELTAS[dir][0];
                    c += ORTHOGONAL_DELTAS[dir][1];
                }
            }
            value += mobility * XQ_CHARIOT_MOBILITY_BONUS;
        }

        value += (4 - std::abs(col - 4)) * XQ_CENTER_FILE_BONUS;

        score += (color == XQ_COLOR_RED) ? value : -value;
    }

    return (board.get_turn() == XQ_SIDE_RED) ? score : -score;
}

int Agent::evaluate() const {
    if (!board) return 0;
    return evaluate_board(*board);
}

// ==================== ALPHA-BETA SEARCH ====================

int Agent::negamax(int depth, int alpha, int beta) {
    nodes_searched++;

    if (depth == 0) {
        return evaluate();
    }

    MoveList moves;
    BoardRules::generate_moves(*board, board->get_turn(), moves);

    // No moves is a loss; more remaining depth means a faster mate
    if (moves.count == 0) {
        return -(XQ_MATE_SCORE + depth);
    }

    int best_score = -XQ_INFINITY;

    for (int i = 0; i < moves.count; i++) {
        MoveGuard guard(*board, moves.moves[i]);
        int score = -negamax(depth - 1, -beta, -alpha);

        if (score > best_score) {
            best_score = score;
        }
        if (score > alpha) {
            alpha = score;
        }
        if (alpha >= beta) {
            break;
        }
    }

    return best_score;
}

// ==================== SEARCH INTERFACE ====================

SearchResult Agent::search(const SearchLimits &limits) {
    SearchResult result;
    if (!board) return result;

    int max_depth = std::max(1, limits.max_depth);
    int64_t time_budget = std::max<int64_t>(0, limits.time_budget_ms);

    nodes_searched = 0;
    search_start_ms = now_ms();

    for (int current_depth = 1; current_depth <= max_depth; current_depth++) {
        // The first two iterations always run
        if (current_depth > 2 && elapsed_ms() > time_budget / 2) break;

        MoveList moves;
        BoardRules::generate_moves(*board, board->get_turn(), moves);

        if (moves.count == 0) {
            result.score = -(XQ_MATE_SCORE + current_depth);
            break;
        }

        int alpha = -XQ_INFINITY;
        int beta = XQ_INFINITY;
        int best_score = -XQ_INFINITY;
        int best_index = -1;
        bool abandoned = false;

        for (int i = 0; i < moves.count; i++) {
            int score;
            {
                MoveGuard guard(*board, moves.moves[i]);

                if (best_index < 0) {
                    score = -negamax(current_depth - 1, -beta, -alpha);
                } else {
                    // Null-window probe against the current best, widened on fail-high
                    score = -negamax(current_depth - 1, -alpha - 1, -alpha);
                    if (score > alpha && score < beta) {
                        score = -negamax(current_depth - 1, -beta, -alpha);
                    }
                }
            }

            if (score > best_score) {
                best_score = score;
                best_index = i;
            }
            if (score > alpha) {
                alpha = score;
            }
            if (alpha >= beta) {
                break;
            }

            if (elapsed_ms() > time_budget) {
                abandoned = (i + 1 < moves.count);
                break;
            }
        }

        // An abandoned iteration only counts when nothing deeper-completed exists
        if (best_index >= 0 && (!abandoned || result.depth == 0)) {
            result.best_move = moves.moves[best_index];
            result.score = best_score;
            result.depth = current_depth;

            log_message(LOG_VERBOSE, "Iteration: depth=", current_depth,
                        " best=", move_to_code(moves.moves[best_index]),
                        " score=", best_score, " nodes=", nodes_searched);
        }

        if (abandoned || elapsed_ms() > time_budget) break;

        // Early stop on a forced result (see the open-question decisions in DESIGN.md)
        if (is_mate_score(best_score)) break;
    }

    result.nodes = nodes_searched;
    result.elapsed_ms = elapsed_ms();

    log_message(LOG_INFO, "Search: depth=", result.depth, " nodes=", result.nodes,
                " time=", result.elapsed_ms, "ms best=",
                result.best_move ? move_to_code(*result.best_move) : std::string("none"),
                " score=", result.score);

    return result;
}

SearchResult Agent::analyze(const std::string &fen, const SearchLimits &limits) {
    Board position;
    if (!position.parse_fen(fen)) {
        log_message(LOG_WARNING, "Analyzing an empty board for unparseable FEN: ", fen);
    }

    Agent worker(&position);
    worker.set_clock(clock);
    return worker.search(limits);
}

} // namespace xiangqi
