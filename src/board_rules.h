#ifndef XIANGQI_BOARD_RULES_H
#define XIANGQI_BOARD_RULES_H

#include "board.h"

namespace xiangqi {

// Per-piece movement rules. Generation and single-move validation share one table.
//
// Moves are pseudo-legal: the only filter is that the target is not occupied
// by an allied piece. A move that leaves the mover's own general capturable is
// still generated.
class BoardRules {
public:
    typedef void (*PieceMoveGenerator)(const Board &board, uint8_t from, MoveList &moves);

    // All pseudo-legal moves for `side` (XQ_SIDE_RED or XQ_SIDE_BLACK)
    static void generate_moves(const Board &board, uint8_t side, MoveList &moves);

    // Pseudo-legal moves of the piece on `square`, whatever its color
    static void generate_for_square(const Board &board, uint8_t square, MoveList &moves);

    // True if `move` is generated for the side to move
    static bool is_valid_move(const Board &board, const Move &move);

    // True if the opponent has a pseudo-move capturing `side`'s general
    static bool is_in_check(const Board &board, uint8_t side);

    static bool in_palace(int row, int col, uint8_t color);
    static bool in_own_half(int row, uint8_t color);
    static bool has_crossed_river(int row, uint8_t color);

private:
    static const PieceMoveGenerator PIECE_GENERATORS[8];

    static void generate_general_moves(const Board &board, uint8_t from, MoveList &moves);
    static void generate_advisor_moves(const Board &board, uint8_t from, MoveList &moves);
    static void generate_elephant_moves(const Board &board, uint8_t from, MoveList &moves);
    static void generate_horse_moves(const Board &board, uint8_t from, MoveList &moves);
    static void generate_chariot_moves(const Board &board, uint8_t from, MoveList &moves);
    static void generate_cannon_moves(const Board &board, uint8_t from, MoveList &moves);
    static void generate_soldier_moves(const Board &board, uint8_t from, MoveList &moves);

    static void add_move(const Board &board, uint8_t from, int to_row, int to_col, MoveList &moves);
};

} // namespace xiangqi

#endif // XIANGQI_BOARD_RULES_H
