#include "board_rules.h"

namespace xiangqi {

// Orthogonal offsets: {row_delta, col_delta}
static const int ORTHOGONAL_DELTAS[4][2] = {
    {-1, 0}, {1, 0}, {0, -1}, {0, 1}
};

static const int DIAGONAL_DELTAS[4][2] = {
    {-1, -1}, {-1, 1}, {1, -1}, {1, 1}
};

// Horse jumps and the leg square that blocks each one
static const int HORSE_JUMPS[8][2] = {
    {-2, -1}, {-2, 1}, {2, -1}, {2, 1},
    {-1, -2}, {-1, 2}, {1, -2}, {1, 2}
};
static const int HORSE_LEGS[8][2] = {
    {-1, 0}, {-1, 0}, {1, 0}, {1, 0},
    {0, -1}, {0, 1}, {0, -1}, {0, 1}
};

// Indexed by piece type
const BoardRules::PieceMoveGenerator BoardRules::PIECE_GENERATORS[8] = {
    nullptr,
    &BoardRules::generate_general_moves,
    &BoardRules::generate_advisor_moves,
    &BoardRules::generate_elephant_moves,
    &BoardRules::generate_horse_moves,
    &BoardRules::generate_chariot_moves,
    &BoardRules::generate_cannon_moves,
    &BoardRules::generate_soldier_moves
};

// ==================== REGIONS ====================

bool BoardRules::in_palace(int row, int col, uint8_t color) {
    if (col < 3 || col > 5) return false;
    return (color == XQ_COLOR_RED) ? (row >= 7 && row <= 9) : (row >= 0 && row <= 2);
}

bool BoardRules::in_own_half(int row, uint8_t color) {
    return (color == XQ_COLOR_RED) ? row >= 5 : row <= 4;
}

bool BoardRules::has_crossed_river(int row, uint8_t color) {
    return !in_own_half(row, color);
}

// ==================== MOVE GENERATION ====================

void BoardRules::add_move(const Board &board, uint8_t from, int to_row, int to_col, MoveList &moves) {
    if (!XQ_ON_BOARD(to_row, to_col)) return;

    uint8_t target = board.get_piece(to_row, to_col);
    if (!XQ_IS_EMPTY(target) && XQ_GET_COLOR(target) == XQ_GET_COLOR(board.get_piece_on_square(from))) {
        return;
    }
    moves.add(from, XQ_SQUARE(to_row, to_col), target);
}

void BoardRules::generate_general_moves(const Board &board, uint8_t from, MoveList &moves) {
    uint8_t color = XQ_GET_COLOR(board.get_piece_on_square(from));
    int row = XQ_ROW_OF(from);
    int col = XQ_COL_OF(from);

    for (int i = 0; i < 4; i++) {
        int to_row = row + ORTHOGONAL_DELTAS[i][0];
        int to_col = col + ORTHOGONAL_DELTAS[i][1];
        if (in_palace(to_row, to_col, color)) {
            add_move(board, from, to_row, to_col, moves);
        }
    }

    // Flying general: the first piece straight ahead on this file is the enemy general
    uint8_t enemy_general = XQ_MAKE_PIECE(XQ_PIECE_GENERAL,
                                          color == XQ_COLOR_RED ? XQ_COLOR_BLACK : XQ_COLOR_RED);
    int direction = (color == XQ_COLOR_RED) ? -1 : 1;
    for (int r = row + direction; r >= 0 && r < XQ_ROWS; r += direction) {
        uint8_t target = board.get_piece(r, col);
        if (XQ_IS_EMPTY(target)) continue;
        if (target == enemy_general) {
            moves.add(from, XQ_SQUARE(r, col), target);
        }
        break;
    }
}

void BoardRules::generate_advisor_moves(const Board &board, uint8_t from, MoveList &moves) {
    uint8_t color = XQ_GET_COLOR(board.get_piece_on_square(from));
    int row = XQ_ROW_OF(from);
    int col = XQ_COL_OF(from);

    for (int i = 0; i < 4; i++) {
        int to_row = row + DIAGONAL_DELTAS[i][0];
        int to_col = col + DIAGONAL_DELTAS[i][1];
        if (in_palace(to_row, to_col, color)) {
            add_move(board, from, to_row, to_col, moves);
        }
    }
}

void BoardRules::generate_elephant_moves(const Board &board, uint8_t from, MoveList &moves) {
    uint8_t color = XQ_GET_COLOR(board.get_piece_on_square(from));
    int row = XQ_ROW_OF(from);
    int col = XQ_COL_OF(from);

    for (int i = 0; i < 4; i++) {
        int to_row = row + 2 * DIAGONAL_DELTAS[i][0];
        int to_col = col + 2 * DIAGONAL_DELTAS[i][1];
        if (!XQ_ON_BOARD(to_row, to_col) || !in_own_half(to_row, color)) continue;

        // Blocked eye
        if (!XQ_IS_EMPTY(board.get_piece(row + DIAGONAL_DELTAS[i][0], col + DIAGONAL_DELTAS[i][1]))) continue;

        add_move(board, from, to_row, to_col, moves);
    }
}

void BoardRules::generate_horse_moves(const Board &board, uint8_t from, MoveList &moves) {
    int row = XQ_ROW_OF(from);
    int col = XQ_COL_OF(from);

    for (int i = 0; i < 8; i++) {
        int to_row = row + HORSE_JUMPS[i][0];
        int to_col = col + HORSE_JUMPS[i][1];
        if (!XQ_ON_BOARD(to_row, to_col)) continue;

        // Hobbled leg
        if (!XQ_IS_EMPTY(board.get_piece(row + HORSE_LEGS[i][0], col + HORSE_LEGS[i][1]))) continue;

        add_move(board, from, to_row, to_col, moves);
    }
}

void BoardRules::generate_chariot_moves(const Board &board, uint8_t from, MoveList &moves) {
    uint8_t color = XQ_GET_COLOR(board.get_piece_on_square(from));
    int row = XQ_ROW_OF(from);
    int col = XQ_COL_OF(from);

    for (int dir = 0; dir < 4; dir++) {
        int r = row + ORTHOGONAL_DELTAS[dir][0];
        int c = col + ORTHOGONAL_DELTAS[dir][1];

        while (XQ_ON_BOARD(r, c)) {
            uint8_t target = board.get_piece(r, c);

            if (XQ_IS_EMPTY(target)) {
                moves.add(from, XQ_SQUARE(r, c), XQ_PIECE_NONE);
            } else {
                if (XQ_GET_COLOR(target) != color) {
                    moves.add(from, XQ_SQUARE(r, c), target);
                }
                break;
            }
            r += ORTHOGONAL_DELTAS[dir][0];
            c += ORTHOGONAL_DELTAS[dir][1];
        }
    }
}

void BoardRules::generate_cannon_moves(const Board &board, uint8_t from, MoveList &moves) {
    uint8_t color = XQ_GET_COLOR(board.get_piece_on_square(from));
    int row = XQ_ROW_OF(from);
    int col = XQ_COL_OF(from);

    for (int dir = 0; dir < 4; dir++) {
        int r = row + ORTHOGONAL_DELTAS[dir][0];
        int c = col + ORTHOGONAL_DELTAS[dir][1];
        bool screened = false;

        while (XQ_ON_BOARD(r, c)) {
            uint8_t target = board.get_piece(r, c);

            if (!screened) {
                if (XQ_IS_EMPTY(target)) {
                    moves.add(from, XQ_SQUARE(r, c), XQ_PIECE_NONE);
                } else {
                    screened = true;
                }
            } else if (!XQ_IS_EMPTY(target)) {
                // Exactly one piece jumped; only an enemy can be taken
                if (XQ_GET_COLOR(target) != color) {
                    moves.add(from, XQ_SQUARE(r, c), target);
                }
                break;
            }
            r += ORTHOGONAL_DELTAS[dir][0];
            c += ORTHOGONAL_DELTAS[dir][1];
        }
    }
}

void BoardRules::generate_soldier_moves(const Board &board, uint8_t from, MoveList &moves) {
    uint8_t color = XQ_GET_COLOR(board.get_piece_on_square(from));
    int row = XQ_ROW_OF(from);
    int col = XQ_COL_OF(from);
    int forward = (color == XQ_COLOR_RED) ? -1 : 1;

    add_move(board, from, row + forward, col, moves);

    // Sideways steps only after crossing; never backward
    if (has_crossed_river(row, color)) {
        add_move(board, from, row, col - 1, moves);
        add_move(board, from, row, col + 1, moves);
    }
}

void BoardRules::generate_for_square(const Board &board, uint8_t square, MoveList &moves) {
    uint8_t piece = board.get_piece_on_square(square);
    if (XQ_IS_EMPTY(piece)) return;

    PieceMoveGenerator generator = PIECE_GENERATORS[XQ_GET_PIECE_TYPE(piece)];
    generator(board, square, moves);
}

void BoardRules::generate_moves(const Board &board, uint8_t side, MoveList &moves) {
    moves.clear();

    uint8_t color = XQ_SIDE_COLOR(side);
    const uint8_t *squares = board.get_squares();

    for (int sq = 0; sq < XQ_SQUARES; sq++) {
        uint8_t piece = squares[sq];
        if (XQ_IS_EMPTY(piece) || XQ_GET_COLOR(piece) != color) continue;
        PIECE_GENERATORS[XQ_GET_PIECE_TYPE(piece)](board, sq, moves);
    }
}

// ==================== VALIDATION ====================

bool BoardRules::is_valid_move(const Board &board, const Move &move) {
    if (move.from >= XQ_SQUARES || move.to >= XQ_SQUARES) return false;

    uint8_t piece = board.get_piece_on_square(move.from);
    if (XQ_IS_EMPTY(piece) || XQ_GET_COLOR(piece) != XQ_SIDE_COLOR(board.get_turn())) {
        return false;
    }

    MoveList moves;
    generate_for_square(board, move.from, moves);
    return moves.contains(move.from, move.to);
}

bool BoardRules::is_in_check(const Board &board, uint8_t side) {
    uint8_t general_square = board.find_general(side);
    if (general_square == XQ_NO_SQUARE) return false;

    MoveList moves;
    generate_moves(board, 1 - side, moves);
    for (int i = 0; i < moves.count; i++) {
        if (moves.moves[i].to == general_square) return true;
    }
    return false;
}

} // namespace xiangqi
