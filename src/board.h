#ifndef XIANGQI_BOARD_H
#define XIANGQI_BOARD_H

#include <cstdint>
#include <cstring>
#include <string>

// Piece type constants (lowest 3 bits)
#define XQ_PIECE_NONE      0
#define XQ_PIECE_GENERAL   1
#define XQ_PIECE_ADVISOR   2
#define XQ_PIECE_ELEPHANT  3
#define XQ_PIECE_HORSE     4
#define XQ_PIECE_CHARIOT   5
#define XQ_PIECE_CANNON    6
#define XQ_PIECE_SOLDIER   7

// Color constants (bits 3-4)
#define XQ_COLOR_NONE  0
#define XQ_COLOR_RED   8
#define XQ_COLOR_BLACK 16

// Masks for bitwise operations
#define XQ_PIECE_TYPE_MASK 7
#define XQ_COLOR_MASK      24

// Helper macros
#define XQ_GET_PIECE_TYPE(square) ((square) & XQ_PIECE_TYPE_MASK)
#define XQ_GET_COLOR(square) ((square) & XQ_COLOR_MASK)
#define XQ_MAKE_PIECE(type, color) ((type) | (color))
#define XQ_IS_EMPTY(square) (((square) & XQ_PIECE_TYPE_MASK) == 0)
#define XQ_IS_RED(square) (((square) & XQ_COLOR_MASK) == XQ_COLOR_RED)
#define XQ_IS_BLACK(square) (((square) & XQ_COLOR_MASK) == XQ_COLOR_BLACK)

// Board geometry: row 0 is black's back rank, row 9 is red's.
#define XQ_ROWS      10
#define XQ_COLS      9
#define XQ_SQUARES   90
#define XQ_NO_SQUARE 255

#define XQ_SQUARE(row, col) ((row) * XQ_COLS + (col))
#define XQ_ROW_OF(square) ((square) / XQ_COLS)
#define XQ_COL_OF(square) ((square) % XQ_COLS)
#define XQ_ON_BOARD(row, col) ((row) >= 0 && (row) < XQ_ROWS && (col) >= 0 && (col) < XQ_COLS)

// Side to move
#define XQ_SIDE_RED   0
#define XQ_SIDE_BLACK 1
#define XQ_SIDE_COLOR(side) ((side) == XQ_SIDE_RED ? XQ_COLOR_RED : XQ_COLOR_BLACK)

#define XQ_INITIAL_FEN "rnbakabnr/9/1c5c1/p1p1p1p1p/9/9/P1P1P1P1P/1C5C1/9/RNBAKABNR w - - 0 1"

namespace xiangqi {

// ==================== MOVE STRUCTURES ====================

struct Move {
    uint8_t from;
    uint8_t to;
    uint8_t captured;  // Piece that stood on `to` before the move (XQ_PIECE_NONE if empty)

    inline bool same_squares(const Move &other) const {
        return from == other.from && to == other.to;
    }
};

// Pre-allocated move list to avoid heap allocations during search
struct MoveList {
    Move moves[256];
    int count;

    MoveList() : count(0) {}

    inline void clear() { count = 0; }
    inline void add(uint8_t from, uint8_t to, uint8_t captured) {
        moves[count++] = {from, to, captured};
    }
    bool contains(uint8_t from, uint8_t to) const;
};

// ==================== BOARD CLASS ====================

class Board {
private:
    // 10 rows x 9 columns, row-major
    uint8_t squares[XQ_SQUARES];

    // XQ_SIDE_RED or XQ_SIDE_BLACK
    uint8_t turn;

public:
    Board();

    void clear();

    // Reads piece placement and side to move; halfmove/fullmove fields are ignored.
    // Returns false (leaving an empty board) on an unknown piece letter.
    bool parse_fen(const std::string &fen);
    std::string generate_fen() const;

    uint8_t get_turn() const { return turn; }
    void set_turn(uint8_t side);

    uint8_t get_piece(int row, int col) const;
    void set_piece(int row, int col, uint8_t piece);
    uint8_t get_piece_on_square(uint8_t square) const;
    const uint8_t *get_squares() const { return squares; }

    // Square of the given side's general, or XQ_NO_SQUARE
    uint8_t find_general(uint8_t side) const;
    int count_pieces() const;

    // No legality check. Records the captured piece in `move` and flips the side to move.
    void make_move(Move &move);
    // Exact inverse of the immediately preceding make_move.
    void unmake_move(const Move &move);

    bool operator==(const Board &other) const;
    bool operator!=(const Board &other) const { return !(*this == other); }

    static char piece_to_char(uint8_t piece);
    static uint8_t char_to_piece(char c);
};

// Applies a move for the lifetime of the guard and undoes it on every exit path.
class MoveGuard {
private:
    Board &board;
    Move &move;

public:
    MoveGuard(Board &p_board, Move &p_move) : board(p_board), move(p_move) {
        board.make_move(move);
    }
    ~MoveGuard() {
        board.unmake_move(move);
    }

    MoveGuard(const MoveGuard &) = delete;
    MoveGuard &operator=(const MoveGuard &) = delete;
};

} // namespace xiangqi

#endif // XIANGQI_BOARD_H
