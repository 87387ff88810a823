#include "board.h"
#include "log.h"
#include <sstream>

namespace xiangqi {

// ==================== MOVE LIST ====================

bool MoveList::contains(uint8_t from, uint8_t to) const {
    for (int i = 0; i < count; i++) {
        if (moves[i].from == from && moves[i].to == to) return true;
    }
    return false;
}

// ==================== CONSTRUCTOR ====================

Board::Board() {
    clear();
}

// ==================== BOARD SETUP ====================

void Board::clear() {
    memset(squares, 0, sizeof(squares));
    turn = XQ_SIDE_RED;
}

void Board::set_turn(uint8_t side) {
    turn = (side == XQ_SIDE_BLACK) ? XQ_SIDE_BLACK : XQ_SIDE_RED;
}

uint8_t Board::get_piece(int row, int col) const {
    if (!XQ_ON_BOARD(row, col)) return XQ_PIECE_NONE;
    return squares[XQ_SQUARE(row, col)];
}

void Board::set_piece(int row, int col, uint8_t piece) {
    if (!XQ_ON_BOARD(row, col)) return;
    squares[XQ_SQUARE(row, col)] = piece;
}

uint8_t Board::get_piece_on_square(uint8_t square) const {
    if (square >= XQ_SQUARES) return XQ_PIECE_NONE;
    return squares[square];
}

uint8_t Board::find_general(uint8_t side) const {
    uint8_t general = XQ_MAKE_PIECE(XQ_PIECE_GENERAL, XQ_SIDE_COLOR(side));
    for (int sq = 0; sq < XQ_SQUARES; sq++) {
        if (squares[sq] == general) return sq;
    }
    return XQ_NO_SQUARE;
}

int Board::count_pieces() const {
    int count = 0;
    for (int sq = 0; sq < XQ_SQUARES; sq++) {
        if (!XQ_IS_EMPTY(squares[sq])) count++;
    }
    return count;
}

// ==================== FEN ====================

char Board::piece_to_char(uint8_t piece) {
    char piece_char = '.';
    switch (XQ_GET_PIECE_TYPE(piece)) {
        case XQ_PIECE_GENERAL:  piece_char = 'k'; break;
        case XQ_PIECE_ADVISOR:  piece_char = 'a'; break;
        case XQ_PIECE_ELEPHANT: piece_char = 'b'; break;
        case XQ_PIECE_HORSE:    piece_char = 'n'; break;
        case XQ_PIECE_CHARIOT:  piece_char = 'r'; break;
        case XQ_PIECE_CANNON:   piece_char = 'c'; break;
        case XQ_PIECE_SOLDIER:  piece_char = 'p'; break;
        default: return piece_char;
    }
    if (XQ_IS_RED(piece)) piece_char -= 32;
    return piece_char;
}

uint8_t Board::char_to_piece(char c) {
    uint8_t color = (c >= 'A' && c <= 'Z') ? XQ_COLOR_RED : XQ_COLOR_BLACK;
    char lower_c = (c >= 'A' && c <= 'Z') ? (c + 32) : c;

    switch (lower_c) {
        case 'k': return XQ_MAKE_PIECE(XQ_PIECE_GENERAL, color);
        case 'a': return XQ_MAKE_PIECE(XQ_PIECE_ADVISOR, color);
        case 'b': return XQ_MAKE_PIECE(XQ_PIECE_ELEPHANT, color);
        case 'n': return XQ_MAKE_PIECE(XQ_PIECE_HORSE, color);
        case 'r': return XQ_MAKE_PIECE(XQ_PIECE_CHARIOT, color);
        case 'c': return XQ_MAKE_PIECE(XQ_PIECE_CANNON, color);
        case 'p': return XQ_MAKE_PIECE(XQ_PIECE_SOLDIER, color);
        default: return XQ_PIECE_NONE;
    }
}

bool Board::parse_fen(const std::string &fen) {
    clear();

    std::istringstream fields(fen);
    std::string placement;
    std::string side;
    fields >> placement >> side;

    if (placement.empty()) {
        log_message(LOG_WARNING, "Empty FEN placement field");
        return false;
    }

    // Short rows stay empty; cells past column 8 or row 9 are dropped.
    int row = 0;
    int col = 0;
    for (size_t i = 0; i < placement.size(); i++) {
        char c = placement[i];

        if (c == '/') {
            row++;
            col = 0;
            continue;
        }

        if (c >= '0' && c <= '9') {
            col += (c - '0');
            continue;
        }

        uint8_t piece = char_to_piece(c);
        if (piece == XQ_PIECE_NONE) {
            clear();
            log_message(LOG_WARNING, "Malformed FEN (unknown piece '", c, "'): ", fen);
            return false;
        }

        if (row < XQ_ROWS && col < XQ_COLS) {
            squares[XQ_SQUARE(row, col)] = piece;
        }
        col++;
    }

    turn = (side == "b") ? XQ_SIDE_BLACK : XQ_SIDE_RED;
    return true;
}

std::string Board::generate_fen() const {
    std::string fen;

    for (int row = 0; row < XQ_ROWS; row++) {
        int empty_count = 0;

        for (int col = 0; col < XQ_COLS; col++) {
            uint8_t piece = squares[XQ_SQUARE(row, col)];

            if (XQ_IS_EMPTY(piece)) {
                empty_count++;
            } else {
                if (empty_count > 0) {
                    fen += static_cast<char>('0' + empty_count);
                    empty_count = 0;
                }
                fen += piece_to_char(piece);
            }
        }

        if (empty_count > 0) fen += static_cast<char>('0' + empty_count);
        if (row < XQ_ROWS - 1) fen += "/";
    }

    // Counters are not tracked; consumers expect the full six fields.
    fen += (turn == XQ_SIDE_RED) ? " w" : " b";
    fen += " - - 0 1";

    return fen;
}

// ==================== MAKE / UNMAKE ====================

void Board::make_move(Move &move) {
    move.captured = squares[move.to];
    squares[move.to] = squares[move.from];
    squares[move.from] = XQ_PIECE_NONE;
    turn = 1 - turn;
}

void Board::unmake_move(const Move &move) {
    squares[move.from] = squares[move.to];
    squares[move.to] = move.captured;
    turn = 1 - turn;
}

bool Board::operator==(const Board &other) const {
    return turn == other.turn && memcmp(squares, other.squares, sizeof(squares)) == 0;
}

} // namespace xiangqi
