#include "notation.h"
#include "agent.h"
#include <cstdio>
#include <cstdlib>

namespace xiangqi {

static const char *const CHINESE_NUMERALS[9] = {
    "一", "二", "三", "四", "五", "六", "七", "八", "九"
};

static const char *const FULLWIDTH_DIGITS[9] = {
    "１", "２", "３", "４", "５", "６", "７", "８", "９"
};

// Indexed by piece type
static const char *const RED_PIECE_NAMES[8] = {
    "", "帥", "仕", "相", "馬", "車", "炮", "兵"
};
static const char *const BLACK_PIECE_NAMES[8] = {
    "", "將", "士", "象", "马", "车", "砲", "卒"
};

// ==================== MOVE CODES ====================

std::string square_to_code(uint8_t square) {
    std::string code;
    code += static_cast<char>('a' + XQ_COL_OF(square));
    code += static_cast<char>('0' + XQ_ROW_OF(square));
    return code;
}

std::string move_to_code(const Move &move) {
    return square_to_code(move.from) + square_to_code(move.to);
}

std::optional<uint8_t> code_to_square(const std::string &code) {
    if (code.size() != 2) return std::nullopt;

    char file = code[0];
    char rank = code[1];
    if (file < 'a' || file >= 'a' + XQ_COLS) return std::nullopt;
    if (rank < '0' || rank >= '0' + XQ_ROWS) return std::nullopt;

    return static_cast<uint8_t>(XQ_SQUARE(rank - '0', file - 'a'));
}

std::optional<Move> code_to_move(const std::string &code) {
    if (code.size() != 4) return std::nullopt;

    std::optional<uint8_t> from = code_to_square(code.substr(0, 2));
    std::optional<uint8_t> to = code_to_square(code.substr(2, 2));
    if (!from || !to) return std::nullopt;

    Move move = {*from, *to, XQ_PIECE_NONE};
    return move;
}

// ==================== SCORES ====================

std::string format_centipawns(int score) {
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%+.2f", score / 100.0);
    return buffer;
}

std::string format_score(int score, int depth) {
    if (!is_mate_score(score)) {
        return format_centipawns(score);
    }

    // Terminal scores carry the remaining depth at the ply with no moves
    int remaining = std::abs(score) - XQ_MATE_SCORE;
    int ply = depth - remaining;
    if (ply < 0) ply = 0;

    if (score > 0) {
        return "mate in " + std::to_string((ply + 1) / 2);
    }
    return "mated in " + std::to_string(ply / 2);
}

// ==================== CHINESE NOTATION ====================

std::string move_to_chinese(const Board &board, const Move &move) {
    uint8_t piece = board.get_piece_on_square(move.from);
    if (XQ_IS_EMPTY(piece) || move.to >= XQ_SQUARES) return "";

    bool red = XQ_IS_RED(piece);
    int from_col = XQ_COL_OF(move.from);
    int to_col = XQ_COL_OF(move.to);
    int row_delta = XQ_ROW_OF(move.to) - XQ_ROW_OF(move.from);

    // Red counts files from column 8 as one, black from column 0
    const char *const *numbers = red ? CHINESE_NUMERALS : FULLWIDTH_DIGITS;
    int from_file = red ? (XQ_COLS - 1 - from_col) : from_col;
    int to_file = red ? (XQ_COLS - 1 - to_col) : to_col;

    std::string notation = red ? RED_PIECE_NAMES[XQ_GET_PIECE_TYPE(piece)]
                               : BLACK_PIECE_NAMES[XQ_GET_PIECE_TYPE(piece)];
    notation += numbers[from_file];

    int forward_delta = red ? -row_delta : row_delta;
    if (row_delta == 0) {
        notation += "平";
        notation += numbers[to_file];
    } else {
        notation += (forward_delta > 0) ? "进" : "退";
        if (from_col == to_col) {
            notation += numbers[std::abs(row_delta) - 1];
        } else {
            notation += numbers[to_file];
        }
    }

    return notation;
}

} // namespace xiangqi
