#include "xiangqi_board.h"
#include "../agent.h"
#include "../board_rules.h"
#include "../notation.h"
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/variant/utility_functions.hpp>
#include <string>

using namespace godot;

static std::string to_std_string(const String &text) {
    return std::string(text.utf8().get_data());
}

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

XiangqiBoard::XiangqiBoard() {
}

XiangqiBoard::~XiangqiBoard() {
}

void XiangqiBoard::_ready() {
    setup_board(XQ_INITIAL_FEN);
}

void XiangqiBoard::_bind_methods() {
    ClassDB::bind_method(D_METHOD("setup_board", "fen_notation"), &XiangqiBoard::setup_board);
    ClassDB::bind_method(D_METHOD("get_fen"), &XiangqiBoard::get_fen);
    ClassDB::bind_method(D_METHOD("get_turn"), &XiangqiBoard::get_turn);
    ClassDB::bind_method(D_METHOD("get_piece_at", "row", "col"), &XiangqiBoard::get_piece_at);
    ClassDB::bind_method(D_METHOD("get_all_possible_moves", "side"), &XiangqiBoard::get_all_possible_moves);
    ClassDB::bind_method(D_METHOD("get_moves_for_piece", "square"), &XiangqiBoard::get_moves_for_piece);
    ClassDB::bind_method(D_METHOD("is_move_valid", "code"), &XiangqiBoard::is_move_valid);
    ClassDB::bind_method(D_METHOD("make_move", "code"), &XiangqiBoard::make_move);
    ClassDB::bind_method(D_METHOD("revert_move"), &XiangqiBoard::revert_move);
    ClassDB::bind_method(D_METHOD("get_moves"), &XiangqiBoard::get_moves);
    ClassDB::bind_method(D_METHOD("is_check", "side"), &XiangqiBoard::is_check);
    ClassDB::bind_method(D_METHOD("evaluate_board"), &XiangqiBoard::evaluate_board);
    ClassDB::bind_method(D_METHOD("get_move_notation", "code"), &XiangqiBoard::get_move_notation);
}

// ==================== BOARD SETUP ====================

bool XiangqiBoard::setup_board(const String &fen_notation) {
    move_history.clear();
    if (!board.parse_fen(to_std_string(fen_notation))) {
        UtilityFunctions::print("Error: Could not parse FEN ", fen_notation);
        return false;
    }
    return true;
}

String XiangqiBoard::get_fen() const {
    return String(board.generate_fen().c_str());
}

int XiangqiBoard::get_turn() const {
    return board.get_turn();
}

String XiangqiBoard::get_piece_at(int row, int col) const {
    uint8_t piece = board.get_piece(row, col);
    if (XQ_IS_EMPTY(piece)) return String();
    return String::chr(xiangqi::Board::piece_to_char(piece));
}

// ==================== MOVES ====================

Dictionary XiangqiBoard::move_to_dictionary(const xiangqi::Move &move) const {
    Dictionary move_data;
    move_data["from"] = Vector2i(XQ_COL_OF(move.from), XQ_ROW_OF(move.from));
    move_data["to"] = Vector2i(XQ_COL_OF(move.to), XQ_ROW_OF(move.to));
    move_data["code"] = String(xiangqi::move_to_code(move).c_str());
    move_data["is_capture"] = !XQ_IS_EMPTY(move.captured);
    return move_data;
}

Array XiangqiBoard::get_all_possible_moves(int side) const {
    Array moves;
    if (side != XQ_SIDE_RED && side != XQ_SIDE_BLACK) return moves;

    xiangqi::MoveList list;
    xiangqi::BoardRules::generate_moves(board, static_cast<uint8_t>(side), list);
    for (int i = 0; i < list.count; i++) {
        moves.append(move_to_dictionary(list.moves[i]));
    }
    return moves;
}

Array XiangqiBoard::get_moves_for_piece(const Vector2i &square) const {
    Array valid_targets;
    if (!XQ_ON_BOARD(square.y, square.x)) return valid_targets;

    xiangqi::MoveList list;
    xiangqi::BoardRules::generate_for_square(board, XQ_SQUARE(square.y, square.x), list);
    for (int i = 0; i < list.count; i++) {
        valid_targets.append(Vector2i(XQ_COL_OF(list.moves[i].to), XQ_ROW_OF(list.moves[i].to)));
    }
    return valid_targets;
}

bool XiangqiBoard::is_move_valid(const String &code) const {
    std::optional<xiangqi::Move> move = xiangqi::code_to_move(to_std_string(code));
    if (!move) return false;
    return xiangqi::BoardRules::is_valid_move(board, *move);
}

bool XiangqiBoard::make_move(const String &code) {
    std::optional<xiangqi::Move> move = xiangqi::code_to_move(to_std_string(code));
    if (!move || !xiangqi::BoardRules::is_valid_move(board, *move)) {
        UtilityFunctions::print("Error: Illegal move ", code);
        return false;
    }

    board.make_move(*move);
    move_history.push_back(*move);
    return true;
}

bool XiangqiBoard::revert_move() {
    if (move_history.empty()) return false;

    board.unmake_move(move_history.back());
    move_history.pop_back();
    return true;
}

Array XiangqiBoard::get_moves() const {
    Array codes;
    for (size_t i = 0; i < move_history.size(); i++) {
        codes.append(String(xiangqi::move_to_code(move_history[i]).c_str()));
    }
    return codes;
}

// ==================== QUERIES ====================

bool XiangqiBoard::is_check(int side) const {
    if (side != XQ_SIDE_RED && side != XQ_SIDE_BLACK) return false;
    return xiangqi::BoardRules::is_in_check(board, static_cast<uint8_t>(side));
}

int XiangqiBoard::evaluate_board() const {
    return xiangqi::Agent::evaluate_board(board);
}

String XiangqiBoard::get_move_notation(const String &code) const {
    std::optional<xiangqi::Move> move = xiangqi::code_to_move(to_std_string(code));
    if (!move) return String();
    return String::utf8(xiangqi::move_to_chinese(board, *move).c_str());
}
