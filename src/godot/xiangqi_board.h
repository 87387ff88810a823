#ifndef XIANGQI_GODOT_XIANGQI_BOARD_H
#define XIANGQI_GODOT_XIANGQI_BOARD_H

#include "../board.h"
#include <godot_cpp/classes/node2d.hpp>
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/variant/array.hpp>
#include <godot_cpp/variant/dictionary.hpp>
#include <godot_cpp/variant/string.hpp>
#include <godot_cpp/variant/vector2i.hpp>
#include <vector>

using namespace godot;

// Scene-side owner of a position. Squares are exchanged with GDScript as
// Vector2i(column, row); moves as 4-character codes.
class XiangqiBoard : public Node2D {
    GDCLASS(XiangqiBoard, Node2D)

private:
    xiangqi::Board board;

    // Moves played through make_move, for revert_move
    std::vector<xiangqi::Move> move_history;

    Dictionary move_to_dictionary(const xiangqi::Move &move) const;

protected:
    static void _bind_methods();

public:
    XiangqiBoard();
    ~XiangqiBoard();

    void _ready() override;

    xiangqi::Board &get_core_board() { return board; }

    // Public API
    bool setup_board(const String &fen_notation);
    String get_fen() const;
    int get_turn() const;
    String get_piece_at(int row, int col) const;

    Array get_all_possible_moves(int side) const;
    Array get_moves_for_piece(const Vector2i &square) const;
    bool is_move_valid(const String &code) const;
    bool make_move(const String &code);
    bool revert_move();
    Array get_moves() const;

    bool is_check(int side) const;
    int evaluate_board() const;
    String get_move_notation(const String &code) const;
};

#endif // XIANGQI_GODOT_XIANGQI_BOARD_H
