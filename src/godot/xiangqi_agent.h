#ifndef XIANGQI_GODOT_XIANGQI_AGENT_H
#define XIANGQI_GODOT_XIANGQI_AGENT_H

#include "../agent.h"
#include "xiangqi_board.h"
#include <godot_cpp/classes/node.hpp>
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/variant/dictionary.hpp>
#include <godot_cpp/variant/string.hpp>

using namespace godot;

// Move suggester. Results are Dictionaries with "score", "score_text",
// "depth", "nodes", "time_ms", plus "code"/"from"/"to" when a move was found.
class XiangqiAgent : public Node {
    GDCLASS(XiangqiAgent, Node)

private:
    // ==================== BOARD REFERENCE ====================
    XiangqiBoard *board;

    xiangqi::Agent agent;
    xiangqi::SearchLimits limits;

    Dictionary result_to_dictionary(const xiangqi::SearchResult &result) const;

protected:
    static void _bind_methods();

public:
    XiangqiAgent();
    ~XiangqiAgent();

    // ==================== BOARD BINDING ====================
    void set_board(XiangqiBoard *p_board);
    XiangqiBoard *get_board() const { return board; }

    // ==================== CONFIGURATION ====================
    void set_max_depth(int depth);
    int get_max_depth() const { return limits.max_depth; }
    void set_time_budget_ms(int time_ms);
    int get_time_budget_ms() const { return static_cast<int>(limits.time_budget_ms); }

    // ==================== SEARCH INTERFACE ====================
    // Searches the bound board's current position
    Dictionary get_best_move();
    // Searches a position without touching the bound board
    Dictionary analyze_fen(const String &fen);
};

#endif // XIANGQI_GODOT_XIANGQI_AGENT_H
