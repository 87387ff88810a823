#include "xiangqi_agent.h"
#include "../notation.h"
#include <godot_cpp/core/class_db.hpp>
#include <godot_cpp/variant/utility_functions.hpp>
#include <godot_cpp/variant/vector2i.hpp>
#include <algorithm>
#include <string>

using namespace godot;

#define XQ_AGENT_MAX_DEPTH 30
#define XQ_AGENT_MAX_TIME_MS 60000

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

XiangqiAgent::XiangqiAgent() {
    board = nullptr;
}

XiangqiAgent::~XiangqiAgent() {
}

void XiangqiAgent::set_board(XiangqiBoard *p_board) {
    board = p_board;
}

// ==================== CONFIGURATION ====================

void XiangqiAgent::set_max_depth(int depth) {
    limits.max_depth = std::clamp(depth, 1, XQ_AGENT_MAX_DEPTH);
}

void XiangqiAgent::set_time_budget_ms(int time_ms) {
    limits.time_budget_ms = std::clamp(time_ms, 0, XQ_AGENT_MAX_TIME_MS);
}

// ==================== SEARCH INTERFACE ====================

Dictionary XiangqiAgent::result_to_dictionary(const xiangqi::SearchResult &result) const {
    Dictionary data;
    data["score"] = result.score;
    data["score_text"] = String(xiangqi::format_score(result.score, result.depth).c_str());
    data["depth"] = result.depth;
    data["nodes"] = static_cast<int64_t>(result.nodes);
    data["time_ms"] = result.elapsed_ms;

    if (result.best_move) {
        const xiangqi::Move &move = *result.best_move;
        data["code"] = String(xiangqi::move_to_code(move).c_str());
        data["from"] = Vector2i(XQ_COL_OF(move.from), XQ_ROW_OF(move.from));
        data["to"] = Vector2i(XQ_COL_OF(move.to), XQ_ROW_OF(move.to));
    }
    return data;
}

Dictionary XiangqiAgent::get_best_move() {
    if (!board) {
        UtilityFunctions::print("Error: XiangqiAgent has no board");
        return Dictionary();
    }

    agent.set_board(&board->get_core_board());
    xiangqi::SearchResult result = agent.search(limits);
    agent.set_board(nullptr);

    if (!result.best_move) {
        UtilityFunctions::print("XiangqiAgent: no move found");
    }
    return result_to_dictionary(result);
}

Dictionary XiangqiAgent::analyze_fen(const String &fen) {
    std::string fen_text(fen.utf8().get_data());
    return result_to_dictionary(agent.analyze(fen_text, limits));
}

// ==================== GODOT BINDINGS ====================

void XiangqiAgent::_bind_methods() {
    // Board binding
    ClassDB::bind_method(D_METHOD("set_board", "board"), &XiangqiAgent::set_board);
    ClassDB::bind_method(D_METHOD("get_board"), &XiangqiAgent::get_board);

    // Configuration
    ClassDB::bind_method(D_METHOD("set_max_depth", "depth"), &XiangqiAgent::set_max_depth);
    ClassDB::bind_method(D_METHOD("get_max_depth"), &XiangqiAgent::get_max_depth);
    ClassDB::bind_method(D_METHOD("set_time_budget_ms", "time_ms"), &XiangqiAgent::set_time_budget_ms);
    ClassDB::bind_method(D_METHOD("get_time_budget_ms"), &XiangqiAgent::get_time_budget_ms);

    ClassDB::add_property("XiangqiAgent",
        PropertyInfo(Variant::INT, "max_depth"),
        "set_max_depth",
        "get_max_depth");
    ClassDB::add_property("XiangqiAgent",
        PropertyInfo(Variant::INT, "time_budget_ms"),
        "set_time_budget_ms",
        "get_time_budget_ms");

    // Search methods
    ClassDB::bind_method(D_METHOD("get_best_move"), &XiangqiAgent::get_best_move);
    ClassDB::bind_method(D_METHOD("analyze_fen", "fen"), &XiangqiAgent::analyze_fen);
}
