#ifndef XIANGQI_UCI_PROTOCOL_H
#define XIANGQI_UCI_PROTOCOL_H

#include "position_analyzer.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Depth sent when neither a depth nor a move time is requested
#define XQ_UCI_DEFAULT_DEPTH 18

namespace xiangqi {

// ==================== ENGINE OUTPUT ====================

struct UciInfo {
    int depth = 0;
    int multipv = 1;
    bool is_mate = false;  // "score mate N": moves to mate, negative when being mated
    int score = 0;
    uint64_t nodes = 0;
    uint64_t nps = 0;
    int64_t time_ms = 0;
    std::vector<std::string> pv;
};

struct UciBestMove {
    std::optional<std::string> best_move;  // Absent for "bestmove (none)"
    std::optional<std::string> ponder;
};

// ==================== COMMANDS ====================

std::string build_position_command(const std::string &fen);

// "go depth N" when depth > 0, else "go movetime T" when movetime_ms > 0,
// else the default depth.
std::string build_go_command(int depth, int64_t movetime_ms);

// ==================== PARSING ====================

// Nothing unless the line is an "info" line carrying a depth or a pv
std::optional<UciInfo> parse_info_line(const std::string &line);
std::optional<UciBestMove> parse_bestmove_line(const std::string &line);

// External engines number ranks from red's side (rank 0 = row 9); this core
// uses raw rows. Both directions are the same mirror.
std::optional<std::string> engine_code_to_core(const std::string &code);
std::optional<std::string> core_code_to_engine(const std::string &code);

// Converts the last info and the bestmove of an external search into this
// core's result type, so either analyzer can serve the same caller.
SearchResult to_search_result(const UciInfo &info, const UciBestMove &best);

// Display string for an info line: "+1.23" or "mate in N" / "mated in N"
std::string format_uci_score(const UciInfo &info);

} // namespace xiangqi

#endif // XIANGQI_UCI_PROTOCOL_H
