#include "uci_protocol.h"
#include "agent.h"
#include "notation.h"
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace xiangqi {

static std::vector<std::string> split_tokens(const std::string &line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

// Malformed numbers fall back instead of failing the whole line
static int64_t token_to_int(const std::vector<std::string> &tokens, size_t index, int64_t fallback) {
    if (index >= tokens.size()) return fallback;

    const char *text = tokens[index].c_str();
    char *end = nullptr;
    long long value = strtoll(text, &end, 10);
    if (end == text || *end != '\0') return fallback;
    return value;
}

// ==================== COMMANDS ====================

std::string build_position_command(const std::string &fen) {
    return "position fen " + fen;
}

std::string build_go_command(int depth, int64_t movetime_ms) {
    if (depth > 0) {
        return "go depth " + std::to_string(depth);
    }
    if (movetime_ms > 0) {
        return "go movetime " + std::to_string(movetime_ms);
    }
    return "go depth " + std::to_string(XQ_UCI_DEFAULT_DEPTH);
}

// ==================== PARSING ====================

std::optional<UciInfo> parse_info_line(const std::string &line) {
    std::vector<std::string> tokens = split_tokens(line);
    if (tokens.empty() || tokens[0] != "info") return std::nullopt;

    UciInfo info;
    size_t i = 1;
    while (i < tokens.size()) {
        const std::string &key = tokens[i];

        if (key == "depth") {
            info.depth = static_cast<int>(token_to_int(tokens, i + 1, 0));
            i += 2;
        } else if (key == "multipv") {
            info.multipv = static_cast<int>(token_to_int(tokens, i + 1, 1));
            i += 2;
        } else if (key == "score") {
            info.is_mate = (i + 1 < tokens.size() && tokens[i + 1] == "mate");
            info.score = static_cast<int>(token_to_int(tokens, i + 2, 0));
            i += 3;
        } else if (key == "nodes") {
            info.nodes = static_cast<uint64_t>(token_to_int(tokens, i + 1, 0));
            i += 2;
        } else if (key == "nps") {
            info.nps = static_cast<uint64_t>(token_to_int(tokens, i + 1, 0));
            i += 2;
        } else if (key == "time") {
            info.time_ms = token_to_int(tokens, i + 1, 0);
            i += 2;
        } else if (key == "pv") {
            info.pv.assign(tokens.begin() + i + 1, tokens.end());
            i = tokens.size();
        } else if (key == "string") {
            // Free text runs to the end of the line
            i = tokens.size();
        } else {
            i++;
        }
    }

    if (info.depth <= 0 && info.pv.empty()) return std::nullopt;
    return info;
}

std::optional<UciBestMove> parse_bestmove_line(const std::string &line) {
    std::vector<std::string> tokens = split_tokens(line);
    if (tokens.empty() || tokens[0] != "bestmove") return std::nullopt;

    UciBestMove best;
    if (tokens.size() > 1 && tokens[1] != "(none)") {
        best.best_move = tokens[1];
    }
    if (tokens.size() > 3 && tokens[2] == "ponder") {
        best.ponder = tokens[3];
    }
    return best;
}

// ==================== COORDINATES ====================

std::optional<std::string> engine_code_to_core(const std::string &code) {
    if (!code_to_move(code)) return std::nullopt;

    std::string mirrored = code;
    mirrored[1] = static_cast<char>('0' + (XQ_ROWS - 1) - (code[1] - '0'));
    mirrored[3] = static_cast<char>('0' + (XQ_ROWS - 1) - (code[3] - '0'));
    return mirrored;
}

std::optional<std::string> core_code_to_engine(const std::string &code) {
    return engine_code_to_core(code);
}

// ==================== RESULTS ====================

SearchResult to_search_result(const UciInfo &info, const UciBestMove &best) {
    SearchResult result;
    result.depth = info.depth;
    result.nodes = info.nodes;
    result.elapsed_ms = info.time_ms;

    if (info.is_mate) {
        // Same encoding as the built-in search: mate score + remaining depth.
        // A mate reported beyond the nominal depth stretches the depth to reach it.
        int plies = (info.score > 0) ? 2 * info.score - 1 : 2 * -info.score;
        result.depth = std::max(info.depth, plies);
        int remaining = result.depth - plies;
        result.score = (info.score > 0) ? XQ_MATE_SCORE + remaining : -(XQ_MATE_SCORE + remaining);
    } else {
        result.score = info.score;
    }

    if (best.best_move) {
        std::optional<std::string> core_code = engine_code_to_core(*best.best_move);
        if (core_code) {
            result.best_move = code_to_move(*core_code);
        }
    }

    return result;
}

std::string format_uci_score(const UciInfo &info) {
    if (!info.is_mate) {
        return format_centipawns(info.score);
    }
    if (info.score > 0) {
        return "mate in " + std::to_string(info.score);
    }
    return "mated in " + std::to_string(-info.score);
}

} // namespace xiangqi
