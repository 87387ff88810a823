#ifndef XIANGQI_NOTATION_H
#define XIANGQI_NOTATION_H

#include "board.h"
#include <optional>
#include <string>

namespace xiangqi {

// "<file><row><file><row>", file = 'a' + column, row = raw 0-9 index
// (row 0 is black's back rank; no inversion).
std::string move_to_code(const Move &move);
std::string square_to_code(uint8_t square);

// Nothing on wrong length or out-of-range characters. The captured field is
// left empty; Board::make_move fills it in.
std::optional<Move> code_to_move(const std::string &code);
std::optional<uint8_t> code_to_square(const std::string &code);

// "+1.23" / "-0.50" for ordinary scores, "mate in N" / "mated in N" for
// terminal scores found by a search of `depth` plies.
std::string format_score(int score, int depth);
std::string format_centipawns(int score);

// Traditional notation such as "炮二平五" (UTF-8). Red files are numbered
// from its own right, black files from its own right in full-width digits.
std::string move_to_chinese(const Board &board, const Move &move);

} // namespace xiangqi

#endif // XIANGQI_NOTATION_H
