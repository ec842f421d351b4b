#pragma once

#include "BoardState.hpp"

#include <string>
#include <string_view>


// Extended FEN with a board size prefix:
//   "<size>:<ranks top to bottom> <w|b> <castling> - 0 1"
// The size prefix is optional on import and defaults to 8.
namespace Fen {

    inline constexpr std::string_view STANDARD_START =
        "8:rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

    // "KQkq" style rights derived from unmoved kings and rooks on the back
    // ranks; empty if there are none.
    std::string castling_rights(const BoardState& board);

    std::string export_fen(const BoardState& board);

    // Replaces the position in `board` only if the whole string parses. The
    // turn state is reset; the ruleset and setup mode are kept.
    ParseResult import_fen(std::string_view fen, BoardState& board);
}
