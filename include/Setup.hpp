#pragma once

#include "BoardState.hpp"

#include <random>
#include <string>
#include <vector>


namespace Setup {

    int min_board_size(SetupMode mode);

    Ruleset ruleset_for(SetupMode mode);

    const char* mode_name(SetupMode mode);
    const char* mode_description(SetupMode mode);

    // Back rank for the One Line mode, shared by both colours.
    std::vector<PieceType> one_line_back_rank(int board_size, std::mt19937_64& rng);

    // One message per colour that does not have exactly one king.
    std::vector<std::string> king_errors(const BoardState& board);

    // Exactly one king per colour, at least one piece per colour, no pawn on
    // the first or last rank.
    SetupResult validate_custom(const BoardState& board);

    // Fills `board` with the starting array for `mode` at its current size and
    // resets the turn state. Custom keeps the pieces already on the board and
    // only validates them. On failure the board is left as it was.
    SetupResult setup_board(BoardState& board, SetupMode mode, std::mt19937_64& rng);
}
