#pragma once
#include "BoardState.hpp"
#include <cstdint>

namespace Evaluation {
    int32_t positional_bonus(const Piece& piece, Coord sq, int board_size);

    // Material plus positional terms, positive when `perspective` is ahead.
    int32_t evaluate(const BoardState& board, Colour perspective);
}
