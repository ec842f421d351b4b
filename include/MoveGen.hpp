#pragma once
#include "BoardState.hpp"
#include <optional>
#include <vector>

namespace MoveGen {
    // Pseudo-legal destinations of the piece on `from`: geometry and occupancy
    // only, including castling candidates. Does not look at the en passant
    // target or at king safety.
    void generate_piece_moves(const BoardState& board, Coord from, std::vector<Coord>& out);

    // Pseudo-legal moves of every piece belonging to `side`.
    void generate_moves(const BoardState& board, Colour side, std::vector<Move>& move_list);

    // The rook a king on `king_sq` may castle with in direction `dir` (+1 or
    // -1): the first piece along the rank, if it is an unmoved rook of the
    // king's colour. The king lands two files away: on the rook's square
    // when it is two files off, beyond it when it is adjacent.
    std::optional<Coord> castling_rook(const BoardState& board, Coord king_sq, int dir);
}
