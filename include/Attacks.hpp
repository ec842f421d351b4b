#pragma once

#include "BoardState.hpp"

#include <array>


namespace Attacks {

struct Offset {
    int df;
    int dr;
};

inline constexpr std::array<Offset, 4> ROOK_DIRS{{{-1, 0}, {0, -1}, {1, 0}, {0, 1}}};
inline constexpr std::array<Offset, 4> BISHOP_DIRS{{{-1, -1}, {-1, 1}, {1, -1}, {1, 1}}};
inline constexpr std::array<Offset, 8> KING_DIRS{{
    {-1, -1}, {-1, 0}, {-1, 1}, {0, -1}, {0, 1}, {1, -1}, {1, 0}, {1, 1}
}};
inline constexpr std::array<Offset, 8> KNIGHT_JUMPS{{
    {-2, -1}, {-2, 1}, {-1, -2}, {-1, 2}, {1, -2}, {1, 2}, {2, -1}, {2, 1}
}};

// True if a piece of colour `attacker` could capture on `sq`. Walks outward
// from the target, which gives the same answer as generating every attacker's
// pseudo-legal moves but touches far fewer squares on large boards.
bool is_square_attacked(const BoardState& board, Coord sq, Colour attacker);

// A side without a king on the board is never in check.
bool in_check(const BoardState& board, Colour side);

}
