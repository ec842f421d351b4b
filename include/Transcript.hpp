#pragma once

#include "BoardState.hpp"

#include <string>
#include <string_view>


// Lossless piece list used to hand a freshly set up game to a remote peer:
// "file,rank,<w|b><K|Q|R|B|N|P>,<0|1>" records joined by ';'. Unlike FEN it
// keeps every has-moved flag but carries no board size or turn state.
namespace Transcript {

    std::string serialize(const BoardState& board);

    // Rebuilds the grid of a `board_size` board from `data`. `board` is only
    // replaced on success; its ruleset and setup mode are kept and the turn
    // state is reset.
    ParseResult deserialize(std::string_view data, int board_size, BoardState& board);
}
