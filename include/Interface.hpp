#pragma once

#include "Search.hpp"
#include "Types.hpp"

#include <string>

namespace GUI {
    struct LaunchOptions {
        int board_size = DEFAULT_BOARD_SIZE;
        SetupMode mode = SetupMode::TwoLines;
        Search::Difficulty difficulty = Search::Difficulty::Medium;
        int human_side = 0; // 0 = white, 1 = black, 2 = bot vs bot
        std::string fen;    // overrides size and mode when set
    };

    void Launch(const LaunchOptions& options);
}
