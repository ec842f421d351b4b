#pragma once

#include "Search.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <string_view>

// Flag value parsing shared by the executables. Every parser returns nullopt
// on input it does not recognise; reporting is left to the caller.
namespace CommandLine {

    std::optional<int> parse_int(std::string_view text);

    // Board size within MIN_BOARD_SIZE..MAX_BOARD_SIZE.
    std::optional<int> parse_board_size(std::string_view text);

    // "two", "one", "three" or "custom" (also "twolines", "two-lines", ...).
    std::optional<SetupMode> parse_mode(std::string_view text);

    // "easy", "medium" or "hard".
    std::optional<Search::Difficulty> parse_difficulty(std::string_view text);

    // "white" -> 0, "black" -> 1, "none" -> 2 (the engine plays both sides).
    std::optional<int> parse_human_side(std::string_view text);

    // Start-up line for the front-end. A FEN replaces the size and mode.
    std::string launch_banner(int board_size, SetupMode mode, Search::Difficulty difficulty, bool from_fen);
}
