#include "CommandLine.hpp"
#include "Setup.hpp"

#include <cctype>
#include <charconv>
#include <string>

namespace {
    std::string normalise(std::string_view text) {
        std::string out;
        for (char c : text) {
            if (c == '-' || c == '_' || c == ' ') continue;
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return out;
    }
}

namespace CommandLine {

    std::optional<int> parse_int(std::string_view text) {
        int value = 0;
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (text.empty() || ec != std::errc() || ptr != end) return std::nullopt;
        return value;
    }

    std::optional<int> parse_board_size(std::string_view text) {
        std::optional<int> size = parse_int(text);
        if (!size || *size < MIN_BOARD_SIZE || *size > MAX_BOARD_SIZE) return std::nullopt;
        return size;
    }

    std::optional<SetupMode> parse_mode(std::string_view text) {
        const std::string key = normalise(text);
        if (key == "two" || key == "twolines") return SetupMode::TwoLines;
        if (key == "one" || key == "oneline") return SetupMode::OneLine;
        if (key == "three" || key == "threelines") return SetupMode::ThreeLines;
        if (key == "custom") return SetupMode::Custom;
        return std::nullopt;
    }

    std::optional<Search::Difficulty> parse_difficulty(std::string_view text) {
        const std::string key = normalise(text);
        if (key == "easy") return Search::Difficulty::Easy;
        if (key == "medium") return Search::Difficulty::Medium;
        if (key == "hard") return Search::Difficulty::Hard;
        return std::nullopt;
    }

    std::optional<int> parse_human_side(std::string_view text) {
        const std::string key = normalise(text);
        if (key == "white" || key == "w") return 0;
        if (key == "black" || key == "b") return 1;
        if (key == "none" || key == "bot") return 2;
        return std::nullopt;
    }

    std::string launch_banner(int board_size, SetupMode mode, Search::Difficulty difficulty, bool from_fen) {
        std::string banner = "Starting GrandChess ";
        if (from_fen) {
            banner += "from FEN";
        } else {
            banner += std::to_string(board_size) + "x" + std::to_string(board_size) + " " + Setup::mode_name(mode);
        }
        return banner + " (" + Search::difficulty_name(difficulty) + ")";
    }
}
