#include "CommandLine.hpp"
#include "Interface.hpp"
#include "Search.hpp"
#include "Setup.hpp"
#include <iostream>
#include <string>
#include <string_view>

namespace {
    void print_usage() {
        std::cout << "Usage: grandchess [--size N] [--mode two|one|three] [--difficulty easy|medium|hard]\n"
                  << "                  [--human white|black|none] [--fen FEN]" << std::endl;
    }
}

int main(int argc, char** argv) {
    GUI::LaunchOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string_view flag = argv[i];
        if (flag == "--help" || flag == "-h") {
            print_usage();
            return 0;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << std::endl;
            return 1;
        }
        std::string_view value = argv[++i];

        if (flag == "--size") {
            auto size = CommandLine::parse_board_size(value);
            if (!size) {
                std::cerr << "Board size must be between " << MIN_BOARD_SIZE << " and " << MAX_BOARD_SIZE << std::endl;
                return 1;
            }
            options.board_size = *size;
        } else if (flag == "--mode") {
            auto mode = CommandLine::parse_mode(value);
            if (!mode || *mode == SetupMode::Custom) {
                std::cerr << "Unknown setup mode: " << value << std::endl;
                return 1;
            }
            options.mode = *mode;
        } else if (flag == "--difficulty") {
            auto difficulty = CommandLine::parse_difficulty(value);
            if (!difficulty) {
                std::cerr << "Unknown difficulty: " << value << std::endl;
                return 1;
            }
            options.difficulty = *difficulty;
        } else if (flag == "--human") {
            auto side = CommandLine::parse_human_side(value);
            if (!side) {
                std::cerr << "Unknown side: " << value << std::endl;
                return 1;
            }
            options.human_side = *side;
        } else if (flag == "--fen") {
            options.fen = std::string(value);
        } else {
            std::cerr << "Unknown option: " << flag << std::endl;
            print_usage();
            return 1;
        }
    }

    if (options.fen.empty() && options.board_size < Setup::min_board_size(options.mode)) {
        std::cerr << Setup::mode_name(options.mode) << " needs a board of at least "
                  << Setup::min_board_size(options.mode) << " squares" << std::endl;
        return 1;
    }

    std::cout << CommandLine::launch_banner(options.board_size, options.mode, options.difficulty, !options.fen.empty())
              << std::endl;
    GUI::Launch(options);
    return 0;
}
