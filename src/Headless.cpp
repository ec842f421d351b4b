#include "ChessCore.hpp"
#include "CommandLine.hpp"
#include "Fen.hpp"
#include "Rules.hpp"
#include "Search.hpp"
#include "Setup.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <string_view>

namespace {

    struct HeadlessOptions {
        int board_size = DEFAULT_BOARD_SIZE;
        SetupMode mode = SetupMode::TwoLines;
        Search::Difficulty difficulty = Search::Difficulty::Medium;
        std::string fen;
        int perft_depth = 0;
        int games = 1;
        int max_moves = 400;
        std::optional<uint64_t> seed;
    };

    void print_usage() {
        std::cout << "Usage: grandchess-headless [--perft DEPTH] [--fen FEN]\n"
                  << "                           [--games N] [--max-moves N] [--seed N]\n"
                  << "                           [--size N] [--mode two|one|three] [--difficulty easy|medium|hard]\n"
                  << "Without --perft the engine plays itself --games times." << std::endl;
    }

    int run_perft(const HeadlessOptions& options) {
        BoardState board;
        std::string_view fen = options.fen.empty() ? Fen::STANDARD_START : std::string_view(options.fen);
        ParseResult parsed = Fen::import_fen(fen, board);
        if (!parsed.success) {
            std::cerr << "FEN rejected: " << parsed.error << std::endl;
            return 1;
        }

        std::cout << "Running Perft on " << board.size << "x" << board.size << " board..." << std::endl;
        for (int d = 1; d <= options.perft_depth; ++d) {
            auto start = std::chrono::high_resolution_clock::now();
            uint64_t nodes = Rules::perft(board, d);
            auto end = std::chrono::high_resolution_clock::now();

            std::chrono::duration<double> elapsed = end - start;
            double nps = elapsed.count() > 0 ? static_cast<double>(nodes) / elapsed.count() : 0.0;

            std::cout << "Depth " << d << ": " << nodes << " nodes | "
                      << elapsed.count() << "s | "
                      << static_cast<uint64_t>(nps) << " NPS" << std::endl;
        }
        return 0;
    }

    // Plays one engine-versus-engine game. Returns the final state, or
    // Playing if max_moves plies went by without a result.
    GameState play_game(ChessCore& game, const HeadlessOptions& options, int& plies) {
        plies = 0;
        while (game.get_game_state() == GameState::Playing && plies < options.max_moves) {
            Colour side = game.get_board_state().to_move;
            std::optional<Move> best = game.request_best_move(side, options.difficulty).get();
            if (!best) break;

            MoveOutcome outcome = game.try_make_move(best->from, best->to);
            if (outcome.success && outcome.promotion_square) outcome = game.complete_promotion(PieceType::Queen);
            if (!outcome.success) {
                std::cerr << "Engine produced an illegal move at ply " << plies << std::endl;
                break;
            }
            ++plies;
        }
        return game.get_game_state();
    }

    int run_self_play(const HeadlessOptions& options) {
        uint64_t seed = options.seed ? *options.seed : std::random_device{}();
        std::cout << "Self-play: " << options.games << " game(s), " << options.board_size << "x"
                  << options.board_size << " " << Setup::mode_name(options.mode) << ", "
                  << Search::difficulty_name(options.difficulty) << ", seed " << seed << std::endl;

        ChessCore game(seed);
        int white_wins = 0, black_wins = 0, draws = 0, unfinished = 0;

        for (int g = 1; g <= options.games; ++g) {
            if (!options.fen.empty()) {
                ParseResult parsed = game.fen(options.fen);
                if (!parsed.success) {
                    std::cerr << "FEN rejected: " << parsed.error << std::endl;
                    return 1;
                }
            } else {
                SetupResult setup = game.new_game(options.mode, options.board_size);
                if (!setup.success) {
                    for (const auto& e : setup.errors) std::cerr << e << std::endl;
                    return 1;
                }
            }

            auto start = std::chrono::steady_clock::now();
            int plies = 0;
            GameState result = play_game(game, options, plies);
            std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

            const char* text = "unfinished";
            switch (result) {
                case GameState::WhiteWins:   ++white_wins; text = "white wins"; break;
                case GameState::BlackWins:   ++black_wins; text = "black wins"; break;
                case GameState::Stalemate:   ++draws; text = "stalemate"; break;
                case GameState::DrawByClock: ++draws; text = "draw by clock"; break;
                case GameState::Playing:     ++unfinished; break;
            }
            std::cout << "Game " << g << ": " << text << " after " << plies << " plies ("
                      << elapsed.count() << "s)" << std::endl;
        }

        std::cout << "White " << white_wins << " | Black " << black_wins << " | Draws " << draws
                  << " | Unfinished " << unfinished << std::endl;
        return 0;
    }
}

int main(int argc, char** argv) {
    HeadlessOptions options;

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

        bool ok = true;
        if (flag == "--size") {
            auto size = CommandLine::parse_board_size(value);
            if ((ok = size.has_value())) options.board_size = *size;
        } else if (flag == "--mode") {
            auto mode = CommandLine::parse_mode(value);
            ok = mode.has_value() && *mode != SetupMode::Custom;
            if (ok) options.mode = *mode;
        } else if (flag == "--difficulty") {
            auto difficulty = CommandLine::parse_difficulty(value);
            if ((ok = difficulty.has_value())) options.difficulty = *difficulty;
        } else if (flag == "--fen") {
            options.fen = std::string(value);
        } else if (flag == "--perft") {
            auto depth = CommandLine::parse_int(value);
            ok = depth && *depth >= 1;
            if (ok) options.perft_depth = *depth;
        } else if (flag == "--games") {
            auto games = CommandLine::parse_int(value);
            ok = games && *games >= 1;
            if (ok) options.games = *games;
        } else if (flag == "--max-moves") {
            auto plies = CommandLine::parse_int(value);
            ok = plies && *plies >= 1;
            if (ok) options.max_moves = *plies;
        } else if (flag == "--seed") {
            auto seed = CommandLine::parse_int(value);
            ok = seed && *seed >= 0;
            if (ok) options.seed = static_cast<uint64_t>(*seed);
        } else {
            std::cerr << "Unknown option: " << flag << std::endl;
            print_usage();
            return 1;
        }

        if (!ok) {
            std::cerr << "Invalid value for " << flag << ": " << value << std::endl;
            return 1;
        }
    }

    if (options.perft_depth > 0) return run_perft(options);
    return run_self_play(options);
}
