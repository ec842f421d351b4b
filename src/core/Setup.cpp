#include "Setup.hpp"

#include <algorithm>

namespace Setup {

    namespace {
        // Pattern codes shared by the fixed setups.
        PieceType pattern_piece(int code) {
            switch (code) {
                case 1: return PieceType::Queen;
                case 2: return PieceType::Bishop;
                case 3: return PieceType::Knight;
                case 4: return PieceType::Rook;
                default: return PieceType::Knight;
            }
        }

        void place_row(BoardState& board, int rank, Colour colour, PieceType type) {
            for (int file = 0; file < board.size; ++file) board.set({file, rank}, Piece{type, colour});
        }

        void two_lines_side(BoardState& board, Colour colour) {
            const bool white = colour == Colour::White;
            const int back1 = white ? 0 : board.size - 1;
            const int back2 = white ? 1 : board.size - 2;
            const int pawns = white ? 2 : board.size - 3;
            const int center = board.size / 2;

            // King centred, then Q B N R repeating outward on both wings.
            board.set({center, back1}, Piece{PieceType::King, colour});
            static constexpr int wing[] = {1, 2, 3, 4};
            for (int offset = 1; offset <= center; ++offset) {
                PieceType type = pattern_piece(wing[(offset - 1) % 4]);
                if (center - offset >= 0) board.set({center - offset, back1}, Piece{type, colour});
                if (center + offset < board.size) board.set({center + offset, back1}, Piece{type, colour});
            }

            static constexpr int second[] = {2, 3, 4, 1, 1, 4, 3, 2};
            for (int file = 0; file < board.size; ++file) {
                board.set({file, back2}, Piece{pattern_piece(second[file % 8]), colour});
            }

            place_row(board, pawns, colour, PieceType::Pawn);
        }

        void three_lines_side(BoardState& board, Colour colour) {
            const bool white = colour == Colour::White;
            const int back1 = white ? 0 : board.size - 1;
            const int back2 = white ? 1 : board.size - 2;
            const int back3 = white ? 2 : board.size - 3;
            const int pawns = white ? 3 : board.size - 4;
            const int center = board.size / 2;

            for (int file = 0; file < board.size; ++file) {
                PieceType type = (file % 3 == 1) ? PieceType::Queen : PieceType::Rook;
                if (file == center) type = PieceType::King;
                board.set({file, back1}, Piece{type, colour});
            }

            static constexpr int second[] = {1, 2, 3, 4, 2, 3, 1, 4};
            for (int file = 0; file < board.size; ++file) {
                board.set({file, back2}, Piece{pattern_piece(second[file % 8]), colour});
            }

            for (int file = 0; file < board.size; ++file) {
                board.set({file, back3}, Piece{file % 2 == 0 ? PieceType::Knight : PieceType::Bishop, colour});
            }

            place_row(board, pawns, colour, PieceType::Pawn);
        }

        void one_line(BoardState& board, std::mt19937_64& rng) {
            std::vector<PieceType> back = one_line_back_rank(board.size, rng);
            for (Colour colour : {Colour::White, Colour::Black}) {
                int back_rank = board.back_rank(colour);
                int pawn_rank = back_rank + forward(colour);
                for (int file = 0; file < board.size; ++file) {
                    board.set({file, back_rank}, Piece{back[file], colour});
                }
                place_row(board, pawn_rank, colour, PieceType::Pawn);
            }
        }

        size_t take_random(std::vector<int>& pool, std::mt19937_64& rng) {
            std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
            size_t idx = pick(rng);
            int value = pool[idx];
            pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(idx));
            return static_cast<size_t>(value);
        }
    }

    int min_board_size(SetupMode mode) {
        switch (mode) {
            case SetupMode::TwoLines:   return 6;
            case SetupMode::OneLine:    return 4;
            case SetupMode::ThreeLines: return 8;
            case SetupMode::Custom:     return MIN_BOARD_SIZE;
        }
        return MIN_BOARD_SIZE;
    }

    Ruleset ruleset_for(SetupMode mode) {
        Ruleset rules;
        rules.pawn_first_move = (mode == SetupMode::ThreeLines) ? 3 : 2;
        return rules;
    }

    const char* mode_name(SetupMode mode) {
        switch (mode) {
            case SetupMode::TwoLines:   return "Two Lines";
            case SetupMode::OneLine:    return "One Line";
            case SetupMode::ThreeLines: return "Three Lines";
            case SetupMode::Custom:     return "Custom Setup";
        }
        return "Unknown";
    }

    const char* mode_description(SetupMode mode) {
        switch (mode) {
            case SetupMode::TwoLines:   return "Two ranks of major pieces. Slower development, more tactical.";
            case SetupMode::OneLine:    return "Randomized back rank. King between rooks, bishops on opposite colours.";
            case SetupMode::ThreeLines: return "Three ranks of major pieces. Pawns can move 3 squares initially.";
            case SetupMode::Custom:     return "Pieces placed by hand.";
        }
        return "";
    }

    std::vector<PieceType> one_line_back_rank(int board_size, std::mt19937_64& rng) {
        const int n = board_size;
        // Counts grow with the board up to the 26-wide layout:
        // 4 bishop pairs, 4 rooks around the king, 3 queens, knights elsewhere.
        const int bishop_pairs = std::min(4, (n - 3) / 4);
        const int rooks = n >= 16 ? 4 : 2;
        const int rest = n - 2 * bishop_pairs - (rooks + 1);
        const int queens = rest > 0 ? std::clamp(rest / 4, 1, 3) : 0;

        std::vector<PieceType> pattern(static_cast<size_t>(n), PieceType::Knight);
        std::vector<int> light, dark;
        for (int file = 0; file < n; ++file) (file % 2 == 0 ? light : dark).push_back(file);

        std::vector<bool> taken(static_cast<size_t>(n), false);
        for (int i = 0; i < bishop_pairs; ++i) {
            size_t l = take_random(light, rng);
            size_t d = take_random(dark, rng);
            pattern[l] = pattern[d] = PieceType::Bishop;
            taken[l] = taken[d] = true;
        }

        std::vector<int> available;
        for (int file = 0; file < n; ++file) {
            if (!taken[static_cast<size_t>(file)]) available.push_back(file);
        }

        std::vector<int> royal;
        for (int i = 0; i < rooks + 1; ++i) royal.push_back(static_cast<int>(take_random(available, rng)));
        std::sort(royal.begin(), royal.end());

        // King strictly between the outermost rooks.
        std::uniform_int_distribution<size_t> king_slot(1, royal.size() - 2);
        size_t king_idx = king_slot(rng);
        for (size_t i = 0; i < royal.size(); ++i) {
            pattern[static_cast<size_t>(royal[i])] = (i == king_idx) ? PieceType::King : PieceType::Rook;
        }

        for (int i = 0; i < queens && !available.empty(); ++i) {
            pattern[take_random(available, rng)] = PieceType::Queen;
        }

        return pattern;
    }

    std::vector<std::string> king_errors(const BoardState& board) {
        int kings[2] = {0, 0};
        for (const auto& cell : board.cells) {
            if (cell && cell->type == PieceType::King) ++kings[static_cast<int>(cell->colour)];
        }

        std::vector<std::string> errors;
        const char* names[2] = {"White", "Black"};
        for (int side = 0; side < 2; ++side) {
            if (kings[side] == 0) {
                errors.push_back(std::string(names[side]) + " needs a King");
            } else if (kings[side] > 1) {
                errors.push_back(std::string(names[side]) + " has " + std::to_string(kings[side]) +
                                 " Kings (need 1)");
            }
        }
        return errors;
    }

    SetupResult validate_custom(const BoardState& board) {
        SetupResult result;
        bool has_pieces[2] = {false, false};

        for (int rank = 0; rank < board.size; ++rank) {
            for (int file = 0; file < board.size; ++file) {
                const auto& cell = board.at({file, rank});
                if (!cell) continue;
                int side = static_cast<int>(cell->colour);
                has_pieces[side] = true;
                if (cell->type == PieceType::Pawn && (rank == 0 || rank == board.size - 1)) {
                    result.errors.push_back("Pawn on invalid rank at " + square_name({file, rank}));
                }
            }
        }

        for (auto& error : king_errors(board)) result.errors.push_back(std::move(error));
        if (!has_pieces[0]) result.errors.push_back("Place at least one white piece");
        if (!has_pieces[1]) result.errors.push_back("Place at least one black piece");

        result.success = result.errors.empty();
        return result;
    }

    SetupResult setup_board(BoardState& board, SetupMode mode, std::mt19937_64& rng) {
        if (mode == SetupMode::Custom) {
            SetupResult result = validate_custom(board);
            if (!result.success) return result;
            board.setup_mode = mode;
            board.rules = ruleset_for(mode);
            board.reset_turn_state();
            return result;
        }

        if (board.size < min_board_size(mode)) {
            SetupResult result;
            result.success = false;
            result.errors.push_back(std::string(mode_name(mode)) + " needs a board of at least " +
                                    std::to_string(min_board_size(mode)) + " squares");
            return result;
        }

        board.clear();
        switch (mode) {
            case SetupMode::TwoLines:
                two_lines_side(board, Colour::White);
                two_lines_side(board, Colour::Black);
                break;
            case SetupMode::OneLine:
                one_line(board, rng);
                break;
            case SetupMode::ThreeLines:
                three_lines_side(board, Colour::White);
                three_lines_side(board, Colour::Black);
                break;
            case SetupMode::Custom:
                break;
        }

        board.setup_mode = mode;
        board.rules = ruleset_for(mode);
        board.reset_turn_state();
        return {};
    }
}
