#pragma once

#include "IChessCore.hpp"

#include <random>


// One live game. Not thread safe: a single controller drives it, and a best
// move request only reads a copy of the position.
class ChessCore : public IChessCore {
public:
    explicit ChessCore(uint64_t seed = std::random_device{}());

    std::vector<Coord> legal_moves(Coord from) override;
    MoveOutcome try_make_move(Coord from, Coord to) override;

    // Unrecognised choices (king, pawn) promote to a queen.
    MoveOutcome complete_promotion(PieceType type) override;
    bool is_awaiting_promotion() const override { return pending_.has_value(); }

    GameState get_game_state() const override { return state_; }
    bool is_check(Colour side) const override;
    const BoardState& get_board_state() const override { return board_; }

    SetupResult reset(SetupMode mode) override;
    SetupResult new_game(SetupMode mode, int board_size);

    ParseResult fen(std::string_view fen) override;
    std::string fen() const override;

    // Transcript sent by a peer that set up a game of `mode` on a `board_size` board.
    ParseResult load_transcript(std::string_view data, int board_size, SetupMode mode);
    std::string transcript() const;

    // Setup editor access: an empty board of the given size, then single squares.
    bool clear_board(int board_size);
    bool place_piece(Coord sq, std::optional<Piece> piece);

    std::future<std::optional<Move>> request_best_move(Colour side, Search::Difficulty difficulty) override;

private:
    struct PendingPromotion {
        Coord from;
        Coord to;
        Piece pawn;
        std::optional<Piece> captured;
    };

    MoveOutcome finish_turn(std::string notation);
    void update_game_state(MoveOutcome& outcome);
    void start_fresh();

    BoardState board_;
    GameState state_ = GameState::Playing;
    std::optional<PendingPromotion> pending_;
    std::mt19937_64 rng_;
};
