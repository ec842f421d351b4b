#pragma once

#include "Types.hpp"
#include "BoardState.hpp"
#include "Search.hpp"

#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


// Everything a caller needs to react to a move, in place of fired events.
struct MoveOutcome {
    bool success = false;
    std::string notation;                  // empty while a promotion is pending
    Colour to_move = Colour::White;
    bool turn_changed = false;
    std::optional<Colour> in_check;        // side to move, if it is in check
    std::optional<Coord> checked_king;
    std::optional<Coord> promotion_square; // set when a piece must be chosen
    std::optional<Colour> promotion_colour;
    GameState state = GameState::Playing;
};

class IChessCore {
public:
    virtual ~IChessCore() = default;
    virtual std::vector<Coord> legal_moves(Coord from) = 0;
    virtual MoveOutcome try_make_move(Coord from, Coord to) = 0;
    virtual MoveOutcome complete_promotion(PieceType type) = 0;
    virtual bool is_awaiting_promotion() const = 0;
    virtual GameState get_game_state() const = 0;
    virtual bool is_check(Colour side) const = 0;
    virtual const BoardState& get_board_state() const = 0;
    virtual SetupResult reset(SetupMode mode) = 0;
    virtual ParseResult fen(std::string_view fen) = 0;
    virtual std::string fen() const = 0;
    virtual std::future<std::optional<Move>> request_best_move(Colour side, Search::Difficulty difficulty) = 0;
};
