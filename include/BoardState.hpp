#pragma once

#include "Types.hpp"

#include <optional>
#include <vector>


// A position on a square board of any size between MIN_BOARD_SIZE and
// MAX_BOARD_SIZE. The grid owns its pieces; a piece's square is its index.
struct BoardState {
    int size;
    std::vector<std::optional<Piece>> cells; // rank * size + file

    Colour to_move;
    std::optional<Coord> en_passant_sq;
    int half_move_clock;
    int full_move_number;
    int move_count; // plies played since setup
    SetupMode setup_mode;
    Ruleset rules;

    explicit BoardState(int board_size = 8) {
        resize(board_size);
        setup_mode = SetupMode::Custom;
    }

    // Clears the grid and the turn state; ruleset and setup mode survive.
    void resize(int board_size) {
        size = board_size;
        cells.assign(static_cast<size_t>(size) * size, std::nullopt);
        reset_turn_state();
    }

    void clear() {
        for (auto& cell : cells) cell.reset();
    }

    void reset_turn_state() {
        to_move = Colour::White;
        en_passant_sq.reset();
        half_move_clock = 0;
        full_move_number = 1;
        move_count = 0;
    }

    bool in_bounds(int file, int rank) const {
        return file >= 0 && file < size && rank >= 0 && rank < size;
    }

    bool in_bounds(Coord sq) const { return in_bounds(sq.file, sq.rank); }

    const std::optional<Piece>& at(Coord sq) const {
        return cells[static_cast<size_t>(sq.rank) * size + sq.file];
    }

    std::optional<Piece>& at(Coord sq) {
        return cells[static_cast<size_t>(sq.rank) * size + sq.file];
    }

    bool empty(Coord sq) const { return !at(sq).has_value(); }

    void set(Coord sq, Piece piece) { at(sq) = piece; }

    std::optional<Piece> remove(Coord sq) {
        std::optional<Piece> taken = at(sq);
        at(sq).reset();
        return taken;
    }

    // Transfers the occupant of `from` to `to`, replacing anything there.
    void move_piece(Coord from, Coord to) {
        std::optional<Piece> piece = remove(from);
        if (!piece) return;
        piece->has_moved = true;
        at(to) = piece;
    }

    int back_rank(Colour c) const { return c == Colour::White ? 0 : size - 1; }

    int promotion_rank(Colour c) const { return c == Colour::White ? size - 1 : 0; }

    std::optional<Coord> find_king(Colour side) const;

    void switch_side() { to_move = opposite(to_move); }
};
