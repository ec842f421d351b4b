#pragma once

#include "BoardState.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>


namespace Rules {

    // What executing a move did to the board, for clocks and notation.
    struct MoveEffects {
        Piece mover;
        std::optional<Piece> captured;
        bool castled = false;
        bool en_passant = false;
        bool reaches_promotion = false;
    };

    // Square of the pawn taken when a `capturer` pawn lands on the en passant target.
    constexpr Coord en_passant_victim(Coord target, Colour capturer) {
        return {target.file, target.rank - forward(capturer)};
    }

    // Legal destinations of the piece on `from`, for that piece's colour,
    // whoever is to move. Check safety is tested by simulating each candidate
    // on the live grid, which is restored before returning.
    std::vector<Coord> legal_moves(BoardState& board, Coord from);

    bool is_move_legal(BoardState& board, Coord from, Coord to);

    void legal_moves_for_side(BoardState& board, Colour side, std::vector<Move>& move_list);

    bool has_any_legal_move(BoardState& board, Colour side);

    // Moves the piece and resolves en passant, castling and the en passant
    // target. Does not validate the move, promote, touch the clocks or pass
    // the turn.
    MoveEffects execute_move(BoardState& board, Move move);

    // execute_move followed by promotion to `promotion`, clock updates and
    // handing the turn to the other colour.
    MoveEffects play(BoardState& board, Move move, PieceType promotion = PieceType::Queen);

    // "Nf3", "exd5", "O-O", "axb8=Q"; no check suffix.
    std::string move_notation(const MoveEffects& effects, Move move, std::optional<PieceType> promotion = std::nullopt);

    // "#" if `side` is mated, "+" if it is in check, otherwise empty.
    std::string check_suffix(BoardState& board, Colour side);

    uint64_t perft(BoardState& board, int depth);
}
