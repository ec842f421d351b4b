#include "Evaluation.hpp"

#include <cstdlib>

namespace Evaluation {

    // Piece-square terms computed from the board size instead of looked up,
    // since boards run from 3x3 to 99x99. No separate endgame phase.
    int32_t positional_bonus(const Piece& piece, Coord sq, int board_size) {
        const int center = board_size / 2;
        const int file_dist = std::abs(sq.file - center);
        const int rank_dist = std::abs(sq.rank - center);
        const int center_dist = file_dist + rank_dist;
        const bool white = piece.colour == Colour::White;

        int32_t bonus = 0;
        switch (piece.type) {
            case PieceType::Pawn: {
                int advancement = white ? sq.rank : (board_size - 1 - sq.rank);
                bonus += advancement * 5;
                bonus += (center - file_dist) * 2;
                break;
            }
            case PieceType::Knight:
                bonus += (board_size - center_dist) * 3;
                if (sq.file == 0 || sq.file == board_size - 1 || sq.rank == 0 || sq.rank == board_size - 1) {
                    bonus -= 20;
                }
                break;
            case PieceType::Bishop:
                bonus += (board_size - center_dist) * 2;
                break;
            case PieceType::Rook: {
                // The opponent's second rank.
                int seventh = white ? board_size - 2 : 1;
                if (sq.rank == seventh) bonus += 20;
                break;
            }
            case PieceType::Queen:
                if (!piece.has_moved) bonus -= 10;
                bonus += board_size - center_dist;
                break;
            case PieceType::King: {
                int home = white ? 0 : board_size - 1;
                bonus -= std::abs(sq.rank - home) * 3;
                break;
            }
        }
        return bonus;
    }

    int32_t evaluate(const BoardState& board, Colour perspective) {
        int32_t score = 0; // white positive

        for (int rank = 0; rank < board.size; ++rank) {
            for (int file = 0; file < board.size; ++file) {
                const auto& cell = board.at({file, rank});
                if (!cell) continue;

                int32_t value = piece_value(cell->type) + positional_bonus(*cell, {file, rank}, board.size);
                score += (cell->colour == Colour::White) ? value : -value;
            }
        }

        return perspective == Colour::White ? score : -score;
    }
}
