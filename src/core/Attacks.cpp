#include "Attacks.hpp"

namespace Attacks {

    namespace {
        bool holds(const BoardState& board, int file, int rank, Colour colour, PieceType type) {
            if (!board.in_bounds(file, rank)) return false;
            const auto& cell = board.at({file, rank});
            return cell && cell->colour == colour && cell->type == type;
        }

        // First occupied square along a ray, if any.
        const std::optional<Piece>* first_on_ray(const BoardState& board, Coord from, Offset dir) {
            int file = from.file + dir.df;
            int rank = from.rank + dir.dr;
            while (board.in_bounds(file, rank)) {
                const auto& cell = board.at({file, rank});
                if (cell) return &cell;
                file += dir.df;
                rank += dir.dr;
            }
            return nullptr;
        }
    }

    bool is_square_attacked(const BoardState& board, Coord sq, Colour attacker) {
        // Pawns capture one rank forward, so an attacking pawn sits one rank behind.
        int pawn_rank = sq.rank - forward(attacker);
        if (holds(board, sq.file - 1, pawn_rank, attacker, PieceType::Pawn) ||
            holds(board, sq.file + 1, pawn_rank, attacker, PieceType::Pawn)) {
            return true;
        }

        for (const auto& jump : KNIGHT_JUMPS) {
            if (holds(board, sq.file + jump.df, sq.rank + jump.dr, attacker, PieceType::Knight)) return true;
        }

        for (const auto& dir : KING_DIRS) {
            if (holds(board, sq.file + dir.df, sq.rank + dir.dr, attacker, PieceType::King)) return true;
        }

        for (const auto& dir : ROOK_DIRS) {
            const auto* hit = first_on_ray(board, sq, dir);
            if (hit && (*hit)->colour == attacker &&
                ((*hit)->type == PieceType::Rook || (*hit)->type == PieceType::Queen)) {
                return true;
            }
        }

        for (const auto& dir : BISHOP_DIRS) {
            const auto* hit = first_on_ray(board, sq, dir);
            if (hit && (*hit)->colour == attacker &&
                ((*hit)->type == PieceType::Bishop || (*hit)->type == PieceType::Queen)) {
                return true;
            }
        }

        return false;
    }

    bool in_check(const BoardState& board, Colour side) {
        std::optional<Coord> king = board.find_king(side);
        if (!king) return false;
        return is_square_attacked(board, *king, opposite(side));
    }
}
