#include "MoveGen.hpp"
#include "Attacks.hpp"

namespace MoveGen {

    namespace {
        template <typename Dirs>
        void add_sliding(const BoardState& board, Coord from, Colour us, const Dirs& dirs, std::vector<Coord>& out) {
            for (const auto& dir : dirs) {
                int file = from.file + dir.df;
                int rank = from.rank + dir.dr;
                while (board.in_bounds(file, rank)) {
                    const auto& target = board.at({file, rank});
                    if (!target) {
                        out.emplace_back(file, rank);
                    } else {
                        if (target->colour != us) out.emplace_back(file, rank);
                        break;
                    }
                    file += dir.df;
                    rank += dir.dr;
                }
            }
        }

        template <typename Offsets>
        void add_steps(const BoardState& board, Coord from, Colour us, const Offsets& offsets, std::vector<Coord>& out) {
            for (const auto& off : offsets) {
                int file = from.file + off.df;
                int rank = from.rank + off.dr;
                if (!board.in_bounds(file, rank)) continue;
                const auto& target = board.at({file, rank});
                if (!target || target->colour != us) out.emplace_back(file, rank);
            }
        }

        void add_pawn(const BoardState& board, Coord from, const Piece& pawn, std::vector<Coord>& out) {
            int dir = forward(pawn.colour);
            int next_rank = from.rank + dir;

            if (board.in_bounds(from.file, next_rank) && board.empty({from.file, next_rank})) {
                out.emplace_back(from.file, next_rank);

                // Longer first step, every square on the way must be free.
                if (!pawn.has_moved) {
                    for (int step = 2; step <= board.rules.pawn_first_move; ++step) {
                        int rank = from.rank + dir * step;
                        if (!board.in_bounds(from.file, rank) || !board.empty({from.file, rank})) break;
                        out.emplace_back(from.file, rank);
                    }
                }
            }

            for (int df : {-1, 1}) {
                int file = from.file + df;
                if (!board.in_bounds(file, next_rank)) continue;
                const auto& target = board.at({file, next_rank});
                if (target && target->colour != pawn.colour) out.emplace_back(file, next_rank);
            }
        }
    }

    std::optional<Coord> castling_rook(const BoardState& board, Coord king_sq, int dir) {
        const auto& king = board.at(king_sq);
        if (!king || king->type != PieceType::King || king->has_moved) return std::nullopt;

        for (int file = king_sq.file + dir; file >= 0 && file < board.size; file += dir) {
            const auto& cell = board.at({file, king_sq.rank});
            if (!cell) continue;
            bool usable = cell->type == PieceType::Rook && cell->colour == king->colour && !cell->has_moved;
            if (!usable) return std::nullopt;

            // An adjacent rook stays put, so the king needs an empty square beyond it.
            Coord landing{king_sq.file + 2 * dir, king_sq.rank};
            if (file - king_sq.file == dir && (!board.in_bounds(landing) || !board.empty(landing))) {
                return std::nullopt;
            }
            return Coord{file, king_sq.rank};
        }
        return std::nullopt;
    }

    void generate_piece_moves(const BoardState& board, Coord from, std::vector<Coord>& out) {
        const auto& cell = board.at(from);
        if (!cell) return;
        const Piece& piece = *cell;

        switch (piece.type) {
            case PieceType::Queen:
                add_sliding(board, from, piece.colour, Attacks::ROOK_DIRS, out);
                add_sliding(board, from, piece.colour, Attacks::BISHOP_DIRS, out);
                break;
            case PieceType::Rook:
                add_sliding(board, from, piece.colour, Attacks::ROOK_DIRS, out);
                break;
            case PieceType::Bishop:
                add_sliding(board, from, piece.colour, Attacks::BISHOP_DIRS, out);
                break;
            case PieceType::Knight:
                add_steps(board, from, piece.colour, Attacks::KNIGHT_JUMPS, out);
                break;
            case PieceType::King:
                add_steps(board, from, piece.colour, Attacks::KING_DIRS, out);
                for (int dir : {1, -1}) {
                    if (castling_rook(board, from, dir)) out.emplace_back(from.file + 2 * dir, from.rank);
                }
                break;
            case PieceType::Pawn:
                add_pawn(board, from, piece, out);
                break;
        }
    }

    void generate_moves(const BoardState& board, Colour side, std::vector<Move>& move_list) {
        std::vector<Coord> targets;
        for (int rank = 0; rank < board.size; ++rank) {
            for (int file = 0; file < board.size; ++file) {
                Coord from{file, rank};
                const auto& cell = board.at(from);
                if (!cell || cell->colour != side) continue;

                targets.clear();
                generate_piece_moves(board, from, targets);
                for (const auto& to : targets) move_list.push_back({from, to});
            }
        }
    }
}
