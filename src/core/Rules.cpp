#include "Rules.hpp"
#include "Attacks.hpp"
#include "MoveGen.hpp"

#include <algorithm>
#include <cstdlib>

namespace Rules {

    namespace {
        // Relocates a piece on the grid for the lifetime of the object and puts
        // every touched square back on destruction.
        class ScopedSimulation {
        public:
            ScopedSimulation(BoardState& board, Coord from, Coord to, std::optional<Coord> victim)
                : board_(board), from_(from), to_(to), victim_(victim),
                  saved_from_(board.at(from)), saved_to_(board.at(to)) {
                if (victim_) {
                    saved_victim_ = board_.at(*victim_);
                    board_.at(*victim_).reset();
                }
                board_.at(to_) = saved_from_;
                board_.at(from_).reset();
            }

            ~ScopedSimulation() {
                board_.at(to_) = saved_to_;
                board_.at(from_) = saved_from_;
                if (victim_) board_.at(*victim_) = saved_victim_;
            }

            ScopedSimulation(const ScopedSimulation&) = delete;
            ScopedSimulation& operator=(const ScopedSimulation&) = delete;

        private:
            BoardState& board_;
            Coord from_;
            Coord to_;
            std::optional<Coord> victim_;
            std::optional<Piece> saved_from_;
            std::optional<Piece> saved_to_;
            std::optional<Piece> saved_victim_;
        };

        bool is_en_passant(const BoardState& board, const Piece& piece, Coord from, Coord to) {
            return piece.type == PieceType::Pawn && board.en_passant_sq && *board.en_passant_sq == to &&
                   to.file != from.file && board.empty(to);
        }

        // The en passant capture available to the pawn on `from`, if any.
        std::optional<Coord> en_passant_target_for(const BoardState& board, Coord from, const Piece& pawn) {
            if (pawn.type != PieceType::Pawn || !board.en_passant_sq) return std::nullopt;
            Coord target = *board.en_passant_sq;
            if (std::abs(target.file - from.file) != 1 || target.rank != from.rank + forward(pawn.colour)) {
                return std::nullopt;
            }
            if (!board.in_bounds(target) || !board.empty(target)) return std::nullopt;

            Coord victim = en_passant_victim(target, pawn.colour);
            if (!board.in_bounds(victim)) return std::nullopt;
            const auto& cell = board.at(victim);
            if (!cell || cell->type != PieceType::Pawn || cell->colour == pawn.colour) return std::nullopt;
            return target;
        }

        bool king_safe_after(BoardState& board, Coord from, Coord to, std::optional<Coord> victim, Colour us) {
            ScopedSimulation sim(board, from, to, victim);
            return !Attacks::in_check(board, us);
        }
    }

    bool is_move_legal(BoardState& board, Coord from, Coord to) {
        const auto& cell = board.at(from);
        if (!cell) return false;
        const Piece piece = *cell;

        std::optional<Coord> victim;
        if (is_en_passant(board, piece, from, to)) victim = en_passant_victim(to, piece.colour);

        // Castling: not out of check, not across an attacked square, and not
        // into check once the rook has moved too.
        if (piece.type == PieceType::King && std::abs(to.file - from.file) == 2) {
            if (Attacks::in_check(board, piece.colour)) return false;
            int dir = to.file > from.file ? 1 : -1;
            if (!king_safe_after(board, from, {from.file + dir, from.rank}, std::nullopt, piece.colour)) return false;

            BoardState after = board;
            execute_move(after, {from, to});
            return !Attacks::in_check(after, piece.colour);
        }

        return king_safe_after(board, from, to, victim, piece.colour);
    }

    std::vector<Coord> legal_moves(BoardState& board, Coord from) {
        std::vector<Coord> result;
        if (!board.in_bounds(from) || !board.at(from)) return result;
        const Piece piece = *board.at(from);

        std::vector<Coord> candidates;
        MoveGen::generate_piece_moves(board, from, candidates);
        if (auto ep = en_passant_target_for(board, from, piece)) candidates.push_back(*ep);

        for (const auto& to : candidates) {
            if (is_move_legal(board, from, to)) result.push_back(to);
        }
        return result;
    }

    void legal_moves_for_side(BoardState& board, Colour side, std::vector<Move>& move_list) {
        for (int rank = 0; rank < board.size; ++rank) {
            for (int file = 0; file < board.size; ++file) {
                Coord from{file, rank};
                const auto& cell = board.at(from);
                if (!cell || cell->colour != side) continue;
                for (const auto& to : legal_moves(board, from)) move_list.push_back({from, to});
            }
        }
    }

    bool has_any_legal_move(BoardState& board, Colour side) {
        for (int rank = 0; rank < board.size; ++rank) {
            for (int file = 0; file < board.size; ++file) {
                Coord from{file, rank};
                const auto& cell = board.at(from);
                if (!cell || cell->colour != side) continue;
                if (!legal_moves(board, from).empty()) return true;
            }
        }
        return false;
    }

    MoveEffects execute_move(BoardState& board, Move move) {
        MoveEffects fx;
        fx.mover = *board.at(move.from);
        fx.captured = board.at(move.to);
        const Colour us = fx.mover.colour;

        if (is_en_passant(board, fx.mover, move.from, move.to)) {
            fx.captured = board.remove(en_passant_victim(move.to, us));
            fx.en_passant = true;
        }

        if (fx.mover.type == PieceType::King && std::abs(move.to.file - move.from.file) == 2) {
            int dir = move.to.file > move.from.file ? 1 : -1;
            if (auto rook = MoveGen::castling_rook(board, move.from, dir)) {
                board.move_piece(*rook, {move.to.file - dir, move.from.rank});
                fx.castled = true;
            }
        }

        board.en_passant_sq.reset();
        if (fx.mover.type == PieceType::Pawn && std::abs(move.to.rank - move.from.rank) >= 2) {
            board.en_passant_sq = Coord{move.to.file, move.to.rank - forward(us)};
        }

        board.move_piece(move.from, move.to);

        fx.reaches_promotion = fx.mover.type == PieceType::Pawn && move.to.rank == board.promotion_rank(us);
        return fx;
    }

    MoveEffects play(BoardState& board, Move move, PieceType promotion) {
        MoveEffects fx = execute_move(board, move);
        const Colour us = fx.mover.colour;

        if (fx.reaches_promotion) board.set(move.to, Piece{promotion, us, true});

        ++board.move_count;
        if (us == Colour::Black) ++board.full_move_number;
        if (fx.captured || fx.mover.type == PieceType::Pawn) {
            board.half_move_clock = 0;
        } else {
            ++board.half_move_clock;
        }

        board.to_move = opposite(us);
        return fx;
    }

    std::string move_notation(const MoveEffects& effects, Move move, std::optional<PieceType> promotion) {
        if (effects.mover.type == PieceType::King && std::abs(move.to.file - move.from.file) == 2) {
            return move.to.file > move.from.file ? "O-O" : "O-O-O";
        }

        std::string notation;
        if (effects.mover.type != PieceType::Pawn) notation += piece_letter(effects.mover.type);
        if (effects.captured) {
            if (effects.mover.type == PieceType::Pawn) notation += file_label(move.from.file);
            notation += 'x';
        }
        notation += square_name(move.to);
        if (promotion) {
            notation += '=';
            notation += piece_letter(*promotion);
        }
        return notation;
    }

    std::string check_suffix(BoardState& board, Colour side) {
        if (!Attacks::in_check(board, side)) return "";
        return has_any_legal_move(board, side) ? "+" : "#";
    }

    uint64_t perft(BoardState& board, int depth) {
        if (depth <= 0) return 1ULL;

        std::vector<Move> moves;
        legal_moves_for_side(board, board.to_move, moves);
        if (depth == 1) return moves.size();

        uint64_t nodes = 0;
        for (const auto& move : moves) {
            BoardState next = board;
            play(next, move);
            nodes += perft(next, depth - 1);
        }
        return nodes;
    }
}
