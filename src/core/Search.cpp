#include "Search.hpp"
#include "Attacks.hpp"
#include "Evaluation.hpp"
#include "MoveGen.hpp"
#include "Rules.hpp"
#include <algorithm>
#include <cstdlib>

namespace Search {

    static constexpr int32_t INF = MATE_SCORE * 10;

    int depth_for(Difficulty difficulty) {
        switch (difficulty) {
            case Difficulty::Easy:   return 1;
            case Difficulty::Medium: return 2;
            case Difficulty::Hard:   return 3;
        }
        return 2;
    }

    SearchParams params_for(Difficulty difficulty) {
        SearchParams params;
        params.depth = depth_for(difficulty);
        params.evalFunc = Evaluation::evaluate;
        params.random_move_chance = (difficulty == Difficulty::Easy) ? 0.3 : 0.0;
        return params;
    }

    const char* difficulty_name(Difficulty difficulty) {
        switch (difficulty) {
            case Difficulty::Easy:   return "Easy";
            case Difficulty::Medium: return "Medium";
            case Difficulty::Hard:   return "Hard";
        }
        return "Unknown";
    }

    int score_move(const BoardState& board, const Move& m) {
        int score = 0;
        const auto& victim = board.at(m.to);
        const auto& attacker = board.at(m.from);
        if (victim && attacker) {
            score += piece_value(victim->type) * 10 - piece_value(attacker->type);
        }

        int center = board.size / 2;
        score -= std::abs(m.to.file - center) + std::abs(m.to.rank - center);
        return score;
    }

    void order_moves(const BoardState& board, std::vector<Move>& moves) {
        std::vector<std::pair<int, Move>> scored;
        scored.reserve(moves.size());
        for (const auto& m : moves) scored.emplace_back(score_move(board, m), m);

        std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
            return a.first > b.first;
        });

        for (size_t i = 0; i < moves.size(); ++i) moves[i] = scored[i].second;
    }

    namespace {
        // Child position, or nothing if the move leaves `side` in check.
        std::optional<BoardState> make_child(const BoardState& board, const Move& move, Colour side) {
            BoardState child = board;
            Rules::play(child, move);
            if (Attacks::in_check(child, side)) return std::nullopt;
            return child;
        }

        bool has_escape(const BoardState& board, Colour side) {
            std::vector<Move> moves;
            MoveGen::generate_moves(board, side, moves);
            for (const auto& move : moves) {
                if (make_child(board, move, side)) return true;
            }
            return false;
        }

        int32_t alpha_beta(const BoardState& board, Colour side, int depth, int32_t alpha, int32_t beta,
                           EvalCallback eval, SearchStats& stats) {
            ++stats.nodes;

            if (depth == 0) {
                // Mate or stalemate on the horizon is scored like any other dead end.
                if (!has_escape(board, side)) return Attacks::in_check(board, side) ? -MATE_SCORE : 0;
                return eval(board, side);
            }

            std::vector<Move> moves;
            MoveGen::generate_moves(board, side, moves);
            order_moves(board, moves);

            int legal_moves = 0;
            for (const auto& move : moves) {
                std::optional<BoardState> child = make_child(board, move, side);
                if (!child) continue;
                ++legal_moves;

                int32_t score = -alpha_beta(*child, opposite(side), depth - 1, -beta, -alpha, eval, stats);

                if (score >= beta) return beta;
                if (score > alpha) alpha = score;
            }

            if (legal_moves == 0) {
                // Faster mates score higher for the winner.
                if (Attacks::in_check(board, side)) return -(MATE_SCORE + depth);
                return 0;
            }

            return alpha;
        }
    }

    std::optional<Move> find_best_move(const BoardState& board, Colour side, const SearchParams& params,
                                       std::mt19937_64& rng, SearchStats& stats) {
        stats = SearchStats();
        EvalCallback eval = params.evalFunc ? params.evalFunc : Evaluation::evaluate;
        int depth = std::max(1, params.depth);

        BoardState root = board;
        root.to_move = side;

        std::vector<Move> moves;
        Rules::legal_moves_for_side(root, side, moves);
        if (moves.empty()) return std::nullopt;

        if (params.random_move_chance > 0.0) {
            std::uniform_real_distribution<double> coin(0.0, 1.0);
            if (coin(rng) < params.random_move_chance) {
                std::uniform_int_distribution<size_t> pick(0, moves.size() - 1);
                stats.random_pick = true;
                return moves[pick(rng)];
            }
        }

        order_moves(root, moves);

        int32_t best_score = -INF;
        std::vector<Move> best_moves;

        for (const auto& move : moves) {
            BoardState child = root;
            Rules::play(child, move);

            // Full window per root move so that tied scores are exact.
            int32_t score = -alpha_beta(child, opposite(side), depth - 1, -INF, INF, eval, stats);

            if (score > best_score) {
                best_score = score;
                best_moves.clear();
                best_moves.push_back(move);
            } else if (score == best_score) {
                best_moves.push_back(move);
            }
        }

        stats.depth_reached = depth;
        stats.score = best_score;

        std::uniform_int_distribution<size_t> pick(0, best_moves.size() - 1);
        return best_moves[pick(rng)];
    }
}
