#pragma once

#include "BoardState.hpp"
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace Search {

    enum class Difficulty : uint8_t { Easy, Medium, Hard };

    // Static evaluator, scored from the point of view of `side`.
    using EvalCallback = int32_t(*)(const BoardState& board, Colour side);

    inline constexpr int32_t MATE_SCORE = 1000000;

    struct SearchParams {
        int depth = 2;
        EvalCallback evalFunc = nullptr; // nullptr selects Evaluation::evaluate
        double random_move_chance = 0.0;
    };

    struct SearchStats {
        int depth_reached = 0;
        int32_t score = 0;
        uint64_t nodes = 0;
        bool random_pick = false;
    };

    int depth_for(Difficulty difficulty);
    SearchParams params_for(Difficulty difficulty);
    const char* difficulty_name(Difficulty difficulty);

    // MVV-LVA for captures minus the destination's distance from the centre.
    int score_move(const BoardState& board, const Move& move);
    void order_moves(const BoardState& board, std::vector<Move>& moves);

    // Best move for `side` on a private copy of `board`. Root candidates go
    // through the full rule engine; deeper nodes only reject moves that leave
    // the mover in check. Equal best scores are broken at random.
    std::optional<Move> find_best_move(const BoardState& board, Colour side, const SearchParams& params,
                                       std::mt19937_64& rng, SearchStats& stats);
}
