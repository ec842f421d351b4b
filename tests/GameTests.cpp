#include <gtest/gtest.h>
#include "ChessCore.hpp"
#include "Fen.hpp"
#include "Rules.hpp"
#include "TestHelpers.hpp"

#include <chrono>
#include <memory>

namespace {
    MoveOutcome play(ChessCore& game, Coord from, Coord to) {
        MoveOutcome outcome = game.try_make_move(from, to);
        EXPECT_TRUE(outcome.success) << square_name(from) << "->" << square_name(to);
        return outcome;
    }
}

TEST(GameTest, StartsWithTwoLinesOnDefaultBoard) {
    ChessCore game(1);
    const BoardState& board = game.get_board_state();
    EXPECT_EQ(board.size, DEFAULT_BOARD_SIZE);
    EXPECT_EQ(board.setup_mode, SetupMode::TwoLines);
    EXPECT_EQ(game.get_game_state(), GameState::Playing);
    EXPECT_FALSE(game.is_awaiting_promotion());
}

TEST(GameTest, OnlySideToMoveMayMove) {
    ChessCore game(1);
    ASSERT_TRUE(game.fen(Fen::STANDARD_START).success);

    EXPECT_TRUE(game.legal_moves({4, 6}).empty());
    EXPECT_EQ(game.legal_moves({4, 1}).size(), 2u);
    EXPECT_TRUE(game.legal_moves({40, 40}).empty());

    MoveOutcome wrong = game.try_make_move({4, 6}, {4, 4});
    EXPECT_FALSE(wrong.success);
    EXPECT_FALSE(wrong.turn_changed);
    EXPECT_EQ(game.fen(), Fen::STANDARD_START);

    MoveOutcome illegal = game.try_make_move({4, 1}, {4, 4});
    EXPECT_FALSE(illegal.success);

    MoveOutcome ok = play(game, {4, 1}, {4, 3});
    EXPECT_TRUE(ok.turn_changed);
    EXPECT_EQ(ok.to_move, Colour::Black);
    EXPECT_EQ(ok.notation, "e4");
}

TEST(GameTest, FoolsMate) {
    ChessCore game(1);
    ASSERT_TRUE(game.fen(Fen::STANDARD_START).success);

    play(game, {5, 1}, {5, 2}); // f3
    play(game, {4, 6}, {4, 4}); // e5
    play(game, {6, 1}, {6, 3}); // g4
    MoveOutcome mate = play(game, {3, 7}, {7, 3}); // Qh4#

    EXPECT_EQ(mate.notation, "Qh4#");
    EXPECT_EQ(mate.state, GameState::BlackWins);
    ASSERT_TRUE(mate.in_check.has_value());
    EXPECT_EQ(*mate.in_check, Colour::White);
    ASSERT_TRUE(mate.checked_king.has_value());
    EXPECT_EQ(*mate.checked_king, (Coord{4, 0}));
    EXPECT_EQ(game.get_game_state(), GameState::BlackWins);
    EXPECT_TRUE(game.is_check(Colour::White));

    // Finished games take no more moves.
    EXPECT_TRUE(game.legal_moves({0, 1}).empty());
    EXPECT_FALSE(game.try_make_move({0, 1}, {0, 2}).success);
}

TEST(GameTest, Stalemate) {
    ChessCore game(1);
    ASSERT_TRUE(game.fen("8:k7/8/1Q6/8/8/8/8/7K w - - 0 1").success);
    MoveOutcome outcome = play(game, {7, 0}, {7, 1});
    EXPECT_EQ(outcome.state, GameState::Stalemate);
    EXPECT_FALSE(outcome.in_check.has_value());
}

TEST(GameTest, ImportedFinishedPositionIsTerminal) {
    ChessCore game(1);
    ASSERT_TRUE(game.fen("8:k7/1Q6/1K6/8/8/8/8/8 b - - 0 1").success);
    EXPECT_EQ(game.get_game_state(), GameState::WhiteWins);
}

TEST(GameTest, PromotionWaitsForChoice) {
    ChessCore game(1);
    ASSERT_TRUE(game.fen("8:7k/P7/8/8/8/8/8/K7 w - - 0 1").success);

    MoveOutcome pending = game.try_make_move({0, 6}, {0, 7});
    ASSERT_TRUE(pending.success);
    EXPECT_FALSE(pending.turn_changed);
    EXPECT_TRUE(pending.notation.empty());
    ASSERT_TRUE(pending.promotion_square.has_value());
    EXPECT_EQ(*pending.promotion_square, (Coord{0, 7}));
    ASSERT_TRUE(pending.promotion_colour.has_value());
    EXPECT_EQ(*pending.promotion_colour, Colour::White);
    EXPECT_EQ(game.get_board_state().to_move, Colour::White);

    EXPECT_TRUE(game.is_awaiting_promotion());
    EXPECT_TRUE(game.legal_moves({0, 0}).empty());
    EXPECT_FALSE(game.try_make_move({0, 0}, {1, 0}).success);

    MoveOutcome done = game.complete_promotion(PieceType::Queen);
    ASSERT_TRUE(done.success);
    EXPECT_TRUE(done.turn_changed);
    EXPECT_EQ(done.notation, "a8=Q+");
    EXPECT_EQ(done.to_move, Colour::Black);
    ASSERT_TRUE(done.in_check.has_value());
    EXPECT_EQ(*done.in_check, Colour::Black);
    EXPECT_FALSE(game.is_awaiting_promotion());
    EXPECT_EQ(game.get_board_state().at({0, 7})->type, PieceType::Queen);

    EXPECT_FALSE(game.complete_promotion(PieceType::Rook).success);
}

TEST(GameTest, UnderpromotionAndInvalidChoice) {
    ChessCore game(1);
    ASSERT_TRUE(game.fen("8:7k/P7/8/8/8/8/8/K7 w - - 0 1").success);
    ASSERT_TRUE(game.try_make_move({0, 6}, {0, 7}).success);
    MoveOutcome knight = game.complete_promotion(PieceType::Knight);
    EXPECT_EQ(knight.notation, "a8=N");
    EXPECT_EQ(game.get_board_state().at({0, 7})->type, PieceType::Knight);

    ASSERT_TRUE(game.fen("8:7k/P7/8/8/8/8/8/K7 w - - 0 1").success);
    ASSERT_TRUE(game.try_make_move({0, 6}, {0, 7}).success);
    game.complete_promotion(PieceType::King);
    EXPECT_EQ(game.get_board_state().at({0, 7})->type, PieceType::Queen);
}

TEST(GameTest, DrawByClockAtExactlyOneHundred) {
    ChessCore game(1);
    ASSERT_TRUE(game.fen("8:k7/8/8/8/8/8/8/7K w - - 0 1").success);

    auto shuffle = [&](int ply) {
        if (ply % 2 == 0) {
            const auto& king = game.get_board_state().at({7, 0});
            return king ? game.try_make_move({7, 0}, {6, 0}) : game.try_make_move({6, 0}, {7, 0});
        }
        const auto& king = game.get_board_state().at({0, 7});
        return king ? game.try_make_move({0, 7}, {1, 7}) : game.try_make_move({1, 7}, {0, 7});
    };

    for (int ply = 0; ply < DRAW_CLOCK_LIMIT - 1; ++ply) {
        MoveOutcome outcome = shuffle(ply);
        ASSERT_TRUE(outcome.success) << "ply " << ply;
        EXPECT_EQ(outcome.state, GameState::Playing);
    }
    EXPECT_EQ(game.get_board_state().half_move_clock, DRAW_CLOCK_LIMIT - 1);

    MoveOutcome last = shuffle(DRAW_CLOCK_LIMIT - 1);
    ASSERT_TRUE(last.success);
    EXPECT_EQ(last.state, GameState::DrawByClock);
    EXPECT_EQ(game.get_game_state(), GameState::DrawByClock);
    EXPECT_FALSE(shuffle(DRAW_CLOCK_LIMIT).success);
}

TEST(GameTest, PawnMoveResetsClock) {
    ChessCore game(1);
    ASSERT_TRUE(game.fen("8:k7/8/8/8/8/8/4P3/7K w - - 0 1").success);
    play(game, {7, 0}, {6, 0});
    play(game, {0, 7}, {1, 7});
    EXPECT_EQ(game.get_board_state().half_move_clock, 2);
    play(game, {4, 1}, {4, 3});
    EXPECT_EQ(game.get_board_state().half_move_clock, 0);
    EXPECT_EQ(game.get_board_state().full_move_number, 2);
}

TEST(GameTest, EnPassantThroughTheGame) {
    ChessCore game(1);
    ASSERT_TRUE(game.fen(Fen::STANDARD_START).success);
    play(game, {4, 1}, {4, 3});
    play(game, {0, 6}, {0, 5});
    play(game, {4, 3}, {4, 4});
    play(game, {3, 6}, {3, 4});

    MoveOutcome ep = play(game, {4, 4}, {3, 5});
    EXPECT_EQ(ep.notation, "exd6");
    EXPECT_FALSE(game.get_board_state().at({3, 4}).has_value());
    EXPECT_EQ(game.get_board_state().half_move_clock, 0);
}

TEST(GameTest, CastlingNotation) {
    ChessCore game(1);
    ASSERT_TRUE(game.fen("8:r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1").success);
    EXPECT_EQ(play(game, {4, 0}, {6, 0}).notation, "O-O");
    EXPECT_EQ(play(game, {4, 7}, {2, 7}).notation, "O-O-O");
}

TEST(GameTest, CastlingPastAdjacentRook) {
    ChessCore game(1);
    ASSERT_TRUE(game.fen("8:4k3/8/8/8/8/8/8/4KR2 w K - 0 1").success);
    MoveOutcome outcome = play(game, {4, 0}, {6, 0});
    EXPECT_EQ(outcome.notation, "O-O");
    EXPECT_EQ(game.get_board_state().at({6, 0})->type, PieceType::King);
    EXPECT_EQ(game.get_board_state().at({5, 0})->type, PieceType::Rook);
}

TEST(GameTest, ImportWithoutKingsIsRejected) {
    ChessCore game(1);
    const std::string before = game.fen();
    EXPECT_FALSE(game.fen("8:8/8/8/8/8/8/8/R7 w - - 0 1").success);
    EXPECT_FALSE(game.fen("8:k6k/8/8/8/8/8/8/K7 w - - 0 1").success);
    EXPECT_EQ(game.fen(), before);
    EXPECT_EQ(game.get_game_state(), GameState::Playing);
}

TEST(GameTest, FailedImportKeepsTheGame) {
    ChessCore game(1);
    const std::string before = game.fen();
    ParseResult result = game.fen("8:not/a/real/fen w");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
    EXPECT_EQ(game.fen(), before);
    EXPECT_EQ(game.get_board_state().size, DEFAULT_BOARD_SIZE);
}

TEST(GameTest, NewGameSizesAndModes) {
    ChessCore game(1);
    EXPECT_TRUE(game.new_game(SetupMode::ThreeLines, 10).success);
    EXPECT_EQ(game.get_board_state().size, 10);
    EXPECT_EQ(game.get_board_state().rules.pawn_first_move, 3);

    EXPECT_FALSE(game.new_game(SetupMode::TwoLines, 2).success);
    EXPECT_FALSE(game.new_game(SetupMode::TwoLines, 100).success);
    EXPECT_FALSE(game.new_game(SetupMode::ThreeLines, 7).success);
    EXPECT_EQ(game.get_board_state().size, 10);

    EXPECT_TRUE(game.reset(SetupMode::OneLine).success);
    EXPECT_EQ(game.get_board_state().size, 10);
    EXPECT_EQ(game.get_board_state().setup_mode, SetupMode::OneLine);
}

TEST(GameTest, CustomSetupFromEditor) {
    ChessCore game(1);
    ASSERT_TRUE(game.clear_board(5));
    EXPECT_FALSE(game.place_piece({5, 0}, Piece{PieceType::King, Colour::White}));
    ASSERT_TRUE(game.place_piece({0, 0}, Piece{PieceType::King, Colour::White}));

    SetupResult missing = game.new_game(SetupMode::Custom, 5);
    EXPECT_FALSE(missing.success);

    ASSERT_TRUE(game.place_piece({4, 4}, Piece{PieceType::King, Colour::Black}));
    ASSERT_TRUE(game.place_piece({2, 2}, Piece{PieceType::Rook, Colour::White}));
    EXPECT_TRUE(game.new_game(SetupMode::Custom, 5).success);
    EXPECT_EQ(game.get_board_state().setup_mode, SetupMode::Custom);
    EXPECT_FALSE(game.legal_moves({2, 2}).empty());
}

TEST(GameTest, TranscriptHandOff) {
    ChessCore host(3);
    ASSERT_TRUE(host.new_game(SetupMode::OneLine, 12).success);

    ChessCore guest(4);
    ParseResult result = guest.load_transcript(host.transcript(), 12, SetupMode::OneLine);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(guest.fen(), host.fen());
    EXPECT_EQ(guest.get_board_state().setup_mode, SetupMode::OneLine);

    const std::string before = guest.fen();
    EXPECT_FALSE(guest.load_transcript("0,0,wK", 12, SetupMode::OneLine).success);
    EXPECT_EQ(guest.fen(), before);
}

TEST(GameTest, BestMoveRequestRunsOnSnapshot) {
    std::unique_ptr<IChessCore> game = std::make_unique<ChessCore>(9);
    ASSERT_TRUE(game->fen(Fen::STANDARD_START).success);

    auto future = game->request_best_move(Colour::White, Search::Difficulty::Medium);
    ASSERT_EQ(future.wait_for(std::chrono::seconds(60)), std::future_status::ready);
    std::optional<Move> best = future.get();
    ASSERT_TRUE(best.has_value());
    EXPECT_TRUE(contains(game->legal_moves(best->from), best->to));
    EXPECT_TRUE(game->try_make_move(best->from, best->to).success);
}
