#include <gtest/gtest.h>
#include "Fen.hpp"
#include "Setup.hpp"
#include "TestHelpers.hpp"
#include "Transcript.hpp"

#include <random>

// --- FEN ---

TEST(FenTest, StandardStartRoundTrip) {
    BoardState board;
    ParseResult result = Fen::import_fen(Fen::STANDARD_START, board);
    ASSERT_TRUE(result.success) << result.error;

    EXPECT_EQ(board.size, 8);
    EXPECT_EQ(board.to_move, Colour::White);
    EXPECT_EQ(board.at({4, 0})->type, PieceType::King);
    EXPECT_EQ(board.at({3, 7})->type, PieceType::Queen);
    EXPECT_EQ(board.at({3, 7})->colour, Colour::Black);
    EXPECT_EQ(count_pieces(board, Colour::White, PieceType::Pawn), 8);
    EXPECT_EQ(Fen::export_fen(board), Fen::STANDARD_START);
}

TEST(FenTest, SizePrefixDefaultsToEight) {
    BoardState board(20);
    ParseResult result = Fen::import_fen("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR b KQkq - 0 1", board);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(board.size, 8);
    EXPECT_EQ(board.to_move, Colour::Black);
}

TEST(FenTest, MultiDigitEmptyRuns) {
    BoardState board;
    ParseResult result = Fen::import_fen("10:k9/10/10/10/10/10/10/10/10/9K w - - 0 1", board);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(board.size, 10);
    EXPECT_EQ(board.at({9, 0})->type, PieceType::King);
    EXPECT_EQ(Fen::export_fen(board), "10:k9/10/10/10/10/10/10/10/10/9K w - - 0 1");
}

TEST(FenTest, CastlingFieldSurvivesRoundTrip) {
    BoardState board;
    const std::string partial = "8:r3k2r/8/8/8/8/8/8/R3K2R b Kq - 0 1";
    ASSERT_TRUE(Fen::import_fen(partial, board).success);

    EXPECT_FALSE(board.at({7, 0})->has_moved);
    EXPECT_TRUE(board.at({0, 0})->has_moved);
    EXPECT_TRUE(board.at({7, 7})->has_moved);
    EXPECT_FALSE(board.at({0, 7})->has_moved);
    EXPECT_EQ(Fen::export_fen(board), partial);

    ASSERT_TRUE(Fen::import_fen("8:r3k2r/8/8/8/8/8/8/R3K2R w - - 0 1", board).success);
    EXPECT_TRUE(board.at({4, 0})->has_moved);
    EXPECT_EQ(Fen::castling_rights(board), "");
}

TEST(FenTest, GeneratedLargeBoardRoundTrip) {
    BoardState board(26);
    std::mt19937_64 rng(7);
    ASSERT_TRUE(Setup::setup_board(board, SetupMode::TwoLines, rng).success);

    const std::string exported = Fen::export_fen(board);
    EXPECT_EQ(exported.rfind("26:", 0), 0u);

    BoardState copy;
    ASSERT_TRUE(Fen::import_fen(exported, copy).success);
    EXPECT_EQ(copy.size, 26);
    EXPECT_EQ(Fen::export_fen(copy), exported);
    for (size_t i = 0; i < board.cells.size(); ++i) {
        EXPECT_EQ(board.cells[i].has_value(), copy.cells[i].has_value());
        if (board.cells[i] && copy.cells[i]) {
            EXPECT_EQ(board.cells[i]->type, copy.cells[i]->type);
            EXPECT_EQ(board.cells[i]->colour, copy.cells[i]->colour);
        }
    }
}

TEST(FenTest, ImportKeepsRulesetAndResetsTurnState) {
    BoardState board(10);
    board.rules.pawn_first_move = 3;
    board.setup_mode = SetupMode::ThreeLines;
    board.half_move_clock = 42;
    board.en_passant_sq = Coord{1, 2};

    ASSERT_TRUE(Fen::import_fen(Fen::STANDARD_START, board).success);
    EXPECT_EQ(board.rules.pawn_first_move, 3);
    EXPECT_EQ(board.setup_mode, SetupMode::ThreeLines);
    EXPECT_EQ(board.half_move_clock, 0);
    EXPECT_FALSE(board.en_passant_sq.has_value());
}

TEST(FenTest, MalformedInputLeavesBoardUntouched) {
    BoardState board;
    ASSERT_TRUE(Fen::import_fen(Fen::STANDARD_START, board).success);
    const std::string before = Fen::export_fen(board);

    const char* bad[] = {
        "",
        "   ",
        "2:k1/1K w - - 0 1",
        "100:" ,
        "x:rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w - - 0 1",
        "8:rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP w - - 0 1",
        "8:rnbqkbnr/ppppxppp/8/8/8/8/PPPPPPPP/RNBQKBNR w - - 0 1",
        "8:rnbqkbnr/ppppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w - - 0 1",
        "8:rnbqkbnr/ppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w - - 0 1",
        "8:rnbqkbnr/pppppppp/9/8/8/8/PPPPPPPP/RNBQKBNR w - - 0 1",
        "8:rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x - - 0 1",
        "8:rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KX - 0 1",
    };
    for (const char* fen : bad) {
        ParseResult result = Fen::import_fen(fen, board);
        EXPECT_FALSE(result.success) << "accepted: " << fen;
        EXPECT_FALSE(result.error.empty());
        EXPECT_EQ(Fen::export_fen(board), before);
    }
}

TEST(FenTest, RequiresExactlyOneKingPerColour) {
    BoardState board;
    ASSERT_TRUE(Fen::import_fen(Fen::STANDARD_START, board).success);
    const std::string before = Fen::export_fen(board);

    ParseResult kingless = Fen::import_fen("8:8/8/8/8/8/8/8/R7 w - - 0 1", board);
    EXPECT_FALSE(kingless.success);
    EXPECT_EQ(kingless.error, "White needs a King");
    EXPECT_EQ(Fen::export_fen(board), before);

    ParseResult doubled = Fen::import_fen("8:k6k/8/8/8/8/8/8/K7 w - - 0 1", board);
    EXPECT_FALSE(doubled.success);
    EXPECT_EQ(doubled.error, "Black has 2 Kings (need 1)");
    EXPECT_EQ(Fen::export_fen(board), before);
}

TEST(FenTest, ErrorMessagesNameTheProblem) {
    BoardState board;
    EXPECT_EQ(Fen::import_fen("", board).error, "FEN string is empty");
    EXPECT_EQ(Fen::import_fen("4:k3/4/4 w", board).error, "Expected 4 ranks, got 3");
    EXPECT_NE(Fen::import_fen("4:k3/4/4/3Z w", board).error.find("Rank 1"), std::string::npos);
}

// --- TRANSCRIPT ---

TEST(TranscriptTest, SerializeIsFileMajor) {
    BoardState board;
    clear_board(board);
    add_piece(board, {1, 0}, PieceType::Knight, Colour::White);
    add_piece(board, {0, 7}, PieceType::Rook, Colour::Black, true);
    add_piece(board, {0, 1}, PieceType::Pawn, Colour::White);

    EXPECT_EQ(Transcript::serialize(board), "0,1,wP,0;0,7,bR,1;1,0,wN,0");
}

TEST(TranscriptTest, RoundTripKeepsMovedFlags) {
    BoardState board(12);
    std::mt19937_64 rng(3);
    ASSERT_TRUE(Setup::setup_board(board, SetupMode::OneLine, rng).success);
    board.at({0, 1})->has_moved = true;
    board.move_piece({5, 1}, {5, 3});

    BoardState copy;
    ParseResult result = Transcript::deserialize(Transcript::serialize(board), 12, copy);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(copy.size, 12);
    EXPECT_EQ(copy.cells, board.cells);
}

TEST(TranscriptTest, EmptyTranscriptGivesEmptyBoard) {
    BoardState board;
    ASSERT_TRUE(Fen::import_fen(Fen::STANDARD_START, board).success);
    ASSERT_TRUE(Transcript::deserialize("", 5, board).success);
    EXPECT_EQ(board.size, 5);
    for (const auto& cell : board.cells) EXPECT_FALSE(cell.has_value());
}

TEST(TranscriptTest, RejectsMalformedRecords) {
    BoardState board;
    ASSERT_TRUE(Fen::import_fen(Fen::STANDARD_START, board).success);
    const std::string before = Transcript::serialize(board);

    const char* bad[] = {
        "0,0,wK",
        "0,0,wK,0,1",
        "0,0,xK,0",
        "0,0,wk,0",
        "0,0,wZ,0",
        "8,0,wK,0",
        "0,-1,wK,0",
        "a,0,wK,0",
        "0,0,wK,2",
        "0,0,wK,0;0,0,bK,0",
    };
    for (const char* data : bad) {
        ParseResult result = Transcript::deserialize(data, 8, board);
        EXPECT_FALSE(result.success) << "accepted: " << data;
        EXPECT_EQ(Transcript::serialize(board), before);
    }

    EXPECT_FALSE(Transcript::deserialize("0,0,wK,0", 2, board).success);
}
