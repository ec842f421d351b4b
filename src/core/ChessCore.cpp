#include "ChessCore.hpp"
#include "Attacks.hpp"
#include "Fen.hpp"
#include "Rules.hpp"
#include "Setup.hpp"
#include "Transcript.hpp"

#include <algorithm>

ChessCore::ChessCore(uint64_t seed) : board_(DEFAULT_BOARD_SIZE), rng_(seed) {
    new_game(SetupMode::TwoLines, DEFAULT_BOARD_SIZE);
}

void ChessCore::start_fresh() {
    state_ = GameState::Playing;
    pending_.reset();
}

std::vector<Coord> ChessCore::legal_moves(Coord from) {
    if (pending_ || state_ != GameState::Playing || !board_.in_bounds(from)) return {};
    const auto& cell = board_.at(from);
    if (!cell || cell->colour != board_.to_move) return {};
    return Rules::legal_moves(board_, from);
}

MoveOutcome ChessCore::try_make_move(Coord from, Coord to) {
    MoveOutcome outcome;
    outcome.to_move = board_.to_move;
    outcome.state = state_;

    std::vector<Coord> legal = legal_moves(from);
    if (std::find(legal.begin(), legal.end(), to) == legal.end()) return outcome;

    Rules::MoveEffects fx = Rules::execute_move(board_, {from, to});

    if (fx.reaches_promotion) {
        pending_ = PendingPromotion{from, to, fx.mover, fx.captured};
        outcome.success = true;
        outcome.promotion_square = to;
        outcome.promotion_colour = fx.mover.colour;
        return outcome;
    }

    ++board_.move_count;
    if (fx.mover.colour == Colour::Black) ++board_.full_move_number;
    if (fx.captured || fx.mover.type == PieceType::Pawn) {
        board_.half_move_clock = 0;
    } else {
        ++board_.half_move_clock;
    }

    board_.to_move = opposite(fx.mover.colour);
    std::string notation = Rules::move_notation(fx, {from, to}) + Rules::check_suffix(board_, board_.to_move);
    return finish_turn(std::move(notation));
}

MoveOutcome ChessCore::complete_promotion(PieceType type) {
    if (!pending_) {
        MoveOutcome outcome;
        outcome.to_move = board_.to_move;
        outcome.state = state_;
        return outcome;
    }

    if (type == PieceType::King || type == PieceType::Pawn) type = PieceType::Queen;

    const PendingPromotion promo = *pending_;
    pending_.reset();

    board_.set(promo.to, Piece{type, promo.pawn.colour, true});

    ++board_.move_count;
    if (promo.pawn.colour == Colour::Black) ++board_.full_move_number;
    board_.half_move_clock = 0;
    board_.to_move = opposite(promo.pawn.colour);

    Rules::MoveEffects fx;
    fx.mover = promo.pawn;
    fx.captured = promo.captured;
    std::string notation = Rules::move_notation(fx, {promo.from, promo.to}, type) +
                           Rules::check_suffix(board_, board_.to_move);
    return finish_turn(std::move(notation));
}

MoveOutcome ChessCore::finish_turn(std::string notation) {
    MoveOutcome outcome;
    outcome.success = true;
    outcome.notation = std::move(notation);
    outcome.turn_changed = true;
    outcome.to_move = board_.to_move;
    update_game_state(outcome);
    return outcome;
}

// Check, then mate or stalemate, then the draw clock.
void ChessCore::update_game_state(MoveOutcome& outcome) {
    const Colour side = board_.to_move;
    const bool check = Attacks::in_check(board_, side);
    if (check) {
        outcome.in_check = side;
        outcome.checked_king = board_.find_king(side);
    }

    if (!Rules::has_any_legal_move(board_, side)) {
        if (check) {
            state_ = (side == Colour::White) ? GameState::BlackWins : GameState::WhiteWins;
        } else {
            state_ = GameState::Stalemate;
        }
    } else if (board_.half_move_clock >= DRAW_CLOCK_LIMIT) {
        state_ = GameState::DrawByClock;
    }
    outcome.state = state_;
}

bool ChessCore::is_check(Colour side) const {
    return Attacks::in_check(board_, side);
}

SetupResult ChessCore::reset(SetupMode mode) {
    return new_game(mode, board_.size);
}

SetupResult ChessCore::new_game(SetupMode mode, int board_size) {
    if (board_size < MIN_BOARD_SIZE || board_size > MAX_BOARD_SIZE) {
        SetupResult result;
        result.success = false;
        result.errors.push_back("Board size must be between " + std::to_string(MIN_BOARD_SIZE) + " and " +
                                std::to_string(MAX_BOARD_SIZE));
        return result;
    }

    // Custom games start from the pieces already placed by the editor.
    BoardState next = (mode == SetupMode::Custom) ? board_ : BoardState(board_size);
    if (mode == SetupMode::Custom && next.size != board_size) {
        SetupResult result;
        result.success = false;
        result.errors.push_back("Custom setup was placed on a " + std::to_string(next.size) + "x" +
                                std::to_string(next.size) + " board");
        return result;
    }

    SetupResult result = Setup::setup_board(next, mode, rng_);
    if (!result.success) return result;

    board_ = std::move(next);
    start_fresh();
    return result;
}

ParseResult ChessCore::fen(std::string_view fen) {
    ParseResult result = Fen::import_fen(fen, board_);
    if (!result.success) return result;

    start_fresh();
    MoveOutcome ignored;
    update_game_state(ignored);
    return result;
}

std::string ChessCore::fen() const {
    return Fen::export_fen(board_);
}

ParseResult ChessCore::load_transcript(std::string_view data, int board_size, SetupMode mode) {
    BoardState next = board_;
    next.rules = Setup::ruleset_for(mode);
    next.setup_mode = mode;

    ParseResult result = Transcript::deserialize(data, board_size, next);
    if (!result.success) return result;

    board_ = std::move(next);
    start_fresh();
    return result;
}

std::string ChessCore::transcript() const {
    return Transcript::serialize(board_);
}

bool ChessCore::clear_board(int board_size) {
    if (board_size < MIN_BOARD_SIZE || board_size > MAX_BOARD_SIZE) return false;
    board_.resize(board_size);
    board_.setup_mode = SetupMode::Custom;
    start_fresh();
    return true;
}

bool ChessCore::place_piece(Coord sq, std::optional<Piece> piece) {
    if (!board_.in_bounds(sq)) return false;
    board_.at(sq) = piece;
    return true;
}

std::future<std::optional<Move>> ChessCore::request_best_move(Colour side, Search::Difficulty difficulty) {
    BoardState snapshot = board_;
    uint64_t seed = rng_();
    return std::async(std::launch::async, [snapshot = std::move(snapshot), side, difficulty, seed]() {
        std::mt19937_64 rng(seed);
        Search::SearchStats stats;
        return Search::find_best_move(snapshot, side, Search::params_for(difficulty), rng, stats);
    });
}
