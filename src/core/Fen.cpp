#include "Fen.hpp"
#include "Setup.hpp"

#include <cctype>
#include <charconv>
#include <sstream>
#include <vector>

namespace Fen {

    namespace {
        std::vector<std::string> split(std::string_view text, char sep) {
            std::vector<std::string> parts;
            size_t start = 0;
            while (true) {
                size_t pos = text.find(sep, start);
                parts.emplace_back(text.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
                if (pos == std::string_view::npos) break;
                start = pos + 1;
            }
            return parts;
        }

        bool parse_int(std::string_view token, int& out) {
            if (token.empty()) return false;
            const char* end = token.data() + token.size();
            auto [ptr, ec] = std::from_chars(token.data(), end, out);
            return ec == std::errc() && ptr == end;
        }

        std::optional<int> king_file(const BoardState& board, Colour colour) {
            int rank = board.back_rank(colour);
            for (int file = 0; file < board.size; ++file) {
                const auto& cell = board.at({file, rank});
                if (cell && cell->type == PieceType::King && cell->colour == colour && !cell->has_moved) return file;
            }
            return std::nullopt;
        }

        bool unmoved_rook_towards(const BoardState& board, Colour colour, int king, int dir) {
            int rank = board.back_rank(colour);
            for (int file = king + dir; file >= 0 && file < board.size; file += dir) {
                const auto& cell = board.at({file, rank});
                if (cell && cell->type == PieceType::Rook && cell->colour == colour && !cell->has_moved) return true;
            }
            return false;
        }

        // Marks back-rank rooks (and the king, if neither side remains) as moved
        // for every right missing from the castling field.
        void apply_castling_field(BoardState& board, Colour colour, bool king_side, bool queen_side) {
            int rank = board.back_rank(colour);
            std::optional<int> king = king_file(board, colour);
            if (!king) return;

            for (int file = 0; file < board.size; ++file) {
                auto& cell = board.at({file, rank});
                if (!cell || cell->colour != colour || cell->type != PieceType::Rook) continue;
                bool right_side = file > *king;
                if ((right_side && !king_side) || (!right_side && !queen_side)) cell->has_moved = true;
            }
            if (!king_side && !queen_side) board.at({*king, rank})->has_moved = true;
        }
    }

    std::string castling_rights(const BoardState& board) {
        std::string rights;
        for (Colour colour : {Colour::White, Colour::Black}) {
            std::optional<int> king = king_file(board, colour);
            if (!king) continue;
            bool white = colour == Colour::White;
            if (unmoved_rook_towards(board, colour, *king, 1)) rights += white ? 'K' : 'k';
            if (unmoved_rook_towards(board, colour, *king, -1)) rights += white ? 'Q' : 'q';
        }
        return rights;
    }

    std::string export_fen(const BoardState& board) {
        std::ostringstream ss;
        ss << board.size << ':';

        for (int rank = board.size - 1; rank >= 0; --rank) {
            int empty = 0;
            for (int file = 0; file < board.size; ++file) {
                const auto& cell = board.at({file, rank});
                if (!cell) {
                    ++empty;
                    continue;
                }
                if (empty > 0) {
                    ss << empty;
                    empty = 0;
                }
                char c = piece_letter(cell->type);
                ss << static_cast<char>(cell->colour == Colour::White ? c : std::tolower(c));
            }
            if (empty > 0) ss << empty;
            if (rank > 0) ss << '/';
        }

        std::string rights = castling_rights(board);
        ss << ' ' << (board.to_move == Colour::White ? 'w' : 'b');
        ss << ' ' << (rights.empty() ? "-" : rights);
        ss << " - 0 1";
        return ss.str();
    }

    ParseResult import_fen(std::string_view fen, BoardState& board) {
        std::vector<std::string> fields;
        {
            std::istringstream ss{std::string(fen)};
            std::string field;
            while (ss >> field) fields.push_back(field);
        }
        if (fields.empty()) return ParseResult::fail("FEN string is empty");

        std::string_view placement = fields[0];
        int size = 8;
        size_t colon = placement.find(':');
        if (colon != std::string_view::npos) {
            if (!parse_int(placement.substr(0, colon), size)) return ParseResult::fail("Invalid board size in FEN");
            placement = placement.substr(colon + 1);
        }
        if (size < MIN_BOARD_SIZE || size > MAX_BOARD_SIZE) {
            return ParseResult::fail("Board size must be between " + std::to_string(MIN_BOARD_SIZE) + " and " +
                                     std::to_string(MAX_BOARD_SIZE));
        }

        std::vector<std::string> ranks = split(placement, '/');
        if (static_cast<int>(ranks.size()) != size) {
            return ParseResult::fail("Expected " + std::to_string(size) + " ranks, got " +
                                     std::to_string(ranks.size()));
        }

        BoardState scratch(size);
        scratch.rules = board.rules;
        scratch.setup_mode = board.setup_mode;

        for (size_t idx = 0; idx < ranks.size(); ++idx) {
            const std::string& row = ranks[idx];
            const int rank = size - 1 - static_cast<int>(idx);
            const std::string label = "Rank " + std::to_string(rank + 1);
            int file = 0;

            size_t i = 0;
            while (i < row.size()) {
                if (std::isdigit(static_cast<unsigned char>(row[i]))) {
                    size_t start = i;
                    while (i < row.size() && std::isdigit(static_cast<unsigned char>(row[i]))) ++i;
                    int run = 0;
                    if (!parse_int(std::string_view(row).substr(start, i - start), run) || run == 0) {
                        return ParseResult::fail(label + " has an invalid empty-square count");
                    }
                    file += run;
                } else {
                    PieceType type = PieceType::Pawn;
                    if (!piece_from_letter(row[i], type)) {
                        return ParseResult::fail(label + " contains unknown piece '" + std::string(1, row[i]) + "'");
                    }
                    if (file >= size) break;
                    Colour colour = std::isupper(static_cast<unsigned char>(row[i])) ? Colour::White : Colour::Black;
                    scratch.set({file, rank}, Piece{type, colour});
                    ++file;
                    ++i;
                }
                if (file > size) break;
            }

            if (file != size || i != row.size()) {
                return ParseResult::fail(label + " does not describe exactly " + std::to_string(size) + " squares");
            }
        }

        if (fields.size() >= 2) {
            const std::string& side = fields[1];
            if (side == "w" || side == "W") {
                scratch.to_move = Colour::White;
            } else if (side == "b" || side == "B") {
                scratch.to_move = Colour::Black;
            } else {
                return ParseResult::fail("Invalid side to move '" + side + "'");
            }
        }

        if (fields.size() >= 3) {
            const std::string& castling = fields[2];
            if (castling != "-" && castling.find_first_not_of("KQkq") != std::string::npos) {
                return ParseResult::fail("Invalid castling field '" + castling + "'");
            }
            auto has = [&](char c) { return castling.find(c) != std::string::npos; };
            apply_castling_field(scratch, Colour::White, has('K'), has('Q'));
            apply_castling_field(scratch, Colour::Black, has('k'), has('q'));
        }

        std::vector<std::string> kings = Setup::king_errors(scratch);
        if (!kings.empty()) return ParseResult::fail(kings.front());

        board = std::move(scratch);
        return {};
    }
}
