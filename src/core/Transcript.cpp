#include "Transcript.hpp"

#include <cctype>
#include <charconv>
#include <sstream>
#include <vector>

namespace Transcript {

    namespace {
        bool parse_int(std::string_view token, int& out) {
            if (token.empty()) return false;
            const char* end = token.data() + token.size();
            auto [ptr, ec] = std::from_chars(token.data(), end, out);
            return ec == std::errc() && ptr == end;
        }
    }

    std::string serialize(const BoardState& board) {
        std::ostringstream ss;
        bool first = true;
        for (int file = 0; file < board.size; ++file) {
            for (int rank = 0; rank < board.size; ++rank) {
                const auto& cell = board.at({file, rank});
                if (!cell) continue;
                if (!first) ss << ';';
                first = false;
                ss << file << ',' << rank << ','
                   << (cell->colour == Colour::White ? 'w' : 'b') << piece_letter(cell->type) << ','
                   << (cell->has_moved ? 1 : 0);
            }
        }
        return ss.str();
    }

    ParseResult deserialize(std::string_view data, int board_size, BoardState& board) {
        if (board_size < MIN_BOARD_SIZE || board_size > MAX_BOARD_SIZE) {
            return ParseResult::fail("Board size must be between " + std::to_string(MIN_BOARD_SIZE) + " and " +
                                     std::to_string(MAX_BOARD_SIZE));
        }

        BoardState scratch(board_size);
        scratch.rules = board.rules;
        scratch.setup_mode = board.setup_mode;

        size_t start = 0;
        int index = 0;
        while (start <= data.size()) {
            size_t end = data.find(';', start);
            if (end == std::string_view::npos) end = data.size();
            std::string_view record = data.substr(start, end - start);
            start = end + 1;
            ++index;
            if (record.empty()) continue;

            std::vector<std::string_view> fields;
            size_t pos = 0;
            while (true) {
                size_t comma = record.find(',', pos);
                if (comma == std::string_view::npos) {
                    fields.push_back(record.substr(pos));
                    break;
                }
                fields.push_back(record.substr(pos, comma - pos));
                pos = comma + 1;
            }

            const std::string where = "Record " + std::to_string(index);
            if (fields.size() != 4) return ParseResult::fail(where + " must have 4 fields");

            int file = 0;
            int rank = 0;
            if (!parse_int(fields[0], file) || !parse_int(fields[1], rank) || !scratch.in_bounds(file, rank)) {
                return ParseResult::fail(where + " has an invalid square");
            }

            PieceType type = PieceType::Pawn;
            std::string_view code = fields[2];
            if (code.size() != 2 || (code[0] != 'w' && code[0] != 'b') ||
                !std::isupper(static_cast<unsigned char>(code[1])) || !piece_from_letter(code[1], type)) {
                return ParseResult::fail(where + " has an invalid piece code '" + std::string(code) + "'");
            }
            if (fields[3] != "0" && fields[3] != "1") {
                return ParseResult::fail(where + " has an invalid moved flag");
            }
            if (!scratch.empty({file, rank})) {
                return ParseResult::fail(where + " places a second piece on " + square_name({file, rank}));
            }

            Colour colour = code[0] == 'w' ? Colour::White : Colour::Black;
            scratch.set({file, rank}, Piece{type, colour, fields[3] == "1"});
        }

        board = std::move(scratch);
        return {};
    }
}
