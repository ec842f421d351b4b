#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>


inline constexpr int MIN_BOARD_SIZE = 3;
inline constexpr int MAX_BOARD_SIZE = 99;
inline constexpr int DEFAULT_BOARD_SIZE = 26;

// Plies without a capture or pawn move before the game is drawn.
inline constexpr int DRAW_CLOCK_LIMIT = 100;

enum class Colour : uint8_t { White, Black };
enum class PieceType : uint8_t { King, Queen, Rook, Bishop, Knight, Pawn };

enum class GameState : uint8_t { Playing, WhiteWins, BlackWins, Stalemate, DrawByClock };

enum class SetupMode : uint8_t { TwoLines, OneLine, ThreeLines, Custom };

constexpr Colour opposite(Colour c) {
    return c == Colour::White ? Colour::Black : Colour::White;
}

// +1 for white (towards higher ranks), -1 for black.
constexpr int forward(Colour c) {
    return c == Colour::White ? 1 : -1;
}

struct Coord {
    int file = 0;
    int rank = 0;

    constexpr Coord() = default;
    constexpr Coord(int f, int r) : file(f), rank(r) {}

    bool operator==(const Coord& other) const = default;
};

struct Move {
    Coord from;
    Coord to;

    bool operator==(const Move& other) const = default;
};

struct Piece {
    PieceType type = PieceType::Pawn;
    Colour colour = Colour::White;
    bool has_moved = false;

    bool operator==(const Piece& other) const = default;
};

// Rule variations that depend on the setup a game was started from.
struct Ruleset {
    int pawn_first_move = 2;
};

struct ParseResult {
    bool success = true;
    std::string error;

    static ParseResult fail(std::string message) { return {false, std::move(message)}; }
};

struct SetupResult {
    bool success = true;
    std::vector<std::string> errors;
};

// Material values in centipawns.
constexpr int piece_value(PieceType type) {
    switch (type) {
        case PieceType::Pawn:   return 100;
        case PieceType::Knight: return 320;
        case PieceType::Bishop: return 330;
        case PieceType::Rook:   return 500;
        case PieceType::Queen:  return 900;
        case PieceType::King:   return 20000;
    }
    return 0;
}

// Uppercase letter used by notation and the codecs ('P' for pawns).
constexpr char piece_letter(PieceType type) {
    switch (type) {
        case PieceType::King:   return 'K';
        case PieceType::Queen:  return 'Q';
        case PieceType::Rook:   return 'R';
        case PieceType::Bishop: return 'B';
        case PieceType::Knight: return 'N';
        case PieceType::Pawn:   return 'P';
    }
    return '?';
}

// Inverse of piece_letter, case-insensitive. Returns false on unknown letters.
bool piece_from_letter(char c, PieceType& out);

// File labels continue past 'z' as aa, ab, ... so every board up to 99 wide
// has unique names.
std::string file_label(int file);
std::string square_name(Coord sq);
