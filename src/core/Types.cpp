#include "Types.hpp"

#include <cctype>

bool piece_from_letter(char c, PieceType& out) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'K': out = PieceType::King; return true;
        case 'Q': out = PieceType::Queen; return true;
        case 'R': out = PieceType::Rook; return true;
        case 'B': out = PieceType::Bishop; return true;
        case 'N': out = PieceType::Knight; return true;
        case 'P': out = PieceType::Pawn; return true;
        default: return false;
    }
}

std::string file_label(int file) {
    // Bijective base 26: a..z, aa..az, ba..
    std::string label;
    int n = file + 1;
    while (n > 0) {
        --n;
        label.insert(label.begin(), static_cast<char>('a' + n % 26));
        n /= 26;
    }
    return label;
}

std::string square_name(Coord sq) {
    return file_label(sq.file) + std::to_string(sq.rank + 1);
}
