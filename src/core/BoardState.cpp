#include "BoardState.hpp"

std::optional<Coord> BoardState::find_king(Colour side) const {
    for (int rank = 0; rank < size; ++rank) {
        for (int file = 0; file < size; ++file) {
            const auto& cell = cells[static_cast<size_t>(rank) * size + file];
            if (cell && cell->type == PieceType::King && cell->colour == side) {
                return Coord{file, rank};
            }
        }
    }
    return std::nullopt;
}
