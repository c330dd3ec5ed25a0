#include "engine/RotationSystem.hpp"

namespace modtris::engine {

RotationSystem::RotationSystem(core::Board board)
    : board_{std::move(board)}
{
}

bool RotationSystem::overlaps(const core::Piece& piece) const noexcept {
    return overlaps(piece.minos, piece.x, piece.y);
}

bool RotationSystem::overlaps(const core::Minos& minos, int x, int y) const noexcept {
    for (const auto& m : minos) {
        const int row = x + m.x;
        const int col = y + m.y;
        if (row < 0 || row >= board_.rows() || col < 0 || col >= board_.cols()) {
            return true; // out of board
        }
        if (board_.cell(row, col) != 0) {
            return true; // collision
        }
    }
    return false;
}

} // namespace modtris::engine
