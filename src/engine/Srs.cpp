#include "engine/RotationSystem.hpp"
#include "core/Game.hpp"

#include <array>

namespace modtris::engine {

using core::Mino;
using core::Minos;
using core::Piece;
using core::PieceType;

namespace {

// Offsets inside the piece's bounding box, indexed [type - 1][rotation].
// Rows grow downward, columns to the right.
const std::array<std::array<Minos, 4>, 7> Shapes{{
    // I
    {{
        {{{1, 0}, {1, 1}, {1, 2}, {1, 3}}},
        {{{0, 2}, {1, 2}, {2, 2}, {3, 2}}},
        {{{2, 0}, {2, 1}, {2, 2}, {2, 3}}},
        {{{0, 1}, {1, 1}, {2, 1}, {3, 1}}},
    }},
    // J
    {{
        {{{0, 0}, {1, 0}, {1, 1}, {1, 2}}},
        {{{0, 1}, {0, 2}, {1, 1}, {2, 1}}},
        {{{1, 0}, {1, 1}, {1, 2}, {2, 2}}},
        {{{0, 1}, {1, 1}, {2, 0}, {2, 1}}},
    }},
    // L
    {{
        {{{0, 2}, {1, 0}, {1, 1}, {1, 2}}},
        {{{0, 1}, {1, 1}, {2, 1}, {2, 2}}},
        {{{1, 0}, {1, 1}, {1, 2}, {2, 0}}},
        {{{0, 0}, {0, 1}, {1, 1}, {2, 1}}},
    }},
    // O
    {{
        {{{0, 1}, {0, 2}, {1, 1}, {1, 2}}},
        {{{0, 1}, {0, 2}, {1, 1}, {1, 2}}},
        {{{0, 1}, {0, 2}, {1, 1}, {1, 2}}},
        {{{0, 1}, {0, 2}, {1, 1}, {1, 2}}},
    }},
    // S
    {{
        {{{0, 1}, {0, 2}, {1, 0}, {1, 1}}},
        {{{0, 1}, {1, 1}, {1, 2}, {2, 2}}},
        {{{1, 1}, {1, 2}, {2, 0}, {2, 1}}},
        {{{0, 0}, {1, 0}, {1, 1}, {2, 1}}},
    }},
    // T
    {{
        {{{0, 1}, {1, 0}, {1, 1}, {1, 2}}},
        {{{0, 1}, {1, 1}, {1, 2}, {2, 1}}},
        {{{1, 0}, {1, 1}, {1, 2}, {2, 1}}},
        {{{0, 1}, {1, 0}, {1, 1}, {2, 1}}},
    }},
    // Z
    {{
        {{{0, 0}, {0, 1}, {1, 1}, {1, 2}}},
        {{{0, 2}, {1, 1}, {1, 2}, {2, 1}}},
        {{{1, 0}, {1, 1}, {2, 1}, {2, 2}}},
        {{{0, 1}, {1, 0}, {1, 1}, {2, 0}}},
    }},
}};

// TETR.IO 180 degree kicks
const KickTable& tetrio180() {
    static const KickTable table{
        {{0, 2}, {{-1, +0}, {-1, +1}, {-1, -1}, {+0, +1}, {+0, -1}}},
        {{1, 3}, {{+0, +1}, {-2, +1}, {-1, +1}, {-2, +0}, {-1, +0}}},
        {{2, 0}, {{+1, +0}, {+1, -1}, {+1, +1}, {+0, -1}, {+0, +1}}},
        {{3, 1}, {{+0, -1}, {-2, -1}, {-1, -1}, {-2, +0}, {-1, +0}}},
    };
    return table;
}

KickTable merged(KickTable base, const KickTable& extra) {
    for (const auto& [key, offsets] : extra) {
        base[key] = offsets;
    }
    return base;
}

} // namespace

const KickTable& Srs::standardKicks() {
    static const KickTable table{
        {{0, 1}, {{+0, -1}, {-1, -1}, {+2, +0}, {+2, -1}}},
        {{0, 3}, {{+0, +1}, {-1, +1}, {+2, +0}, {+2, +1}}},
        {{1, 0}, {{+0, +1}, {+1, +1}, {-2, +0}, {-2, +1}}},
        {{1, 2}, {{+0, +1}, {+1, +1}, {-2, +0}, {-2, +1}}},
        {{2, 1}, {{+0, -1}, {-1, -1}, {+2, +0}, {+2, -1}}},
        {{2, 3}, {{+0, +1}, {-1, +1}, {+2, +0}, {+2, +1}}},
        {{3, 0}, {{+0, -1}, {+1, -1}, {-2, +0}, {-2, -1}}},
        {{3, 2}, {{+0, -1}, {+1, -1}, {-2, +0}, {-2, -1}}},
    };
    return table;
}

const KickTable& Srs::standardIKicks() {
    static const KickTable table{
        {{0, 1}, {{+0, -1}, {+0, +1}, {+1, -2}, {-2, +1}}},
        {{0, 3}, {{+0, -1}, {+0, +2}, {-2, -1}, {+1, +2}}},
        {{1, 0}, {{+0, +2}, {+0, -1}, {-1, +2}, {+2, -1}}},
        {{1, 2}, {{+0, -1}, {+0, +2}, {-2, -1}, {+1, +2}}},
        {{2, 1}, {{+0, +1}, {+0, -2}, {+2, +1}, {-1, +2}}},
        {{2, 3}, {{+0, +2}, {+0, -1}, {-1, +2}, {+2, -1}}},
        {{3, 0}, {{+0, +1}, {+0, -2}, {+2, +1}, {-1, -2}}},
        {{3, 2}, {{+0, -2}, {+0, +1}, {+1, -2}, {-2, +1}}},
    };
    return table;
}

Srs::Srs(core::Board board)
    : Srs(std::move(board), standardKicks(), standardIKicks())
{
}

Srs::Srs(core::Board board, KickTable kicks, KickTable iKicks)
    : RotationSystem{std::move(board)}
    , kicks_{std::move(kicks)}
    , iKicks_{std::move(iKicks)}
{
}

std::unique_ptr<Srs> Srs::fromGame(const core::Game& game) {
    return std::make_unique<Srs>(game.board());
}

const Minos& Srs::shape(PieceType type, int rotation) {
    return Shapes[static_cast<std::size_t>(type) - 1][static_cast<std::size_t>(rotation & 3)];
}

Piece Srs::spawn(PieceType type) const {
    const int rows = board_.rows();
    const int cols = board_.cols();

    return Piece{
        type,
        rows / 2 - 2,       // just above the visible area
        (cols + 3) / 2 - 3, // centred, leaning left
        0,
        shape(type, 0),
    };
}

void Srs::rotate(Piece& piece, int turns) const {
    const int target = (piece.r + ((turns % 4) + 4) % 4) % 4;
    const Minos& minos = shape(piece.type, target);

    if (!overlaps(minos, piece.x, piece.y)) {
        piece.r = target;
    } else {
        const KickTable& table = piece.type == PieceType::I ? iKicks_ : kicks_;
        auto it = table.find({piece.r, target});
        if (it != table.end()) {
            for (const Mino& kick : it->second) {
                if (!overlaps(minos, piece.x + kick.x, piece.y + kick.y)) {
                    piece.x += kick.x;
                    piece.y += kick.y;
                    piece.r = target;
                    break;
                }
            }
        }
    }

    piece.minos = shape(piece.type, piece.r);
}

TetrioSrs::TetrioSrs(core::Board board)
    : Srs(std::move(board),
          merged(standardKicks(), tetrio180()),
          merged(standardIKicks(), tetrio180()))
{
}

std::unique_ptr<TetrioSrs> TetrioSrs::fromGame(const core::Game& game) {
    return std::make_unique<TetrioSrs>(game.board());
}

NoKicks::NoKicks(core::Board board)
    : Srs(std::move(board), KickTable{}, KickTable{})
{
}

std::unique_ptr<NoKicks> NoKicks::fromGame(const core::Game& game) {
    return std::make_unique<NoKicks>(game.board());
}

} // namespace modtris::engine
