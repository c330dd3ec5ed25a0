#pragma once

#include "core/Board.hpp"
#include "core/Ruleset.hpp"
#include "core/Types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace modtris::core {
class Game;
}

namespace modtris::engine {

// (from rotation, to rotation) -> ordered (row, column) offsets to try
using KickTable = std::map<std::pair<int, int>, std::vector<core::Mino>>;

class RotationSystem {
public:
    explicit RotationSystem(core::Board board);
    virtual ~RotationSystem() = default;

    static core::RuleOverrides ruleOverrides() { return {}; }
    static std::optional<core::Ruleset> rules() { return std::nullopt; }

    // New piece of the given type at its spawn position, rotation 0
    virtual core::Piece spawn(core::PieceType type) const = 0;

    // Rotate in place by `turns` clockwise quarter turns. Leaves the piece
    // untouched when no placement fits.
    virtual void rotate(core::Piece& piece, int turns) const = 0;

    // True if any mino would sit outside the board or on a filled cell
    bool overlaps(const core::Piece& piece) const noexcept;
    bool overlaps(const core::Minos& minos, int x, int y) const noexcept;

    const core::Board& board() const noexcept { return board_; }

protected:
    core::Board board_; // view onto the game's board
};

// Super Rotation System, without 180 degree kicks
class Srs : public RotationSystem {
public:
    explicit Srs(core::Board board);

    static std::unique_ptr<Srs> fromGame(const core::Game& game);

    static const core::Minos& shape(core::PieceType type, int rotation);

    core::Piece spawn(core::PieceType type) const override;
    void rotate(core::Piece& piece, int turns) const override;

protected:
    Srs(core::Board board, KickTable kicks, KickTable iKicks);

    static const KickTable& standardKicks();
    static const KickTable& standardIKicks();

private:
    KickTable kicks_;
    KickTable iKicks_; // the I piece has its own offsets
};

// SRS with TETR.IO's 180 degree kicks (shared by every piece kind)
class TetrioSrs : public Srs {
public:
    explicit TetrioSrs(core::Board board);

    static std::unique_ptr<TetrioSrs> fromGame(const core::Game& game);
};

// SRS shapes, no kicks at all: a rotation either fits in place or fails
class NoKicks : public Srs {
public:
    explicit NoKicks(core::Board board);

    static std::unique_ptr<NoKicks> fromGame(const core::Game& game);
};

} // namespace modtris::engine
