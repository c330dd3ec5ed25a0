#pragma once // Include guard

#include <array>    // For std::array
#include <cstdint>  // For fixed-width integer types
#include <vector>

// Namespace for modtris core types
namespace modtris::core {

// Tetromino kinds. The numeric value is also the mino code a locked piece
// leaves on the board.
enum class PieceType : std::uint8_t {
    I = 1, J, L, O, S, T, Z
};

inline constexpr std::array<PieceType, 7> AllPieceTypes{
    PieceType::I, PieceType::J, PieceType::L, PieceType::O,
    PieceType::S, PieceType::T, PieceType::Z
};

// Every value a board cell may hold
enum class MinoType : std::uint8_t {
    Empty = 0,
    I, J, L, O, S, T, Z,
    Ghost,   // render-only, never in the authoritative board
    Garbage
};

constexpr std::uint8_t minoCode(PieceType type) noexcept {
    return static_cast<std::uint8_t>(type);
}

constexpr std::uint8_t minoCode(MinoType type) noexcept {
    return static_cast<std::uint8_t>(type);
}

inline char pieceName(PieceType type) noexcept {
    return "?IJLOSTZ"[static_cast<std::uint8_t>(type)];
}

// A single occupied cell offset. x is the row (counted from the top),
// y is the column.
struct Mino {
    int x{};
    int y{};
};

inline bool operator==(const Mino& a, const Mino& b) noexcept {
    return a.x == b.x && a.y == b.y;
}

using Minos = std::array<Mino, 4>;

// Visible board dimensions (the internal board is twice as tall)
struct BoardSize {
    int height{};
    int width{};
};

inline bool operator==(const BoardSize& a, const BoardSize& b) noexcept {
    return a.height == b.height && a.width == b.width;
}

// The active piece. minos are offsets from (x, y) for the current (type, r).
struct Piece {
    PieceType type{PieceType::I};
    int x{};
    int y{};
    int r{};
    Minos minos{};
};

inline bool operator==(const Piece& a, const Piece& b) noexcept {
    return a.type == b.type && a.x == b.x && a.y == b.y && a.r == b.r
        && a.minos == b.minos;
}

inline bool operator!=(const Piece& a, const Piece& b) noexcept {
    return !(a == b);
}

enum class PlayingStatus {
    Playing,
    Idle,    // paused
    Stopped  // lost
};

enum class MoveKind : std::uint8_t {
    Drag,
    HardDrop,
    Rotate,
    SoftDrop,
    Swap
};

// A requested action. x moves down, y moves right, r is clockwise turns
// (negative for counter-clockwise).
struct Move {
    MoveKind kind{MoveKind::Drag};
    int x{};
    int y{};
    int r{};
    bool automatic{false}; // pushed by gravity, not by the player

    static Move drag(int tiles) { return Move{MoveKind::Drag, 0, tiles, 0}; }
    static Move left(int tiles = 1) { return drag(-tiles); }
    static Move right(int tiles = 1) { return drag(tiles); }
    static Move rotate(int turns = 1) {
        return Move{MoveKind::Rotate, 0, 0, turns % 4};
    }
    static Move hardDrop() { return Move{MoveKind::HardDrop}; }
    static Move softDrop(int tiles = 1) { return Move{MoveKind::SoftDrop, tiles}; }
    static Move swap() { return Move{MoveKind::Swap}; }
};

// What a push actually did. rx/ry/rr are the requested offsets, x/y/r the
// applied ones after collision clipping.
struct MoveDelta {
    MoveKind kind{MoveKind::Drag};
    int x{};
    int y{};
    int r{};
    int rx{};
    int ry{};
    int rr{};
    std::vector<int> clears; // cleared row indices, in detection order
    bool automatic{false};
    bool locked{false};      // a hard drop that actually placed the piece
    Piece piece{};           // active piece after the move (the locked one for hard drops)
};

} // namespace modtris::core
