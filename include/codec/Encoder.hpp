#pragma once

#include "core/Board.hpp"
#include "core/Types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace modtris::codec {

enum EncoderFlag : std::uint8_t {
    HasPiece = 1 << 0,
    Padded = 1 << 1, // body ends with one unused zero nibble
};

struct Decoded {
    core::Board board;
    std::optional<core::Piece> piece;
};

/// Pack a board, and optionally a piece, into bytes:
///   [flags, rows, cols] [type, r, x lo, x hi, y lo, y hi]? [body...]
/// The body starts at the first non-empty row and holds two cells per byte,
/// high nibble first.
/// Throws std::invalid_argument when the board or piece does not fit the format.
std::vector<std::uint8_t> encode(const core::Board& board,
                                 const std::optional<core::Piece>& piece = std::nullopt);

/// Inverse of encode(). Piece minos are rebuilt from the SRS shapes.
/// Returns std::nullopt on malformed input.
std::optional<Decoded> decode(const std::vector<std::uint8_t>& bytes);

} // namespace modtris::codec
