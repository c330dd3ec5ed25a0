#include "codec/Encoder.hpp"
#include "engine/RotationSystem.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace modtris::codec {

namespace {

constexpr std::size_t HeaderSize = 3;
constexpr std::size_t PieceSize = 6;
constexpr std::uint8_t MaxCell = core::minoCode(core::MinoType::Garbage);

void putInt16(std::vector<std::uint8_t>& out, int value) {
    if (value < std::numeric_limits<std::int16_t>::min()
        || value > std::numeric_limits<std::int16_t>::max()) {
        throw std::invalid_argument("encode: piece coordinate out of int16 range");
    }
    const auto bits = static_cast<std::uint16_t>(static_cast<std::int16_t>(value));
    out.push_back(static_cast<std::uint8_t>(bits & 0xFF));
    out.push_back(static_cast<std::uint8_t>(bits >> 8));
}

int getInt16(const std::vector<std::uint8_t>& in, std::size_t at) {
    const auto bits = static_cast<std::uint16_t>(in[at] | (in[at + 1] << 8));
    return static_cast<std::int16_t>(bits);
}

} // namespace

std::vector<std::uint8_t> encode(const core::Board& board, const std::optional<core::Piece>& piece)
{
    const int rows = board.rows();
    const int cols = board.cols();
    if (rows > 255 || cols > 255) {
        throw std::invalid_argument("encode: board larger than 255x255");
    }

    int first = rows;
    for (int r = 0; r < rows; ++r) {
        if (!board.isRowEmpty(r)) {
            first = r;
            break;
        }
    }

    std::vector<std::uint8_t> nibbles;
    nibbles.reserve(static_cast<std::size_t>((rows - first) * cols) + 1);
    for (int r = first; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const std::uint8_t cell = board.cell(r, c);
            if (cell > MaxCell) {
                throw std::invalid_argument("encode: cell value " + std::to_string(cell)
                                            + " is not a mino");
            }
            nibbles.push_back(cell);
        }
    }

    std::uint8_t flags = 0;
    if (piece) {
        flags |= HasPiece;
    }
    if (nibbles.size() % 2 != 0) {
        flags |= Padded;
        nibbles.push_back(0);
    }

    std::vector<std::uint8_t> out{flags, static_cast<std::uint8_t>(rows),
                                  static_cast<std::uint8_t>(cols)};
    if (piece) {
        out.push_back(static_cast<std::uint8_t>(piece->type));
        out.push_back(static_cast<std::uint8_t>(piece->r & 3));
        putInt16(out, piece->x);
        putInt16(out, piece->y);
    }

    for (std::size_t i = 0; i < nibbles.size(); i += 2) {
        out.push_back(static_cast<std::uint8_t>((nibbles[i] << 4) | nibbles[i + 1]));
    }
    return out;
}

std::optional<Decoded> decode(const std::vector<std::uint8_t>& bytes)
{
    if (bytes.size() < HeaderSize) {
        return std::nullopt;
    }

    const std::uint8_t flags = bytes[0];
    const int rows = bytes[1];
    const int cols = bytes[2];
    if ((flags & ~(HasPiece | Padded)) != 0 || rows == 0 || cols == 0) {
        return std::nullopt;
    }

    std::size_t at = HeaderSize;
    std::optional<core::Piece> piece;
    if (flags & HasPiece) {
        if (bytes.size() < at + PieceSize) {
            return std::nullopt;
        }
        const std::uint8_t type = bytes[at];
        const std::uint8_t r = bytes[at + 1];
        if (type < 1 || type > 7 || r > 3) {
            return std::nullopt;
        }
        core::Piece p;
        p.type = static_cast<core::PieceType>(type);
        p.r = r;
        p.x = getInt16(bytes, at + 2);
        p.y = getInt16(bytes, at + 4);
        p.minos = engine::Srs::shape(p.type, p.r);
        piece = p;
        at += PieceSize;
    }

    std::vector<std::uint8_t> cells;
    cells.reserve((bytes.size() - at) * 2);
    for (; at < bytes.size(); ++at) {
        cells.push_back(static_cast<std::uint8_t>(bytes[at] >> 4));
        cells.push_back(static_cast<std::uint8_t>(bytes[at] & 0x0F));
    }
    if (flags & Padded) {
        if (cells.empty() || cells.back() != 0) {
            return std::nullopt;
        }
        cells.pop_back();
    }

    const auto width = static_cast<std::size_t>(cols);
    if (cells.size() % width != 0 || cells.size() / width > static_cast<std::size_t>(rows)) {
        return std::nullopt;
    }

    core::Board board(rows, cols);
    const int offset = rows - static_cast<int>(cells.size() / width);
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (cells[i] > MaxCell) {
            return std::nullopt;
        }
        board.setCell(offset + static_cast<int>(i / width), static_cast<int>(i % width), cells[i]);
    }

    return Decoded{board, piece};
}

} // namespace modtris::codec
