#pragma once

#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <vector>

namespace modtris::core {

// 2D grid of mino codes.
//
// A Board is a handle: it refers to shared storage through an offset and a
// pair of strides. Copying a handle, or asking for rows()/row()/slice(),
// gives a view over the same cells, so writes through a view land in the
// owner. copy() is the only way to get independent storage.
class Board {
public:
    using Cell = std::uint8_t;

    class RowIterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Board;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = Board;

        RowIterator(const Board* board, int row) noexcept : board_{board}, row_{row} {}

        Board operator*() const { return board_->row(row_); }
        RowIterator& operator++() noexcept { ++row_; return *this; }
        RowIterator operator++(int) noexcept { RowIterator old = *this; ++row_; return old; }

        bool operator==(const RowIterator& other) const noexcept {
            return board_ == other.board_ && row_ == other.row_;
        }
        bool operator!=(const RowIterator& other) const noexcept { return !(*this == other); }

    private:
        const Board* board_;
        int row_;
    };

    // Zero-filled board
    Board(int rows, int cols);
    Board(std::initializer_list<std::initializer_list<int>> rows);
    explicit Board(const std::vector<std::vector<int>>& rows);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }

    // Negative indices count from the end; anything still out of range
    // throws std::out_of_range.
    Cell cell(int row, int col) const;
    void setCell(int row, int col, Cell value);

    // Views. Bounds follow slice rules: negative values count from the end
    // and are clamped to the axis.
    Board row(int row) const;
    Board rows(int begin, int end) const;
    Board slice(int rowBegin, int rowEnd, int colBegin, int colEnd) const;

    Board copy() const;
    void fill(Cell value);

    bool isRowFull(int row) const;
    bool isRowEmpty(int row) const;

    // Remove a row: rows above it shift down one, the top row is zeroed.
    void removeRow(int row);

    bool sharesStorageWith(const Board& other) const noexcept {
        return data_ == other.data_;
    }

    RowIterator begin() const noexcept { return RowIterator{this, 0}; }
    RowIterator end() const noexcept { return RowIterator{this, rows_}; }

    friend bool operator==(const Board& a, const Board& b);
    friend bool operator!=(const Board& a, const Board& b) { return !(a == b); }

private:
    Board(std::shared_ptr<std::vector<Cell>> data, int rows, int cols,
          std::ptrdiff_t offset, std::ptrdiff_t rowStride, std::ptrdiff_t colStride) noexcept;

    std::shared_ptr<std::vector<Cell>> data_;
    int rows_;
    int cols_;
    std::ptrdiff_t offset_{0};
    std::ptrdiff_t rowStride_;
    std::ptrdiff_t colStride_{1};

    std::ptrdiff_t index(int row, int col) const noexcept {
        return offset_ + row * rowStride_ + col * colStride_;
    }

    int normalize(int index, int extent, int axis) const;
};

} // namespace modtris::core
