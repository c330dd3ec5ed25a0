#include "core/Board.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace modtris::core {

namespace {

std::vector<std::vector<int>> toNested(std::initializer_list<std::initializer_list<int>> rows) {
    std::vector<std::vector<int>> nested;
    nested.reserve(rows.size());
    for (const auto& r : rows) {
        nested.emplace_back(r);
    }
    return nested;
}

// Slice bound: negative counts from the end, then clamped into [0, extent]
int clampBound(int bound, int extent) noexcept {
    if (bound < 0) {
        bound += extent;
    }
    return std::clamp(bound, 0, extent);
}

} // namespace

Board::Board(int rows, int cols)
    : data_{}
    , rows_{rows}
    , cols_{cols}
    , rowStride_{cols}
{
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
    data_ = std::make_shared<std::vector<Cell>>(static_cast<std::size_t>(rows) * cols, Cell{0});
}

Board::Board(std::initializer_list<std::initializer_list<int>> rows)
    : Board(toNested(rows))
{
}

Board::Board(const std::vector<std::vector<int>>& rows)
    : data_{}
    , rows_{static_cast<int>(rows.size())}
    , cols_{rows.empty() ? 0 : static_cast<int>(rows.front().size())}
    , rowStride_{cols_}
{
    if (rows_ == 0 || cols_ == 0) {
        throw std::invalid_argument("Board axes must have non-zero length");
    }

    data_ = std::make_shared<std::vector<Cell>>();
    data_->reserve(static_cast<std::size_t>(rows_) * cols_);
    for (const auto& r : rows) {
        if (static_cast<int>(r.size()) != cols_) {
            throw std::invalid_argument("Board rows must all have the same length");
        }
        for (int v : r) {
            if (v < 0 || v > 0xFF) {
                throw std::invalid_argument("Board cell values must fit in a byte");
            }
            data_->push_back(static_cast<Cell>(v));
        }
    }
}

Board::Board(std::shared_ptr<std::vector<Cell>> data, int rows, int cols,
             std::ptrdiff_t offset, std::ptrdiff_t rowStride, std::ptrdiff_t colStride) noexcept
    : data_{std::move(data)}
    , rows_{rows}
    , cols_{cols}
    , offset_{offset}
    , rowStride_{rowStride}
    , colStride_{colStride}
{
}

int Board::normalize(int index, int extent, int axis) const {
    const int original = index;
    if (index < 0) {
        index += extent;
    }
    if (index < 0 || index >= extent) {
        throw std::out_of_range("board index " + std::to_string(original)
                                + " out of bounds for axis " + std::to_string(axis));
    }
    return index;
}

Board::Cell Board::cell(int row, int col) const {
    row = normalize(row, rows_, 0);
    col = normalize(col, cols_, 1);
    return (*data_)[index(row, col)];
}

void Board::setCell(int row, int col, Cell value) {
    row = normalize(row, rows_, 0);
    col = normalize(col, cols_, 1);
    (*data_)[index(row, col)] = value;
}

Board Board::row(int row) const {
    row = normalize(row, rows_, 0);
    return Board{data_, 1, cols_, index(row, 0), rowStride_, colStride_};
}

Board Board::rows(int begin, int end) const {
    return slice(begin, end, 0, cols_);
}

Board Board::slice(int rowBegin, int rowEnd, int colBegin, int colEnd) const {
    rowBegin = clampBound(rowBegin, rows_);
    rowEnd = std::max(clampBound(rowEnd, rows_), rowBegin);
    colBegin = clampBound(colBegin, cols_);
    colEnd = std::max(clampBound(colEnd, cols_), colBegin);

    return Board{data_, rowEnd - rowBegin, colEnd - colBegin,
                 index(rowBegin, colBegin), rowStride_, colStride_};
}

Board Board::copy() const {
    auto data = std::make_shared<std::vector<Cell>>();
    data->reserve(static_cast<std::size_t>(rows_) * cols_);
    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < cols_; ++c) {
            data->push_back((*data_)[index(r, c)]);
        }
    }
    return Board{std::move(data), rows_, cols_, 0, cols_, 1};
}

void Board::fill(Cell value) {
    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < cols_; ++c) {
            (*data_)[index(r, c)] = value;
        }
    }
}

bool Board::isRowFull(int row) const {
    row = normalize(row, rows_, 0);
    for (int c = 0; c < cols_; ++c) {
        if ((*data_)[index(row, c)] == 0) {
            return false;
        }
    }
    return true;
}

bool Board::isRowEmpty(int row) const {
    row = normalize(row, rows_, 0);
    for (int c = 0; c < cols_; ++c) {
        if ((*data_)[index(row, c)] != 0) {
            return false;
        }
    }
    return true;
}

void Board::removeRow(int row) {
    row = normalize(row, rows_, 0);

    // Shift rows above down by 1, bottom-up so nothing is overwritten early
    for (int r = row; r > 0; --r) {
        for (int c = 0; c < cols_; ++c) {
            (*data_)[index(r, c)] = (*data_)[index(r - 1, c)];
        }
    }
    // Clear top row
    for (int c = 0; c < cols_; ++c) {
        (*data_)[index(0, c)] = 0;
    }
}

bool operator==(const Board& a, const Board& b) {
    if (a.rows_ != b.rows_ || a.cols_ != b.cols_) {
        return false;
    }
    for (int r = 0; r < a.rows_; ++r) {
        for (int c = 0; c < a.cols_; ++c) {
            if ((*a.data_)[a.index(r, c)] != (*b.data_)[b.index(r, c)]) {
                return false;
            }
        }
    }
    return true;
}

} // namespace modtris::core
