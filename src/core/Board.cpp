#include "termtris/core/Board.hpp"
#include <algorithm>
#include <stdexcept>

namespace termtris::core {

Board::Board(int rows, int cols)
    : rows_{rows}
    , cols_{cols}
    , grid_{}
{
    if (rows <= 0 || cols <= 0) {
        throw std::invalid_argument("Board dimensions must be positive");
    }
    grid_.assign(static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols), EmptyCell);
}

CellValue Board::cell(int row, int col) const {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::cell out of range");
    }
    return grid_[index(row, col)];
}

void Board::setCell(int row, int col, CellValue value) {
    if (!isInside(row, col)) {
        throw std::out_of_range("Board::setCell out of range");
    }
    grid_[index(row, col)] = value;
}

bool Board::isRowFull(int row) const {
    if (row < 0 || row >= rows_) {
        throw std::out_of_range("Board::isRowFull out of range");
    }
    for (int col = 0; col < cols_; ++col) {
        if (grid_[index(row, col)] == EmptyCell) {
            return false;
        }
    }
    return true;
}

bool Board::isEmpty() const noexcept {
    return std::all_of(grid_.begin(), grid_.end(),
                       [](CellValue v) { return v == EmptyCell; });
}

bool Board::collides(const Tetromino& piece, Position origin) const noexcept {
    for (int r = 0; r < piece.height(); ++r) {
        for (int c = 0; c < piece.width(); ++c) {
            if (!piece.occupied(r, c)) {
                continue;
            }
            const int row = origin.row + r;
            const int col = origin.col + c;
            if (col < 0 || col >= cols_ || row >= rows_) {
                return true; // out of board
            }
            if (row < 0) {
                continue; // still entering from above
            }
            if (grid_[index(row, col)] != EmptyCell) {
                return true;
            }
        }
    }
    return false;
}

void Board::lockTetromino(const Tetromino& piece, Position origin) {
    for (const auto& b : piece.blocks(origin)) {
        if (isInside(b.row, b.col)) {
            grid_[index(b.row, b.col)] = piece.fillValue();
        }
    }
}

int Board::clearFullLines() {
    int cleared = 0;

    // Go bottom-up: when we clear, we shift everything above down
    for (int row = rows_ - 1; row >= 0; --row) {
        if (!isRowFull(row)) {
            continue;
        }

        // Shift rows above down by 1
        for (int r = row; r > 0; --r) {
            std::copy_n(grid_.begin() + index(r - 1, 0), cols_, grid_.begin() + index(r, 0));
        }
        // Clear top row
        std::fill_n(grid_.begin(), cols_, EmptyCell);

        ++cleared;
        ++row; // re-check this row index because we just pulled everything down
    }

    return cleared;
}

} // namespace termtris::core
