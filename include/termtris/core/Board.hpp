#pragma once

#include "Types.hpp"
#include "Tetromino.hpp"
#include <vector>

namespace termtris::core {

// The playing field. Every cell starts at EmptyCell and the dimensions are
// fixed for the lifetime of the board.
class Board {
public:
    Board(int rows, int cols);

    int rows() const noexcept { return rows_; }
    int cols() const noexcept { return cols_; }

    CellValue cell(int row, int col) const;
    void setCell(int row, int col, CellValue value);

    bool isFilled(int row, int col) const { return cell(row, col) != EmptyCell; }
    bool isRowFull(int row) const;
    bool isEmpty() const noexcept;

    // True if any occupied cell of the piece anchored at origin lies left,
    // right or below the grid, or on a filled cell. Cells above the top
    // edge (row < 0) do not collide.
    bool collides(const Tetromino& piece, Position origin) const noexcept;

    // Write the piece's occupied cells into the grid using its fill value.
    // Cells above the top edge are dropped.
    void lockTetromino(const Tetromino& piece, Position origin);

    // Remove full rows, pull the rest down and return how many were removed
    int clearFullLines();

private:
    int rows_;
    int cols_;
    std::vector<CellValue> grid_; // rows_ * cols_

    int index(int row, int col) const noexcept {
        return row * cols_ + col;
    }

    bool isInside(int row, int col) const noexcept {
        return row >= 0 && row < rows_ && col >= 0 && col < cols_;
    }
};

} // namespace termtris::core
