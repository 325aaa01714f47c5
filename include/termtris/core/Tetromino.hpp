#pragma once // Include guard

#include "Types.hpp" // For Position, CellValue, TetrominoType
#include <optional>
#include <vector>

// Namespace for termtris core types
namespace termtris::core {

// A falling piece: a small 0/1 matrix inside its bounding box plus the
// value written into the grid when it locks.
class Tetromino {
public:
    using Row = std::vector<CellValue>;
    using Matrix = std::vector<Row>;

    // One of the seven standard shapes, unrotated
    explicit Tetromino(TetrominoType type);

    // Arbitrary shape (puzzles, tests). Nonzero entries are occupied.
    // Throws std::invalid_argument on an empty or ragged matrix, or fill == 0.
    explicit Tetromino(Matrix shape, CellValue fill = 1);

    std::optional<TetrominoType> type() const noexcept { return type_; }
    CellValue fillValue() const noexcept { return fill_; }

    const Matrix& shape() const noexcept { return shape_; }
    int height() const noexcept { return static_cast<int>(shape_.size()); }
    int width() const noexcept { return static_cast<int>(shape_.front().size()); }

    bool occupied(int row, int col) const noexcept {
        return shape_[row][col] != EmptyCell;
    }

    // Rotations are transpose + reverse: clockwise reverses each row,
    // counter-clockwise reverses the row order.
    void rotateClockwise();
    void rotateCounterClockwise();

    // Grid coordinates of every occupied cell when anchored at origin
    std::vector<Position> blocks(Position origin) const;

    // Canonical matrix for a standard type
    static const Matrix& shapeFor(TetrominoType type) noexcept;

private:
    std::optional<TetrominoType> type_;
    CellValue fill_;
    Matrix shape_;

    Matrix transposed() const;
};

} // namespace termtris::core
