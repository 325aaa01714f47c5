#include "termtris/core/Tetromino.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace termtris::core {

Tetromino::Tetromino(TetrominoType type)
    : type_{type}, fill_{fillValueFor(type)}, shape_{shapeFor(type)}
{
}

Tetromino::Tetromino(Matrix shape, CellValue fill)
    : type_{std::nullopt}, fill_{fill}, shape_{std::move(shape)}
{
    if (shape_.empty() || shape_.front().empty()) {
        throw std::invalid_argument("Tetromino shape must not be empty");
    }
    for (const auto& row : shape_) {
        if (row.size() != shape_.front().size()) {
            throw std::invalid_argument("Tetromino shape rows must have equal length");
        }
    }
    if (fill_ == EmptyCell) {
        throw std::invalid_argument("Tetromino fill value must be nonzero");
    }
}

Tetromino::Matrix Tetromino::transposed() const {
    const int h = height();
    const int w = width();
    Matrix out(w, Row(h, EmptyCell));
    for (int r = 0; r < h; ++r) {
        for (int c = 0; c < w; ++c) {
            out[c][r] = shape_[r][c];
        }
    }
    return out;
}

void Tetromino::rotateClockwise() {
    Matrix m = transposed();
    for (auto& row : m) {
        std::reverse(row.begin(), row.end());
    }
    shape_ = std::move(m);
}

void Tetromino::rotateCounterClockwise() {
    Matrix m = transposed();
    std::reverse(m.begin(), m.end());
    shape_ = std::move(m);
}

std::vector<Position> Tetromino::blocks(Position origin) const {
    std::vector<Position> out;
    out.reserve(4);
    for (int r = 0; r < height(); ++r) {
        for (int c = 0; c < width(); ++c) {
            if (occupied(r, c)) {
                out.push_back(Position{origin.col + c, origin.row + r});
            }
        }
    }
    return out;
}

const Tetromino::Matrix& Tetromino::shapeFor(TetrominoType type) noexcept {
    static const std::array<Matrix, TetrominoTypeCount> shapes{{
        // I: [ ][ ][ ][ ]
        {{1, 1, 1, 1}},
        // O: [ ][ ]
        //    [ ][ ]
        {{1, 1},
         {1, 1}},
        // T: [ ][ ][ ]
        //       [ ]
        {{1, 1, 1},
         {0, 1, 0}},
        // S:    [ ][ ]
        //    [ ][ ]
        {{0, 1, 1},
         {1, 1, 0}},
        // Z: [ ][ ]
        //       [ ][ ]
        {{1, 1, 0},
         {0, 1, 1}},
        // J: [ ]
        //    [ ][ ][ ]
        {{1, 0, 0},
         {1, 1, 1}},
        // L:       [ ]
        //    [ ][ ][ ]
        {{0, 0, 1},
         {1, 1, 1}},
    }};
    return shapes[static_cast<std::size_t>(type)];
}

} // namespace termtris::core
