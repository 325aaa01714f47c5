#pragma once // Include guard

#include <cstdint> // For fixed-width integer types

// Namespace for termtris core types
namespace termtris::core {

// Value stored in a grid cell: 0 is empty, anything else is a fill id
using CellValue = std::uint8_t;

inline constexpr CellValue EmptyCell = 0;

// Top-left anchor of a piece inside the grid (column first, then row).
// Rows above the grid (row < 0) are allowed while a piece enters.
struct Position {
    int col{};
    int row{};
};

inline bool operator==(Position a, Position b) noexcept {
    return a.col == b.col && a.row == b.row;
}

inline bool operator!=(Position a, Position b) noexcept {
    return !(a == b);
}

// Tetromino types
enum class TetrominoType : std::uint8_t {
    I, O, T, S, Z, J, L
};

inline constexpr int TetrominoTypeCount = 7;

// Fill id written into the grid when a piece of this type locks (1..7)
inline constexpr CellValue fillValueFor(TetrominoType type) noexcept {
    return static_cast<CellValue>(static_cast<std::uint8_t>(type) + 1U);
}

} // namespace termtris::core
