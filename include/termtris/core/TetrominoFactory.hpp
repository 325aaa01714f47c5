#pragma once

#include "Types.hpp"
#include "Tetromino.hpp"
#include <cstdint>
#include <random>

namespace termtris::core {

class TetrominoFactory {
public:
    TetrominoFactory();

    // Deterministic sequence, used by tests and --seed
    explicit TetrominoFactory(std::uint32_t seed);

    // Next random piece out of the seven standard shapes
    Tetromino createRandom();

private:
    std::mt19937 rng_;
};

} // namespace termtris::core
