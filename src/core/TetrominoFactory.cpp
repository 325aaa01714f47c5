#include "termtris/core/TetrominoFactory.hpp"
#include <random>

namespace termtris::core {

TetrominoFactory::TetrominoFactory()
    : rng_{std::random_device{}()}
{
}

TetrominoFactory::TetrominoFactory(std::uint32_t seed)
    : rng_{seed}
{
}

Tetromino TetrominoFactory::createRandom() {
    std::uniform_int_distribution<int> dist(0, TetrominoTypeCount - 1);
    TetrominoType type = static_cast<TetrominoType>(dist(rng_));
    return Tetromino{type};
}

} // namespace termtris::core
