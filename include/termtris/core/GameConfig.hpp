#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace termtris::core {

struct GameConfig {
    int rows{20};
    int cols{10};

    // Gravity curve, see SpeedPolicy.hpp
    int baseIntervalMs{800};         // speed at score 0
    int intervalStepMs{70};          // faster by this much per threshold
    int minIntervalMs{50};           // never faster than this
    std::uint64_t pointsPerStep{10}; // one threshold every N points

    std::size_t highScoreCapacity{10};
    std::string scoreFile{"termtris_scores.txt"};
};

} // namespace termtris::core
