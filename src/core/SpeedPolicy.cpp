#include "termtris/core/SpeedPolicy.hpp"
#include <algorithm>
#include <limits>

namespace termtris::core {

int levelForScore(std::uint64_t score, const GameConfig& config) noexcept {
    if (config.pointsPerStep == 0) return 0;

    const std::uint64_t level = score / config.pointsPerStep;
    const auto cap = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    return static_cast<int>(std::min(level, cap));
}

int speedForScore(std::uint64_t score, const GameConfig& config) noexcept {
    const int base = config.baseIntervalMs;
    const int floor = std::min(config.minIntervalMs, base);
    if (config.intervalStepMs <= 0) return base;

    // Past this many thresholds we're at the floor anyway
    const int maxSteps = (base - floor) / config.intervalStepMs + 1;
    const int steps = std::min(levelForScore(score, config), maxSteps);

    return std::max(base - steps * config.intervalStepMs, floor);
}

} // namespace termtris::core
