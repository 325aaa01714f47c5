#pragma once

#include <cstdint>

#include "GameConfig.hpp"

namespace termtris::core {

// Number of thresholds crossed (score / pointsPerStep)
int levelForScore(std::uint64_t score, const GameConfig& config = GameConfig{}) noexcept;

// Gravity interval in milliseconds for a score. Monotonically
// non-increasing: starts at baseIntervalMs, drops by intervalStepMs per
// threshold and never goes below minIntervalMs.
int speedForScore(std::uint64_t score, const GameConfig& config = GameConfig{}) noexcept;

} // namespace termtris::core
