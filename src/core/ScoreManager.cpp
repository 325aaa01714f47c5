#include "termtris/core/ScoreManager.hpp"

namespace termtris::core {

void ScoreManager::addLinesCleared(int lines) noexcept {
    if (lines <= 0) return;

    lines_ += static_cast<std::uint64_t>(lines);
    score_ += static_cast<std::uint64_t>(lines);
}

} // namespace termtris::core
