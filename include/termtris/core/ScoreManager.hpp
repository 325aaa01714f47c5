#pragma once

#include <cstdint>

namespace termtris::core {

// One point per cleared line, no multi-line bonus.
class ScoreManager {
public:
    void addLinesCleared(int lines) noexcept;

    std::uint64_t score() const noexcept { return score_; }
    std::uint64_t linesCleared() const noexcept { return lines_; }

    void reset() noexcept { score_ = 0; lines_ = 0; }

private:
    std::uint64_t score_{0};
    std::uint64_t lines_{0};
};

} // namespace termtris::core
