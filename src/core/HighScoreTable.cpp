#include "termtris/core/HighScoreTable.hpp"

#include <algorithm>
#include <iterator>

namespace termtris::core {

HighScoreTable::HighScoreTable(std::size_t capacity)
    : capacity_{capacity}
{
    entries_.reserve(capacity_ + 1);
}

std::optional<std::size_t> HighScoreTable::update(std::string name, std::uint64_t score) {
    // First position whose score is strictly lower: ties stay ahead of us
    auto pos = std::upper_bound(entries_.begin(), entries_.end(), score,
        [](std::uint64_t s, const HighScoreEntry& e) { return s > e.score; });

    const auto rank = static_cast<std::size_t>(std::distance(entries_.begin(), pos));
    entries_.insert(pos, HighScoreEntry{std::move(name), score});

    if (entries_.size() > capacity_) {
        entries_.resize(capacity_);
    }

    if (rank >= capacity_) {
        return std::nullopt;
    }
    return rank;
}

bool HighScoreTable::qualifies(std::uint64_t score) const noexcept {
    if (capacity_ == 0) return false;
    if (entries_.size() < capacity_) return true;

    return score > entries_.back().score;
}

} // namespace termtris::core
