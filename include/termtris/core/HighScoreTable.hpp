#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace termtris::core {

struct HighScoreEntry {
    std::string name;
    std::uint64_t score{};
};

inline bool operator==(const HighScoreEntry& a, const HighScoreEntry& b) {
    return a.name == b.name && a.score == b.score;
}

// Entries sorted by descending score, at most capacity() of them.
// Equal scores keep insertion order (the older entry ranks higher).
class HighScoreTable {
public:
    static constexpr std::size_t DefaultCapacity = 10;

    explicit HighScoreTable(std::size_t capacity = DefaultCapacity);

    // Insert an entry and re-establish the ordering. Returns the entry's
    // 0-based rank, or std::nullopt if it fell off the end of the table.
    std::optional<std::size_t> update(std::string name, std::uint64_t score);

    // Would this score make it into the table right now?
    bool qualifies(std::uint64_t score) const noexcept;

    const std::vector<HighScoreEntry>& entries() const noexcept { return entries_; }
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    std::size_t capacity() const noexcept { return capacity_; }

    void clear() noexcept { entries_.clear(); }

private:
    std::size_t capacity_;
    std::vector<HighScoreEntry> entries_;
};

} // namespace termtris::core
