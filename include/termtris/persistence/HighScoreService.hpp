#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "termtris/core/HighScoreTable.hpp"
#include "termtris/persistence/IScoreStore.hpp"

namespace termtris::persistence {

// Offers finished-game scores to the high-score table and writes the table
// back through a store. The in-memory table stays valid when saving fails.
class HighScoreService {
public:
    struct SubmitResult {
        std::optional<std::size_t> rank; // 0-based, empty if it didn't make the table
        bool saved{false};
    };

    /// Loads the current table from the store.
    explicit HighScoreService(IScoreStorePtr store);

    const core::HighScoreTable& table() const noexcept { return m_table; }

    /// Re-read the table from the store, dropping unsaved entries.
    void reload();

    SubmitResult submit(const std::string& name, std::uint64_t score);

private:
    IScoreStorePtr m_store;
    core::HighScoreTable m_table;
};

} // namespace termtris::persistence
