#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "termtris/persistence/IScoreStore.hpp"
#include "termtris/persistence/PlayerName.hpp"

namespace termtris::persistence {

/// Plain text store, one "<name> <score>" record per line. The score is the
/// last space-separated token, so names may contain spaces.
class FileScoreStore : public IScoreStore {
public:
    explicit FileScoreStore(std::string path,
                            std::size_t capacity = core::HighScoreTable::DefaultCapacity);

    core::HighScoreTable load() override;
    bool save(const core::HighScoreTable& table) override;

    const std::string& path() const noexcept { return m_path; }

private:
    std::string m_path;
    std::size_t m_capacity;
};

/// Serialize one entry into a single line (without trailing '\n').
std::string formatEntry(const core::HighScoreEntry& entry);

/// Parse one line. Returns std::nullopt on parse error.
std::optional<core::HighScoreEntry> parseEntry(const std::string& line);

} // namespace termtris::persistence
