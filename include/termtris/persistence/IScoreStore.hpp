#pragma once

#include <memory>

#include "termtris/core/HighScoreTable.hpp"

namespace termtris::persistence {

// Where the high-score table lives between sessions.
class IScoreStore {
public:
    virtual ~IScoreStore() = default;

    // Previously saved table; an empty one if nothing was saved yet.
    // Never throws.
    virtual core::HighScoreTable load() = 0;

    // Returns false if the table could not be written. The caller's table
    // is untouched either way.
    virtual bool save(const core::HighScoreTable& table) = 0;
};

using IScoreStorePtr = std::shared_ptr<IScoreStore>;

} // namespace termtris::persistence
