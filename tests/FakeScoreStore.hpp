#pragma once

#include "termtris/persistence/IScoreStore.hpp"

class FakeScoreStore : public termtris::persistence::IScoreStore {
public:
    using HighScoreTable = termtris::core::HighScoreTable;

    HighScoreTable load() override {
        ++loadCount;
        return stored;
    }

    bool save(const HighScoreTable& table) override {
        ++saveCount;
        if (failSaves) {
            return false;
        }
        stored = table;
        return true;
    }

    HighScoreTable stored;
    bool failSaves{false};
    int loadCount{0};
    int saveCount{0};
};
