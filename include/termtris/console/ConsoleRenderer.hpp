#pragma once

#include <string>

#include "termtris/core/GameState.hpp"
#include "termtris/core/HighScoreTable.hpp"

namespace termtris::console {

// Helper: render the current board + active tetromino as ASCII.
// Locked cells are '#', the falling piece 'X', empty cells '.'.
std::string renderFrame(const termtris::core::GameState& game);

// Numbered high-score listing, best first
std::string renderHighScores(const termtris::core::HighScoreTable& table);

const char* statusName(termtris::core::GameStatus status) noexcept;

} // namespace termtris::console
