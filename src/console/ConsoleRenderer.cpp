#include "termtris/console/ConsoleRenderer.hpp"

#include <sstream>
#include <vector>

using namespace termtris::core;

namespace termtris::console {

const char* statusName(GameStatus status) noexcept {
    switch (status) {
    case GameStatus::NotStarted: return "NotStarted";
    case GameStatus::Running:    return "Running";
    case GameStatus::Paused:     return "Paused";
    case GameStatus::GameOver:   return "GameOver";
    }
    return "Unknown";
}

std::string renderFrame(const GameState& game) {
    const Board& board = game.board();
    const int rows = board.rows();
    const int cols = board.cols();

    // Start with base board
    std::vector<std::string> lines(rows, std::string(cols, '.'));

    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (board.isFilled(r, c)) {
                lines[r][c] = '#'; // locked blocks
            }
        }
    }

    // Overlay active tetromino as 'X'
    if (game.activeTetromino()) {
        for (const auto& b : game.activeTetromino()->blocks(game.position())) {
            if (b.row >= 0 && b.row < rows && b.col >= 0 && b.col < cols) {
                lines[b.row][b.col] = 'X';
            }
        }
    }

    std::ostringstream os;
    os << "==== TERMTRIS ====\n";
    os << "Score: " << game.score()
       << " | Level: " << game.level()
       << " | Speed: " << game.speed() << "ms"
       << " | Status: " << statusName(game.status()) << '\n';

    // Print board with borders
    os << '+' << std::string(cols, '-') << "+\n";
    for (const auto& line : lines) {
        os << '|' << line << "|\n";
    }
    os << '+' << std::string(cols, '-') << "+\n";

    if (game.nextTetromino()) {
        const auto& next = *game.nextTetromino();
        os << "Next:\n";
        for (int r = 0; r < next.height(); ++r) {
            os << "  ";
            for (int c = 0; c < next.width(); ++c) {
                os << (next.occupied(r, c) ? 'X' : ' ');
            }
            os << '\n';
        }
    }

    return os.str();
}

std::string renderHighScores(const HighScoreTable& table) {
    std::ostringstream os;
    os << "==== HIGH SCORES ====\n";
    if (table.empty()) {
        os << "  (none yet)\n";
        return os.str();
    }

    std::size_t rank = 1;
    for (const auto& entry : table.entries()) {
        os << "  " << rank++ << ". " << entry.name << "  " << entry.score << '\n';
    }
    return os.str();
}

} // namespace termtris::console
