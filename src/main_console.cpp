#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "termtris/core/GameConfig.hpp"
#include "termtris/core/GameState.hpp"
#include "termtris/controller/GameController.hpp"
#include "termtris/console/ConsoleRenderer.hpp"
#include "termtris/console/Terminal.hpp"
#include "termtris/persistence/FileScoreStore.hpp"
#include "termtris/persistence/HighScoreService.hpp"

using namespace termtris::core;
using namespace std::chrono_literals;

namespace {

struct Options {
    GameConfig config;
    std::optional<std::uint32_t> seed;
    std::optional<std::string> playerName;
};

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options]\n"
              << "  --scores <file>  high-score file (default termtris_scores.txt)\n"
              << "  --seed <n>       fixed piece sequence\n"
              << "  --rows <n>       grid rows (default 20)\n"
              << "  --cols <n>       grid columns (default 10)\n"
              << "  --name <player>  name recorded on game over\n"
              << "  --help           show this text\n";
}

// Returns std::nullopt on bad arguments (usage already printed)
std::optional<Options> parseArgs(int argc, char* argv[], bool& helpOnly) {
    Options opts;
    helpOnly = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            helpOnly = true;
            return opts;
        }

        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            printUsage(argv[0]);
            return std::nullopt;
        }
        const std::string value = argv[++i];

        try {
            if (arg == "--scores") {
                opts.config.scoreFile = value;
            } else if (arg == "--seed") {
                opts.seed = static_cast<std::uint32_t>(std::stoul(value));
            } else if (arg == "--rows") {
                opts.config.rows = std::stoi(value);
            } else if (arg == "--cols") {
                opts.config.cols = std::stoi(value);
            } else if (arg == "--name") {
                opts.playerName = value;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return std::nullopt;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Invalid value for " << arg << ": " << value << "\n";
            return std::nullopt;
        }
    }

    if (opts.config.rows < 4 || opts.config.cols < 4) {
        std::cerr << "Grid must be at least 4x4\n";
        return std::nullopt;
    }
    return opts;
}

void printHelpLine() {
    std::cout << "a/d or arrows = move, s = soft drop, w = rotate CW, z = rotate CCW\n"
              << "space = hard drop, p = pause/resume, q = quit\n";
}

void recordScore(const Options& opts, const GameState& game, termtris::console::Terminal& term) {
    term.restore();

    std::string name;
    if (opts.playerName) {
        name = *opts.playerName;
    } else {
        std::cout << "GAME OVER. Score " << game.score() << ". Your name: " << std::flush;
        std::getline(std::cin, name);
    }

    auto store = std::make_shared<termtris::persistence::FileScoreStore>(
        opts.config.scoreFile, opts.config.highScoreCapacity);
    termtris::persistence::HighScoreService scores{store};
    const auto result = scores.submit(name, game.score());

    if (!result.saved) {
        std::cout << "Could not save high scores to " << store->path() << "\n";
    }

    std::cout << termtris::console::renderHighScores(scores.table());
    if (result.rank) {
        std::cout << "You placed #" << (*result.rank + 1) << "!\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    bool helpOnly = false;
    auto opts = parseArgs(argc, argv, helpOnly);
    if (helpOnly) {
        printUsage(argv[0]);
        return 0;
    }
    if (!opts) {
        return 1;
    }

    GameState game = opts->seed ? GameState{opts->config, *opts->seed}
                                : GameState{opts->config};
    termtris::controller::GameController controller{game};

    termtris::console::Terminal term;
    game.start(); // start immediately

    using Clock = termtris::controller::GameController::Clock;
    auto last = Clock::now();
    std::string lastFrame;
    bool running = true;

    while (running) {
        const auto key = term.pollKey();
        const auto action = key ? termtris::console::mapKey(*key)
                                : termtris::controller::InputAction::None;

        const auto elapsed = termtris::controller::GameController::consumeElapsed(
            last, Clock::now());

        running = controller.step(action, elapsed);

        // Only redraw when something visible changed
        std::string frame = termtris::console::renderFrame(game);
        if (frame != lastFrame) {
            termtris::console::Terminal::clearScreen();
            std::cout << frame;
            printHelpLine();
            std::cout << std::flush;
            lastFrame = std::move(frame);
        }

        std::this_thread::sleep_for(16ms);
    }

    if (game.status() == GameStatus::GameOver) {
        recordScore(*opts, game, term);
    } else {
        term.restore();
        std::cout << "Quitting.\n";
    }

    return 0;
}
