#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include "termtris/core/GameState.hpp"
#include "termtris/core/Board.hpp"
#include "termtris/core/Tetromino.hpp"
#include "termtris/controller/GameController.hpp"
#include "termtris/controller/InputAction.hpp"

using termtris::core::Board;
using termtris::core::GameConfig;
using termtris::core::GameState;
using termtris::core::GameStatus;
using termtris::core::Position;
using termtris::core::Tetromino;
using termtris::core::TetrominoType;
using termtris::controller::GameController;
using termtris::controller::InputAction;

using Ms = GameController::Duration;

namespace {

// Running game with an O piece parked at a known spot
void startWithSquareAt(GameState& game, Position origin) {
    game.start();
    REQUIRE(game.placeActive(Tetromino{TetrominoType::O}, origin));
}

} // namespace

TEST_CASE("GameController maps lateral input actions to GameState movement", "[controller]")
{
    GameState game{GameConfig{}, 1u};
    GameController controller{game};
    startWithSquareAt(game, Position{4, 5});

    controller.handleAction(InputAction::MoveLeft);
    REQUIRE(game.position() == Position{3, 5});

    controller.handleAction(InputAction::MoveRight);
    REQUIRE(game.position() == Position{4, 5});

    controller.handleAction(InputAction::SoftDrop);
    REQUIRE(game.position() == Position{4, 6});
}

TEST_CASE("GameController toggles pause/resume", "[controller]")
{
    GameState game{GameConfig{}, 1u};
    GameController controller{game};

    game.start();
    REQUIRE(game.status() == GameStatus::Running);

    controller.handleAction(InputAction::PauseResume);
    REQUIRE(game.status() == GameStatus::Paused);

    controller.handleAction(InputAction::PauseResume);
    REQUIRE(game.status() == GameStatus::Running);
}

TEST_CASE("GameController update applies gravity at the game's speed", "[controller]")
{
    GameState game{GameConfig{}, 1u};
    GameController controller{game};
    startWithSquareAt(game, Position{4, 5});

    const int interval = game.speed();
    REQUIRE(interval == 800);

    controller.update(Ms{interval - 1});
    REQUIRE(game.position() == Position{4, 5});

    controller.update(Ms{1});
    REQUIRE(game.position() == Position{4, 6});

    controller.update(Ms{interval});
    REQUIRE(game.position() == Position{4, 7});
}

TEST_CASE("A long stall still gives a single gravity step", "[controller][step]")
{
    GameState game{GameConfig{}, 1u};
    GameController controller{game};
    startWithSquareAt(game, Position{4, 0});

    REQUIRE(controller.step(InputAction::None, Ms{5 * game.speed()}));
    REQUIRE(game.position() == Position{4, 1});

    // The backlog is dropped, not replayed on the following steps
    REQUIRE(controller.step(InputAction::None, Ms{0}));
    REQUIRE(game.position() == Position{4, 1});

    REQUIRE(controller.step(InputAction::None, Ms{game.speed() - 1}));
    REQUIRE(game.position() == Position{4, 1});

    REQUIRE(controller.step(InputAction::None, Ms{1}));
    REQUIRE(game.position() == Position{4, 2});
}

TEST_CASE("consumeElapsed carries sub-millisecond remainders", "[controller][clock]")
{
    using Clock = GameController::Clock;
    using std::chrono::microseconds;

    const Clock::time_point start{};
    Clock::time_point last = start;

    // Three 1.5 ms frames add up to 4 whole ms, not 3
    Ms total{0};
    for (int frame = 1; frame <= 3; ++frame) {
        total += GameController::consumeElapsed(last, start + microseconds{1500 * frame});
    }

    REQUIRE(total == Ms{4});
    REQUIRE(last == start + Ms{4});
}

TEST_CASE("Gravity does nothing while paused", "[controller]")
{
    GameState game{GameConfig{}, 1u};
    GameController controller{game};
    startWithSquareAt(game, Position{4, 5});

    controller.handleAction(InputAction::PauseResume);
    controller.update(Ms{10 * game.speed()});
    REQUIRE(game.position() == Position{4, 5});

    // Paused time is not banked either
    controller.handleAction(InputAction::PauseResume);
    controller.update(Ms{game.speed() - 1});
    REQUIRE(game.position() == Position{4, 5});
}

TEST_CASE("Hard drop restarts the gravity clock", "[controller]")
{
    GameState game{GameConfig{}, 1u};
    GameController controller{game};
    startWithSquareAt(game, Position{4, 5});

    controller.update(Ms{700});
    controller.handleAction(InputAction::HardDrop);

    REQUIRE(game.lockedPieces() == 1);
    REQUIRE(game.position().row == 0);

    controller.update(Ms{700});
    REQUIRE(game.position().row == 0);
}

TEST_CASE("step stops the driver on Quit without touching the game", "[controller][step]")
{
    GameState game{GameConfig{}, 1u};
    GameController controller{game};
    startWithSquareAt(game, Position{4, 5});

    REQUIRE_FALSE(controller.step(InputAction::Quit, Ms{5000}));
    REQUIRE(game.position() == Position{4, 5});
    REQUIRE(game.status() == GameStatus::Running);
}

TEST_CASE("step with no input only advances time", "[controller][step]")
{
    GameState game{GameConfig{}, 1u};
    GameController controller{game};
    startWithSquareAt(game, Position{4, 5});

    REQUIRE(controller.step(InputAction::None, Ms{0}));
    REQUIRE(game.position() == Position{4, 5});

    REQUIRE(controller.step(InputAction::None, Ms{game.speed()}));
    REQUIRE(game.position() == Position{4, 6});

    REQUIRE(controller.step(InputAction::RotateCW, Ms{0}));
    REQUIRE(game.activeTetromino()->type() == TetrominoType::O);
}

TEST_CASE("step reports game over and further input is ignored", "[controller][step]")
{
    GameState game{GameConfig{}, 1u};
    GameController controller{game};
    game.start();

    // Fill the spawn rows, leaving column 0 open so nothing clears
    Board b = game.createEmptyGrid();
    for (int c = 1; c < b.cols(); ++c) {
        b.setCell(0, c, 1);
        b.setCell(1, c, 1);
    }
    game.setBoard(b);
    REQUIRE_FALSE(game.spawnPiece());
    REQUIRE(game.status() == GameStatus::GameOver);

    REQUIRE_FALSE(controller.step(InputAction::None, Ms{0}));

    controller.handleAction(InputAction::PauseResume);
    REQUIRE(game.status() == GameStatus::GameOver);
    REQUIRE_FALSE(controller.step(InputAction::MoveLeft, Ms{5000}));
}
