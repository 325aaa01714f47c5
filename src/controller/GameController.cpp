#include "termtris/controller/GameController.hpp"

namespace termtris::controller {

GameController::GameController(termtris::core::GameState& game)
    : game_{game}
{
}

void GameController::handleAction(InputAction action) {
    using core::GameStatus;

    // Once the game is over only an external reset() + start() revives it
    if (game_.status() == GameStatus::GameOver) {
        return;
    }

    switch (action) {
    case InputAction::None:
    case InputAction::Quit:
        // Quit is observed by the driver loop, not the game
        break;
    case InputAction::MoveLeft:
        game_.moveLeft();
        break;
    case InputAction::MoveRight:
        game_.moveRight();
        break;
    case InputAction::SoftDrop:
        game_.softDrop();
        break;
    case InputAction::HardDrop:
        game_.hardDrop();
        // So the next piece won't instantly tick
        accumulated_ = Duration{0};
        break;
    case InputAction::RotateCW:
        game_.rotateClockwise();
        break;
    case InputAction::RotateCCW:
        game_.rotateCounterClockwise();
        break;
    case InputAction::PauseResume:
        if (game_.status() == GameStatus::Running) {
            game_.pause();
        } else if (game_.status() == GameStatus::Paused) {
            game_.resume();
        }
        break;
    }
}

void GameController::update(Duration elapsed) {
    using core::GameStatus;

    if (game_.status() != GameStatus::Running) {
        return;
    }

    accumulated_ += elapsed;

    // At most one gravity step per call; a stall is not replayed later
    const Duration interval{game_.speed()};
    if (interval <= Duration{0} || accumulated_ < interval) {
        return;
    }
    game_.tick();
    accumulated_ -= interval;
    if (accumulated_ >= interval) {
        accumulated_ = Duration{0};
    }
}

GameController::Duration GameController::consumeElapsed(Clock::time_point& last,
                                                        Clock::time_point now) {
    const auto elapsed = std::chrono::duration_cast<Duration>(now - last);
    // Only whole milliseconds are consumed; the remainder stays on the clock
    last += elapsed;
    return elapsed;
}

bool GameController::step(InputAction action, Duration elapsed) {
    if (action == InputAction::Quit) {
        return false;
    }

    handleAction(action);
    update(elapsed);

    return game_.status() != core::GameStatus::GameOver;
}

void GameController::resetTiming() {
    accumulated_ = Duration{0};
}

} // namespace termtris::controller
