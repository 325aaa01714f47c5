#pragma once

#include "termtris/core/GameState.hpp"
#include "termtris/controller/InputAction.hpp"
#include <chrono>

namespace termtris::controller {

class GameController {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::milliseconds;

    /// Controller does not own the GameState; caller keeps it alive.
    explicit GameController(termtris::core::GameState& game);

    /// Handle a single discrete player action (e.g. key press).
    void handleAction(InputAction action);

    // Called periodically with elapsed time since last call.
    // It accumulates time and performs one gravity tick once the
    // accumulated time reaches the current gravity interval.
    void update(Duration elapsed);

    /// One driver tick: at most one command, then gravity.
    /// Returns false once the driver should stop (Quit or game over).
    bool step(InputAction action, Duration elapsed);

    // Reset timing accumulator (e.g. when game is reset)
    void resetTiming();

    // Whole milliseconds between last and now. last is advanced by exactly
    // that much so sub-millisecond remainders carry into the next frame.
    static Duration consumeElapsed(Clock::time_point& last, Clock::time_point now);

private:
    termtris::core::GameState& game_;
    Duration accumulated_{0};
};

} // namespace termtris::controller
