#pragma once

namespace termtris::controller {

// Discrete player input actions, one per driver tick at most.
// These are UI- and platform-agnostic: terminal keys, SDL keys, scripted tests.
enum class InputAction {
    None,
    MoveLeft,
    MoveRight,
    SoftDrop,
    HardDrop,
    RotateCW,
    RotateCCW,
    PauseResume,
    Quit
};

} // namespace termtris::controller
