#pragma once

namespace modtris::controller {

// Discrete player input actions.
// These are UI- and platform-agnostic: keyboard, gamepad, replay, etc.
enum class InputAction {
    MoveLeft,
    MoveRight,
    SoftDrop,
    HardDrop,
    RotateCW,
    RotateCCW,
    Rotate180,
    Hold,
    PauseResume,
    Restart
};

} // namespace modtris::controller
