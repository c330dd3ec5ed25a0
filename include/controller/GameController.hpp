#pragma once

#include "core/Game.hpp"
#include "controller/InputAction.hpp"

namespace modtris::controller {

class GameController {
public:
    /// Controller does not own the Game; caller keeps it alive.
    explicit GameController(modtris::core::Game& game);

    /// Handle a single discrete player action (e.g. key press).
    void handleAction(InputAction action);

    // Called by the main loop at its own cadence. Gravity reads its own
    // clock, so no elapsed time is passed in.
    void update();

private:
    modtris::core::Game& game_;
};

} // namespace modtris::controller
