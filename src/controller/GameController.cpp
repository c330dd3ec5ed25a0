#include "controller/GameController.hpp"

namespace modtris::controller {

GameController::GameController(modtris::core::Game& game)
    : game_{game}
{
}

void GameController::handleAction(InputAction action) {
    // Once the game is lost the only way on is a restart
    if (game_.lost() && action != InputAction::Restart) {
        return;
    }

    switch (action) {
    case InputAction::MoveLeft:
        game_.left();
        break;
    case InputAction::MoveRight:
        game_.right();
        break;
    case InputAction::SoftDrop:
        game_.softDrop();
        break;
    case InputAction::HardDrop:
        game_.hardDrop();
        break;
    case InputAction::RotateCW:
        game_.rotate(1);
        break;
    case InputAction::RotateCCW:
        game_.rotate(-1);
        break;
    case InputAction::Rotate180:
        game_.rotate(2);
        break;
    case InputAction::Hold:
        game_.swap();
        break;
    case InputAction::PauseResume:
        game_.pause();
        break;
    case InputAction::Restart:
        game_.reset();
        break;
    }
}

void GameController::update() {
    game_.tick();
}

} // namespace modtris::controller
