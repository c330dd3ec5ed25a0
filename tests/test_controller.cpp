// tests/test_controller.cpp

#include <catch2/catch.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "FakeClock.hpp"
#include "controller/GameController.hpp"
#include "controller/InputAction.hpp"
#include "core/Game.hpp"
#include "engine/Presets.hpp"

using modtris::controller::GameController;
using modtris::controller::InputAction;
using modtris::core::Board;
using modtris::core::Game;
using modtris::core::GameOptions;
using modtris::core::PieceType;
using modtris::core::PlayingStatus;

namespace {

GameOptions controlled(const std::shared_ptr<FakeClock>& clock)
{
    GameOptions options;
    options.clock = clock;
    options.seed = std::string{"controller"};
    options.queue = {PieceType::T, PieceType::O, PieceType::I};
    return options;
}

} // namespace

TEST_CASE("GameController maps lateral input actions to game moves", "[controller]")
{
    Game game(modtris::engine::presets::modern(), controlled(FakeClock::make()));
    GameController controller{game};

    const auto before = game.piece();

    controller.handleAction(InputAction::MoveLeft);
    REQUIRE(game.piece().x == before.x);
    REQUIRE(game.piece().y == before.y - 1);

    controller.handleAction(InputAction::MoveRight);
    REQUIRE(game.piece().x == before.x);
    REQUIRE(game.piece().y == before.y);
}

TEST_CASE("GameController rotates in both directions and by half turns", "[controller]")
{
    Game game(modtris::engine::presets::modern(), controlled(FakeClock::make()));
    GameController controller{game};

    controller.handleAction(InputAction::RotateCW);
    REQUIRE(game.piece().r == 1);

    controller.handleAction(InputAction::RotateCCW);
    REQUIRE(game.piece().r == 0);

    controller.handleAction(InputAction::RotateCCW);
    REQUIRE(game.piece().r == 3);

    controller.handleAction(InputAction::Rotate180);
    REQUIRE(game.piece().r == 1);
}

TEST_CASE("GameController drops, holds and locks", "[controller]")
{
    Game game(modtris::engine::presets::modern(), controlled(FakeClock::make()));
    GameController controller{game};

    const int spawnRow = game.piece().x;
    controller.handleAction(InputAction::SoftDrop);
    REQUIRE(game.piece().x == spawnRow + 1);
    REQUIRE(game.score() == 1);

    controller.handleAction(InputAction::Hold);
    REQUIRE(game.piece().type == PieceType::O);
    REQUIRE(game.hold() == PieceType::T);

    controller.handleAction(InputAction::HardDrop);
    REQUIRE(game.piece().type == PieceType::I);
    REQUIRE_FALSE(game.board().isRowEmpty(39));
}

TEST_CASE("GameController toggles pause/resume", "[controller]")
{
    Game game(modtris::engine::presets::modern(), controlled(FakeClock::make()));
    GameController controller{game};

    controller.handleAction(InputAction::PauseResume);
    REQUIRE(game.status() == PlayingStatus::Idle);

    controller.handleAction(InputAction::MoveLeft);
    REQUIRE(game.piece().y == 3);

    controller.handleAction(InputAction::PauseResume);
    REQUIRE(game.status() == PlayingStatus::Playing);
}

TEST_CASE("GameController update lets gravity act on the game clock", "[controller]")
{
    auto clock = FakeClock::make();
    Game game(modtris::engine::presets::modern(), controlled(clock));
    GameController controller{game};

    const int spawnRow = game.piece().x;

    controller.update();
    REQUIRE(game.piece().x == spawnRow);

    clock->advance(std::chrono::seconds{1});
    controller.update();
    REQUIRE(game.piece().x == spawnRow + 1);
}

TEST_CASE("GameController only restarts a lost game", "[controller]")
{
    Board board(40, 10);
    board.setCell(18, 5, 9); // blocks the O spawn

    auto clock = FakeClock::make();
    GameOptions options = controlled(clock);
    options.queue = {PieceType::I, PieceType::O};
    options.board = board;
    Game game(modtris::engine::presets::modern(), options);
    GameController controller{game};

    controller.handleAction(InputAction::HardDrop);
    REQUIRE(game.lost());

    controller.handleAction(InputAction::PauseResume);
    controller.handleAction(InputAction::MoveLeft);
    REQUIRE(game.status() == PlayingStatus::Stopped);

    controller.handleAction(InputAction::Restart);
    REQUIRE(game.status() == PlayingStatus::Playing);
    REQUIRE(game.score() == 0);
    REQUIRE(game.board().isRowEmpty(39));
}
