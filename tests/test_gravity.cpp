#include <catch2/catch.hpp>

#include <chrono>
#include <string>

#include "FakeClock.hpp"
#include "core/Game.hpp"
#include "engine/Gravity.hpp"
#include "engine/Presets.hpp"

using namespace std::chrono_literals;
using namespace modtris::core;
using modtris::engine::InfinityGravity;
using modtris::engine::dropDelay;
namespace presets = modtris::engine::presets;

namespace {

GameOptions fakeTimed(const std::shared_ptr<FakeClock>& clock, std::vector<PieceType> queue = {}) {
    GameOptions options;
    options.clock = clock;
    options.seed = std::string{"gravity"};
    options.queue = std::move(queue);
    return options;
}

const InfinityGravity& infinity(const Game& game) {
    return dynamic_cast<const InfinityGravity&>(game.gravity());
}

} // namespace

TEST_CASE("Drop delay follows the guideline curve", "[gravity]") {
    CHECK(dropDelay(1) == 1s);
    CHECK(dropDelay(0) == 1s);
    CHECK(dropDelay(-3) == 1s);

    const auto level2 = std::chrono::duration_cast<std::chrono::microseconds>(dropDelay(2));
    CHECK(level2 == 793000us);

    for (int level = 1; level < 40; ++level) {
        CHECK(dropDelay(level + 1) <= dropDelay(level));
        CHECK(dropDelay(level) >= 1ms);
    }
    CHECK(dropDelay(500) == 1ms);
}

TEST_CASE("Infinity gravity drops by elapsed time on tick", "[gravity][infinity]") {
    auto clock = FakeClock::make();
    Game game(presets::modern(), fakeTimed(clock));
    const int spawnRow = game.piece().x;

    game.tick();
    CHECK(game.piece().x == spawnRow);

    clock->advance(1s);
    game.tick();
    CHECK(game.piece().x == spawnRow + 1);
    REQUIRE(game.delta().has_value());
    CHECK(game.delta()->automatic);
    CHECK(game.delta()->kind == MoveKind::SoftDrop);

    clock->advance(3500ms);
    game.tick();
    CHECK(game.piece().x == spawnRow + 4);

    // Automatic drops earn nothing
    CHECK(game.score() == 0);
}

TEST_CASE("Infinity gravity locks a grounded piece after the lock delay", "[gravity][infinity]") {
    auto clock = FakeClock::make();
    Game game(presets::modern(), fakeTimed(clock, {PieceType::O, PieceType::I}));

    game.softDrop(40);
    REQUIRE(game.piece().x == 38);
    CHECK(infinity(game).lockTimerRunning());

    clock->advance(499ms);
    game.tick();
    CHECK(game.board().isRowEmpty(39));
    CHECK(game.piece().type == PieceType::O);

    clock->advance(1ms);
    game.tick();
    CHECK_FALSE(game.board().isRowEmpty(39));
    CHECK(game.board().cell(39, 4) == minoCode(PieceType::O));
    CHECK(game.piece().type == PieceType::I);
    CHECK_FALSE(infinity(game).lockTimerRunning());
    REQUIRE(game.delta().has_value());
    CHECK(game.delta()->kind == MoveKind::HardDrop);
    CHECK(game.delta()->automatic);
}

TEST_CASE("Infinity gravity caps lock delay resets", "[gravity][infinity]") {
    auto clock = FakeClock::make();
    Game game(presets::modern(), fakeTimed(clock, {PieceType::O, PieceType::I}));

    game.softDrop(40);
    REQUIRE(infinity(game).lockTimerRunning());

    for (int i = 0; i < 14; ++i) {
        if (i % 2 == 0) {
            game.left();
        } else {
            game.right();
        }
    }
    CHECK(infinity(game).lockResets() == 14);
    CHECK(game.board().isRowEmpty(39));

    game.left();
    CHECK_FALSE(game.board().isRowEmpty(39));
    CHECK(game.piece().type == PieceType::I);
    CHECK(infinity(game).lockResets() == 0);
}

TEST_CASE("A refused hard drop keeps the lock timer and its resets", "[gravity][infinity][ruleset]") {
    auto clock = FakeClock::make();
    GameOptions options = fakeTimed(clock, {PieceType::O, PieceType::I});
    options.ruleOverrides = {{"can_hard_drop", false}};
    Game game(presets::modern(), options);

    game.softDrop(40);
    game.left();
    game.right();
    REQUIRE(infinity(game).lockResets() == 2);

    clock->advance(300ms);
    game.hardDrop();
    CHECK_FALSE(game.delta()->locked);
    CHECK(infinity(game).lockTimerRunning());
    CHECK(infinity(game).lockResets() == 2);
    CHECK(game.piece().type == PieceType::O);

    // The timer still counts from the last real reset
    clock->advance(200ms);
    game.tick();
    CHECK(game.piece().type == PieceType::I);
    CHECK(game.delta()->locked);
    CHECK(game.delta()->automatic);
}

TEST_CASE("Infinity lock timer stops when the piece leaves the ground", "[gravity][infinity]") {
    auto clock = FakeClock::make();
    Board board(40, 10);
    board.setCell(20, 4, minoCode(MinoType::Garbage)); // ledge under the spawned O

    GameOptions options = fakeTimed(clock, {PieceType::O});
    options.board = board;
    Game game(presets::modern(), options);

    game.tick();
    REQUIRE(infinity(game).lockTimerRunning());

    game.right(2);
    CHECK_FALSE(infinity(game).lockTimerRunning());
    CHECK(infinity(game).lockResets() == 1);

    // Waiting longer than the lock delay does not lock a falling piece
    clock->advance(600ms);
    game.tick();
    CHECK(game.piece().type == PieceType::O);
}

TEST_CASE("Lock delay is configurable through the gravity rules", "[gravity][infinity][ruleset]") {
    auto clock = FakeClock::make();
    GameOptions options = fakeTimed(clock, {PieceType::O, PieceType::I});
    options.ruleOverrides = {{"gravity_lock_delay", 100}, {"gravity_lock_resets", 3}};
    Game game(presets::modern(), options);

    CHECK(game.rules().get<int>("gravity_lock_delay") == 100);

    game.softDrop(40);
    clock->advance(100ms);
    game.tick();
    CHECK(game.piece().type == PieceType::I);
}

TEST_CASE("Gravity moves are dropped while paused", "[gravity]") {
    auto clock = FakeClock::make();
    Game game(presets::modern(), fakeTimed(clock));
    const int spawnRow = game.piece().x;

    game.pause();
    REQUIRE(game.paused());

    clock->advance(2s);
    game.tick();
    CHECK(game.piece().x == spawnRow);

    game.pause();
    REQUIRE(game.playing());
    clock->advance(1s);
    game.tick();
    CHECK(game.piece().x == spawnRow + 1);
}

TEST_CASE("Marathon gravity locks on a drop step when grounded", "[gravity][marathon]") {
    auto clock = FakeClock::make();
    Game game(presets::classic(), fakeTimed(clock, {PieceType::O, PieceType::I}));
    REQUIRE(game.level() == 0);

    clock->advance(1s);
    game.tick();
    CHECK(game.piece().x == 19);

    game.softDrop(40);
    REQUIRE(game.piece().x == 38);

    clock->advance(999ms);
    game.tick();
    CHECK(game.piece().type == PieceType::O);

    clock->advance(1ms);
    game.tick();
    CHECK(game.piece().type == PieceType::I);
    CHECK(game.board().cell(39, 5) == minoCode(PieceType::O));
}

TEST_CASE("Marathon gravity forces a lock after the force lock time", "[gravity][marathon]") {
    auto clock = FakeClock::make();
    Game game(presets::classic(), fakeTimed(clock, {PieceType::O, PieceType::I}));

    CHECK(game.rules().get<int>("gravity_force_lock") == 30000);

    clock->advance(30s);
    game.tick();

    CHECK(game.piece().type == PieceType::I);
    CHECK_FALSE(game.board().isRowEmpty(39));
    REQUIRE(game.delta().has_value());
    CHECK(game.delta()->kind == MoveKind::HardDrop);
}
