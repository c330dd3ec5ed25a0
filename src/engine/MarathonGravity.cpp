#include "engine/Gravity.hpp"
#include "core/Game.hpp"

#include <algorithm>
#include <chrono>

namespace modtris::engine {

using core::Move;
using core::MoveKind;
using core::Rule;
using core::RuleType;

MarathonGravity::MarathonGravity(const core::Game& game, Clock::Duration forceLock)
    : Gravity(game)
    , forceLock_{forceLock}
    , lastDrop_{now()}
    , lastLock_{lastDrop_}
{
}

std::optional<core::Ruleset> MarathonGravity::rules() {
    return core::Ruleset{
        {
            Rule{"force_lock", {RuleType::Int}, 30000},
        },
        "gravity",
    };
}

std::unique_ptr<MarathonGravity> MarathonGravity::fromGame(const core::Game& game) {
    return std::make_unique<MarathonGravity>(
        game, std::chrono::milliseconds{game.rules().get<int>("gravity_force_lock")});
}

std::optional<Move> MarathonGravity::calculate(const core::MoveDelta* delta) {
    const Clock::TimePoint current = now();

    if (delta != nullptr && delta->kind == MoveKind::HardDrop && delta->locked) {
        lastLock_ = current;
    }

    if (current - lastLock_ >= forceLock_) {
        lastLock_ = current;
        lastDrop_ = current;
        return automatic(Move::hardDrop());
    }

    const Clock::Duration sinceDrop = current - lastDrop_;
    const Clock::Duration delay = dropDelay(game_.level());
    if (sinceDrop < delay) {
        return std::nullopt;
    }

    lastDrop_ = current;
    if (grounded()) {
        lastLock_ = current;
        return automatic(Move::hardDrop());
    }

    const auto rows = std::min<Clock::Duration::rep>(sinceDrop / delay, game_.board().rows());
    return automatic(Move::softDrop(static_cast<int>(rows)));
}

} // namespace modtris::engine
