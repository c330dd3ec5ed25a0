#include "engine/Gravity.hpp"
#include "core/Game.hpp"

#include <algorithm>
#include <chrono>

namespace modtris::engine {

using core::Move;
using core::MoveKind;
using core::Rule;
using core::RuleType;

InfinityGravity::InfinityGravity(const core::Game& game, Clock::Duration lockDelay, int lockResets)
    : Gravity(game)
    , lockDelay_{lockDelay}
    , maxResets_{lockResets}
    , lastDrop_{now()}
{
}

std::optional<core::Ruleset> InfinityGravity::rules() {
    return core::Ruleset{
        {
            Rule{"lock_delay", {RuleType::Int}, 500},
            Rule{"lock_resets", {RuleType::Int}, 15},
        },
        "gravity",
    };
}

std::unique_ptr<InfinityGravity> InfinityGravity::fromGame(const core::Game& game) {
    const core::Ruleset& rules = game.rules();
    return std::make_unique<InfinityGravity>(
        game,
        std::chrono::milliseconds{rules.get<int>("gravity_lock_delay")},
        rules.get<int>("gravity_lock_resets"));
}

std::optional<Move> InfinityGravity::calculate(const core::MoveDelta* delta) {
    const Clock::TimePoint current = now();

    if (delta != nullptr) {
        if (delta->kind == MoveKind::HardDrop && delta->locked) {
            lockRunning_ = false;
            resets_ = 0;
        } else if (lockRunning_ && (delta->x != 0 || delta->y != 0 || delta->r != 0)) {
            lockStarted_ = current;
            ++resets_;
        }
    }

    // The timer only runs while the piece rests on something
    const bool onGround = grounded();
    if (!lockRunning_ && onGround) {
        lockRunning_ = true;
        lockStarted_ = current;
    } else if (lockRunning_ && !onGround) {
        lockRunning_ = false;
    }

    if ((lockRunning_ && current - lockStarted_ >= lockDelay_) || resets_ >= maxResets_) {
        lockRunning_ = false;
        resets_ = 0;
        return automatic(Move::hardDrop());
    }

    const Clock::Duration sinceDrop = current - lastDrop_;
    const Clock::Duration delay = dropDelay(game_.level());
    if (sinceDrop >= delay) {
        lastDrop_ = current;
        const auto rows = std::min<Clock::Duration::rep>(sinceDrop / delay, game_.board().rows());
        return automatic(Move::softDrop(static_cast<int>(rows)));
    }

    return std::nullopt;
}

} // namespace modtris::engine
