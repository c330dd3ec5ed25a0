#pragma once

#include "core/Ruleset.hpp"
#include "core/Types.hpp"
#include "engine/Clock.hpp"

#include <memory>
#include <optional>

namespace modtris::core {
class Game;
}

namespace modtris::engine {

// Time between automatic drops at a level: (0.8 - (level-1) * 0.007)^(level-1)
// seconds. Levels below 1 count as 1; never shorter than 1 ms.
Clock::Duration dropDelay(int level);

// Automatic movement. Gravity never pushes into the game itself: calculate()
// returns the move the game should apply next, if any.
class Gravity {
public:
    explicit Gravity(const core::Game& game);
    virtual ~Gravity() = default;

    static core::RuleOverrides ruleOverrides() { return {}; }
    static std::optional<core::Ruleset> rules() { return std::nullopt; }

    // delta is the last player move, or nullptr on a plain tick
    virtual std::optional<core::Move> calculate(const core::MoveDelta* delta = nullptr) = 0;

protected:
    // True if the active piece cannot move one row down
    bool grounded() const;
    Clock::TimePoint now() const;

    static core::Move automatic(core::Move move) {
        move.automatic = true;
        return move;
    }

    const core::Game& game_;
};

// Marathon drops with Infinity lock delay: every successful move while
// grounded restarts the lock timer, up to a number of resets.
class InfinityGravity : public Gravity {
public:
    InfinityGravity(const core::Game& game, Clock::Duration lockDelay, int lockResets);

    static std::unique_ptr<InfinityGravity> fromGame(const core::Game& game);
    static std::optional<core::Ruleset> rules();

    std::optional<core::Move> calculate(const core::MoveDelta* delta = nullptr) override;

    bool lockTimerRunning() const noexcept { return lockRunning_; }
    int lockResets() const noexcept { return resets_; }

private:
    Clock::Duration lockDelay_;
    int maxResets_;

    bool lockRunning_{false};
    Clock::TimePoint lockStarted_{};
    int resets_{0};
    Clock::TimePoint lastDrop_;
};

// Marathon drops without lock delay: a drop step on a grounded piece locks
// it. A piece that stays in play too long is locked regardless.
class MarathonGravity : public Gravity {
public:
    MarathonGravity(const core::Game& game, Clock::Duration forceLock);

    static std::unique_ptr<MarathonGravity> fromGame(const core::Game& game);
    static std::optional<core::Ruleset> rules();

    std::optional<core::Move> calculate(const core::MoveDelta* delta = nullptr) override;

private:
    Clock::Duration forceLock_;
    Clock::TimePoint lastDrop_;
    Clock::TimePoint lastLock_;
};

} // namespace modtris::engine
