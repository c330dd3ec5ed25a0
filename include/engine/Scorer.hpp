#pragma once

#include "core/Board.hpp"
#include "core/Ruleset.hpp"
#include "core/Types.hpp"

#include <cstdint>
#include <memory>
#include <optional>

namespace modtris::core {
class Game;
}

namespace modtris::engine {

// Score and level keeping. judge() sees every push exactly once.
class Scorer {
public:
    Scorer(core::Board board, std::uint64_t score, int level, int goal);
    virtual ~Scorer() = default;

    static core::RuleOverrides ruleOverrides() { return {}; }
    static std::optional<core::Ruleset> rules() { return std::nullopt; }

    // Returns the points awarded for this move
    virtual std::uint64_t judge(const core::MoveDelta& delta) = 0;

    std::uint64_t score() const noexcept { return score_; }
    int level() const noexcept { return level_; }
    int lineClears() const noexcept { return lineClears_; }
    int goal() const noexcept { return goal_; }

protected:
    core::Board board_; // view onto the game's board
    std::uint64_t score_;
    int level_;
    int lineClears_{0};
    int goal_;
};

// 2009 guideline scoring with 3-corner T-spins, T-spin minis, combos,
// back-to-back and perfect clears
class GuidelineScorer : public Scorer {
public:
    GuidelineScorer(core::Board board, std::uint64_t score = 0, int level = 1);

    static std::unique_ptr<GuidelineScorer> fromGame(const core::Game& game,
                                                     std::uint64_t score,
                                                     std::optional<int> level);

    std::uint64_t judge(const core::MoveDelta& delta) override;

    int combo() const noexcept { return combo_; }
    int backToBack() const noexcept { return backToBack_; }
    bool tspin() const noexcept { return tspin_; }
    bool tspinMini() const noexcept { return tspinMini_; }

private:
    void detectTSpin(const core::MoveDelta& delta);
    bool cornerOccupied(int row, int col) const;
    bool perfectClear() const;

    int combo_{0};
    int backToBack_{0};
    bool tspin_{false};
    bool tspinMini_{false};
};

// NES scoring: fixed line table scaled by level + 1, no spins
class NesScorer : public Scorer {
public:
    NesScorer(core::Board board, std::uint64_t score = 0, int level = 0, int initialLevel = 0);

    static std::unique_ptr<NesScorer> fromGame(const core::Game& game,
                                               std::uint64_t score,
                                               std::optional<int> level);
    static core::RuleOverrides ruleOverrides();

    std::uint64_t judge(const core::MoveDelta& delta) override;

private:
    static int firstGoal(int initialLevel);
};

} // namespace modtris::engine
