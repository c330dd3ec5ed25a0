#include "engine/Scorer.hpp"
#include "core/Game.hpp"

#include <algorithm>
#include <array>

namespace modtris::engine {

using core::MoveKind;

namespace {

constexpr std::array<std::uint64_t, 5> LinePoints{0, 40, 100, 300, 1200};

} // namespace

NesScorer::NesScorer(core::Board board, std::uint64_t score, int level, int initialLevel)
    : Scorer(std::move(board), score, level, firstGoal(initialLevel))
{
}

int NesScorer::firstGoal(int initialLevel) {
    return std::min(initialLevel * 10 + 10, std::max(100, initialLevel * 10 - 50));
}

core::RuleOverrides NesScorer::ruleOverrides() {
    return {{"initial_level", 0}}; // the NES counts levels from 0
}

std::unique_ptr<NesScorer> NesScorer::fromGame(const core::Game& game,
                                               std::uint64_t score,
                                               std::optional<int> level) {
    const int initialLevel = game.rules().get<int>("initial_level");
    return std::make_unique<NesScorer>(game.board(), score, level.value_or(initialLevel),
                                       initialLevel);
}

std::uint64_t NesScorer::judge(const core::MoveDelta& delta) {
    std::uint64_t awarded = 0;

    if (delta.kind == MoveKind::SoftDrop) {
        if (!delta.automatic && delta.x > 0) {
            awarded += static_cast<std::uint64_t>(delta.x);
        }
    } else if (delta.kind == MoveKind::HardDrop && delta.locked) {
        // No hard drop on the NES; scored like a soft drop of the same length
        if (!delta.automatic && delta.x > 0) {
            awarded += static_cast<std::uint64_t>(delta.x);
        }

        const std::size_t lines = std::min<std::size_t>(delta.clears.size(), 4);
        awarded += LinePoints[lines] * static_cast<std::uint64_t>(level_ + 1);

        lineClears_ += static_cast<int>(lines);
        if (lineClears_ >= goal_) {
            ++level_;
            goal_ = lineClears_ + 10;
        }
    }

    score_ += awarded;
    return awarded;
}

} // namespace modtris::engine
