#include "engine/Scorer.hpp"
#include "core/Game.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>

namespace modtris::engine {

using core::Mino;
using core::MoveDelta;
using core::MoveKind;
using core::PieceType;

namespace {

// Indexed by number of cleared lines
constexpr std::array<std::uint64_t, 5> PerfectClearPoints{0, 800, 1200, 1800, 2000};
constexpr std::array<std::uint64_t, 5> TSpinPoints{400, 800, 1200, 1600, 0};
constexpr std::array<std::uint64_t, 5> TSpinMiniPoints{100, 200, 400, 0, 0};
constexpr std::array<std::uint64_t, 5> LinePoints{0, 100, 300, 500, 800};

// Corners of the 3x3 box clockwise from top-left, and the edge midpoints
// clockwise from the top. Edge i lies between corner i and corner i + 1.
constexpr std::array<Mino, 4> Corners{{{0, 0}, {0, 2}, {2, 2}, {2, 0}}};
constexpr std::array<Mino, 4> Edges{{{0, 1}, {1, 2}, {2, 1}, {1, 0}}};

} // namespace

GuidelineScorer::GuidelineScorer(core::Board board, std::uint64_t score, int level)
    : Scorer(std::move(board), score, std::max(level, 1), std::max(level, 1) * 10)
{
}

std::unique_ptr<GuidelineScorer> GuidelineScorer::fromGame(const core::Game& game,
                                                           std::uint64_t score,
                                                           std::optional<int> level) {
    return std::make_unique<GuidelineScorer>(
        game.board(), score, level.value_or(game.rules().get<int>("initial_level")));
}

bool GuidelineScorer::cornerOccupied(int row, int col) const {
    if (row < 0 || row >= board_.rows() || col < 0 || col >= board_.cols()) {
        return true; // walls and floor count
    }
    return board_.cell(row, col) != 0;
}

void GuidelineScorer::detectTSpin(const MoveDelta& delta) {
    tspin_ = false;
    tspinMini_ = false;

    const core::Piece& piece = delta.piece;

    std::array<bool, 4> corners{};
    for (std::size_t i = 0; i < Corners.size(); ++i) {
        corners[i] = cornerOccupied(piece.x + Corners[i].x, piece.y + Corners[i].y);
    }

    // The flat side of the T is the one edge it does not cover
    std::size_t back = Edges.size();
    for (std::size_t i = 0; i < Edges.size(); ++i) {
        if (std::find(piece.minos.begin(), piece.minos.end(), Edges[i]) == piece.minos.end()) {
            back = i;
            break;
        }
    }
    if (back == Edges.size()) {
        return;
    }

    const int front = corners[(back + 2) % 4] + corners[(back + 3) % 4];
    const int rear = corners[back] + corners[(back + 1) % 4];

    if (front == 2 && rear >= 1) {
        tspin_ = true;
    } else if (front == 1 && rear == 2) {
        // A long kick into the slot still counts as a full spin
        if (std::abs(delta.x) >= 2 && std::abs(delta.y) >= 1) {
            tspin_ = true;
        } else {
            tspinMini_ = true;
        }
    }
}

bool GuidelineScorer::perfectClear() const {
    for (int row = 0; row < board_.rows(); ++row) {
        if (!board_.isRowEmpty(row) && !board_.isRowFull(row)) {
            return false;
        }
    }
    return true;
}

std::uint64_t GuidelineScorer::judge(const MoveDelta& delta) {
    std::uint64_t awarded = 0;

    switch (delta.kind) {
    case MoveKind::Rotate:
        if (delta.piece.type == PieceType::T && delta.r != 0) {
            detectTSpin(delta);
        }
        break;

    case MoveKind::Drag:
        if (delta.y != 0) {
            tspin_ = tspinMini_ = false;
        }
        break;

    case MoveKind::SoftDrop:
        if (delta.x != 0) {
            tspin_ = tspinMini_ = false;
        }
        if (!delta.automatic && delta.x > 0) {
            awarded += static_cast<std::uint64_t>(delta.x);
        }
        break;

    case MoveKind::Swap:
        tspin_ = tspinMini_ = false;
        break;

    case MoveKind::HardDrop: {
        if (!delta.locked) {
            break; // refused, nothing was placed
        }
        if (!delta.automatic && delta.x > 0) {
            awarded += static_cast<std::uint64_t>(delta.x) * 2; // not scaled by level
        }

        const std::size_t lines = std::min<std::size_t>(delta.clears.size(), 4);

        if (lines > 0) {
            if (tspin_ || tspinMini_ || lines >= 4) {
                ++backToBack_;
            } else {
                backToBack_ = 0;
            }
            ++combo_;
        } else {
            combo_ = 0;
        }

        const bool perfect = lines > 0 && perfectClear();
        const auto level = static_cast<std::uint64_t>(level_);

        std::uint64_t points = 0;
        if (perfect) {
            points = PerfectClearPoints[lines];
        } else if (tspin_) {
            points = TSpinPoints[lines];
        } else if (tspinMini_) {
            points = TSpinMiniPoints[lines];
        } else {
            points = LinePoints[lines];
        }

        if (combo_ > 0) {
            points += 50 * static_cast<std::uint64_t>(combo_ - 1);
        }

        points *= level;

        if (backToBack_ > 1) {
            points = points * 3 / 2;
            if (perfect) {
                points += 200 * level;
            }
        }

        awarded += points;
        lineClears_ += static_cast<int>(lines);
        if (lineClears_ >= goal_) {
            goal_ += 10;
            ++level_;
        }

        // The piece is locked, its spin is spent
        tspin_ = tspinMini_ = false;
        break;
    }
    }

    score_ += awarded;
    return awarded;
}

} // namespace modtris::engine
