#include "engine/Gravity.hpp"
#include "core/Game.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace modtris::engine {

using namespace std::chrono_literals;

Clock::Duration dropDelay(int level) {
    const int steps = std::max(level, 1) - 1;
    const double base = 0.8 - steps * 0.007;
    if (base <= 0.0) {
        return 1ms;
    }
    const double seconds = std::pow(base, steps);
    const auto delay = std::chrono::duration_cast<Clock::Duration>(
        std::chrono::duration<double>(seconds));
    return std::max<Clock::Duration>(delay, 1ms);
}

Gravity::Gravity(const core::Game& game)
    : game_{game}
{
}

bool Gravity::grounded() const {
    const core::Piece& piece = game_.piece();
    return game_.rotationSystem().overlaps(piece.minos, piece.x + 1, piece.y);
}

Clock::TimePoint Gravity::now() const {
    return game_.clock().now();
}

} // namespace modtris::engine
