#include "engine/Scorer.hpp"

#include <utility>

namespace modtris::engine {

Scorer::Scorer(core::Board board, std::uint64_t score, int level, int goal)
    : board_{std::move(board)}
    , score_{score}
    , level_{level}
    , goal_{goal}
{
}

} // namespace modtris::engine
