#pragma once

#include "core/Ruleset.hpp"
#include "core/Types.hpp"
#include "engine/Gravity.hpp"
#include "engine/Queue.hpp"
#include "engine/RotationSystem.hpp"
#include "engine/Scorer.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace modtris::core {
class Game;
}

namespace modtris::engine {

// Type-erased "how to build a part from a game".
//
// T must provide static fromGame(const Game&, Args...), ruleOverrides() and
// rules(). The last two are usually inherited from the part's base class.
template <typename Part, typename... Args>
class PartFactory {
public:
    using Builder = std::function<std::unique_ptr<Part>(const core::Game&, Args...)>;

    template <typename T>
    static PartFactory of(std::string name) {
        return PartFactory{
            std::move(name),
            [](const core::Game& game, Args... args) -> std::unique_ptr<Part> {
                return T::fromGame(game, std::move(args)...);
            },
            &T::ruleOverrides,
            &T::rules,
        };
    }

    std::unique_ptr<Part> build(const core::Game& game, Args... args) const {
        return builder_(game, std::move(args)...);
    }

    core::RuleOverrides ruleOverrides() const { return ruleOverrides_(); }
    std::optional<core::Ruleset> rules() const { return rules_(); }

    const std::string& name() const noexcept { return name_; }

private:
    PartFactory(std::string name, Builder builder,
                core::RuleOverrides (*ruleOverrides)(),
                std::optional<core::Ruleset> (*rules)())
        : name_{std::move(name)}
        , builder_{std::move(builder)}
        , ruleOverrides_{ruleOverrides}
        , rules_{rules}
    {
    }

    std::string name_;
    Builder builder_;
    core::RuleOverrides (*ruleOverrides_)();
    std::optional<core::Ruleset> (*rules_)();
};

using GravityFactory = PartFactory<Gravity>;
using QueueFactory = PartFactory<Queue, std::vector<core::PieceType>>;
using RotationSystemFactory = PartFactory<RotationSystem>;
using ScorerFactory = PartFactory<Scorer, std::uint64_t, std::optional<int>>;

// The four replaceable pieces of game logic
struct EngineParts {
    GravityFactory gravity;
    QueueFactory queue;
    RotationSystemFactory rotationSystem;
    ScorerFactory scorer;
};

} // namespace modtris::engine
