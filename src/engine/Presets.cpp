#include "engine/Presets.hpp"

namespace modtris::engine::presets {

EngineParts modern() {
    return EngineParts{
        GravityFactory::of<InfinityGravity>("InfinityGravity"),
        QueueFactory::of<SevenBag>("SevenBag"),
        RotationSystemFactory::of<Srs>("Srs"),
        ScorerFactory::of<GuidelineScorer>("GuidelineScorer"),
    };
}

EngineParts tetrio() {
    EngineParts parts = modern();
    parts.rotationSystem = RotationSystemFactory::of<TetrioSrs>("TetrioSrs");
    return parts;
}

EngineParts classic() {
    return EngineParts{
        GravityFactory::of<MarathonGravity>("MarathonGravity"),
        QueueFactory::of<NesQueue>("NesQueue"),
        RotationSystemFactory::of<NoKicks>("NoKicks"),
        ScorerFactory::of<NesScorer>("NesScorer"),
    };
}

} // namespace modtris::engine::presets
