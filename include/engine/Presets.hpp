#pragma once

#include "engine/EngineParts.hpp"

namespace modtris::engine::presets {

// Infinity gravity, 7-bag, SRS, guideline scoring
EngineParts modern();

// modern() with TETR.IO's 180 degree kicks
EngineParts tetrio();

// Marathon gravity, NES randomizer, no kicks, NES scoring
EngineParts classic();

} // namespace modtris::engine::presets
