#pragma once

#include "map.hpp"
#include "rng.hpp"

#include <cstdint>

// Procedural mansion ("siheyuan") generator.
//
// A grid of 5x5 room cells, mirrored left to right, with jittered wall
// lines. Rooms are joined through doors until the interior is connected,
// ranked public/private by depth from the south entrance, then decorated,
// furnished, looted and staffed with guards. Everything is drawn from the
// RNG passed in, so a seed fully determines the level.

struct MansionGenOptions {
    // Occasional creaky floorboards in public rooms on deeper levels.
    bool creakyFloors = true;

    // Layouts with fewer patrol regions than this are rejected and retried.
    int minPatrolRegions = 1;
};

constexpr int MANSION_OUTER_BORDER = 3;
constexpr int MANSION_ROOM_SIZE_X = 5;
constexpr int MANSION_ROOM_SIZE_Y = 5;

// Retries (up to 100 times) layouts with fewer than opts.minPatrolRegions
// patrol regions, then accepts whatever the next attempt yields.
Map generateMap(RNG& rng, int level, const MansionGenOptions& opts = MansionGenOptions{});

// Convenience: fresh RNG from `seed`.
Map generateLevel(uint32_t seed, int level, const MansionGenOptions& opts = MansionGenOptions{});
