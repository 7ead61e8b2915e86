#pragma once

#include "map.hpp"
#include "popups.hpp"
#include "rng.hpp"

#include <cstddef>
#include <functional>
#include <vector>

// Guard AI: sensing, the mode state machine, goal pathing and shouts.
//
// Turn order (guardActAll):
//   1. every guard rolls its per-turn flags (preTurn)
//   2. every guard acts once, in list order, against a snapshot of where
//      all guards stood before the pass
//   3. shouts raised in step 2 are delivered; receivers act on them next turn

// Squared radii.
constexpr int PLAYER_NOISE_RADIUS_SQ = 75;
constexpr int GUARD_SHOUT_RADIUS_SQ = 150;
constexpr int GUARD_SPEECH_RADIUS_SQ = 200;

// ---------------------------------------------------------------------------
// Dialogue
// ---------------------------------------------------------------------------

// Round-robin cursor over a fixed pool of lines. The Nth pick from a pool
// is always line N (mod pool size).
struct LineIter {
    const char* const* lines = nullptr;
    size_t count = 0;
    size_t index = 0;

    const char* next();
};

struct GuardLines {
    LineIter see;
    LineIter seeDisguised;
    LineIter hear;
    LineIter hearGuard;
    LineIter chase;
    LineIter investigate;
    LineIter endChase;
    LineIter endInvestigation;
    LineIter doneLooking;
    LineIter doneSeeingDisguised;
    LineIter doneListening;
    LineIter damage;

    GuardLines();
};

// Pool to draw from when a guard goes from `prev` to `next`, or nullptr for
// a silent change.
LineIter* linesForStateChange(GuardLines& lines, GuardMode prev, GuardMode next);

// ---------------------------------------------------------------------------
// Sensing and steering
// ---------------------------------------------------------------------------

// Guard occupancy before the guard pass.
struct GuardSnapshot {
    std::vector<Vec2i> positions;
    bool anyChasing = false;
};

GuardSnapshot snapshotGuards(const Map& map);

using OccupiedFn = std::function<bool(Vec2i p)>;

// Snap a facing toward `aim`: keep forward, or turn left, right or around.
// Ties go to the forward axis.
Vec2i updateDir(Vec2i dirForward, Vec2i dirAim);

// Bresenham walk; true if no sight-blocking cell lies strictly between.
bool lineOfSight(const Map& map, Vec2i from, Vec2i to);

int guardSightCutoff(GuardMode mode, bool litTarget);

bool guardSeesThief(const Guard& guard, const Map& map, const Player& player, bool anyGuardChasing);

// Cheapest legal step in the 3x3 window around `from` by `field`; returns
// `from` when nothing is better.
Vec2i posNextBest(const Map& map, const std::vector<int>& field, Vec2i from, const OccupiedFn& occupied);

// Pick the next patrol region (or the nearest one when off the patrol
// graph).
void setupGoalRegion(Guard& guard, RNG& rng, const Map& map);

// Facing toward the first patrol step.
Vec2i initialDir(const Guard& guard, const Map& map);

// ---------------------------------------------------------------------------
// Turn
// ---------------------------------------------------------------------------

void guardActAll(RNG& rng, bool seeAll, Popups& popups, GuardLines& lines, Map& map, Player& player);
