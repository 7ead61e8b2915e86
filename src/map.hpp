#pragma once

#include "common.hpp"
#include "rng.hpp"
#include "tiles.hpp"

#include <cstdint>
#include <utility>
#include <vector>

struct Map;

// Per-cell state. Everything except `seen` is fixed once the generator calls
// Map::cacheCellInfo().
struct Cell {
    CellType type = CellType::GroundNormal;
    // Cost for a guard to enter this cell; INFINITE_COST iff impassable.
    int moveCost = 0;
    int region = INVALID_REGION;
    bool blocksPlayerSight = false;
    bool blocksSight = false;
    bool blocksSound = false;
    bool hidesPlayer = false;
    bool lit = false;
    bool seen = false;
};

// Half-open rectangle: posMin inclusive, posMax exclusive.
struct Rect {
    Vec2i posMin;
    Vec2i posMax;

    bool contains(Vec2i p) const {
        return p.x >= posMin.x && p.y >= posMin.y && p.x < posMax.x && p.y < posMax.y;
    }
    int area() const { return (posMax.x - posMin.x) * (posMax.y - posMin.y); }
};

struct PatrolRegion {
    Rect rect;
    // Inner regions lie in private (master-suite) territory.
    bool inner = false;
};

struct Item {
    Vec2i pos;
    ItemKind kind = ItemKind::Coin;
};

enum class GuardMode : uint8_t {
    Patrol = 0,
    Look,
    LookAtDisguised,
    Listen,
    ChaseVisibleTarget,
    MoveToLastSighting,
    MoveToLastSound,
    MoveToGuardShout,
};

enum class GuardKind : uint8_t {
    Inner = 0,
    Outer,
};

const char* guardModeName(GuardMode m);

struct Guard {
    Vec2i pos;
    Vec2i dir{1, 0};
    GuardKind kind = GuardKind::Outer;
    GuardMode mode = GuardMode::Patrol;

    // Transient, per turn.
    bool speaking = false;
    bool hasMoved = false;
    bool heardThief = false;
    bool hearingGuard = false;  // shout received this turn, acted on next turn
    bool heardGuard = false;
    Vec2i heardGuardPos;

    // Chase / investigate.
    Vec2i goal;
    int modeTimeout = 0;

    // Patrol.
    int regionGoal = INVALID_REGION;
    int regionPrev = INVALID_REGION;

    void hearThief() { heardThief = true; }
    void hearGuard(Vec2i posTarget) {
        hearingGuard = true;
        heardGuardPos = posTarget;
    }
    bool adjacentTo(Vec2i p) const {
        const Vec2i d = p - pos;
        return d.x > -2 && d.x < 2 && d.y > -2 && d.y < 2;
    }
};

constexpr int PLAYER_MAX_HEALTH = 5;
constexpr int PLAYER_AIR_TURNS = 7;

struct Player {
    Vec2i pos;
    Vec2i dir{0, -1};
    int maxHealth = PLAYER_MAX_HEALTH;
    int health = PLAYER_MAX_HEALTH;
    int gold = 0;
    bool disguised = false;

    bool noisy = false;  // made noise this turn
    bool damagedLastTurn = false;

    int turnsRemainingUnderwater = 0;

    Player() = default;
    explicit Player(Vec2i p, int hp = PLAYER_MAX_HEALTH) : pos(p), maxHealth(hp), health(hp) {}

    // Saturates at zero.
    void applyDamage(int d) {
        health -= (d < health) ? d : health;
        damagedLastTurn = true;
    }

    bool dead() const { return health <= 0; }

    // Concealed by a table or bush, or submerged with air left. Nobody is
    // hidden while any guard is in an active chase.
    bool hidden(const Map& map, bool anyGuardChasing) const;
    bool hidden(const Map& map) const;
};

struct Map {
    int width = 0;
    int height = 0;
    std::vector<Cell> cells;

    std::vector<PatrolRegion> patrolRegions;
    // Undirected edges between patrol region indices.
    std::vector<std::pair<int, int>> patrolRoutes;

    std::vector<Item> items;
    std::vector<Guard> guards;

    Vec2i posStart;
    int totalLoot = 0;

    Map() = default;
    Map(int w, int h);

    bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < width && y < height; }
    bool inBounds(Vec2i p) const { return inBounds(p.x, p.y); }

    // Unchecked: callers test inBounds() first.
    Cell& at(int x, int y) { return cells[static_cast<size_t>(y * width + x)]; }
    const Cell& at(int x, int y) const { return cells[static_cast<size_t>(y * width + x)]; }
    Cell& at(Vec2i p) { return at(p.x, p.y); }
    const Cell& at(Vec2i p) const { return at(p.x, p.y); }

    bool blocksSight(int x, int y) const { return at(x, y).blocksSight; }
    bool blocksPlayerSight(int x, int y) const { return at(x, y).blocksPlayerSight; }
    bool hidesPlayer(int x, int y) const { return at(x, y).hidesPlayer; }

    // Derive per-cell cost and blocking flags from the cell types and the
    // items standing in them.
    void cacheCellInfo();

    // Items / loot
    int collectLootAt(Vec2i p);
    int collectAllLoot();
    bool allLootCollected() const;
    int lootRemaining() const;
    bool isItemAt(Vec2i p) const;
    bool isOutfitAt(Vec2i p) const;
    // Swap the outfit lying at `p` for `outfitCur`. Returns false if there is
    // no outfit there or it is the same kind.
    bool tryUseOutfitAt(Vec2i p, ItemKind outfitCur, ItemKind& outfitNew);

    // Guards
    bool isGuardAt(Vec2i p) const;
    int guardIndexAt(Vec2i p) const;
    bool anyGuardChasing() const;

    // Visibility (fov.cpp)
    void recomputeVisibility(Vec2i viewer);
    bool playerCanSeeInDirection(Vec2i viewer, Vec2i dir) const;
    bool allSeen() const;
    int percentSeen() const;
    void markAllSeen();
    void markAllUnseen();

    // Sound (earshot.cpp)
    // Per-cell mask (y*width+x) of cells the sound reaches.
    std::vector<uint8_t> coordsInEarshot(Vec2i origin, int radiusSquared) const;
    // Indices into `guards`.
    std::vector<int> guardsInEarshot(Vec2i origin, int radiusSquared) const;

    // Patrol graph
    // Random route neighbor of `region` other than `regionExclude`; returns
    // `region` itself when there is none. With `outerOnly`, inner regions
    // are not considered.
    int randomNeighborRegion(RNG& rng, int region, int regionExclude, bool outerOnly = false) const;

    // Cost for a guard to step from `from` to the adjacent cell `to`.
    // Diagonal steps may not cut a corner past an impassable cell.
    int guardMoveCost(Vec2i from, Vec2i to) const;
};
