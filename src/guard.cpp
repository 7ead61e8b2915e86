#include "guard.hpp"

#include "pathfinding.hpp"

#include <algorithm>
#include <cstdlib>

namespace {

struct Shout {
    Vec2i posShouter; // who is shouting
    Vec2i posTarget;  // where they report the thief
};

// Everything a single guard's turn reads or writes besides itself.
struct GuardTurn {
    RNG& rng;
    bool seeAll;
    Popups& popups;
    GuardLines& lines;
    const Map& map;
    Player& player;
    const GuardSnapshot& snapshot;
    // Cells guards have stepped into earlier in this pass.
    std::vector<Vec2i>& claimed;
    std::vector<Shout>& shouts;
    size_t self;
};

bool occupiedForGuard(const GuardTurn& t, Vec2i p) {
    for (size_t i = 0; i < t.snapshot.positions.size(); ++i) {
        if (i != t.self && t.snapshot.positions[i] == p) return true;
    }
    return std::find(t.claimed.begin(), t.claimed.end(), p) != t.claimed.end();
}

void preTurn(Guard& g) {
    g.heardGuard = g.hearingGuard;
    g.hearingGuard = false;
    g.speaking = false;
    g.hasMoved = false;
}

void say(Guard& g, GuardTurn& t, const char* msg) {
    const int d2 = lengthSquared(g.pos - t.player.pos);
    if (d2 < GUARD_SPEECH_RADIUS_SQ || t.seeAll) {
        t.popups.guardSpeech(g.pos, msg);
    }
    g.speaking = true;
}

// Returns true if the next step would have been onto the thief.
bool moveTowardRegion(Guard& g, GuardTurn& t) {
    if (g.regionGoal == INVALID_REGION) return false;

    const std::vector<int> field = computeDistancesToRegion(t.map, g.regionGoal);
    const Vec2i next = posNextBest(t.map, field, g.pos, [&](Vec2i p) { return occupiedForGuard(t, p); });

    if (t.player.pos == next) return true;

    g.dir = updateDir(g.dir, next - g.pos);
    g.pos = next;
    return false;
}

// Returns false if the guard did not move.
bool moveTowardGoal(Guard& g, GuardTurn& t) {
    const std::vector<int> field = computeDistancesToPosition(t.map, g.goal);
    const Vec2i next = posNextBest(t.map, field, g.pos, [&](Vec2i p) { return occupiedForGuard(t, p); });

    if (next == g.pos) return false;

    g.dir = updateDir(g.dir, next - g.pos);

    // Never step onto the thief; adjacency is handled as an attack.
    if (t.player.pos == next) return false;

    g.pos = next;
    return true;
}

void patrolStep(Guard& g, GuardTurn& t) {
    const bool bumpedThief = moveTowardRegion(g, t);

    if (t.map.at(g.pos).region == g.regionGoal) {
        const int regionPrev = g.regionPrev;
        g.regionPrev = g.regionGoal;
        g.regionGoal = t.map.randomNeighborRegion(t.rng, g.regionGoal, regionPrev, g.kind == GuardKind::Outer);
    }

    if (bumpedThief && !t.player.disguised) {
        g.mode = GuardMode::ChaseVisibleTarget;
        g.goal = t.player.pos;
        g.dir = updateDir(g.dir, g.goal - g.pos);
    }
}

// Switch into Look/LookAtDisguised or Chase on sighting; drop to
// MoveToLastSighting when a chase loses sight. Returns true on sighting.
bool reactToSight(Guard& g, GuardTurn& t) {
    if (guardSeesThief(g, t.map, t.player, t.snapshot.anyChasing)) {
        g.goal = t.player.pos;

        if (g.mode == GuardMode::Patrol && (t.player.disguised || !g.adjacentTo(t.player.pos))) {
            g.mode = t.player.disguised ? GuardMode::LookAtDisguised : GuardMode::Look;
            g.modeTimeout = t.rng.range(3, 5);
        } else {
            g.mode = GuardMode::ChaseVisibleTarget;
        }
        return true;
    }

    if (g.mode == GuardMode::ChaseVisibleTarget) {
        g.mode = GuardMode::MoveToLastSighting;
        g.modeTimeout = 3;
        g.goal = t.player.pos;
    }
    return false;
}

void guardAct(Guard& g, GuardTurn& t) {
    const GuardMode modePrev = g.mode;
    const Vec2i posPrev = g.pos;

    // Senses first: sight, then sound.

    if (reactToSight(g, t)) {
        if (g.mode == GuardMode::Look || g.mode == GuardMode::LookAtDisguised) {
            g.dir = updateDir(g.dir, t.player.pos - g.pos);
        }
    }

    if (g.mode != GuardMode::ChaseVisibleTarget) {
        if (g.heardGuard) {
            g.mode = GuardMode::MoveToGuardShout;
            g.modeTimeout = t.rng.range(2, 5);
            g.goal = g.heardGuardPos;
        }

        if (g.heardThief) {
            if (g.adjacentTo(t.player.pos)) {
                g.mode = GuardMode::ChaseVisibleTarget;
                g.goal = t.player.pos;
            } else if (g.mode == GuardMode::Patrol) {
                g.mode = GuardMode::Listen;
                g.modeTimeout = t.rng.range(3, 5);
                g.dir = updateDir(g.dir, t.player.pos - g.pos);
            } else {
                g.mode = GuardMode::MoveToLastSound;
                g.modeTimeout = t.rng.range(3, 5);
                g.goal = t.player.pos;
            }
        }
    }

    // Spend the turn in the current mode.

    switch (g.mode) {
        case GuardMode::Patrol:
            patrolStep(g, t);
            break;

        case GuardMode::Look:
        case GuardMode::LookAtDisguised:
        case GuardMode::Listen:
            --g.modeTimeout;
            if (g.modeTimeout <= 0) g.mode = GuardMode::Patrol;
            break;

        case GuardMode::ChaseVisibleTarget:
            if (g.adjacentTo(t.player.pos)) {
                g.dir = updateDir(g.dir, g.goal - g.pos);
                // The first turn of a chase is spent closing in.
                if (modePrev == GuardMode::ChaseVisibleTarget && !t.player.damagedLastTurn) {
                    t.popups.damage(t.player.pos, t.lines.damage.next());
                    t.player.applyDamage(1);
                }
            } else {
                moveTowardGoal(g, t);
            }
            break;

        case GuardMode::MoveToLastSighting:
        case GuardMode::MoveToLastSound:
        case GuardMode::MoveToGuardShout:
            if (!moveTowardGoal(g, t)) --g.modeTimeout;

            if (g.modeTimeout <= 0) {
                g.mode = GuardMode::Patrol;
                setupGoalRegion(g, t.rng, t.map);
            }
            break;
    }

    // Moving may have brought the thief into (or out of) view.

    if (g.pos != posPrev) {
        g.hasMoved = true;
        t.claimed.push_back(g.pos);

        if (reactToSight(g, t)) {
            g.dir = updateDir(g.dir, t.player.pos - g.pos);
        }
    }

    g.heardThief = false;

    if (LineIter* pool = linesForStateChange(t.lines, modePrev, g.mode)) {
        say(g, t, pool->next());
    }

    if (g.mode == GuardMode::ChaseVisibleTarget && modePrev != GuardMode::ChaseVisibleTarget) {
        t.shouts.push_back({g.pos, t.player.pos});
    }
}

void alertNearbyGuards(Map& map, const Shout& shout) {
    for (int i : map.guardsInEarshot(shout.posShouter, GUARD_SHOUT_RADIUS_SQ)) {
        Guard& g = map.guards[static_cast<size_t>(i)];
        if (g.pos != shout.posShouter) g.hearGuard(shout.posTarget);
    }
}

} // namespace

GuardSnapshot snapshotGuards(const Map& map) {
    GuardSnapshot s;
    s.positions.reserve(map.guards.size());
    for (const Guard& g : map.guards) {
        s.positions.push_back(g.pos);
        if (g.mode == GuardMode::ChaseVisibleTarget) s.anyChasing = true;
    }
    return s;
}

Vec2i updateDir(Vec2i dirForward, Vec2i dirAim) {
    const Vec2i dirLeft{-dirForward.y, dirForward.x};

    const int dotForward = dot(dirForward, dirAim);
    const int dotLeft = dot(dirLeft, dirAim);

    if (std::abs(dotForward) >= std::abs(dotLeft)) {
        return (dotForward >= 0) ? dirForward : -dirForward;
    }
    return (dotLeft >= 0) ? dirLeft : -dirLeft;
}

bool lineOfSight(const Map& map, Vec2i from, Vec2i to) {
    int x = from.x;
    int y = from.y;

    const int dx = to.x - x;
    const int dy = to.y - y;

    int ax = std::abs(dx);
    int ay = std::abs(dy);

    const int xInc = (dx > 0) ? 1 : -1;
    const int yInc = (dy > 0) ? 1 : -1;

    int error = ay - ax;
    int n = ax + ay - 1;

    ax *= 2;
    ay *= 2;

    while (n > 0) {
        if (error > 0) {
            y += yInc;
            error -= ax;
        } else {
            x += xInc;
            error += ay;
        }

        if (map.blocksSight(x, y)) return false;

        --n;
    }

    return true;
}

int guardSightCutoff(GuardMode mode, bool litTarget) {
    const bool relaxed = (mode == GuardMode::Patrol || mode == GuardMode::LookAtDisguised);
    if (litTarget) return relaxed ? 40 : 75;
    return relaxed ? 3 : 33;
}

bool guardSeesThief(const Guard& guard, const Map& map, const Player& player, bool anyGuardChasing) {
    const Vec2i d = player.pos - guard.pos;
    if (dot(guard.dir, d) < 0) return false;

    // A disguise reads as shadow until someone is already after you.
    const bool disguisedTarget = player.disguised && guard.mode != GuardMode::ChaseVisibleTarget;
    const bool lit = !disguisedTarget && map.at(player.pos).lit;

    if (lengthSquared(d) >= guardSightCutoff(guard.mode, lit)) return false;

    if (!player.hidden(map, anyGuardChasing) && lineOfSight(map, guard.pos, player.pos)) return true;

    // Alert guards feel an adjacent thief.
    if (guard.mode != GuardMode::Patrol && guard.adjacentTo(player.pos)) return true;

    return false;
}

Vec2i posNextBest(const Map& map, const std::vector<int>& field, Vec2i from, const OccupiedFn& occupied) {
    int costBest = INFINITE_COST;
    Vec2i posBest = from;

    const int x0 = std::max(0, from.x - 1);
    const int y0 = std::max(0, from.y - 1);
    const int x1 = std::min(map.width, from.x + 2);
    const int y1 = std::min(map.height, from.y + 2);

    for (int x = x0; x < x1; ++x) {
        for (int y = y0; y < y1; ++y) {
            const int cost = field[static_cast<size_t>(y * map.width + x)];
            if (cost == INFINITE_COST) continue;

            const Vec2i p{x, y};
            if (map.guardMoveCost(from, p) == INFINITE_COST) continue;
            if (map.at(p).type == CellType::GroundWater) continue;
            if (occupied && occupied(p)) continue;

            if (cost < costBest) {
                costBest = cost;
                posBest = p;
            }
        }
    }

    return posBest;
}

void setupGoalRegion(Guard& guard, RNG& rng, const Map& map) {
    const int regionCur = map.at(guard.pos).region;

    if (guard.regionGoal != INVALID_REGION && regionCur == guard.regionPrev) return;

    if (regionCur == INVALID_REGION) {
        guard.regionGoal = closestRegion(map, guard.pos, guard.kind == GuardKind::Outer);
    } else {
        guard.regionGoal = map.randomNeighborRegion(rng, regionCur, guard.regionPrev, guard.kind == GuardKind::Outer);
        guard.regionPrev = regionCur;
    }
}

Vec2i initialDir(const Guard& guard, const Map& map) {
    if (guard.regionGoal == INVALID_REGION) return guard.dir;

    const std::vector<int> field = computeDistancesToRegion(map, guard.regionGoal);
    const Vec2i next = posNextBest(map, field, guard.pos, [&](Vec2i p) { return map.isGuardAt(p); });

    return updateDir(guard.dir, next - guard.pos);
}

void guardActAll(RNG& rng, bool seeAll, Popups& popups, GuardLines& lines, Map& map, Player& player) {
    for (Guard& g : map.guards) preTurn(g);

    const GuardSnapshot snapshot = snapshotGuards(map);
    std::vector<Vec2i> claimed;
    std::vector<Shout> shouts;

    for (size_t i = 0; i < map.guards.size(); ++i) {
        // Work on a copy; the map itself is read-only during the pass.
        Guard g = map.guards[i];
        GuardTurn t{rng, seeAll, popups, lines, map, player, snapshot, claimed, shouts, i};
        guardAct(g, t);
        map.guards[i] = g;
    }

    for (const Shout& s : shouts) {
        alertNearbyGuards(map, s);
    }
}
