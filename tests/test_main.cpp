#include "game.hpp"
#include "guard.hpp"
#include "mansion_gen.hpp"
#include "map.hpp"
#include "pathfinding.hpp"
#include "rng.hpp"
#include "settings.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

// Lit, unseen, wall-free map of `floor`.
Map makeOpenMap(int w, int h, CellType floor = CellType::GroundWood) {
    Map m(w, h);
    for (Cell& c : m.cells) {
        c.type = floor;
        c.lit = true;
    }
    m.cacheCellInfo();
    return m;
}

void plotWallColumn(Map& m, int x, int y0, int y1) {
    for (int y = y0; y <= y1; ++y) m.at(x, y).type = CellType::Wall1100;
}

Guard makeGuard(Vec2i pos, Vec2i dir, GuardMode mode) {
    Guard g;
    g.pos = pos;
    g.dir = dir;
    g.mode = mode;
    g.goal = pos;
    g.heardGuardPos = pos;
    return g;
}

int countSeen(const Map& m) {
    int n = 0;
    for (const Cell& c : m.cells) {
        if (c.seen) ++n;
    }
    return n;
}

// ---------------------------------------------------------------------------
// Primitives
// ---------------------------------------------------------------------------

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    // Also validate range() stays within bounds.
    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }

    std::vector<int> v = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
    shuffleVector(rng, v);
    std::vector<int> sorted = v;
    std::sort(sorted.begin(), sorted.end());
    for (int i = 0; i < 10; ++i) {
        expect(sorted[static_cast<size_t>(i)] == i, "shuffleVector must permute, not duplicate");
    }
}

void test_vec2i_math() {
    const Vec2i a{3, -2};
    const Vec2i b{-1, 4};

    expect(a + b == Vec2i{2, 2}, "Vec2i add");
    expect(a - b == Vec2i{4, -6}, "Vec2i sub");
    expect(-a == Vec2i{-3, 2}, "Vec2i negate");
    expect(a * 3 == Vec2i{9, -6}, "Vec2i scale");
    expect(dot(a, b) == -11, "Vec2i dot");
    expect(lengthSquared(a) == 13, "Vec2i lengthSquared");
    expect(mulComponents(a, b) == Vec2i{-3, -8}, "Vec2i mulComponents");
}

void test_update_dir() {
    const Vec2i east{1, 0};

    expect(updateDir(east, {5, 1}) == east, "mostly ahead keeps facing");
    expect(updateDir(east, {-5, 1}) == Vec2i{-1, 0}, "mostly behind turns around");
    expect(updateDir(east, {1, 5}) == Vec2i{0, 1}, "mostly left (north) turns left");
    expect(updateDir(east, {1, -5}) == Vec2i{0, -1}, "mostly right (south) turns right");

    // Ties go to the forward axis.
    expect(updateDir(east, {1, 1}) == east, "diagonal tie keeps forward");
    expect(updateDir(east, {-1, 1}) == Vec2i{-1, 0}, "diagonal tie behind reverses");
    expect(updateDir(east, {0, 0}) == east, "zero aim keeps facing");
}

void test_tile_catalog() {
    expect(!tileDef(CellType::GroundWood).blocksPlayer, "wood is walkable");
    expect(tileDef(CellType::Wall0101).blocksPlayer, "walls block movement");
    expect(tileDef(CellType::Wall0101).blocksPlayerSight, "walls block the player's sight");
    expect(tileDef(CellType::Wall0101).blocksSound, "walls block sound");

    // Free-standing pillars: solid, but the player sees past them.
    expect(tileDef(CellType::Wall0000).blocksPlayer, "pillar blocks movement");
    expect(!tileDef(CellType::Wall0000).blocksPlayerSight, "pillar does not block player sight");
    expect(tileDef(CellType::Wall0000).blocksSight, "pillar blocks guard sight");

    expect(tileDef(CellType::OneWayWindowN).blocksSight, "window blocks guard sight");
    expect(!tileDef(CellType::OneWayWindowN).blocksPlayerSight, "player sees through windows");
    expect(!tileDef(CellType::OneWayWindowN).blocksSound, "sound passes windows");

    expect(wallTypeFromNeighbors(0) == CellType::Wall0000, "wall mask 0");
    expect(wallTypeFromNeighbors(8 | 4) == CellType::Wall1100, "wall mask N|S");
    expect(wallTypeFromNeighbors(15) == CellType::Wall1111, "wall mask all");

    expect(guardMoveCostForTileType(CellType::GroundWater) == 4096, "water is very expensive for guards");
    expect(guardMoveCostForTileType(CellType::OneWayWindowE) == INFINITE_COST, "guards never climb windows");
    expect(guardMoveCostForItemKind(ItemKind::Table) == 10, "tables are costly");
    expect(guardMoveCostForItemKind(ItemKind::Outfit2) == INFINITE_COST, "outfits are impassable");

    expect(std::string(itemKindName(ItemKind::Outfit2)) == "SERVANT UNIFORM", "outfit name");
}

// ---------------------------------------------------------------------------
// Pathing
// ---------------------------------------------------------------------------

void test_distance_field_weights() {
    const Map m = makeOpenMap(11, 11);
    const std::vector<int> field = computeDistancesToPosition(m, {5, 5});

    auto at = [&](int x, int y) { return field[static_cast<size_t>(y * m.width + x)]; };

    expect(at(5, 5) == 0, "goal costs 0");
    expect(at(8, 5) == 6, "cardinal run costs 2 per step (east)");
    expect(at(5, 2) == 6, "cardinal run costs 2 per step (south)");
    expect(at(7, 6) == 5, "one diagonal plus one cardinal");

    // All four diagonals are reachable at 3 per step.
    expect(at(8, 8) == 9, "diagonal NE costs 3 per step");
    expect(at(2, 2) == 9, "diagonal SW costs 3 per step");
    expect(at(8, 2) == 9, "diagonal SE costs 3 per step");
    expect(at(2, 8) == 9, "diagonal NW costs 3 per step");
}

void test_corner_cutting_forbidden() {
    Map m = makeOpenMap(5, 5);
    m.at(2, 1).type = CellType::Wall1100;
    m.cacheCellInfo();

    expect(m.guardMoveCost({1, 1}, {2, 2}) == INFINITE_COST, "diagonal past a wall corner is forbidden");
    expect(m.guardMoveCost({3, 0}, {2, 1}) == INFINITE_COST, "stepping into a wall is forbidden");
    expect(m.guardMoveCost({1, 2}, {2, 3}) == 0, "open diagonal is allowed");

    // The field has to go around: (1,1) -> (1,2) -> (2,2) at best.
    const std::vector<int> field = computeDistancesToPosition(m, {1, 1});
    expect(field[static_cast<size_t>(2 * m.width + 2)] == 4, "field routes around the corner");
}

void test_closest_region() {
    Map m = makeOpenMap(10, 5);
    PatrolRegion pr;
    pr.rect = Rect{{6, 0}, {10, 5}};
    m.patrolRegions.push_back(pr);
    for (int x = 6; x < 10; ++x) {
        for (int y = 0; y < 5; ++y) m.at(x, y).region = 0;
    }

    expect(closestRegion(m, {1, 2}) == 0, "closest region found across open floor");

    plotWallColumn(m, 4, 0, 4);
    m.cacheCellInfo();
    expect(closestRegion(m, {1, 2}) == INVALID_REGION, "sealed-off cell reaches no region");
}

void test_goal_region_follows_guard_kind() {
    Map m = makeOpenMap(12, 5);
    PatrolRegion inner;
    inner.rect = Rect{{3, 0}, {5, 5}};
    inner.inner = true;
    PatrolRegion outer;
    outer.rect = Rect{{9, 0}, {12, 5}};
    m.patrolRegions.push_back(inner);
    m.patrolRegions.push_back(outer);
    for (size_t r = 0; r < m.patrolRegions.size(); ++r) {
        const Rect& rect = m.patrolRegions[r].rect;
        for (int x = rect.posMin.x; x < rect.posMax.x; ++x) {
            for (int y = rect.posMin.y; y < rect.posMax.y; ++y) m.at(x, y).region = static_cast<int>(r);
        }
    }

    expect(closestRegion(m, {1, 2}) == 0, "nearest region is the inner one");
    expect(closestRegion(m, {1, 2}, true) == 1, "outer-only search skips inner regions");

    RNG rng(1u);
    Guard outerGuard = makeGuard({1, 2}, {1, 0}, GuardMode::Patrol);
    outerGuard.kind = GuardKind::Outer;
    setupGoalRegion(outerGuard, rng, m);
    expect(outerGuard.regionGoal == 1, "outer guard off the patrol graph heads for an outer region");

    Guard innerGuard = makeGuard({1, 2}, {1, 0}, GuardMode::Patrol);
    innerGuard.kind = GuardKind::Inner;
    setupGoalRegion(innerGuard, rng, m);
    expect(innerGuard.regionGoal == 0, "inner guard takes the nearest region");

    // With only inner regions left, an outer guard has nowhere to go.
    m.patrolRegions[1].inner = true;
    Guard stranded = makeGuard({1, 2}, {1, 0}, GuardMode::Patrol);
    stranded.kind = GuardKind::Outer;
    setupGoalRegion(stranded, rng, m);
    expect(stranded.regionGoal == INVALID_REGION, "outer guard never re-seeds into an inner region");
}

// ---------------------------------------------------------------------------
// Visibility and sound
// ---------------------------------------------------------------------------

void test_visibility_open_floor() {
    Map m = makeOpenMap(41, 41);
    m.recomputeVisibility({20, 20});

    expect(m.at(20, 20).seen, "viewer cell is seen");
    expect(m.at(39, 20).seen, "cell 19 away is seen");
    expect(m.at(25, 25).seen, "nearby diagonal cell is seen");
    expect(!m.at(0, 0).seen, "far corner is beyond view distance");
}

void test_visibility_walls_and_monotonic() {
    Map m = makeOpenMap(21, 21);
    plotWallColumn(m, 12, 0, 20);
    m.cacheCellInfo();

    m.recomputeVisibility({5, 10});
    expect(m.at(12, 10).seen, "the wall face itself is seen");
    expect(!m.at(15, 10).seen, "cells behind a wall stay unseen");

    const int before = countSeen(m);
    const std::vector<Cell> snapshot = m.cells;

    m.recomputeVisibility({1, 1});
    expect(countSeen(m) >= before, "recomputing never reduces the seen count");
    for (size_t i = 0; i < snapshot.size(); ++i) {
        if (snapshot[i].seen && !m.cells[i].seen) {
            expect(false, "a seen cell became unseen");
            break;
        }
    }

    expect(m.playerCanSeeInDirection({11, 10}, {0, 1}), "open neighbor is see-through");
    expect(!m.playerCanSeeInDirection({11, 10}, {1, 0}), "wall neighbor blocks");
    expect(m.playerCanSeeInDirection({0, 0}, {-1, 0}), "off-map direction counts as open");

    m.markAllSeen();
    expect(m.allSeen() && m.percentSeen() == 100, "markAllSeen");
    m.markAllUnseen();
    expect(!m.allSeen() && m.percentSeen() == 0, "markAllUnseen");
}

void test_earshot() {
    Map m = makeOpenMap(20, 11);
    plotWallColumn(m, 10, 0, 10);
    m.cacheCellInfo();

    const std::vector<uint8_t> sealed = m.coordsInEarshot({8, 2}, PLAYER_NOISE_RADIUS_SQ);
    expect(sealed[static_cast<size_t>(2 * m.width + 8)] != 0, "origin is in earshot");
    expect(sealed[static_cast<size_t>(2 * m.width + 12)] == 0, "sound does not pass a wall");

    // Open a gap at the bottom; sound now bends around.
    m.at(10, 0).type = CellType::GroundWood;
    m.cacheCellInfo();

    const std::vector<uint8_t> gap = m.coordsInEarshot({8, 2}, PLAYER_NOISE_RADIUS_SQ);
    expect(gap[static_cast<size_t>(2 * m.width + 12)] != 0, "sound goes around through a gap");

    // Radius is straight-line, exclusive.
    const std::vector<uint8_t> near = m.coordsInEarshot({3, 5}, 9);
    expect(near[static_cast<size_t>(5 * m.width + 5)] != 0, "inside radius");
    expect(near[static_cast<size_t>(5 * m.width + 6)] == 0, "at radius is out of earshot");

    m.guards.push_back(makeGuard({12, 2}, {1, 0}, GuardMode::Patrol));
    m.guards.push_back(makeGuard({8, 9}, {1, 0}, GuardMode::Patrol));
    const std::vector<int> heard = m.guardsInEarshot({8, 2}, PLAYER_NOISE_RADIUS_SQ);
    expect(heard.size() == 2, "both guards hear the noise");
}

// ---------------------------------------------------------------------------
// Level generation
// ---------------------------------------------------------------------------

bool sameMap(const Map& a, const Map& b) {
    if (a.width != b.width || a.height != b.height) return false;
    if (a.posStart != b.posStart || a.totalLoot != b.totalLoot) return false;
    for (size_t i = 0; i < a.cells.size(); ++i) {
        if (a.cells[i].type != b.cells[i].type || a.cells[i].region != b.cells[i].region) return false;
    }
    if (a.items.size() != b.items.size() || a.guards.size() != b.guards.size()) return false;
    for (size_t i = 0; i < a.items.size(); ++i) {
        if (a.items[i].pos != b.items[i].pos || a.items[i].kind != b.items[i].kind) return false;
    }
    for (size_t i = 0; i < a.guards.size(); ++i) {
        if (a.guards[i].pos != b.guards[i].pos || a.guards[i].dir != b.guards[i].dir) return false;
    }
    return true;
}

void test_generation_deterministic() {
    for (int level = 0; level < 6; ++level) {
        const Map a = generateLevel(1234u, level);
        const Map b = generateLevel(1234u, level);
        expect(sameMap(a, b), "same seed and level must give the same map (level " + std::to_string(level) + ")");
    }

    const Map c = generateLevel(1u, 4);
    const Map d = generateLevel(2u, 4);
    expect(!sameMap(c, d), "different seeds should give different maps");
}

void test_generation_invariants() {
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        const int level = static_cast<int>(seed % 7);
        const Map m = generateLevel(seed, level);
        const std::string tag = " (seed " + std::to_string(seed) + ")";

        expect(!m.patrolRegions.empty(), "at least one patrol region" + tag);
        expect(m.inBounds(m.posStart), "start inside the map" + tag);
        expect(!tileDef(m.at(m.posStart).type).blocksPlayer, "start is walkable" + tag);
        expect(m.totalLoot == m.lootRemaining(), "totalLoot counts placed coins" + tag);

        // Region stamps agree with the region rectangles.
        for (int x = 0; x < m.width; ++x) {
            for (int y = 0; y < m.height; ++y) {
                const int r = m.at(x, y).region;
                if (r == INVALID_REGION) continue;
                expect(r >= 0 && r < static_cast<int>(m.patrolRegions.size()), "region index in range" + tag);
                expect(m.patrolRegions[static_cast<size_t>(r)].rect.contains({x, y}), "cell inside its region" + tag);
            }
        }
        for (size_t r = 0; r < m.patrolRegions.size(); ++r) {
            const Rect& rect = m.patrolRegions[r].rect;
            for (int x = rect.posMin.x; x < rect.posMax.x; ++x) {
                for (int y = rect.posMin.y; y < rect.posMax.y; ++y) {
                    expect(m.at(x, y).region == static_cast<int>(r), "region rect fully stamped" + tag);
                }
            }
        }

        // Patrol graph is connected.
        std::vector<uint8_t> reached(m.patrolRegions.size(), 0);
        std::vector<int> open = {0};
        reached[0] = 1;
        while (!open.empty()) {
            const int r = open.back();
            open.pop_back();
            for (const auto& route : m.patrolRoutes) {
                int n = -1;
                if (route.first == r) n = route.second;
                else if (route.second == r) n = route.first;
                if (n >= 0 && !reached[static_cast<size_t>(n)]) {
                    reached[static_cast<size_t>(n)] = 1;
                    open.push_back(n);
                }
            }
        }
        expect(std::all_of(reached.begin(), reached.end(), [](uint8_t v) { return v != 0; }),
               "patrol graph connected" + tag);

        // Items and guards.
        for (const Item& it : m.items) {
            expect(m.inBounds(it.pos), "item in bounds" + tag);
        }
        for (size_t i = 0; i < m.guards.size(); ++i) {
            const Guard& g = m.guards[i];
            expect(level > 0, "no guards on level 0" + tag);
            expect(m.at(g.pos).moveCost != INFINITE_COST, "guard stands on passable floor" + tag);
            expect(!m.isItemAt(g.pos), "guard not on an item" + tag);
            expect(m.guardIndexAt(g.pos) == static_cast<int>(i), "guards do not stack" + tag);

            const int r = m.at(g.pos).region;
            expect(r != INVALID_REGION, "guard spawns inside a patrol region" + tag);
            if (r != INVALID_REGION) {
                expect(m.patrolRegions[static_cast<size_t>(r)].inner == (g.kind == GuardKind::Inner),
                       "guard spawns in a region of its own kind" + tag);
            }
            expect(lengthSquared(g.pos - m.posStart) >= 64, "guard spawns away from the entrance" + tag);
        }
    }
}

void test_generation_retry_policy() {
    // Unsatisfiable: every attempt is rejected and the last one is kept.
    MansionGenOptions picky;
    picky.minPatrolRegions = 1000;

    RNG rngA(77u);
    const Map a = generateMap(rngA, 3, picky);
    expect(a.width > 0 && a.height > 0, "rejected layouts still yield a map");
    expect(static_cast<int>(a.patrolRegions.size()) < picky.minPatrolRegions, "threshold was never met");
    expect(a.inBounds(a.posStart) && !tileDef(a.at(a.posStart).type).blocksPlayer, "fallback map has a walkable start");
    expect(a.totalLoot == a.lootRemaining(), "fallback map tallies its loot");

    RNG rngB(77u);
    const Map b = generateMap(rngB, 3, picky);
    expect(sameMap(a, b), "exhausted retries stay deterministic");
    expect(rngA.nextU32() == rngB.nextU32(), "exhausted retries consume the same draws");

    RNG rngC(77u);
    const Map c = generateMap(rngC, 3);
    expect(!sameMap(a, c), "fallback map comes from a later attempt");

    // Reachable threshold: the result satisfies it.
    MansionGenOptions two;
    two.minPatrolRegions = 2;
    for (uint32_t seed = 30; seed < 35; ++seed) {
        RNG rng(seed);
        const Map m = generateMap(rng, 2, two);
        expect(m.patrolRegions.size() >= 2, "accepted layout meets the region threshold (seed " + std::to_string(seed) + ")");
    }
}

void test_generation_outfits_and_creaks() {
    int outfits = 0;
    int creaks = 0;
    int creaksDisabled = 0;

    MansionGenOptions noCreaks;
    noCreaks.creakyFloors = false;

    for (uint32_t seed = 100; seed < 110; ++seed) {
        const Map early = generateLevel(seed, 1);
        for (const Item& it : early.items) {
            expect(!isOutfit(it.kind), "no outfits before level 2");
        }
        for (const Cell& c : early.cells) {
            expect(c.type != CellType::GroundWoodCreaky, "no creaky floors before level 4");
        }

        const Map deep = generateLevel(seed, 6);
        for (const Item& it : deep.items) {
            if (isOutfit(it.kind)) ++outfits;
        }
        for (const Cell& c : deep.cells) {
            if (c.type == CellType::GroundWoodCreaky) ++creaks;
        }

        const Map quiet = generateLevel(seed, 6, noCreaks);
        for (const Cell& c : quiet.cells) {
            if (c.type == CellType::GroundWoodCreaky) ++creaksDisabled;
        }
    }

    expect(outfits > 0, "deeper levels place outfits");
    expect(creaks > 0, "deeper levels have some creaky boards");
    expect(creaksDisabled == 0, "creaky floors can be disabled");
}

// ---------------------------------------------------------------------------
// Guards
// ---------------------------------------------------------------------------

void test_guard_never_sees_behind() {
    Map m = makeOpenMap(11, 11);
    const GuardMode modes[] = {
        GuardMode::Patrol, GuardMode::Look, GuardMode::LookAtDisguised, GuardMode::Listen,
        GuardMode::ChaseVisibleTarget, GuardMode::MoveToLastSighting,
        GuardMode::MoveToLastSound, GuardMode::MoveToGuardShout,
    };
    const Vec2i behind[] = {{4, 5}, {4, 4}, {4, 6}, {2, 5}, {3, 7}};

    for (GuardMode mode : modes) {
        const Guard g = makeGuard({5, 5}, {1, 0}, mode);
        for (const Vec2i& p : behind) {
            for (int disguised = 0; disguised < 2; ++disguised) {
                Player player(p);
                player.disguised = disguised != 0;
                expect(!guardSeesThief(g, m, player, false),
                       std::string("guard perceives a thief behind it in mode ") + guardModeName(mode));
                expect(!guardSeesThief(g, m, player, true),
                       std::string("guard perceives a thief behind it during a chase in mode ") + guardModeName(mode));
            }
        }
    }

    // Sanity: the same thief in front is seen.
    const Guard g = makeGuard({5, 5}, {1, 0}, GuardMode::Patrol);
    expect(guardSeesThief(g, m, Player({7, 5}), false), "thief in front is seen");
}

void test_guard_sight_rules() {
    Map m = makeOpenMap(20, 11);

    const Guard patrol = makeGuard({2, 5}, {1, 0}, GuardMode::Patrol);
    expect(guardSeesThief(patrol, m, Player({8, 5}), false), "lit thief at d2=36 seen by patrol");
    expect(!guardSeesThief(patrol, m, Player({9, 5}), false), "patrol cutoff is d2 < 40");

    const Guard alert = makeGuard({2, 5}, {1, 0}, GuardMode::Look);
    expect(guardSeesThief(alert, m, Player({10, 5}), false), "alert guard sees further");

    // Unlit thief.
    m.at(4, 5).lit = false;
    expect(!guardSeesThief(patrol, m, Player({4, 5}), false), "patrol barely sees into the dark");

    // Concealment.
    Map hide = makeOpenMap(10, 10);
    Item table;
    table.pos = {5, 5};
    table.kind = ItemKind::Table;
    hide.items.push_back(table);
    hide.cacheCellInfo();

    Player under({5, 5});
    expect(under.hidden(hide, false), "a table hides the thief");
    expect(!under.hidden(hide, true), "nobody hides during a chase");
    under.disguised = true;
    expect(!under.hidden(hide, false), "a disguised thief does not crouch under tables");

    // Walls block line of sight.
    Map walled = makeOpenMap(12, 5);
    walled.at(5, 2).type = CellType::Wall1100;
    walled.cacheCellInfo();
    expect(!lineOfSight(walled, {2, 2}, {8, 2}), "wall blocks line of sight");
    expect(lineOfSight(walled, {2, 0}, {8, 0}), "clear row has line of sight");
}

void test_guard_lines_round_robin() {
    GuardLines lines;
    expect(std::string(lines.see.next()) == "WHO GOES THERE?", "first SEE line");
    expect(std::string(lines.see.next()) == "HUH?", "second SEE line");
    for (size_t i = 2; i < lines.see.count; ++i) lines.see.next();
    expect(std::string(lines.see.next()) == "WHO GOES THERE?", "SEE pool wraps around");

    expect(linesForStateChange(lines, GuardMode::Patrol, GuardMode::Patrol) == nullptr, "no line without a change");
    expect(linesForStateChange(lines, GuardMode::Patrol, GuardMode::ChaseVisibleTarget) == &lines.chase, "chase line");
    expect(linesForStateChange(lines, GuardMode::MoveToLastSighting, GuardMode::ChaseVisibleTarget) == nullptr,
           "re-acquiring the trail is silent");
    expect(linesForStateChange(lines, GuardMode::Listen, GuardMode::Patrol) == &lines.doneListening,
           "done listening line");
}

void test_shout_alerts_nearby_guard() {
    Map m = makeOpenMap(20, 20);
    Player player({10, 10});
    m.guards.push_back(makeGuard({8, 10}, {1, 0}, GuardMode::Look));
    m.guards.push_back(makeGuard({4, 10}, {-1, 0}, GuardMode::Patrol));

    RNG rng(7u);
    GuardLines lines;
    Popups popups;

    guardActAll(rng, false, popups, lines, m, player);

    expect(m.guards[0].mode == GuardMode::ChaseVisibleTarget, "guard that keeps seeing the thief gives chase");
    expect(popups.count(PopupType::GuardSpeech) >= 1, "entering a chase is announced");
    expect(m.guards[1].mode == GuardMode::Patrol, "listener has not reacted yet");
    expect(m.guards[1].hearingGuard, "shout is delivered within earshot");
    expect(m.guards[1].heardGuardPos == player.pos, "shout reports the thief's position");

    player.damagedLastTurn = false;
    popups.clear();
    guardActAll(rng, false, popups, lines, m, player);
    expect(m.guards[1].mode != GuardMode::Patrol, "listener responds to the shout on the next turn");
}

void test_scenario_patrol_ignores_distant_target() {
    Map m = makeOpenMap(30, 11);
    m.guards.push_back(makeGuard({20, 5}, {1, 0}, GuardMode::Patrol));
    Player player({10, 5});

    RNG rng(3u);
    GuardLines lines;
    Popups popups;
    guardActAll(rng, false, popups, lines, m, player);

    expect(m.guards[0].mode == GuardMode::Patrol, "patrol guard ignores a distant thief behind it");
    expect(player.health == player.maxHealth, "no damage");
}

void test_scenario_adjacent_chase_damage() {
    Map m = makeOpenMap(12, 12);
    m.guards.push_back(makeGuard({5, 5}, {1, 0}, GuardMode::ChaseVisibleTarget));
    Player player({6, 5});
    player.turnsRemainingUnderwater = PLAYER_AIR_TURNS;

    RNG rng(11u);
    GuardLines lines;
    Popups popups;

    guardActAll(rng, false, popups, lines, m, player);
    expect(player.health == PLAYER_MAX_HEALTH - 1, "first adjacent chase turn deals 1 damage");
    expect(popups.count(PopupType::Damage) == 1, "damage popup raised");

    player.damagedLastTurn = false;
    guardActAll(rng, false, popups, lines, m, player);
    expect(player.health == PLAYER_MAX_HEALTH - 2, "second adjacent chase turn deals 1 more");

    // A second chaser in the same turn does not double up.
    m.guards.push_back(makeGuard({6, 6}, {0, -1}, GuardMode::ChaseVisibleTarget));
    player.damagedLastTurn = false;
    guardActAll(rng, false, popups, lines, m, player);
    expect(player.health == PLAYER_MAX_HEALTH - 3, "at most 1 damage per turn");

    // Health floors at zero.
    player.health = 1;
    player.damagedLastTurn = false;
    guardActAll(rng, false, popups, lines, m, player);
    expect(player.health == 0 && player.dead(), "last hit kills");
    player.damagedLastTurn = false;
    guardActAll(rng, false, popups, lines, m, player);
    expect(player.health == 0, "health never goes negative");

    Player p2({0, 0}, 3);
    p2.applyDamage(10);
    expect(p2.health == 0, "applyDamage saturates");
}

void test_guards_never_share_a_cell() {
    for (uint32_t seed = 5; seed < 10; ++seed) {
        Map m = generateLevel(seed, 6);
        Player player(m.posStart);
        RNG rng(seed);
        GuardLines lines;
        Popups popups;

        for (int turn = 0; turn < 40; ++turn) {
            popups.clear();
            player.damagedLastTurn = false;
            guardActAll(rng, false, popups, lines, m, player);

            for (size_t i = 0; i < m.guards.size(); ++i) {
                expect(m.guardIndexAt(m.guards[i].pos) == static_cast<int>(i), "guards stacked after a turn");
                expect(m.guards[i].pos != player.pos, "guard stepped onto the thief");
            }
        }
    }
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

bool loggedMessage(const Game& game, const std::string& text) {
    for (const Message& m : game.messages()) {
        if (m.text == text) return true;
    }
    return false;
}

void test_scenario_collect_coin() {
    Map m = makeOpenMap(9, 7);
    m.posStart = {2, 3};
    Item coin;
    coin.pos = {4, 3};
    coin.kind = ItemKind::Coin;
    m.items.push_back(coin);
    m.totalLoot = 1;
    m.cacheCellInfo();

    Game game(42u);
    game.debugLoadMap(m);
    expect(game.player().pos == Vec2i{2, 3}, "player placed at the map's start");
    expect(!game.finishedLevel(), "loot left: level not complete");

    expect(game.applyPlayerIntent({1, 0}) == TurnOutcome::Moved, "step east");
    expect(game.player().pos == Vec2i{3, 3}, "moved one cell");
    expect(game.player().gold == 0, "no loot on plain floor");

    expect(game.applyPlayerIntent({1, 0}) == TurnOutcome::Moved, "step onto the coin");
    expect(game.player().gold == 1, "picking up a coin adds exactly 1 gold");
    expect(game.map().items.empty(), "the coin is removed");
    expect(game.map().allLootCollected(), "no loot remains");
    expect(loggedMessage(game, "YOU PICK UP 1 GOLD."), "pickup is logged");
    expect(game.finishedLevel(), "last coin on a fully seen map completes the level");
}

void test_player_bumps_and_slides() {
    Map m = makeOpenMap(9, 7);
    plotWallColumn(m, 5, 0, 6);
    m.cacheCellInfo();
    m.posStart = {4, 3};

    // Listens for a few turns; its countdown tracks elapsed time.
    Guard listener = makeGuard({1, 6}, {-1, 0}, GuardMode::Listen);
    listener.modeTimeout = 3;
    m.guards.push_back(listener);

    Game game(7u);
    game.debugLoadMap(m);

    expect(game.applyPlayerIntent({1, 0}) == TurnOutcome::Blocked, "walking into a wall is blocked");
    expect(game.player().pos == Vec2i{4, 3}, "blocked move leaves the player in place");
    expect(game.map().guards[0].modeTimeout == 3, "a blocked move spends no time");

    expect(game.applyPlayerIntent({0, 0}) == TurnOutcome::Moved, "waiting");
    expect(game.map().guards[0].modeTimeout == 2, "waiting spends a turn");

    expect(game.applyPlayerIntent({1, 1}) == TurnOutcome::Deflected, "diagonal into a wall slides");
    expect(game.player().pos == Vec2i{4, 4}, "slid along the open axis");
    expect(game.map().guards[0].modeTimeout == 1, "a slide spends a turn");

    expect(game.applyPlayerIntent({-1, 1}) == TurnOutcome::Moved, "open diagonal is a plain move");
    expect(game.player().pos == Vec2i{3, 5}, "diagonal step");
}

void test_one_way_window() {
    Map m = makeOpenMap(9, 7);
    m.at(4, 3).type = CellType::OneWayWindowE;
    m.cacheCellInfo();
    m.posStart = {5, 3};

    Game game(3u);
    game.debugLoadMap(m);

    expect(game.applyPlayerIntent({-1, 0}) == TurnOutcome::Blocked, "an east window refuses a westward step");
    expect(game.player().pos == Vec2i{5, 3}, "still outside the window");

    // Go around to the west side.
    game.applyPlayerIntent({0, 1});
    game.applyPlayerIntent({-1, 0});
    game.applyPlayerIntent({-1, 0});
    game.applyPlayerIntent({0, -1});
    expect(game.player().pos == Vec2i{3, 3}, "walked around the window");

    expect(game.applyPlayerIntent({1, 0}) == TurnOutcome::Moved, "an east window admits an eastward step");
    expect(game.player().pos == Vec2i{4, 3}, "standing in the window");
    expect(game.applyPlayerIntent({1, 0}) == TurnOutcome::Moved, "leave the window eastward");
    expect(game.player().pos == Vec2i{5, 3}, "through the window");
}

void test_creaky_floor_alerts_guard() {
    Map m = makeOpenMap(9, 11);
    m.at(4, 3).type = CellType::GroundWoodCreaky;
    m.cacheCellInfo();
    m.posStart = {2, 3};
    m.guards.push_back(makeGuard({4, 9}, {0, 1}, GuardMode::Patrol));

    Game game(5u);
    game.debugLoadMap(m);

    expect(game.applyPlayerIntent({1, 0}) == TurnOutcome::Moved, "step on plain floor");
    expect(!game.player().noisy, "plain floor is quiet");
    expect(game.map().guards[0].mode == GuardMode::Patrol, "guard undisturbed");

    expect(game.applyPlayerIntent({1, 0}) == TurnOutcome::Moved, "step on the creaky board");
    expect(game.player().noisy, "creaky board makes noise");
    expect(game.popups().count(PopupType::Noise) == 1, "noise popup raised");
    expect(loggedMessage(game, "THE FLOOR CREAKS."), "creak is logged");
    expect(game.map().guards[0].mode == GuardMode::Listen, "guard in earshot stops to listen");
    expect(game.map().guards[0].dir == Vec2i{0, -1}, "listener turns toward the sound");

    expect(game.applyPlayerIntent({0, 0}) == TurnOutcome::Moved, "wait on the board");
    expect(!game.player().noisy, "standing still on a creaky board is quiet");
}

void test_walk_off_finished_level() {
    Map m = makeOpenMap(7, 5);
    m.posStart = {0, 2};
    Item coin;
    coin.pos = {5, 2};
    coin.kind = ItemKind::Coin;
    m.items.push_back(coin);
    m.totalLoot = 1;
    m.cacheCellInfo();

    Game game(11u);
    game.debugLoadMap(m);

    expect(game.applyPlayerIntent({-1, 0}) == TurnOutcome::Blocked, "the map edge blocks an unfinished level");
    expect(game.level() == 0, "still on the first level");

    game.debugCollectAllLoot();
    game.debugMarkAllSeen();
    expect(game.finishedLevel(), "level complete");

    expect(game.applyPlayerIntent({-1, 0}) == TurnOutcome::LevelAdvanced, "walking off a finished level");
    expect(game.level() == 1, "next level");
    expect(!game.finishedLevel(), "new level starts unfinished");
    expect(game.player().pos == game.map().posStart, "player at the new entrance");
    expect(game.player().gold == 0, "gold resets per level");
}

void test_player_caught() {
    Settings s;
    s.playerHealth = 2;
    Game game(13u, s);

    Map m = makeOpenMap(7, 5);
    m.posStart = {3, 2};
    m.guards.push_back(makeGuard({4, 2}, {-1, 0}, GuardMode::ChaseVisibleTarget));
    game.debugLoadMap(m);

    expect(game.applyPlayerIntent({0, 0}) == TurnOutcome::Moved, "first turn next to a chaser");
    expect(game.player().health == 1, "hit once");
    expect(loggedMessage(game, "YOU ARE HIT!"), "hit is logged");

    expect(game.applyPlayerIntent({0, 0}) == TurnOutcome::Moved, "second turn next to a chaser");
    expect(game.player().health == 0 && game.player().dead(), "hit again at 1 health is fatal");
    expect(loggedMessage(game, "YOU HAVE BEEN CAUGHT!"), "capture is logged");

    expect(game.applyPlayerIntent({-1, 0}) == TurnOutcome::PlayerDead, "dead players do not act");
    expect(game.player().pos == Vec2i{3, 2}, "dead player stays put");
}

void test_scenario_level_complete_flag() {
    {
        Game game(42u);
        expect(!game.finishedLevel(), "fresh level not complete");

        game.debugCollectAllLoot();
        game.applyPlayerIntent({0, 0});
        expect(game.map().allSeen() == game.finishedLevel(), "loot alone: complete iff all seen");
    }
    {
        Game game(42u);
        game.debugMarkAllSeen();
        game.applyPlayerIntent({0, 0});
        expect(game.map().allLootCollected() == game.finishedLevel(), "seen alone: complete iff all loot");

        game.debugCollectAllLoot();
        game.applyPlayerIntent({0, 0});
        expect(game.finishedLevel(), "all loot and all seen completes the level");
    }
    {
        Game game(42u);
        game.debugMarkAllSeen();
        game.debugCollectAllLoot();
        game.debugMarkAllUnseen();
        game.applyPlayerIntent({0, 0});
        expect(!game.finishedLevel(), "forgetting the map un-completes the level");
    }
    {
        Game game(42u);
        game.debugMarkAllSeen();
        game.debugCollectAllLoot();
        expect(game.finishedLevel(), "debug hooks complete the level");

        game.toggleSeeAll();
        expect(game.finishedLevel(), "see-all toggle keeps a complete level complete");
        game.toggleDisguise();
        expect(game.finishedLevel(), "disguise toggle keeps a complete level complete");

        game.debugMarkAllUnseen();
        game.toggleSeeAll();
        expect(game.finishedLevel() == (game.map().allLootCollected() && game.map().allSeen()),
               "see-all toggle recomputes the flag from the map");
        game.toggleDisguise();
        expect(game.finishedLevel() == (game.map().allLootCollected() && game.map().allSeen()),
               "disguise toggle recomputes the flag from the map");
    }
}

void test_game_session() {
    Settings s;
    s.playerHealth = 3;
    s.initialLevel = 2;

    Game game(99u, s);
    expect(game.level() == 2, "initial level from settings");
    expect(game.player().health == 3 && game.player().maxHealth == 3, "player health from settings");
    expect(game.player().pos == game.map().posStart, "player starts at the entrance");
    expect(game.map().at(game.player().pos).seen, "entrance is visible");

    Game twin(99u, s);
    expect(sameMap(game.map(), twin.map()), "a session replays from its seed");

    game.advanceToNextLevel();
    expect(game.level() == 3, "advance increments the level");
    expect(game.player().gold == 0 && !game.player().disguised, "advance resets the player");
    expect(game.player().health == 3, "advance keeps health");

    game.restart();
    expect(game.level() == 2, "restart returns to the initial level");

    game.toggleDisguise();
    expect(game.player().disguised, "toggleDisguise");
    game.toggleSeeAll();
    expect(game.seeAll(), "toggleSeeAll");
    for (size_t i = 0; i < game.map().guards.size(); ++i) {
        expect(game.guardVisibleToPlayer(i), "see-all shows every guard");
    }

    // Waiting always spends the turn.
    expect(game.applyPlayerIntent({0, 0}) == TurnOutcome::Moved, "waiting is a move");
}

void test_message_log() {
    Game game(1u);
    const size_t base = game.messages().size();

    game.pushMsg("HELLO.", MessageKind::Info);
    game.pushMsg("HELLO.", MessageKind::Info);
    expect(game.messages().size() == base + 1, "duplicates coalesce");
    expect(game.messages().back().repeat == 2, "repeat counter");

    for (int i = 0; i < 500; ++i) game.pushMsg("LINE " + std::to_string(i));
    expect(game.messages().size() <= 401, "scrollback is bounded");
    expect(game.messages().back().text == "LINE 499", "newest message kept");
}

void test_outfit_swap() {
    Map m = makeOpenMap(5, 5);
    Item outfit;
    outfit.pos = {2, 2};
    outfit.kind = ItemKind::Outfit2;
    m.items.push_back(outfit);

    ItemKind got = ItemKind::Outfit1;
    expect(m.isOutfitAt({2, 2}), "outfit present");
    expect(m.tryUseOutfitAt({2, 2}, ItemKind::Outfit1, got), "swap clothes for uniform");
    expect(got == ItemKind::Outfit2, "now wearing the uniform");
    expect(m.items[0].kind == ItemKind::Outfit1, "own clothes left behind");
    expect(!m.tryUseOutfitAt({2, 2}, ItemKind::Outfit1, got), "same outfit: nothing to swap");

    // Bumping into an outfit puts it on.
    Map room = makeOpenMap(7, 5);
    Item uniform;
    uniform.pos = {4, 2};
    uniform.kind = ItemKind::Outfit2;
    room.items.push_back(uniform);
    room.posStart = {3, 2};
    room.cacheCellInfo();

    Game game(5u);
    game.debugLoadMap(room);
    expect(!game.player().disguised, "starts in own clothes");

    expect(game.applyPlayerIntent({1, 0}) == TurnOutcome::Used, "bumping an outfit uses it");
    expect(game.player().pos == Vec2i{3, 2}, "using an outfit does not move the player");
    expect(game.player().disguised, "wearing the uniform");
    expect(game.map().items[0].kind == ItemKind::Outfit1, "own clothes left in its place");
    expect(loggedMessage(game, "YOU PUT ON SERVANT UNIFORM."), "outfit change is logged");

    expect(game.applyPlayerIntent({1, 0}) == TurnOutcome::Used, "bump again to change back");
    expect(!game.player().disguised, "back in own clothes");
    expect(game.map().items[0].kind == ItemKind::Outfit2, "uniform back on the floor");
}

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

void test_settings_roundtrip() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "disguiser_test_settings.ini";
    const std::string p = path.string();

    expect(writeDefaultSettings(p), "writeDefaultSettings");
    const Settings defaults = loadSettings(p);
    expect(defaults.seed == 0 && defaults.initialLevel == 0 && defaults.playerHealth == 5,
           "default file loads as defaults");
    expect(defaults.creakyFloors && !defaults.seeAll, "default flags");

    expect(updateIniKey(p, "seed", "1234"), "updateIniKey existing key");
    expect(updateIniKey(p, "player_health", "500"), "updateIniKey out of range value");
    expect(updateIniKey(p, "see_all", "maybe"), "updateIniKey bad bool");

    Settings s;
    std::string err;
    expect(loadSettingsFile(p, s, &err), "loadSettingsFile opens");
    expect(s.seed == 1234u, "seed updated");
    expect(s.playerHealth == 99, "player_health clamped");
    expect(!s.seeAll, "bad bool keeps default");
    expect(err.find("see_all") != std::string::npos, "bad value reported");

    Settings missing;
    std::string err2;
    expect(!loadSettingsFile((fs::temp_directory_path() / "disguiser_no_such_file.ini").string(), missing, &err2),
           "missing file reported");
    expect(!err2.empty(), "missing file error text");

    std::error_code ec;
    fs::remove(path, ec);
}

} // namespace

int main() {
    std::cout << "Running Disguiser tests...\n";

    test_rng_reproducible();
    test_vec2i_math();
    test_update_dir();
    test_tile_catalog();

    test_distance_field_weights();
    test_corner_cutting_forbidden();
    test_closest_region();
    test_goal_region_follows_guard_kind();

    test_visibility_open_floor();
    test_visibility_walls_and_monotonic();
    test_earshot();

    test_generation_deterministic();
    test_generation_invariants();
    test_generation_retry_policy();
    test_generation_outfits_and_creaks();

    test_guard_never_sees_behind();
    test_guard_sight_rules();
    test_guard_lines_round_robin();
    test_shout_alerts_nearby_guard();
    test_scenario_patrol_ignores_distant_target();
    test_scenario_adjacent_chase_damage();
    test_guards_never_share_a_cell();

    test_scenario_collect_coin();
    test_player_bumps_and_slides();
    test_one_way_window();
    test_creaky_floor_alerts_guard();
    test_walk_off_finished_level();
    test_player_caught();
    test_scenario_level_complete_flag();
    test_game_session();
    test_message_log();
    test_outfit_swap();

    test_settings_roundtrip();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
