#pragma once

#include "common.hpp"

#include <functional>
#include <vector>

struct Map;

// Dijkstra helpers for 8-way grid pathing.
//
// Conventions:
//   - moveCost(from, to) is the cost of stepping from `from` into the
//     adjacent cell `to`, NOT including the direction weight. Return
//     INFINITE_COST to forbid the step (walls, corner cutting).
//   - Every step also pays a direction weight: 2 for cardinal steps, 3 for
//     diagonal ones, an exact-integer stand-in for 1 : sqrt(2).
//   - Result grids are row-major (y * width + x). Unreached cells hold
//     INFINITE_COST.

using MoveCostFn = std::function<int(Vec2i from, Vec2i to)>;
using AcceptCellFn = std::function<bool(int x, int y)>;

constexpr int CARDINAL_STEP_COST = 2;
constexpr int DIAGONAL_STEP_COST = 3;

struct DijkstraSeed {
    int cost = 0;
    Vec2i pos;
};

// Multi-source cost field.
std::vector<int> dijkstraField(
    int width,
    int height,
    const std::vector<DijkstraSeed>& seeds,
    const MoveCostFn& moveCost);

// Expands outward from `start` and returns the index of the first cell
// dequeued for which accept(x,y) holds, or -1 if none is reachable.
int dijkstraNearest(
    int width,
    int height,
    Vec2i start,
    const MoveCostFn& moveCost,
    const AcceptCellFn& accept);

// ---------------------------------------------------------------------------
// Guard pathing over a generated map (costs from Map::guardMoveCost).
// ---------------------------------------------------------------------------

std::vector<int> computeDistanceField(const Map& map, const std::vector<DijkstraSeed>& seeds);

// Single seed at cost 0.
std::vector<int> computeDistancesToPosition(const Map& map, Vec2i goal);

// Every cell of the patrol region, seeded with its own move cost.
std::vector<int> computeDistancesToRegion(const Map& map, int region);

// Region of the nearest (by path cost) cell that belongs to one, or
// INVALID_REGION. With `outerOnly`, inner regions are skipped.
int closestRegion(const Map& map, Vec2i pos, bool outerOnly = false);
