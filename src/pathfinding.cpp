#include "pathfinding.hpp"

#include "map.hpp"

#include <algorithm>
#include <cstdint>
#include <queue>

namespace {

inline bool inBounds(int w, int h, int x, int y) {
    return x >= 0 && y >= 0 && x < w && y < h;
}

inline int idxOf(int w, int x, int y) {
    return y * w + x;
}

// Four cardinals, then the four distinct diagonals.
constexpr int DIRS8[8][3] = {
    {1, 0, CARDINAL_STEP_COST}, {-1, 0, CARDINAL_STEP_COST},
    {0, 1, CARDINAL_STEP_COST}, {0, -1, CARDINAL_STEP_COST},
    {-1, -1, DIAGONAL_STEP_COST}, {1, -1, DIAGONAL_STEP_COST},
    {-1, 1, DIAGONAL_STEP_COST}, {1, 1, DIAGONAL_STEP_COST},
};

using Node = std::pair<int, int>; // (cost, idx)
using MinQueue = std::priority_queue<Node, std::vector<Node>, std::greater<Node>>;

// Pushes the neighbors of cell i (settled at cost `costHere`).
void relaxNeighbors(int width, int height, int i, int costHere,
                    const MoveCostFn& moveCost, const std::vector<int>& dist, MinQueue& pq) {
    const int x = i % width;
    const int y = i / width;

    for (const auto& dv : DIRS8) {
        const int nx = x + dv[0];
        const int ny = y + dv[1];
        if (!inBounds(width, height, nx, ny)) continue;

        const int step = moveCost({x, y}, {nx, ny});
        if (step == INFINITE_COST) continue;

        const int ncost = costHere + step + dv[2];
        const int ni = idxOf(width, nx, ny);
        if (ncost < dist[static_cast<size_t>(ni)]) {
            pq.push({ncost, ni});
        }
    }
}

} // namespace

std::vector<int> dijkstraField(
    int width,
    int height,
    const std::vector<DijkstraSeed>& seeds,
    const MoveCostFn& moveCost)
{
    std::vector<int> dist(static_cast<size_t>(std::max(0, width) * std::max(0, height)), INFINITE_COST);
    if (width <= 0 || height <= 0) return dist;

    MinQueue pq;
    for (const DijkstraSeed& s : seeds) {
        if (!inBounds(width, height, s.pos.x, s.pos.y)) continue;
        if (s.cost == INFINITE_COST) continue;
        pq.push({s.cost, idxOf(width, s.pos.x, s.pos.y)});
    }

    // Lazy deletion: a cell is settled the first time it is popped.
    while (!pq.empty()) {
        const Node cur = pq.top();
        pq.pop();

        const int costHere = cur.first;
        const int i = cur.second;
        if (costHere >= dist[static_cast<size_t>(i)]) continue;
        dist[static_cast<size_t>(i)] = costHere;

        relaxNeighbors(width, height, i, costHere, moveCost, dist, pq);
    }

    return dist;
}

int dijkstraNearest(
    int width,
    int height,
    Vec2i start,
    const MoveCostFn& moveCost,
    const AcceptCellFn& accept)
{
    if (width <= 0 || height <= 0) return -1;
    if (!inBounds(width, height, start.x, start.y)) return -1;

    std::vector<int> dist(static_cast<size_t>(width * height), INFINITE_COST);

    MinQueue pq;
    pq.push({0, idxOf(width, start.x, start.y)});

    while (!pq.empty()) {
        const Node cur = pq.top();
        pq.pop();

        const int costHere = cur.first;
        const int i = cur.second;

        if (accept(i % width, i / width)) return i;

        if (costHere >= dist[static_cast<size_t>(i)]) continue;
        dist[static_cast<size_t>(i)] = costHere;

        relaxNeighbors(width, height, i, costHere, moveCost, dist, pq);
    }

    return -1;
}

std::vector<int> computeDistanceField(const Map& map, const std::vector<DijkstraSeed>& seeds) {
    return dijkstraField(map.width, map.height, seeds, [&](Vec2i from, Vec2i to) {
        return map.guardMoveCost(from, to);
    });
}

std::vector<int> computeDistancesToPosition(const Map& map, Vec2i goal) {
    if (!map.inBounds(goal)) return std::vector<int>(map.cells.size(), INFINITE_COST);
    return computeDistanceField(map, {DijkstraSeed{0, goal}});
}

std::vector<int> computeDistancesToRegion(const Map& map, int region) {
    if (region < 0 || region >= static_cast<int>(map.patrolRegions.size())) {
        return std::vector<int>(map.cells.size(), INFINITE_COST);
    }

    const Rect& r = map.patrolRegions[static_cast<size_t>(region)].rect;

    std::vector<DijkstraSeed> seeds;
    seeds.reserve(static_cast<size_t>(std::max(0, r.area())));
    for (int y = r.posMin.y; y < r.posMax.y; ++y) {
        for (int x = r.posMin.x; x < r.posMax.x; ++x) {
            seeds.push_back({map.at(x, y).moveCost, {x, y}});
        }
    }

    return computeDistanceField(map, seeds);
}

int closestRegion(const Map& map, Vec2i pos, bool outerOnly) {
    const int i = dijkstraNearest(map.width, map.height, pos,
        [&](Vec2i from, Vec2i to) { return map.guardMoveCost(from, to); },
        [&](int x, int y) {
            const int r = map.at(x, y).region;
            if (r == INVALID_REGION) return false;
            return !outerOnly || !map.patrolRegions[static_cast<size_t>(r)].inner;
        });

    if (i < 0) return INVALID_REGION;
    return map.cells[static_cast<size_t>(i)].region;
}
