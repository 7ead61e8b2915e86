#include "map.hpp"

#include <deque>

// Sound spreads as a 4-connected flood fill. It stops at sound-blocking
// cells (walls) and at a straight-line radius from the origin, so it can
// travel around a corner but not through a wall.

namespace {

constexpr int SOUND_NEIGHBORS[4][2] = {
    {-1, 0}, {1, 0}, {0, -1}, {0, 1}
};

} // namespace

std::vector<uint8_t> Map::coordsInEarshot(Vec2i origin, int radiusSquared) const {
    std::vector<uint8_t> heard(cells.size(), 0);
    if (!inBounds(origin)) return heard;

    auto idx = [&](Vec2i p) { return static_cast<size_t>(p.y * width + p.x); };

    std::deque<Vec2i> open;
    heard[idx(origin)] = 1;
    open.push_back(origin);

    while (!open.empty()) {
        const Vec2i p = open.front();
        open.pop_front();

        for (const auto& dv : SOUND_NEIGHBORS) {
            const Vec2i n{p.x + dv[0], p.y + dv[1]};
            if (!inBounds(n)) continue;
            if (heard[idx(n)]) continue;
            if (lengthSquared(n - origin) >= radiusSquared) continue;
            if (at(n).blocksSound) continue;

            heard[idx(n)] = 1;
            open.push_back(n);
        }
    }

    return heard;
}

std::vector<int> Map::guardsInEarshot(Vec2i origin, int radiusSquared) const {
    std::vector<int> out;
    const std::vector<uint8_t> heard = coordsInEarshot(origin, radiusSquared);
    for (size_t i = 0; i < guards.size(); ++i) {
        const Vec2i p = guards[i].pos;
        if (!inBounds(p)) continue;
        if (heard[static_cast<size_t>(p.y * width + p.x)]) out.push_back(static_cast<int>(i));
    }
    return out;
}
