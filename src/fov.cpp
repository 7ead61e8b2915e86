#include "map.hpp"

// Player visibility: recursive shadow casting through cell "portals".
//
// All math is on doubled coordinates so cell corners land on integers. The
// viewer's cell spans (-1,-1)..(1,1); a frustum is a pair of edge vectors
// (left, right) relative to the viewer, and a direction lies inside it when
// it is neither right of `right` nor left of `left`.

namespace {

// Radius 20 cells, squared, in doubled coordinates.
constexpr int VIEW_DIST_SQ = 1600;

struct PortalInfo {
    // Left and right corners of the portal relative to the cell centre.
    int lx, ly;
    int rx, ry;
    // Neighbor cell on the far side of the portal.
    int nx, ny;
};

constexpr PortalInfo PORTAL[4] = {
    // lx, ly   rx, ry   nx, ny
    {-1, -1,  -1,  1,  -1,  0},
    {-1,  1,   1,  1,   0,  1},
    { 1,  1,   1, -1,   1,  0},
    { 1, -1,  -1, -1,   0, -1},
};

inline bool aRightOfB(int ax, int ay, int bx, int by) {
    return ax * by > ay * bx;
}

void computeVisibility(Map& map,
                       int viewerX, int viewerY,
                       int targetX, int targetY,
                       int ldx, int ldy,
                       int rdx, int rdy) {
    if (!map.inBounds(targetX, targetY)) return;

    const int dx = 2 * (targetX - viewerX);
    const int dy = 2 * (targetY - viewerY);

    if (dx * dx + dy * dy > VIEW_DIST_SQ) return;

    map.at(targetX, targetY).seen = true;

    if (map.blocksPlayerSight(targetX, targetY)) return;

    // Diagonal neighbors whose shared corner falls inside the frustum.
    for (int x = 0; x < 2; ++x) {
        for (int y = 0; y < 2; ++y) {
            const int nx = targetX + 2 * x - 1;
            const int ny = targetY + 2 * y - 1;
            const int cdx = dx + 2 * x - 1;
            const int cdy = dy + 2 * y - 1;

            if (map.inBounds(nx, ny) &&
                !aRightOfB(ldx, ldy, cdx, cdy) &&
                !aRightOfB(cdx, cdy, rdx, rdy)) {
                map.at(nx, ny).seen = true;
            }
        }
    }

    for (const PortalInfo& portal : PORTAL) {
        const int pldx = dx + portal.lx;
        const int pldy = dy + portal.ly;
        const int prdx = dx + portal.rx;
        const int prdy = dy + portal.ry;

        // Clip the portal against the frustum.
        int cldx = pldx, cldy = pldy;
        if (aRightOfB(ldx, ldy, pldx, pldy)) {
            cldx = ldx;
            cldy = ldy;
        }
        int crdx = rdx, crdy = rdy;
        if (aRightOfB(rdx, rdy, prdx, prdy)) {
            crdx = prdx;
            crdy = prdy;
        }

        // Recurse only through a span of positive width.
        if (aRightOfB(crdx, crdy, cldx, cldy)) {
            computeVisibility(map,
                              viewerX, viewerY,
                              targetX + portal.nx, targetY + portal.ny,
                              cldx, cldy,
                              crdx, crdy);
        }
    }
}

} // namespace

void Map::recomputeVisibility(Vec2i viewer) {
    for (const PortalInfo& portal : PORTAL) {
        computeVisibility(*this,
                          viewer.x, viewer.y,
                          viewer.x, viewer.y,
                          portal.lx, portal.ly,
                          portal.rx, portal.ry);
    }
}

bool Map::playerCanSeeInDirection(Vec2i viewer, Vec2i dir) const {
    const Vec2i p = viewer + dir;
    if (!inBounds(p)) return true;
    return !blocksPlayerSight(p.x, p.y);
}

bool Map::allSeen() const {
    for (const Cell& c : cells) {
        if (!c.seen) return false;
    }
    return true;
}

int Map::percentSeen() const {
    if (cells.empty()) return 100;
    size_t n = 0;
    for (const Cell& c : cells) {
        if (c.seen) ++n;
    }
    return static_cast<int>((n * 100) / cells.size());
}

void Map::markAllSeen() {
    for (Cell& c : cells) c.seen = true;
}

void Map::markAllUnseen() {
    for (Cell& c : cells) c.seen = false;
}
