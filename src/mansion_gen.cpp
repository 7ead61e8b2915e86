#include "mansion_gen.hpp"

#include "guard.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace {

constexpr int OUTER_BORDER = MANSION_OUTER_BORDER;
constexpr int ROOM_SIZE_X = MANSION_ROOM_SIZE_X;
constexpr int ROOM_SIZE_Y = MANSION_ROOM_SIZE_Y;

constexpr int GENERATION_ATTEMPTS = 100;
constexpr int PLACEMENT_TRIES = 1000;

// Dense 2D array indexed (x, y).
template <typename T>
struct Grid2 {
    int sx = 0;
    int sy = 0;
    std::vector<T> v;

    Grid2(int x, int y, T init) : sx(x), sy(y), v(static_cast<size_t>(x * y), init) {}

    T& operator()(int x, int y) { return v[static_cast<size_t>(y * sx + x)]; }
    const T& operator()(int x, int y) const { return v[static_cast<size_t>(y * sx + x)]; }
};

enum class RoomType : uint8_t {
    Exterior = 0,
    PublicCourtyard,
    PublicRoom,
    PrivateCourtyard,
    PrivateRoom,
};

inline bool isCourtyard(RoomType t) {
    return t == RoomType::PublicCourtyard || t == RoomType::PrivateCourtyard;
}

struct Room {
    RoomType type = RoomType::Exterior;
    int group = 0;
    int depth = 0;
    bool deadEnd = false;
    bool hasPatroller = false;
    GuardKind patroller = GuardKind::Outer;
    // Interior floor, half-open.
    Vec2i posMin;
    Vec2i posMax;
    std::vector<int> edges;
};

// A straight run of wall cells shared by two rooms. `roomLeft` lies to the
// left of `dir` (rotated +90 degrees), `roomRight` to the right.
struct Adjacency {
    Vec2i origin;
    Vec2i dir;
    int length = 0;
    int roomLeft = 0;
    int roomRight = 0;
    bool door = false;
};

// Generation-time state shared by the passes below.
struct Layout {
    Grid2<uint8_t> inside;   // room cell is enclosed (vs. courtyard)
    Grid2<int> offsetX;      // x of vertical wall lines, (roomsX+1) x roomsY
    Grid2<int> offsetY;      // y of horizontal wall lines, roomsX x (roomsY+1)
    Grid2<int> roomIndex;
    std::vector<Room> rooms;
    std::vector<Adjacency> adjacencies;
    // Mirror partner of each adjacency (itself when unpaired).
    std::vector<int> mirrorOf;

    Layout(int roomsX, int roomsY)
        : inside(roomsX, roomsY, 1),
          offsetX(roomsX + 1, roomsY, 0),
          offsetY(roomsX, roomsY + 1, 0),
          roomIndex(roomsX, roomsY, 0) {}

    int roomsX() const { return inside.sx; }
    int roomsY() const { return inside.sy; }
};

// ---------------------------------------------------------------------------
// Room grid and wall lines
// ---------------------------------------------------------------------------

void makeRoomGrid(Layout& L, RNG& rng) {
    const int sx = L.roomsX();
    const int sy = L.roomsY();
    const int halfX = (sx + 1) / 2;

    for (int i = 0; i < (sy * halfX) / 4; ++i) {
        const int x = rng.range(0, halfX - 1);
        const int y = rng.range(0, sy - 1);
        L.inside(x, y) = 0;
    }

    for (int y = 0; y < sy; ++y) {
        for (int x = halfX; x < sx; ++x) {
            L.inside(x, y) = L.inside((sx - 1) - x, y);
        }
    }
}

void offsetWalls(Layout& L, RNG& rng) {
    const int rx = L.roomsX();
    const int ry = L.roomsY();
    Grid2<int>& ox = L.offsetX;
    Grid2<int>& oy = L.offsetY;

    // Outer wall lines move as a unit.
    {
        const int i = rng.range(0, 2) - 1;
        for (int y = 0; y < ry; ++y) ox(0, y) = i;
    }
    {
        const int i = rng.range(0, 2) - 1;
        for (int y = 0; y < ry; ++y) ox(rx, y) = i;
    }
    {
        const int i = rng.range(0, 2) - 1;
        for (int x = 0; x < rx; ++x) oy(x, 0) = i;
    }
    {
        const int i = rng.range(0, 2) - 1;
        for (int x = 0; x < rx; ++x) oy(x, ry) = i;
    }

    for (int x = 1; x < rx; ++x) {
        for (int y = 0; y < ry; ++y) {
            ox(x, y) = rng.range(0, 2) - 1;
        }
    }

    for (int x = 0; x < rx; ++x) {
        for (int y = 1; y < ry; ++y) {
            oy(x, y) = rng.range(0, 2) - 1;
        }
    }

    // At each interior corner, one of the two crossing lines stays straight.
    for (int x = 1; x < rx; ++x) {
        for (int y = 1; y < ry; ++y) {
            if (rng.coin()) {
                ox(x, y) = ox(x, y - 1);
            } else {
                oy(x, y) = oy(x - 1, y);
            }
        }
    }

    // Mirror left to right. Vertical lines reflect as 1 - offset because a
    // wall occupies the cell at its offset.
    if ((rx & 1) == 0) {
        const int xMid = rx / 2;
        for (int y = 0; y < ry; ++y) ox(xMid, y) = 0;
    }

    for (int x = 0; x < (rx + 1) / 2; ++x) {
        for (int y = 0; y < ry; ++y) {
            ox(rx - x, y) = 1 - ox(x, y);
        }
    }

    for (int x = 0; x < rx / 2; ++x) {
        for (int y = 0; y < ry + 1; ++y) {
            oy((rx - 1) - x, y) = oy(x, y);
        }
    }

    int roomOffsetX = -1000000;
    int roomOffsetY = -1000000;

    for (int y = 0; y < ry; ++y) roomOffsetX = std::max(roomOffsetX, -ox(0, y));
    for (int x = 0; x < rx; ++x) roomOffsetY = std::max(roomOffsetY, -oy(x, 0));

    roomOffsetX += OUTER_BORDER;
    roomOffsetY += OUTER_BORDER;

    for (int x = 0; x < rx + 1; ++x) {
        for (int y = 0; y < ry; ++y) {
            ox(x, y) += roomOffsetX + x * ROOM_SIZE_X;
        }
    }

    for (int x = 0; x < rx; ++x) {
        for (int y = 0; y < ry + 1; ++y) {
            oy(x, y) += roomOffsetY + y * ROOM_SIZE_Y;
        }
    }
}

void plotNSWall(Map& map, int x0, int y0, int y1) {
    for (int y = y0; y <= y1; ++y) map.at(x0, y).type = CellType::Wall0000;
}

void plotEWWall(Map& map, int x0, int y0, int x1) {
    for (int x = x0; x <= x1; ++x) map.at(x, y0).type = CellType::Wall0000;
}

Map plotWalls(const Layout& L) {
    const int cx = L.roomsX();
    const int cy = L.roomsY();

    int mapX = 0;
    int mapY = 0;
    for (int y = 0; y < cy; ++y) mapX = std::max(mapX, L.offsetX(cx, y));
    for (int x = 0; x < cx; ++x) mapY = std::max(mapY, L.offsetY(x, cy));
    mapX += OUTER_BORDER + 1;
    mapY += OUTER_BORDER + 1;

    Map map(mapX, mapY);

    // Grass under every room cell (plugs gaps left by jittered walls), lit.
    for (int rx = 0; rx < cx; ++rx) {
        for (int ry = 0; ry < cy; ++ry) {
            const int x0 = L.offsetX(rx, ry);
            const int x1 = L.offsetX(rx + 1, ry) + 1;
            const int y0 = L.offsetY(rx, ry);
            const int y1 = L.offsetY(rx, ry + 1) + 1;

            for (int x = x0; x < x1; ++x) {
                for (int y = y0; y < y1; ++y) {
                    Cell& c = map.at(x, y);
                    c.type = CellType::GroundGrass;
                    c.lit = true;
                }
            }
        }
    }

    // Room outlines. Courtyards only get walls on the mansion boundary.
    for (int rx = 0; rx < cx; ++rx) {
        for (int ry = 0; ry < cy; ++ry) {
            const bool indoors = L.inside(rx, ry) != 0;

            const int x0 = L.offsetX(rx, ry);
            const int x1 = L.offsetX(rx + 1, ry);
            const int y0 = L.offsetY(rx, ry);
            const int y1 = L.offsetY(rx, ry + 1);

            if (rx == 0 || indoors) plotNSWall(map, x0, y0, y1);
            if (rx == cx - 1 || indoors) plotNSWall(map, x1, y0, y1);
            if (ry == 0 || indoors) plotEWWall(map, x0, y0, x1);
            if (ry == cy - 1 || indoors) plotEWWall(map, x0, y1, x1);
        }
    }

    return map;
}

uint32_t neighboringWalls(const Map& map, int x, int y) {
    uint32_t bits = 0;
    if (y < map.height - 1 && isWall(map.at(x, y + 1).type)) bits |= 8;
    if (y > 0 && isWall(map.at(x, y - 1).type)) bits |= 4;
    if (x < map.width - 1 && isWall(map.at(x + 1, y).type)) bits |= 2;
    if (x > 0 && isWall(map.at(x - 1, y).type)) bits |= 1;
    return bits;
}

void fixupWalls(Map& map) {
    for (int x = 0; x < map.width; ++x) {
        for (int y = 0; y < map.height; ++y) {
            if (isWall(map.at(x, y).type)) {
                map.at(x, y).type = wallTypeFromNeighbors(neighboringWalls(map, x, y));
            }
        }
    }
}

// ---------------------------------------------------------------------------
// Adjacency graph
// ---------------------------------------------------------------------------

int addAdjacency(Layout& L, Vec2i origin, Vec2i dir, int length, int roomLeft, int roomRight) {
    const int i = static_cast<int>(L.adjacencies.size());
    Adjacency a;
    a.origin = origin;
    a.dir = dir;
    a.length = length;
    a.roomLeft = roomLeft;
    a.roomRight = roomRight;
    L.adjacencies.push_back(a);
    L.mirrorOf.push_back(i);
    return i;
}

void pairMirror(Layout& L, int a, int b) {
    L.mirrorOf[static_cast<size_t>(a)] = b;
    L.mirrorOf[static_cast<size_t>(b)] = a;
}

// Reverse an edge in place so mirrored pairs run in opposite directions.
void flipAdjacency(Adjacency& a) {
    a.origin += a.dir * (a.length - 1);
    a.dir = -a.dir;
    std::swap(a.roomLeft, a.roomRight);
}

void computeAdjacencies(Layout& L) {
    const int roomsX = L.roomsX();
    const int roomsY = L.roomsY();
    const Grid2<int>& ox = L.offsetX;
    const Grid2<int>& oy = L.offsetY;
    const Grid2<int>& ri = L.roomIndex;

    // Horizontal wall lines, south to north. Where two rows of rooms are
    // staggered, a line splits into up to three runs per room.
    {
        std::vector<std::vector<int>> rows;

        {
            std::vector<int> row;
            const int ry = 0;
            for (int rx = 0; rx < roomsX; ++rx) {
                const int x0 = ox(rx, ry);
                const int x1 = ox(rx + 1, ry);
                const int y = oy(rx, ry);
                row.push_back(addAdjacency(L, {x0 + 1, y}, {1, 0}, x1 - (x0 + 1), ri(rx, ry), 0));
            }
            rows.push_back(row);
        }

        for (int ry = 1; ry < roomsY; ++ry) {
            std::vector<int> row;

            for (int rx = 0; rx < roomsX; ++rx) {
                const int x0Upper = ox(rx, ry);
                const int x0Lower = ox(rx, ry - 1);
                const int x1Upper = ox(rx + 1, ry);
                const int x1Lower = ox(rx + 1, ry - 1);
                const int x0 = std::max(x0Lower, x0Upper);
                const int x1 = std::min(x1Lower, x1Upper);
                const int y = oy(rx, ry);

                if (rx > 0 && x0Lower - x0Upper > 1) {
                    row.push_back(addAdjacency(L, {x0Upper + 1, y}, {1, 0}, x0Lower - (x0Upper + 1),
                                               ri(rx, ry), ri(rx - 1, ry - 1)));
                }

                if (x1 - x0 > 1) {
                    row.push_back(addAdjacency(L, {x0 + 1, y}, {1, 0}, x1 - (x0 + 1),
                                               ri(rx, ry), ri(rx, ry - 1)));
                }

                if (rx + 1 < roomsX && x1Upper - x1Lower > 1) {
                    row.push_back(addAdjacency(L, {x1Lower + 1, y}, {1, 0}, x1Upper - (x1Lower + 1),
                                               ri(rx, ry), ri(rx + 1, ry - 1)));
                }
            }

            rows.push_back(row);
        }

        {
            std::vector<int> row;
            const int ry = roomsY;
            for (int rx = 0; rx < roomsX; ++rx) {
                const int x0 = ox(rx, ry - 1);
                const int x1 = ox(rx + 1, ry - 1);
                const int y = oy(rx, ry);
                row.push_back(addAdjacency(L, {x0 + 1, y}, {1, 0}, x1 - (x0 + 1), 0, ri(rx, ry - 1)));
            }
            rows.push_back(row);
        }

        // Pair runs from both ends of each line.
        for (const std::vector<int>& row : rows) {
            if (row.empty()) continue;
            size_t i = 0;
            size_t j = row.size() - 1;
            while (i < j) {
                pairMirror(L, row[i], row[j]);
                flipAdjacency(L.adjacencies[static_cast<size_t>(row[j])]);
                ++i;
                --j;
            }
        }
    }

    // Vertical wall lines, west to east.
    {
        std::vector<std::vector<int>> cols;

        {
            std::vector<int> col;
            const int rx = 0;
            for (int ry = 0; ry < roomsY; ++ry) {
                const int y0 = oy(rx, ry);
                const int y1 = oy(rx, ry + 1);
                const int x = ox(rx, ry);
                col.push_back(addAdjacency(L, {x, y0 + 1}, {0, 1}, y1 - (y0 + 1), 0, ri(rx, ry)));
            }
            cols.push_back(col);
        }

        for (int rx = 1; rx < roomsX; ++rx) {
            std::vector<int> col;

            for (int ry = 0; ry < roomsY; ++ry) {
                const int y0Left = oy(rx - 1, ry);
                const int y0Right = oy(rx, ry);
                const int y1Left = oy(rx - 1, ry + 1);
                const int y1Right = oy(rx, ry + 1);
                const int y0 = std::max(y0Left, y0Right);
                const int y1 = std::min(y1Left, y1Right);
                const int x = ox(rx, ry);

                if (ry > 0 && y0Left - y0Right > 1) {
                    col.push_back(addAdjacency(L, {x, y0Right + 1}, {0, 1}, y0Left - (y0Right + 1),
                                               ri(rx - 1, ry - 1), ri(rx, ry)));
                }

                if (y1 - y0 > 1) {
                    col.push_back(addAdjacency(L, {x, y0 + 1}, {0, 1}, y1 - (y0 + 1),
                                               ri(rx - 1, ry), ri(rx, ry)));
                }

                if (ry + 1 < roomsY && y1Right - y1Left > 1) {
                    col.push_back(addAdjacency(L, {x, y1Left + 1}, {0, 1}, y1Right - (y1Left + 1),
                                               ri(rx - 1, ry + 1), ri(rx, ry)));
                }
            }

            cols.push_back(col);
        }

        {
            std::vector<int> col;
            const int rx = roomsX;
            for (int ry = 0; ry < roomsY; ++ry) {
                const int y0 = oy(rx - 1, ry);
                const int y1 = oy(rx - 1, ry + 1);
                const int x = ox(rx, ry);
                col.push_back(addAdjacency(L, {x, y0 + 1}, {0, 1}, y1 - (y0 + 1), ri(rx - 1, ry), 0));
            }
            cols.push_back(col);
        }

        // Pair whole columns across the centerline.
        size_t c0 = 0;
        size_t c1 = cols.size() - 1;
        while (c0 < c1) {
            const std::vector<int>& a = cols[c0];
            const std::vector<int>& b = cols[c1];
            const size_t n = std::min(a.size(), b.size());
            for (size_t i = 0; i < n; ++i) pairMirror(L, a[i], b[i]);
            ++c0;
            --c1;
        }
    }

    for (size_t i = 0; i < L.adjacencies.size(); ++i) {
        const Adjacency& a = L.adjacencies[i];
        L.rooms[static_cast<size_t>(a.roomLeft)].edges.push_back(static_cast<int>(i));
        L.rooms[static_cast<size_t>(a.roomRight)].edges.push_back(static_cast<int>(i));
    }
}

// ---------------------------------------------------------------------------
// Connectivity
// ---------------------------------------------------------------------------

void joinGroups(std::vector<Room>& rooms, int groupFrom, int groupTo) {
    if (groupFrom == groupTo) return;
    for (Room& r : rooms) {
        if (r.group == groupFrom) r.group = groupTo;
    }
}

// Each set is one adjacency or a mirrored pair, in random order.
std::vector<std::vector<int>> getEdgeSets(const Layout& L, RNG& rng) {
    std::vector<std::vector<int>> sets;
    sets.reserve(L.adjacencies.size());

    for (int i = 0; i < static_cast<int>(L.adjacencies.size()); ++i) {
        const int j = L.mirrorOf[static_cast<size_t>(i)];
        if (j > i) {
            sets.push_back({i, j});
        } else if (j == i) {
            sets.push_back({i});
        }
    }

    shuffleVector(rng, sets);
    return sets;
}

// Door the first edge of each set when it joins two groups (or, 40% of the
// time, anyway); its mirror partner follows.
template <typename EligibleFn>
void addDoors(Layout& L, RNG& rng, const std::vector<std::vector<int>>& edgeSets, EligibleFn eligible) {
    for (const std::vector<int>& set : edgeSets) {
        Adjacency& a = L.adjacencies[static_cast<size_t>(set[0])];
        const Room& r0 = L.rooms[static_cast<size_t>(a.roomLeft)];
        const Room& r1 = L.rooms[static_cast<size_t>(a.roomRight)];

        if (!eligible(r0.type, r1.type)) continue;

        if (r0.group == r1.group && !rng.chance(0.4f)) continue;

        a.door = true;
        joinGroups(L.rooms, r0.group, r1.group);

        for (size_t k = 1; k < set.size(); ++k) {
            Adjacency& m = L.adjacencies[static_cast<size_t>(set[k])];
            m.door = true;
            joinGroups(L.rooms, L.rooms[static_cast<size_t>(m.roomLeft)].group,
                       L.rooms[static_cast<size_t>(m.roomRight)].group);
        }
    }
}

// A south-wall run bordering the exterior. Of a mirrored pair, the flipped
// (higher) index is the one whose left side is the exterior.
int frontDoorAdjacencyIndex(const Layout& L, const std::vector<std::vector<int>>& edgeSets) {
    for (const std::vector<int>& set : edgeSets) {
        for (int i : set) {
            const Adjacency& a = L.adjacencies[static_cast<size_t>(i)];
            const int mirror = L.mirrorOf[static_cast<size_t>(i)];

            if (a.dir.x == 0) continue;
            if (mirror > i) continue;

            if (mirror == i) {
                if (L.rooms[static_cast<size_t>(a.roomRight)].type != RoomType::Exterior) continue;
            } else {
                if (L.rooms[static_cast<size_t>(a.roomLeft)].type != RoomType::Exterior) continue;
            }

            return i;
        }
    }

    // The south row always borders the exterior.
    return 0;
}

Vec2i connectRooms(Layout& L, RNG& rng) {
    const std::vector<std::vector<int>> edgeSets = getEdgeSets(L, rng);

    // Courtyards open onto each other.
    for (Adjacency& a : L.adjacencies) {
        const Room& r0 = L.rooms[static_cast<size_t>(a.roomLeft)];
        const Room& r1 = L.rooms[static_cast<size_t>(a.roomRight)];
        if (r0.type != RoomType::PublicCourtyard || r1.type != RoomType::PublicCourtyard) continue;

        a.door = true;
        joinGroups(L.rooms, r0.group, r1.group);
    }

    // Interior rooms.
    addDoors(L, rng, edgeSets, [](RoomType t0, RoomType t1) {
        return t0 == RoomType::PublicRoom && t1 == RoomType::PublicRoom;
    });

    // Interiors to courtyards.
    addDoors(L, rng, edgeSets, [](RoomType t0, RoomType t1) {
        if (t0 == t1) return false;
        return t0 != RoomType::Exterior && t1 != RoomType::Exterior;
    });

    // Front door, on the south side.
    const int i = frontDoorAdjacencyIndex(L, edgeSets);
    Adjacency& front = L.adjacencies[static_cast<size_t>(i)];

    Vec2i posStart;
    posStart.x = front.origin.x + front.dir.x * (front.length / 2);
    posStart.y = OUTER_BORDER - 1;

    front.door = true;

    // Only one side of the facade gets the front door.
    const int j = L.mirrorOf[static_cast<size_t>(i)];
    if (j != i) {
        L.mirrorOf[static_cast<size_t>(j)] = j;
        L.mirrorOf[static_cast<size_t>(i)] = i;
    }

    return posStart;
}

// ---------------------------------------------------------------------------
// Room privacy
// ---------------------------------------------------------------------------

void assignRoomTypes(Layout& L) {
    std::vector<Room>& rooms = L.rooms;
    const int unvisited = static_cast<int>(rooms.size());

    rooms[0].depth = 0;
    for (size_t i = 1; i < rooms.size(); ++i) rooms[i].depth = unvisited;

    // Breadth-first depth through doors, starting from the south row.
    std::vector<int> toVisit;
    toVisit.reserve(rooms.size());
    for (int x = 0; x < L.roomsX(); ++x) {
        const int r = L.roomIndex(x, 0);
        rooms[static_cast<size_t>(r)].depth = 1;
        toVisit.push_back(r);
    }

    for (size_t k = 0; k < toVisit.size(); ++k) {
        const int r = toVisit[k];
        for (int e : rooms[static_cast<size_t>(r)].edges) {
            const Adjacency& a = L.adjacencies[static_cast<size_t>(e)];
            if (!a.door) continue;

            const int n = (a.roomLeft == r) ? a.roomRight : a.roomLeft;
            Room& rn = rooms[static_cast<size_t>(n)];
            if (rn.depth == unvisited) {
                rn.depth = rooms[static_cast<size_t>(r)].depth + 1;
                toVisit.push_back(n);
            }
        }
    }

    // Deepest rooms become the master suite (unreached rooms count as
    // deepest of all).
    int maxDepth = 0;
    for (const Room& r : rooms) maxDepth = std::max(maxDepth, r.depth);

    const int targetMasterRooms = (L.roomsX() * L.roomsY()) / 4;
    int numMasterRooms = 0;

    for (int depth = maxDepth; depth > 0; --depth) {
        for (Room& r : rooms) {
            if (r.type != RoomType::PublicRoom && r.type != RoomType::PublicCourtyard) continue;
            if (r.depth != depth) continue;

            if (r.type == RoomType::PublicRoom) {
                r.type = RoomType::PrivateRoom;
                ++numMasterRooms;
            } else {
                r.type = RoomType::PrivateCourtyard;
            }
        }

        if (numMasterRooms >= targetMasterRooms) break;
    }

    // Public courtyards touching private ones go private too.
    for (;;) {
        bool changed = false;

        for (size_t i = 0; i < rooms.size(); ++i) {
            if (rooms[i].type != RoomType::PublicCourtyard) continue;

            for (int e : rooms[i].edges) {
                const Adjacency& a = L.adjacencies[static_cast<size_t>(e)];
                const int other = (a.roomLeft != static_cast<int>(i)) ? a.roomLeft : a.roomRight;
                if (rooms[static_cast<size_t>(other)].type == RoomType::PrivateCourtyard) {
                    rooms[i].type = RoomType::PrivateCourtyard;
                    changed = true;
                    break;
                }
            }
        }

        if (!changed) break;
    }
}

// ---------------------------------------------------------------------------
// Patrol graph
// ---------------------------------------------------------------------------

// Rooms accepted by `accept` minus dead ends, trimmed to a fixpoint.
template <typename AcceptFn>
std::vector<uint8_t> nonDeadEndRooms(const Layout& L, AcceptFn accept) {
    std::vector<uint8_t> include(L.rooms.size(), 0);
    for (size_t i = 0; i < L.rooms.size(); ++i) include[i] = accept(L.rooms[i]) ? 1 : 0;

    for (;;) {
        bool trimmed = false;

        for (size_t i = 0; i < L.rooms.size(); ++i) {
            if (!include[i]) continue;

            int numExits = 0;
            for (int e : L.rooms[i].edges) {
                const Adjacency& a = L.adjacencies[static_cast<size_t>(e)];
                if (!a.door) continue;
                const int other = (a.roomLeft != static_cast<int>(i)) ? a.roomLeft : a.roomRight;
                if (include[static_cast<size_t>(other)]) ++numExits;
            }

            if (numExits < 2) {
                include[i] = 0;
                trimmed = true;
            }
        }

        if (!trimmed) break;
    }

    return include;
}

int addPatrolRegion(Map& map, Vec2i posMin, Vec2i posMax, bool inner) {
    const int region = static_cast<int>(map.patrolRegions.size());

    PatrolRegion pr;
    pr.rect = Rect{posMin, posMax};
    pr.inner = inner;
    map.patrolRegions.push_back(pr);

    for (int x = posMin.x; x < posMax.x; ++x) {
        for (int y = posMin.y; y < posMax.y; ++y) {
            map.at(x, y).region = region;
        }
    }

    return region;
}

void generatePatrolRoutes(Layout& L, Map& map) {
    const std::vector<uint8_t> general = nonDeadEndRooms(L, [](const Room& r) {
        return r.type != RoomType::Exterior;
    });
    const std::vector<uint8_t> outer = nonDeadEndRooms(L, [](const Room& r) {
        return r.type != RoomType::Exterior &&
               r.type != RoomType::PrivateRoom &&
               r.type != RoomType::PrivateCourtyard;
    });

    std::vector<int> roomRegion(L.rooms.size(), INVALID_REGION);

    for (size_t i = 0; i < L.rooms.size(); ++i) {
        Room& r = L.rooms[i];
        r.deadEnd = !general[i];
        if (!general[i]) continue;

        const bool inner = !outer[i];
        r.hasPatroller = true;
        r.patroller = inner ? GuardKind::Inner : GuardKind::Outer;
        roomRegion[i] = addPatrolRegion(map, r.posMin, r.posMax, inner);
    }

    for (const Adjacency& a : L.adjacencies) {
        if (!a.door) continue;

        const int r0 = roomRegion[static_cast<size_t>(a.roomLeft)];
        const int r1 = roomRegion[static_cast<size_t>(a.roomRight)];
        if (r0 == INVALID_REGION || r1 == INVALID_REGION) continue;

        map.patrolRoutes.push_back({r0, r1});
    }
}

// ---------------------------------------------------------------------------
// Decoration
// ---------------------------------------------------------------------------

void placeItem(Map& map, int x, int y, ItemKind kind) {
    Item it;
    it.pos = {x, y};
    it.kind = kind;
    map.items.push_back(it);
}

// Item or guard already standing there.
bool isOccupied(const Map& map, Vec2i p) {
    return map.isItemAt(p) || map.isGuardAt(p);
}

// Window variant permitting the crossing from the right of `dir` to its
// left, indexed by 2*dir.x + dir.y + 2.
constexpr CellType ONE_WAY_WINDOW[5] = {
    CellType::OneWayWindowS,
    CellType::OneWayWindowE,
    CellType::OneWayWindowE, // unused
    CellType::OneWayWindowW,
    CellType::OneWayWindowN,
};

CellType oneWayWindowFor(Vec2i dir) {
    return ONE_WAY_WINDOW[2 * dir.x + dir.y + 2];
}

void renderWalls(const Layout& L, RNG& rng, Map& map) {
    const std::vector<Room>& rooms = L.rooms;
    const std::vector<Adjacency>& adjs = L.adjacencies;

    auto roomType = [&](int r) { return rooms[static_cast<size_t>(r)].type; };

    // No wall at all between two courtyards.
    for (const Adjacency& a : adjs) {
        if (!isCourtyard(roomType(a.roomLeft)) || !isCourtyard(roomType(a.roomRight))) continue;

        for (int k = 0; k < a.length; ++k) {
            map.at(a.origin + a.dir * k).type = CellType::GroundGrass;
        }
    }

    for (size_t i = 0; i < adjs.size(); ++i) {
        const Adjacency& adj0 = adjs[i];
        const RoomType type0 = roomType(adj0.roomLeft);
        const RoomType type1 = roomType(adj0.roomRight);

        if (isCourtyard(type0) && isCourtyard(type1)) continue;

        const size_t j = static_cast<size_t>(L.mirrorOf[i]);
        if (j < i) continue;

        // Mirrored pairs share a random door offset; lone walls center it.
        int offset = 0;
        if (j == i) {
            offset = adj0.length / 2;
        } else if (adj0.length > 2) {
            offset = 1 + rng.range(0, adj0.length - 3);
        } else {
            offset = rng.range(0, adj0.length - 1);
        }

        std::vector<const Adjacency*> walls;
        walls.push_back(&adj0);
        if (j != i) walls.push_back(&adjs[j]);

        if (!adj0.door && type0 != type1) {
            if (type0 == RoomType::Exterior || type1 == RoomType::Exterior) {
                // One window mid-wall, facing out.
                if ((adj0.length & 1) != 0) {
                    const int k = adj0.length / 2;
                    for (const Adjacency* a : walls) {
                        const Vec2i p = a->origin + a->dir * k;
                        const Vec2i d = (roomType(a->roomRight) == RoomType::Exterior) ? -a->dir : a->dir;
                        map.at(p).type = oneWayWindowFor(d);
                    }
                }
            } else if (isCourtyard(type0) || isCourtyard(type1)) {
                // Windows every other cell, symmetric about the middle,
                // facing into the courtyard.
                int k = rng.range(0, 1);
                const int kEnd = (adj0.length + 1) / 2;

                while (k < kEnd) {
                    for (const Adjacency* a : walls) {
                        const Vec2i d = isCourtyard(roomType(a->roomRight)) ? -a->dir : a->dir;
                        const CellType windowType = oneWayWindowFor(d);

                        const Vec2i p = a->origin + a->dir * k;
                        const Vec2i q = a->origin + a->dir * (a->length - (k + 1));

                        map.at(p).type = windowType;
                        map.at(q).type = windowType;
                    }
                    k += 2;
                }
            }
        }

        const bool installMasterSuiteDoor = rng.chance(0.3333f);

        for (const Adjacency* a : walls) {
            if (!a->door) continue;

            const Vec2i p = a->origin + a->dir * offset;
            const bool orientNS = (a->dir.x == 0);

            map.at(p).type = orientNS ? CellType::DoorNS : CellType::DoorEW;

            const RoomType left = roomType(a->roomLeft);
            const RoomType right = roomType(a->roomRight);

            if (left == RoomType::Exterior || right == RoomType::Exterior) {
                map.at(p).type = orientNS ? CellType::PortcullisNS : CellType::PortcullisEW;
                placeItem(map, p.x, p.y, orientNS ? ItemKind::PortcullisNS : ItemKind::PortcullisEW);
            } else if (left != RoomType::PrivateRoom || right != RoomType::PrivateRoom || installMasterSuiteDoor) {
                placeItem(map, p.x, p.y, orientNS ? ItemKind::DoorNS : ItemKind::DoorEW);
            }
            // Otherwise a bare opening between two master-suite rooms.
        }
    }
}

bool doorAdjacent(const Map& map, int x, int y) {
    constexpr int DIRS4[4][2] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};
    for (const auto& dv : DIRS4) {
        const int nx = x + dv[0];
        const int ny = y + dv[1];
        if (!map.inBounds(nx, ny)) continue;
        if (map.at(nx, ny).type >= CellType::PortcullisNS) return true;
    }
    return false;
}

bool doorOrWindowAdjacent(const Map& map, Vec2i p) {
    constexpr int DIRS4[4][2] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};
    for (const auto& dv : DIRS4) {
        const int nx = p.x + dv[0];
        const int ny = p.y + dv[1];
        if (!map.inBounds(nx, ny)) continue;
        if (map.at(nx, ny).type >= CellType::OneWayWindowE) return true;
    }
    return false;
}

void tryPlaceBush(Map& map, int x, int y) {
    if (map.at(x, y).type != CellType::GroundGrass) return;
    if (doorAdjacent(map, x, y)) return;
    placeItem(map, x, y, ItemKind::Bush);
}

void tryPlaceFurniture(Map& map, int x, int y, ItemKind kind) {
    if (doorAdjacent(map, x, y)) return;
    placeItem(map, x, y, kind);
}

void renderRooms(const Layout& L, int level, bool creakyFloors, RNG& rng, Map& map) {
    for (size_t i = 1; i < L.rooms.size(); ++i) {
        const Room& room = L.rooms[i];

        CellType floor = CellType::GroundNormal;
        switch (room.type) {
            case RoomType::Exterior: floor = CellType::GroundNormal; break;
            case RoomType::PublicCourtyard: floor = CellType::GroundGrass; break;
            case RoomType::PublicRoom: floor = CellType::GroundWood; break;
            case RoomType::PrivateCourtyard: floor = CellType::GroundGrass; break;
            case RoomType::PrivateRoom: floor = CellType::GroundMarble; break;
        }

        for (int x = room.posMin.x; x < room.posMax.x; ++x) {
            for (int y = room.posMin.y; y < room.posMax.y; ++y) {
                CellType t = floor;
                if (t == CellType::GroundWood && creakyFloors && level > 3 && rng.chance(1.0f / 50.0f)) {
                    t = CellType::GroundWoodCreaky;
                }
                map.at(x, y).type = t;
            }
        }

        const int dx = room.posMax.x - room.posMin.x;
        const int dy = room.posMax.y - room.posMin.y;
        const Vec2i lo = room.posMin;
        const Vec2i hi = room.posMax;

        if (isCourtyard(room.type)) {
            if (dx >= 5 && dy >= 5) {
                // Pond.
                for (int x = lo.x + 1; x < hi.x - 1; ++x) {
                    for (int y = lo.y + 1; y < hi.y - 1; ++y) {
                        map.at(x, y).type = CellType::GroundWater;
                    }
                }
            } else if (dx >= 2 && dy >= 2) {
                tryPlaceBush(map, lo.x, lo.y);
                tryPlaceBush(map, hi.x - 1, lo.y);
                tryPlaceBush(map, lo.x, hi.y - 1);
                tryPlaceBush(map, hi.x - 1, hi.y - 1);
            }
            continue;
        }

        if (room.type != RoomType::PublicRoom && room.type != RoomType::PrivateRoom) continue;

        const bool isPublic = (room.type == RoomType::PublicRoom);
        const ItemKind pairKind = isPublic ? ItemKind::Table : ItemKind::Chair;

        if (dx >= 5 && dy >= 5) {
            if (!isPublic) {
                for (int x = 2; x < dx - 2; ++x) {
                    for (int y = 2; y < dy - 2; ++y) {
                        map.at(lo.x + x, lo.y + y).type = CellType::GroundWater;
                    }
                }
            }

            map.at(lo.x + 1, lo.y + 1).type = CellType::Wall0000;
            map.at(hi.x - 2, lo.y + 1).type = CellType::Wall0000;
            map.at(lo.x + 1, hi.y - 2).type = CellType::Wall0000;
            map.at(hi.x - 2, hi.y - 2).type = CellType::Wall0000;
        } else if (dx == 5 && dy >= 3 && (isPublic || rng.chance(1.0f / 3.0f))) {
            for (int y = 1; y < dy - 1; ++y) {
                placeItem(map, lo.x + 1, lo.y + y, ItemKind::Chair);
                placeItem(map, lo.x + 2, lo.y + y, ItemKind::Table);
                placeItem(map, lo.x + 3, lo.y + y, ItemKind::Chair);
            }
        } else if (dy == 5 && dx >= 3 && (isPublic || rng.chance(1.0f / 3.0f))) {
            for (int x = 1; x < dx - 1; ++x) {
                placeItem(map, lo.x + x, lo.y + 1, ItemKind::Chair);
                placeItem(map, lo.x + x, lo.y + 2, ItemKind::Table);
                placeItem(map, lo.x + x, lo.y + 3, ItemKind::Chair);
            }
        } else if (dx > dy && (dy & 1) == 1 && rng.chance(2.0f / 3.0f)) {
            const int y = lo.y + dy / 2;
            tryPlaceFurniture(map, lo.x + 1, y, pairKind);
            tryPlaceFurniture(map, hi.x - 2, y, pairKind);
        } else if (dy > dx && (dx & 1) == 1 && rng.chance(2.0f / 3.0f)) {
            const int x = lo.x + dx / 2;
            tryPlaceFurniture(map, x, lo.y + 1, pairKind);
            tryPlaceFurniture(map, x, hi.y - 2, pairKind);
        } else if (dx > 3 && dy > 3) {
            tryPlaceFurniture(map, lo.x, lo.y, pairKind);
            tryPlaceFurniture(map, hi.x - 1, lo.y, pairKind);
            tryPlaceFurniture(map, lo.x, hi.y - 1, pairKind);
            tryPlaceFurniture(map, hi.x - 1, hi.y - 1, pairKind);
        }
    }
}

// ---------------------------------------------------------------------------
// Outfits, loot, exterior
// ---------------------------------------------------------------------------

bool tryPlaceOutfit(RNG& rng, Vec2i posMin, Vec2i posMax, Map& map, ItemKind kind) {
    const int dx = posMax.x - posMin.x;
    const int dy = posMax.y - posMin.y;
    if (dx <= 0 || dy <= 0) return false;

    for (int tries = 0; tries < PLACEMENT_TRIES; ++tries) {
        const Vec2i p{posMin.x + rng.range(0, dx - 1), posMin.y + rng.range(0, dy - 1)};

        const CellType t = map.at(p).type;
        if (t != CellType::GroundWood && t != CellType::GroundMarble && t != CellType::GroundGrass) continue;
        if (isOccupied(map, p)) continue;
        if (doorOrWindowAdjacent(map, p)) continue;

        placeItem(map, p.x, p.y, kind);
        return true;
    }

    return false;
}

void placeOutfits(const Layout& L, RNG& rng, Map& map) {
    std::vector<const Room*> ordered;
    for (const Room& r : L.rooms) {
        if (r.type != RoomType::Exterior) ordered.push_back(&r);
    }
    shuffleVector(rng, ordered);

    // Dead ends first, then rooms at depth 2 or more.
    auto rank = [](const Room* r) {
        return (r->deadEnd ? 0 : 2) + (r->depth >= 2 ? 0 : 1);
    };
    std::stable_sort(ordered.begin(), ordered.end(), [&](const Room* a, const Room* b) {
        return rank(a) < rank(b);
    });

    const ItemKind outfits[2] = {ItemKind::Outfit2, ItemKind::Outfit1};
    size_t outfitIndex = 0;

    int numOutfits = std::max(1, std::min(2, static_cast<int>(L.rooms.size()) / 12));
    for (const Room* r : ordered) {
        if (tryPlaceOutfit(rng, r->posMin, r->posMax, map, outfits[outfitIndex])) {
            ++outfitIndex;
            if (--numOutfits == 0) break;
        }
    }
}

void tryPlaceLoot(RNG& rng, Vec2i posMin, Vec2i posMax, Map& map) {
    const int dx = posMax.x - posMin.x;
    const int dy = posMax.y - posMin.y;
    if (dx <= 0 || dy <= 0) return;

    for (int tries = 0; tries < PLACEMENT_TRIES; ++tries) {
        const Vec2i p{posMin.x + rng.range(0, dx - 1), posMin.y + rng.range(0, dy - 1)};

        const CellType t = map.at(p).type;
        if (t != CellType::GroundWood && t != CellType::GroundMarble) continue;
        if (isOccupied(map, p)) continue;

        placeItem(map, p.x, p.y, ItemKind::Coin);
        return;
    }
}

void placeLoot(const Layout& L, RNG& rng, Map& map) {
    int numRooms = 0;
    for (const Room& r : L.rooms) {
        if (r.type == RoomType::PublicRoom || r.type == RoomType::PrivateRoom) ++numRooms;
    }

    // Master suite: usually.
    for (const Room& r : L.rooms) {
        if (r.type != RoomType::PrivateRoom) continue;
        if (rng.chance(0.2f)) continue;
        tryPlaceLoot(rng, r.posMin, r.posMax, map);
    }

    // Dead ends: always.
    for (const Room& r : L.rooms) {
        if (r.type != RoomType::PublicRoom && r.type != RoomType::PrivateRoom) continue;

        int numExits = 0;
        for (int e : r.edges) {
            if (L.adjacencies[static_cast<size_t>(e)].door) ++numExits;
        }

        if (numExits < 2) tryPlaceLoot(rng, r.posMin, r.posMax, map);
    }

    // A little extra anywhere indoors.
    const int extra = numRooms / 4 + rng.range(0, 3);
    for (int i = 0; i < extra; ++i) {
        tryPlaceLoot(rng, {0, 0}, {map.width, map.height}, map);
    }
}

void placeExteriorBushes(RNG& rng, Map& map) {
    const int sx = map.width;
    const int sy = map.height;

    auto lawn = [&](int x, int y) {
        Cell& c = map.at(x, y);
        if (c.type != CellType::GroundNormal) return;
        c.type = CellType::GroundGrass;
        c.seen = true;
    };

    // Back garden with a hedge along the far edge.
    for (int x = 0; x < sx; ++x) {
        for (int y = sy - OUTER_BORDER + 1; y < sy; ++y) lawn(x, y);

        if ((x & 1) == 0 && rng.chance(0.8f)) placeItem(map, x, sy - 1, ItemKind::Bush);
    }

    // Side gardens.
    for (int y = OUTER_BORDER; y < sy - OUTER_BORDER + 1; ++y) {
        for (int x = 0; x < OUTER_BORDER - 1; ++x) lawn(x, y);
        for (int x = sx - OUTER_BORDER + 1; x < sx; ++x) lawn(x, y);

        if (((sy - y) & 1) != 0) {
            if (rng.chance(0.8f)) placeItem(map, 0, y, ItemKind::Bush);
            if (rng.chance(0.8f)) placeItem(map, sx - 1, y, ItemKind::Bush);
        }
    }
}

void placeFrontPillars(Map& map) {
    const int sx = map.width - 1;
    const int cx = map.width / 2;

    for (int x = OUTER_BORDER; x < cx; x += 5) {
        map.at(x, 1).type = CellType::Wall0000;
        map.at(sx - x, 1).type = CellType::Wall0000;
    }
}

// ---------------------------------------------------------------------------
// Guards
// ---------------------------------------------------------------------------

constexpr int GUARD_MIN_START_DIST_SQ = 64;

// Floor cells in regions of the guard's kind, away from the entrance.
std::vector<Vec2i> guardSpawnCandidates(const Map& map, GuardKind kind) {
    std::vector<Vec2i> out;
    const bool wantInner = (kind == GuardKind::Inner);

    for (const PatrolRegion& pr : map.patrolRegions) {
        if (pr.inner != wantInner) continue;

        for (int y = pr.rect.posMin.y; y < pr.rect.posMax.y; ++y) {
            for (int x = pr.rect.posMin.x; x < pr.rect.posMax.x; ++x) {
                const Vec2i p{x, y};
                if (lengthSquared(map.posStart - p) < GUARD_MIN_START_DIST_SQ) continue;

                const CellType t = map.at(p).type;
                if (t != CellType::GroundWood && t != CellType::GroundMarble) continue;
                if (isOccupied(map, p)) continue;

                out.push_back(p);
            }
        }
    }

    return out;
}

void placeGuard(RNG& rng, Map& map, Vec2i pos, GuardKind kind) {
    Guard g;
    g.pos = pos;
    g.dir = {1, 0};
    g.kind = kind;
    g.mode = GuardMode::Patrol;
    g.heardGuardPos = pos;
    g.goal = pos;

    setupGoalRegion(g, rng, map);
    g.dir = initialDir(g, map);

    map.guards.push_back(g);
}

void placeGuardsByKind(const Layout& L, RNG& rng, int level, Map& map, GuardKind kind) {
    int numRooms = 0;
    for (const Room& r : L.rooms) {
        if (r.hasPatroller && r.patroller == kind) ++numRooms;
    }

    int numGuards = 0;
    if (level == 1 && numRooms > 0) {
        numGuards = 1;
    } else {
        numGuards = (numRooms * std::min(level + 18, 40) + 99) / 100;
    }

    std::vector<Vec2i> candidates = guardSpawnCandidates(map, kind);

    while (numGuards > 0 && !candidates.empty()) {
        const size_t k = static_cast<size_t>(rng.range(0, static_cast<int>(candidates.size()) - 1));
        const Vec2i p = candidates[k];
        candidates[k] = candidates.back();
        candidates.pop_back();

        if (map.isGuardAt(p)) continue;

        placeGuard(rng, map, p, kind);
        --numGuards;
    }
}

void markExteriorAsSeen(Map& map) {
    auto isOutside = [&](int x, int y) {
        return map.inBounds(x, y) && map.at(x, y).type == CellType::GroundNormal;
    };

    for (int x = 0; x < map.width; ++x) {
        for (int y = 0; y < map.height; ++y) {
            bool nearOutside = false;
            for (int oy = -1; oy <= 1 && !nearOutside; ++oy) {
                for (int ox = -1; ox <= 1 && !nearOutside; ++ox) {
                    if (isOutside(x + ox, y + oy)) nearOutside = true;
                }
            }
            if (nearOutside) map.at(x, y).seen = true;
        }
    }
}

// ---------------------------------------------------------------------------

Map generateSiheyuan(RNG& rng, int level, const MansionGenOptions& opts) {
    int sizeX = 0;
    for (int i = 0; i < std::min(3, level); ++i) sizeX += rng.range(0, 1);
    sizeX = sizeX * 2 + 3;

    int sizeY = 0;
    if (level == 0) {
        sizeY = 2;
    } else {
        sizeY = 3;
        for (int i = 0; i < std::min(4, level - 1); ++i) sizeY += rng.range(0, 1);
    }

    Layout L(sizeX, sizeY);

    makeRoomGrid(L, rng);
    offsetWalls(L, rng);

    Map map = plotWalls(L);
    fixupWalls(map);

    // Room 0 stands for everything outside the mansion.
    {
        Room exterior;
        exterior.type = RoomType::Exterior;
        exterior.group = 0;
        exterior.deadEnd = true;
        L.rooms.push_back(exterior);
    }

    for (int rx = 0; rx < sizeX; ++rx) {
        for (int ry = 0; ry < sizeY; ++ry) {
            const int idx = static_cast<int>(L.rooms.size());
            L.roomIndex(rx, ry) = idx;

            Room r;
            r.type = L.inside(rx, ry) ? RoomType::PublicRoom : RoomType::PublicCourtyard;
            r.group = idx;
            r.posMin = {L.offsetX(rx, ry) + 1, L.offsetY(rx, ry) + 1};
            r.posMax = {L.offsetX(rx + 1, ry), L.offsetY(rx, ry + 1)};
            L.rooms.push_back(r);
        }
    }

    computeAdjacencies(L);
    map.posStart = connectRooms(L, rng);
    assignRoomTypes(L);
    generatePatrolRoutes(L, map);
    renderWalls(L, rng, map);
    renderRooms(L, level, opts.creakyFloors, rng, map);

    if (level > 1) placeOutfits(L, rng, map);

    placeLoot(L, rng, map);
    placeExteriorBushes(rng, map);
    placeFrontPillars(map);

    // Guards path over the cached costs.
    map.cacheCellInfo();

    if (level > 0) {
        placeGuardsByKind(L, rng, level, map, GuardKind::Inner);
        placeGuardsByKind(L, rng, level, map, GuardKind::Outer);
    }

    markExteriorAsSeen(map);

    map.totalLoot = map.lootRemaining();

    return map;
}

} // namespace

Map generateMap(RNG& rng, int level, const MansionGenOptions& opts) {
    for (int attempt = 0; attempt < GENERATION_ATTEMPTS; ++attempt) {
        Map map = generateSiheyuan(rng, level, opts);
        if (static_cast<int>(map.patrolRegions.size()) >= opts.minPatrolRegions) return map;
    }

    return generateSiheyuan(rng, level, opts);
}

Map generateLevel(uint32_t seed, int level, const MansionGenOptions& opts) {
    RNG rng(seed);
    return generateMap(rng, level, opts);
}
