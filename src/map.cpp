#include "map.hpp"

#include <algorithm>

const char* guardModeName(GuardMode m) {
    switch (m) {
        case GuardMode::Patrol: return "PATROL";
        case GuardMode::Look: return "LOOK";
        case GuardMode::LookAtDisguised: return "LOOK (DISGUISED)";
        case GuardMode::Listen: return "LISTEN";
        case GuardMode::ChaseVisibleTarget: return "CHASE";
        case GuardMode::MoveToLastSighting: return "SEARCH (SIGHTING)";
        case GuardMode::MoveToLastSound: return "SEARCH (SOUND)";
        case GuardMode::MoveToGuardShout: return "SEARCH (SHOUT)";
    }
    return "?";
}

bool Player::hidden(const Map& map, bool anyGuardChasing) const {
    if (anyGuardChasing) return false;

    if (!disguised && map.hidesPlayer(pos.x, pos.y)) return true;

    if (map.at(pos).type == CellType::GroundWater && turnsRemainingUnderwater > 0) return true;

    return false;
}

bool Player::hidden(const Map& map) const {
    return hidden(map, map.anyGuardChasing());
}

Map::Map(int w, int h)
    : width(w), height(h), cells(static_cast<size_t>(std::max(0, w) * std::max(0, h))) {}

void Map::cacheCellInfo() {
    for (Cell& c : cells) {
        const TileDef& td = tileDef(c.type);
        c.moveCost = guardMoveCostForTileType(c.type);
        c.blocksPlayerSight = td.blocksPlayerSight;
        c.blocksSight = td.blocksSight;
        c.blocksSound = td.blocksSound;
        c.hidesPlayer = false;
    }

    for (const Item& it : items) {
        if (!inBounds(it.pos)) continue;
        Cell& c = at(it.pos);
        c.moveCost = std::max(c.moveCost, guardMoveCostForItemKind(it.kind));

        switch (it.kind) {
            case ItemKind::DoorNS:
            case ItemKind::DoorEW:
                c.blocksPlayerSight = true;
                c.blocksSight = true;
                break;
            case ItemKind::PortcullisNS:
            case ItemKind::PortcullisEW:
                c.blocksSight = true;
                break;
            case ItemKind::Bush:
                c.blocksSight = true;
                c.hidesPlayer = true;
                break;
            case ItemKind::Table:
                c.hidesPlayer = true;
                break;
            default:
                break;
        }
    }
}

int Map::collectLootAt(Vec2i p) {
    const size_t before = items.size();
    items.erase(std::remove_if(items.begin(), items.end(), [&](const Item& it) {
        return it.kind == ItemKind::Coin && it.pos == p;
    }), items.end());
    return static_cast<int>(before - items.size());
}

int Map::collectAllLoot() {
    const size_t before = items.size();
    items.erase(std::remove_if(items.begin(), items.end(), [](const Item& it) {
        return it.kind == ItemKind::Coin;
    }), items.end());
    return static_cast<int>(before - items.size());
}

bool Map::allLootCollected() const {
    return lootRemaining() == 0;
}

int Map::lootRemaining() const {
    int n = 0;
    for (const Item& it : items) {
        if (it.kind == ItemKind::Coin) ++n;
    }
    return n;
}

bool Map::isItemAt(Vec2i p) const {
    for (const Item& it : items) {
        if (it.pos == p) return true;
    }
    return false;
}

bool Map::isOutfitAt(Vec2i p) const {
    for (const Item& it : items) {
        if (it.pos == p && isOutfit(it.kind)) return true;
    }
    return false;
}

bool Map::tryUseOutfitAt(Vec2i p, ItemKind outfitCur, ItemKind& outfitNew) {
    for (Item& it : items) {
        if (it.pos != p || !isOutfit(it.kind)) continue;
        if (it.kind == outfitCur) return false;
        outfitNew = it.kind;
        it.kind = outfitCur;
        return true;
    }
    return false;
}

bool Map::isGuardAt(Vec2i p) const {
    return guardIndexAt(p) >= 0;
}

int Map::guardIndexAt(Vec2i p) const {
    for (size_t i = 0; i < guards.size(); ++i) {
        if (guards[i].pos == p) return static_cast<int>(i);
    }
    return -1;
}

bool Map::anyGuardChasing() const {
    for (const Guard& g : guards) {
        if (g.mode == GuardMode::ChaseVisibleTarget) return true;
    }
    return false;
}

int Map::randomNeighborRegion(RNG& rng, int region, int regionExclude, bool outerOnly) const {
    std::vector<int> neighbors;
    neighbors.reserve(8);

    auto eligible = [&](int r) {
        if (r == regionExclude) return false;
        if (outerOnly && patrolRegions[static_cast<size_t>(r)].inner) return false;
        return true;
    };

    for (const auto& [r0, r1] : patrolRoutes) {
        if (r0 == region && eligible(r1)) {
            neighbors.push_back(r1);
        } else if (r1 == region && eligible(r0)) {
            neighbors.push_back(r0);
        }
    }

    if (neighbors.empty()) return region;

    return neighbors[static_cast<size_t>(rng.range(0, static_cast<int>(neighbors.size()) - 1))];
}

int Map::guardMoveCost(Vec2i from, Vec2i to) const {
    const int cost = at(to).moveCost;
    if (cost == INFINITE_COST) return cost;

    // No slipping diagonally past a wall corner.
    if (from.x != to.x && from.y != to.y) {
        if (at(from.x, to.y).moveCost == INFINITE_COST ||
            at(to.x, from.y).moveCost == INFINITE_COST) {
            return INFINITE_COST;
        }
    }

    return cost;
}
