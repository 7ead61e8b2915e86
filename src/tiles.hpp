#pragma once

#include <climits>
#include <cstdint>

// Sentinels shared by the cell model, the path costs and the patrol graph.
constexpr int INFINITE_COST = INT_MAX;
constexpr int INVALID_REGION = -1;

// Order matters: the generator compares against PortcullisNS (door-like)
// and OneWayWindowE (door- or window-like) with >=.
enum class CellType : uint8_t {
    GroundNormal = 0,
    GroundGrass,
    GroundWater,
    GroundMarble,
    GroundWood,
    GroundWoodCreaky,

    //  NSEW neighbor-wall bitmask. Purely visual; every wall behaves the same.
    Wall0000,
    Wall0001,
    Wall0010,
    Wall0011,
    Wall0100,
    Wall0101,
    Wall0110,
    Wall0111,
    Wall1000,
    Wall1001,
    Wall1010,
    Wall1011,
    Wall1100,
    Wall1101,
    Wall1110,
    Wall1111,

    // A one-way window can only be entered moving in its named direction.
    OneWayWindowE,
    OneWayWindowW,
    OneWayWindowN,
    OneWayWindowS,
    PortcullisNS,
    PortcullisEW,
    DoorNS,
    DoorEW,
};

enum class ItemKind : uint8_t {
    Chair = 0,
    Table,
    Bush,
    Coin,
    DoorNS,
    DoorEW,
    PortcullisNS,
    PortcullisEW,
    // Outfit1 is the thief's own clothing; Outfit2 is a servant's uniform.
    Outfit1,
    Outfit2,
};

// Static capabilities of a cell type.
struct TileDef {
    bool blocksPlayer = false;
    bool blocksPlayerSight = false;
    bool blocksSight = false;
    bool blocksSound = false;
    bool ignoresLighting = false;
};

const TileDef& tileDef(CellType t);

bool isWall(CellType t);
inline bool isOutfit(ItemKind k) { return k == ItemKind::Outfit1 || k == ItemKind::Outfit2; }

// Wall variant for a 4-bit neighbor mask (N=8, S=4, E=2, W=1).
CellType wallTypeFromNeighbors(uint32_t bits);

// Guard pathing weights. INFINITE_COST means impassable.
int guardMoveCostForTileType(CellType t);
int guardMoveCostForItemKind(ItemKind k);

// One character per cell type / item, for text dumps.
char glyphForCellType(CellType t);
char glyphForItemKind(ItemKind k);

const char* cellTypeName(CellType t);
const char* itemKindName(ItemKind k);
