#include "tiles.hpp"

namespace {

//                        player  psight  sight  sound  unlit
constexpr TileDef GROUND  {false,  false,  false, false, false};
constexpr TileDef PILLAR  {true,   false,  true,  true,  true};
constexpr TileDef WALL    {true,   true,   true,  true,  true};
constexpr TileDef WINDOW  {false,  false,  true,  false, true};
constexpr TileDef OPENING {false,  false,  false, false, true};

} // namespace

const TileDef& tileDef(CellType t) {
    switch (t) {
        case CellType::GroundNormal:
        case CellType::GroundGrass:
        case CellType::GroundWater:
        case CellType::GroundMarble:
        case CellType::GroundWood:
        case CellType::GroundWoodCreaky:
            return GROUND;

        // A free-standing pillar hides guards from each other but the
        // player can see past it.
        case CellType::Wall0000:
            return PILLAR;

        case CellType::Wall0001:
        case CellType::Wall0010:
        case CellType::Wall0011:
        case CellType::Wall0100:
        case CellType::Wall0101:
        case CellType::Wall0110:
        case CellType::Wall0111:
        case CellType::Wall1000:
        case CellType::Wall1001:
        case CellType::Wall1010:
        case CellType::Wall1011:
        case CellType::Wall1100:
        case CellType::Wall1101:
        case CellType::Wall1110:
        case CellType::Wall1111:
            return WALL;

        case CellType::OneWayWindowE:
        case CellType::OneWayWindowW:
        case CellType::OneWayWindowN:
        case CellType::OneWayWindowS:
            return WINDOW;

        // Doors and portcullises only block via the item standing in them.
        case CellType::PortcullisNS:
        case CellType::PortcullisEW:
        case CellType::DoorNS:
        case CellType::DoorEW:
            return OPENING;
    }
    return GROUND;
}

bool isWall(CellType t) {
    // Windows, doors and portcullises sit in wall lines, so they count for
    // wall-capping purposes.
    return static_cast<uint8_t>(t) >= static_cast<uint8_t>(CellType::Wall0000);
}

CellType wallTypeFromNeighbors(uint32_t bits) {
    if (bits > 15u) return CellType::Wall0000;
    return static_cast<CellType>(static_cast<uint8_t>(CellType::Wall0000) + bits);
}

int guardMoveCostForTileType(CellType t) {
    switch (t) {
        case CellType::GroundNormal:
        case CellType::GroundGrass:
        case CellType::GroundMarble:
        case CellType::GroundWood:
        case CellType::GroundWoodCreaky:
            return 0;
        case CellType::GroundWater:
            return 4096;
        case CellType::PortcullisNS:
        case CellType::PortcullisEW:
        case CellType::DoorNS:
        case CellType::DoorEW:
            return 0;
        default:
            // Walls and windows.
            return INFINITE_COST;
    }
}

int guardMoveCostForItemKind(ItemKind k) {
    switch (k) {
        case ItemKind::Chair: return 4;
        case ItemKind::Table: return 10;
        case ItemKind::Bush: return 10;
        case ItemKind::Coin: return 0;
        case ItemKind::DoorNS:
        case ItemKind::DoorEW:
        case ItemKind::PortcullisNS:
        case ItemKind::PortcullisEW:
            return 0;
        case ItemKind::Outfit1:
        case ItemKind::Outfit2:
            return INFINITE_COST;
    }
    return 0;
}

char glyphForCellType(CellType t) {
    switch (t) {
        case CellType::GroundNormal: return '.';
        case CellType::GroundGrass: return ',';
        case CellType::GroundWater: return '~';
        case CellType::GroundMarble: return '_';
        case CellType::GroundWood: return '.';
        case CellType::GroundWoodCreaky: return ':';
        case CellType::Wall0000: return 'o';
        case CellType::OneWayWindowE: return '>';
        case CellType::OneWayWindowW: return '<';
        case CellType::OneWayWindowN: return '^';
        case CellType::OneWayWindowS: return 'v';
        case CellType::PortcullisNS:
        case CellType::PortcullisEW: return '#';
        case CellType::DoorNS: return '|';
        case CellType::DoorEW: return '-';
        default: return '#';
    }
}

char glyphForItemKind(ItemKind k) {
    switch (k) {
        case ItemKind::Chair: return 'h';
        case ItemKind::Table: return 'T';
        case ItemKind::Bush: return '*';
        case ItemKind::Coin: return '$';
        case ItemKind::DoorNS: return '|';
        case ItemKind::DoorEW: return '-';
        case ItemKind::PortcullisNS:
        case ItemKind::PortcullisEW: return '=';
        case ItemKind::Outfit1:
        case ItemKind::Outfit2: return '[';
    }
    return '?';
}

const char* cellTypeName(CellType t) {
    switch (t) {
        case CellType::GroundNormal: return "GROUND";
        case CellType::GroundGrass: return "GRASS";
        case CellType::GroundWater: return "WATER";
        case CellType::GroundMarble: return "MARBLE";
        case CellType::GroundWood: return "WOOD";
        case CellType::GroundWoodCreaky: return "CREAKY WOOD";
        case CellType::OneWayWindowE:
        case CellType::OneWayWindowW:
        case CellType::OneWayWindowN:
        case CellType::OneWayWindowS: return "WINDOW";
        case CellType::PortcullisNS:
        case CellType::PortcullisEW: return "PORTCULLIS";
        case CellType::DoorNS:
        case CellType::DoorEW: return "DOOR";
        default: return "WALL";
    }
}

const char* itemKindName(ItemKind k) {
    switch (k) {
        case ItemKind::Chair: return "CHAIR";
        case ItemKind::Table: return "TABLE";
        case ItemKind::Bush: return "BUSH";
        case ItemKind::Coin: return "GOLD";
        case ItemKind::DoorNS:
        case ItemKind::DoorEW: return "DOOR";
        case ItemKind::PortcullisNS:
        case ItemKind::PortcullisEW: return "PORTCULLIS";
        case ItemKind::Outfit1: return "YOUR CLOTHES";
        case ItemKind::Outfit2: return "SERVANT UNIFORM";
    }
    return "THING";
}
