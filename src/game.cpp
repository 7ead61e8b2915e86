#include "game.hpp"

#include "mansion_gen.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace {

constexpr Vec2i DIRS4[4] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};

const char* const CREAK_NOISE = "CREAK!";

} // namespace

const char* turnOutcomeName(TurnOutcome o) {
    switch (o) {
        case TurnOutcome::Moved: return "MOVED";
        case TurnOutcome::Deflected: return "DEFLECTED";
        case TurnOutcome::Used: return "USED";
        case TurnOutcome::Blocked: return "BLOCKED";
        case TurnOutcome::PlayerDead: return "DEAD";
        case TurnOutcome::LevelAdvanced: return "LEVEL";
    }
    return "?";
}

Game::Game(uint32_t seed) : Game(seed, Settings{}) {}

Game::Game(uint32_t seed, const Settings& settings) : rng(seed), settings_(settings) {
    newGame(seed);
}

void Game::pushMsg(const std::string& s, MessageKind kind, bool fromPlayer) {
    // Coalesce consecutive identical messages.
    if (!msgs.empty()) {
        Message& last = msgs.back();
        if (last.text == s && last.kind == kind && last.fromPlayer == fromPlayer) {
            if (last.repeat < 9999) {
                ++last.repeat;
            }
            return;
        }
    }

    // Keep some scrollback
    if (msgs.size() > 400) {
        msgs.erase(msgs.begin(), msgs.begin() + 100);
    }

    Message m;
    m.text = s;
    m.kind = kind;
    m.fromPlayer = fromPlayer;
    msgs.push_back(m);
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------

Map Game::buildLevel(int level) {
    MansionGenOptions opts;
    opts.creakyFloors = settings_.creakyFloors;
    return generateMap(rng, level, opts);
}

void Game::startLevel(int level) {
    level_ = level;
    map_ = buildLevel(level);
    finishedLevel_ = false;
    popups_.clear();
}

void Game::newGame(uint32_t seed) {
    rng = RNG(seed);
    lines = GuardLines();
    seeAll_ = settings_.seeAll;
    msgs.clear();

    startLevel(settings_.initialLevel);
    player_ = Player(map_.posStart, settings_.playerHealth);
    updateMapVisibility();

    std::ostringstream ss;
    ss << "WELCOME TO LEVEL " << (level_ + 1) << ". STEAL THE LOOT AND MAP THE MANSION.";
    pushMsg(ss.str(), MessageKind::System, false);
}

void Game::restart() {
    startLevel(settings_.initialLevel);
    player_ = Player(map_.posStart, settings_.playerHealth);
    updateMapVisibility();

    pushMsg("RESTARTED.", MessageKind::System, false);
}

void Game::advanceToNextLevel() {
    startLevel(level_ + 1);

    player_.pos = map_.posStart;
    player_.dir = {0, -1};
    player_.gold = 0;
    player_.noisy = false;
    player_.disguised = false;
    player_.damagedLastTurn = false;
    player_.turnsRemainingUnderwater = 0;

    updateMapVisibility();

    std::ostringstream ss;
    ss << "WELCOME TO LEVEL " << (level_ + 1) << ".";
    pushMsg(ss.str(), MessageKind::System, false);
}

// ---------------------------------------------------------------------------
// Player turn
// ---------------------------------------------------------------------------

bool Game::blocked(Vec2i posOld, Vec2i posNew) const {
    if (!map_.inBounds(posNew)) return true;
    if (posOld == posNew) return false;

    const CellType t = map_.at(posNew).type;
    if (tileDef(t).blocksPlayer) return true;

    // One-way windows only admit movement in their named direction.
    switch (t) {
        case CellType::OneWayWindowE: if (posNew.x <= posOld.x) return true; break;
        case CellType::OneWayWindowW: if (posNew.x >= posOld.x) return true; break;
        case CellType::OneWayWindowN: if (posNew.y <= posOld.y) return true; break;
        case CellType::OneWayWindowS: if (posNew.y >= posOld.y) return true; break;
        default: break;
    }

    if (map_.isGuardAt(posNew)) return true;
    if (map_.isOutfitAt(posNew)) return true;

    return false;
}

bool Game::haltsSlide(Vec2i pos) const {
    if (!map_.inBounds(pos)) return false;
    return map_.isGuardAt(pos) || map_.isOutfitAt(pos);
}

TurnOutcome Game::tryUseInDirection(Vec2i dir) {
    const Vec2i pos = player_.pos + dir;
    if (!map_.inBounds(pos)) return TurnOutcome::Blocked;

    const ItemKind outfitCur = player_.disguised ? ItemKind::Outfit2 : ItemKind::Outfit1;
    ItemKind outfitNew = outfitCur;
    if (!map_.tryUseOutfitAt(pos, outfitCur, outfitNew)) return TurnOutcome::Blocked;

    preTurn();
    player_.disguised = (outfitNew != ItemKind::Outfit1);
    player_.dir = updateDir(player_.dir, dir);

    std::string msg = "YOU PUT ON ";
    msg += itemKindName(outfitNew);
    msg += ".";
    pushMsg(msg, MessageKind::Info);

    advanceTime();
    return TurnOutcome::Used;
}

void Game::makeNoise(const char* noise) {
    player_.noisy = true;
    popups_.noise(player_.pos, noise);

    for (int i : map_.guardsInEarshot(player_.pos, PLAYER_NOISE_RADIUS_SQ)) {
        map_.guards[static_cast<size_t>(i)].hearThief();
    }
}

void Game::preTurn() {
    popups_.clear();
    player_.noisy = false;
    player_.damagedLastTurn = false;
}

TurnOutcome Game::applyPlayerIntent(Vec2i dir) {
    if (player_.dead()) return TurnOutcome::PlayerDead;

    dir.x = clampi(dir.x, -1, 1);
    dir.y = clampi(dir.y, -1, 1);

    const Vec2i posNew = player_.pos + dir;

    // Walking off a finished level.
    if (!map_.inBounds(posNew) && finishedLevel_) {
        advanceToNextLevel();
        return TurnOutcome::LevelAdvanced;
    }

    TurnOutcome outcome = TurnOutcome::Moved;

    if (blocked(player_.pos, posNew)) {
        if (dir.x == 0 || dir.y == 0 || haltsSlide(posNew)) {
            return tryUseInDirection(dir);
        }

        // Diagonal into something solid: slide along whichever axis is open.
        const bool xBlocked = blocked(player_.pos, player_.pos + Vec2i{dir.x, 0});
        const bool yBlocked = blocked(player_.pos, player_.pos + Vec2i{0, dir.y});

        if (xBlocked == yBlocked) return tryUseInDirection(dir);

        if (xBlocked) {
            dir.x = 0;
        } else {
            dir.y = 0;
        }
        outcome = TurnOutcome::Deflected;
    }

    preTurn();

    player_.dir = updateDir(player_.dir, dir);
    player_.pos += dir;

    const int loot = map_.collectLootAt(player_.pos);
    if (loot > 0) {
        player_.gold += loot;
        std::ostringstream ss;
        ss << "YOU PICK UP " << loot << " GOLD.";
        pushMsg(ss.str(), MessageKind::Loot);
    }

    if (dir != Vec2i{0, 0} && map_.at(player_.pos).type == CellType::GroundWoodCreaky) {
        makeNoise(CREAK_NOISE);
        pushMsg("THE FLOOR CREAKS.", MessageKind::Warning);
    }

    advanceTime();
    return outcome;
}

void Game::advanceTime() {
    if (map_.at(player_.pos).type == CellType::GroundWater) {
        if (player_.turnsRemainingUnderwater > 0) {
            --player_.turnsRemainingUnderwater;
        }
    } else {
        player_.turnsRemainingUnderwater = AIR_TURNS;
    }

    const int healthPrev = player_.health;

    guardActAll(rng, seeAll_, popups_, lines, map_, player_);

    if (player_.health < healthPrev) {
        pushMsg(player_.dead() ? "YOU HAVE BEEN CAUGHT!" : "YOU ARE HIT!", MessageKind::Combat, false);
    }

    updateMapVisibility();

    if (!finishedLevel_ && map_.allLootCollected() && map_.allSeen()) {
        finishedLevel_ = true;
        popups_.narration(player_.pos, "LEVEL COMPLETE");
        pushMsg("LEVEL COMPLETE! WALK OFF THE MAP TO CONTINUE.", MessageKind::Success, false);
    }
}

// The player sees from their own cell and, where nothing blocks, from each
// orthogonal neighbor, which lets them peek around corners.
void Game::updateMapVisibility() {
    map_.recomputeVisibility(player_.pos);

    for (const Vec2i& d : DIRS4) {
        if (map_.playerCanSeeInDirection(player_.pos, d)) {
            map_.recomputeVisibility(player_.pos + d);
        }
    }
}

// Every debug hook leaves finishedLevel_ equal to allLootCollected() && allSeen().
void Game::refreshFinished() {
    finishedLevel_ = map_.allLootCollected() && map_.allSeen();
}

// ---------------------------------------------------------------------------
// Debug hooks
// ---------------------------------------------------------------------------

void Game::toggleSeeAll() {
    seeAll_ = !seeAll_;
    refreshFinished();
    pushMsg(seeAll_ ? "SEE ALL: ON." : "SEE ALL: OFF.", MessageKind::System, false);
}

void Game::debugMarkAllSeen() {
    map_.markAllSeen();
    refreshFinished();
    pushMsg("MAP REVEALED.", MessageKind::System, false);
}

void Game::debugMarkAllUnseen() {
    map_.markAllUnseen();
    updateMapVisibility();
    refreshFinished();
    pushMsg("MAP FORGOTTEN.", MessageKind::System, false);
}

void Game::debugCollectAllLoot() {
    player_.gold += map_.collectAllLoot();
    refreshFinished();
    pushMsg("ALL LOOT COLLECTED.", MessageKind::System, false);
}

void Game::debugLoadMap(Map map) {
    map_ = std::move(map);
    popups_.clear();
    player_.pos = map_.posStart;
    updateMapVisibility();
    refreshFinished();
    pushMsg("MAP LOADED.", MessageKind::System, false);
}

void Game::toggleDisguise() {
    player_.disguised = !player_.disguised;
    refreshFinished();
    pushMsg(player_.disguised ? "DISGUISE ON." : "DISGUISE OFF.", MessageKind::System, false);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool Game::guardVisibleToPlayer(size_t i) const {
    if (i >= map_.guards.size()) return false;
    const Guard& g = map_.guards[i];

    if (seeAll_ || map_.at(g.pos).seen || g.speaking) return true;
    return lengthSquared(player_.pos - g.pos) <= GUARD_SENSE_RADIUS_SQ;
}

GuardAlertIcon Game::guardAlertIcon(size_t i) const {
    if (i >= map_.guards.size()) return GuardAlertIcon::None;
    const Guard& g = map_.guards[i];

    const bool visible = seeAll_ || map_.at(g.pos).seen || g.speaking;
    if (!visible && lengthSquared(player_.pos - g.pos) > GUARD_ICON_RADIUS_SQ) return GuardAlertIcon::None;

    if (g.mode == GuardMode::ChaseVisibleTarget) return GuardAlertIcon::Exclamation;
    if (g.mode != GuardMode::Patrol) return GuardAlertIcon::Question;
    return GuardAlertIcon::None;
}
