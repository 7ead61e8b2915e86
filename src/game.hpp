#pragma once

#include "common.hpp"
#include "guard.hpp"
#include "map.hpp"
#include "popups.hpp"
#include "rng.hpp"
#include "settings.hpp"

#include <cstdint>
#include <string>
#include <vector>

enum class MessageKind : uint8_t {
    Info = 0,
    Combat,
    Loot,
    System,
    Warning,
    Success,
};

struct Message {
    std::string text;
    MessageKind kind = MessageKind::Info;
    bool fromPlayer = true;

    // Consecutive duplicate messages are compacted by incrementing this counter.
    // Example: "YOU ARE HIT!" repeated 3 times becomes one log line with repeat=3.
    int repeat = 1;
};

// What a player intent turned into.
enum class TurnOutcome : uint8_t {
    Moved = 0,      // stepped (or waited); time advanced
    Deflected,      // diagonal slid along a wall; time advanced
    Used,           // swapped outfits in place; time advanced
    Blocked,        // nothing happened; time did not advance
    PlayerDead,     // ignored, the player is dead
    LevelAdvanced,  // walked off a finished level onto the next one
};

const char* turnOutcomeName(TurnOutcome o);

// Overhead marker drawn above an alerted guard.
enum class GuardAlertIcon : uint8_t {
    None = 0,
    Question,     // looking, listening or searching
    Exclamation,  // chasing
};

class Game {
public:
    // Unseen guards closer than this (distance squared) are still drawn, and
    // their alert icons show a little closer in.
    static constexpr int GUARD_SENSE_RADIUS_SQ = 36;
    static constexpr int GUARD_ICON_RADIUS_SQ = 25;
    static constexpr int AIR_TURNS = PLAYER_AIR_TURNS;

    explicit Game(uint32_t seed);
    Game(uint32_t seed, const Settings& settings);

    // Fresh session: reseeds the RNG and generates the initial level.
    void newGame(uint32_t seed);

    // Regenerate the initial level from the session RNG (no reseed).
    void restart();

    // Next level; health carries over, everything else on the player resets.
    void advanceToNextLevel();

    // One player action. `dir` is a step in {-1,0,1}^2; (0,0) waits a turn.
    TurnOutcome applyPlayerIntent(Vec2i dir);

    // Debug hooks. Each refreshes the level-complete flag.
    void toggleSeeAll();
    void debugMarkAllSeen();
    void debugMarkAllUnseen();
    void debugCollectAllLoot();
    void toggleDisguise();

    // Replace the current level with a prepared map. The player moves to
    // map.posStart and keeps health, gold and outfit.
    void debugLoadMap(Map map);

    const Map& map() const { return map_; }
    const Player& player() const { return player_; }
    int level() const { return level_; }
    bool finishedLevel() const { return finishedLevel_; }
    bool seeAll() const { return seeAll_; }
    const Popups& popups() const { return popups_; }
    const std::vector<Message>& messages() const { return msgs; }
    const Settings& settings() const { return settings_; }

    // Whether the presentation layer should draw guard `i` at all.
    bool guardVisibleToPlayer(size_t i) const;
    GuardAlertIcon guardAlertIcon(size_t i) const;

    void pushMsg(const std::string& s, MessageKind kind = MessageKind::Info, bool fromPlayer = true);

private:
    RNG rng;
    Settings settings_;
    int level_ = 0;
    Map map_;
    GuardLines lines;
    Popups popups_;
    Player player_;
    bool finishedLevel_ = false;
    bool seeAll_ = false;

    std::vector<Message> msgs;

    void startLevel(int level);
    Map buildLevel(int level);

    bool blocked(Vec2i posOld, Vec2i posNew) const;
    bool haltsSlide(Vec2i pos) const;
    TurnOutcome tryUseInDirection(Vec2i dir);
    void makeNoise(const char* noise);
    void preTurn();
    void advanceTime();
    void updateMapVisibility();
    void refreshFinished();
};
