#include "game.hpp"
#include "settings.hpp"
#include "version.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>              Session seed (default: settings, else the clock).\n"
        << "  --level <n>             Level to start on (overrides initial_level).\n"
        << "  --moves <keys>          Moves to replay: h j k l y u b n (vi keys), '.' waits.\n"
        << "  --turns <n>             After the moves, take n random steps.\n"
        << "  --settings <path>       Settings INI to load.\n"
        << "  --write-settings <path> Write a commented default settings file and exit.\n"
        << "  --dump                  Print an ASCII map after the run.\n"
        << "  --version               Print version.\n"
        << "  --help                  Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

// y grows northward, so 'k' (up) is +y.
static bool dirFromKey(char c, Vec2i& out) {
    switch (c) {
        case 'h': out = {-1, 0}; return true;
        case 'l': out = {1, 0}; return true;
        case 'k': out = {0, 1}; return true;
        case 'j': out = {0, -1}; return true;
        case 'y': out = {-1, 1}; return true;
        case 'u': out = {1, 1}; return true;
        case 'b': out = {-1, -1}; return true;
        case 'n': out = {1, -1}; return true;
        case '.': out = {0, 0}; return true;
        default: return false;
    }
}

static void dumpMap(const Game& game) {
    const Map& map = game.map();

    for (int y = map.height - 1; y >= 0; --y) {
        std::string row;
        row.reserve(static_cast<size_t>(map.width));

        for (int x = 0; x < map.width; ++x) {
            const Vec2i p{x, y};
            const Cell& c = map.at(p);

            char ch = c.seen || game.seeAll() ? glyphForCellType(c.type) : ' ';
            if (c.seen || game.seeAll()) {
                for (const Item& it : map.items) {
                    if (it.pos == p) ch = glyphForItemKind(it.kind);
                }
            }

            const int gi = map.guardIndexAt(p);
            if (gi >= 0 && game.guardVisibleToPlayer(static_cast<size_t>(gi))) ch = 'G';
            if (game.player().pos == p) ch = '@';

            row.push_back(ch);
        }

        std::cout << row << "\n";
    }
}

static const char* alertMark(GuardAlertIcon icon) {
    switch (icon) {
        case GuardAlertIcon::Question: return " ?";
        case GuardAlertIcon::Exclamation: return " !";
        case GuardAlertIcon::None: break;
    }
    return "";
}

static void printSummary(const Game& game, uint32_t seed, int movesTaken, TurnOutcome last) {
    const Player& p = game.player();
    const Map& map = game.map();

    std::cout << DISGUISER_APPNAME << " " << DISGUISER_VERSION << "\n";
    std::cout << "SEED " << seed << "  LEVEL " << (game.level() + 1)
              << "  SIZE " << map.width << "x" << map.height
              << "  TURNS " << movesTaken
              << "  LAST " << turnOutcomeName(last) << "\n";
    std::cout << "HEALTH " << p.health << "/" << p.maxHealth
              << "  GOLD " << p.gold << "/" << map.totalLoot
              << "  SEEN " << map.percentSeen() << "%"
              << "  ON " << cellTypeName(map.at(p.pos).type)
              << (p.disguised ? "  DISGUISED" : "")
              << (game.finishedLevel() ? "  COMPLETE" : "") << "\n";

    for (size_t i = 0; i < map.guards.size(); ++i) {
        const Guard& g = map.guards[i];
        std::cout << "GUARD " << i << " (" << g.pos.x << "," << g.pos.y << ") "
                  << (g.kind == GuardKind::Inner ? "INNER " : "OUTER ")
                  << guardModeName(g.mode) << alertMark(game.guardAlertIcon(i)) << "\n";
    }

    const std::vector<Message>& msgs = game.messages();
    const size_t first = msgs.size() > 8 ? msgs.size() - 8 : 0;
    for (size_t i = first; i < msgs.size(); ++i) {
        std::cout << "> " << msgs[i].text;
        if (msgs[i].repeat > 1) std::cout << " (x" << msgs[i].repeat << ")";
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string settingsPath;
    std::string moves;
    bool haveSeed = false;
    bool haveLevel = false;
    bool dump = false;
    uint32_t seed = 0;
    uint32_t level = 0;
    uint32_t randomTurns = 0;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << DISGUISER_APPNAME << " " << DISGUISER_VERSION << "\n";
            return 0;
        } else if (a == "--seed") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--seed requires a value\n";
                return 2;
            }
            if (!parseU32(v, seed)) {
                std::cerr << "Invalid --seed: " << v << "\n";
                return 2;
            }
            haveSeed = true;
        } else if (a == "--level") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--level requires a value\n";
                return 2;
            }
            if (!parseU32(v, level) || level > 99) {
                std::cerr << "Invalid --level: " << v << "\n";
                return 2;
            }
            haveLevel = true;
        } else if (a == "--moves") {
            if (!argValue(i, argc, argv, moves)) {
                std::cerr << "--moves requires a string\n";
                return 2;
            }
        } else if (a == "--turns") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--turns requires a value\n";
                return 2;
            }
            if (!parseU32(v, randomTurns)) {
                std::cerr << "Invalid --turns: " << v << "\n";
                return 2;
            }
        } else if (a == "--settings") {
            if (!argValue(i, argc, argv, settingsPath)) {
                std::cerr << "--settings requires a path\n";
                return 2;
            }
        } else if (a == "--write-settings") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--write-settings requires a path\n";
                return 2;
            }
            if (!writeDefaultSettings(v)) {
                std::cerr << "Failed to write " << v << "\n";
                return 1;
            }
            std::cout << "Wrote " << v << "\n";
            return 0;
        } else if (a == "--dump") {
            dump = true;
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    Settings settings;
    if (!settingsPath.empty()) {
        std::string err;
        if (!loadSettingsFile(settingsPath, settings, &err)) {
            std::cerr << err << "\n";
            return 1;
        }
        if (!err.empty()) std::cerr << err << "\n";
    }

    if (haveLevel) settings.initialLevel = static_cast<int>(level);

    if (!haveSeed) {
        seed = settings.seed;
        if (seed == 0) {
            const auto now = std::chrono::system_clock::now().time_since_epoch();
            seed = hash32(static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count()));
        }
    }

    Game game(seed, settings);
    int movesTaken = 0;
    TurnOutcome last = TurnOutcome::Blocked;

    for (char c : moves) {
        Vec2i d;
        if (!dirFromKey(c, d)) {
            std::cerr << "Invalid move key: '" << c << "'\n";
            return 2;
        }
        last = game.applyPlayerIntent(d);
        if (last == TurnOutcome::PlayerDead) break;
        if (last != TurnOutcome::Blocked) ++movesTaken;
    }

    // Own stream; the session RNG only feeds generation and the guards.
    RNG walk(hashCombine(seed, 0x5741u));
    static const char* const WALK_KEYS = "hjklyubn.";
    for (uint32_t t = 0; t < randomTurns; ++t) {
        Vec2i d;
        if (!dirFromKey(WALK_KEYS[walk.range(0, 8)], d)) continue;
        last = game.applyPlayerIntent(d);
        if (last == TurnOutcome::PlayerDead) break;
        if (last != TurnOutcome::Blocked) ++movesTaken;
    }

    printSummary(game, seed, movesTaken, last);
    if (dump) dumpMap(game);

    return 0;
}
