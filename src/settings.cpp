#include "settings.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    try {
        size_t used = 0;
        const std::string s = trim(v);
        const int n = std::stoi(s, &used);
        if (used != s.size()) return false;
        out = n;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseU32(const std::string& v, uint32_t& out) {
    try {
        size_t used = 0;
        const std::string s = trim(v);
        if (s.empty() || s[0] == '-') return false;
        const unsigned long n = std::stoul(s, &used, 0);
        if (used != s.size() || n > 0xFFFFFFFFul) return false;
        out = static_cast<uint32_t>(n);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void noteBadValue(std::string* err, int lineNo, const std::string& key, const std::string& val) {
    if (!err) return;
    if (!err->empty()) *err += "\n";
    *err += "LINE " + std::to_string(lineNo) + ": BAD VALUE FOR " + key + ": '" + val + "'";
}

} // namespace

bool loadSettingsFile(const std::string& path, Settings& s, std::string* err) {
    std::ifstream f(path);
    if (!f) {
        if (err) *err = "CANNOT OPEN " + path;
        return false;
    }

    std::string line;
    int lineNo = 0;
    while (std::getline(f, line)) {
        ++lineNo;

        // Strip comments (# or ;)
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                              semi == std::string::npos ? line.size() : semi);
        line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));

        bool ok = true;
        if (key == "seed") {
            uint32_t v = 0;
            ok = parseU32(val, v);
            if (ok) s.seed = v;
        } else if (key == "initial_level") {
            int v = 0;
            ok = parseInt(val, v);
            if (ok) s.initialLevel = std::clamp(v, 0, 99);
        } else if (key == "see_all") {
            bool b = false;
            ok = parseBool(val, b);
            if (ok) s.seeAll = b;
        } else if (key == "player_health") {
            int v = 0;
            ok = parseInt(val, v);
            if (ok) s.playerHealth = std::clamp(v, 1, 99);
        } else if (key == "creaky_floors") {
            bool b = true;
            ok = parseBool(val, b);
            if (ok) s.creakyFloors = b;
        }

        if (!ok) noteBadValue(err, lineNo, key, val);
    }

    return true;
}

Settings loadSettings(const std::string& path) {
    Settings s;
    std::string ignored;
    if (!loadSettingsFile(path, s, &ignored)) return Settings{};
    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# Disguiser settings
#
# Lines are: key = value
# Comments start with # or ;

# Session
# seed: 0 picks a seed from the clock; any other value replays exactly.
seed = 0
# initial_level: level a new game (and restart) begins on (0 = tutorial yard).
initial_level = 0

# Player
# player_health: 1..99
player_health = 5

# Level generation
# creaky_floors: true/false  (wooden floors on deeper levels sometimes creak)
creaky_floors = true

# Debug
# see_all: true/false  (show every guard and every guard's speech)
see_all = false
)INI";

    return static_cast<bool>(f);
}

bool updateIniKey(const std::string& path, const std::string& key, const std::string& value) {
    std::ifstream in(path);
    if (!in) return false;

    std::vector<std::string> lines;
    std::string line;

    bool found = false;
    while (std::getline(in, line)) {
        std::string raw = line;

        // Strip comments for matching, but preserve the original line for output when not matching.
        auto commentPos = raw.find_first_of("#;");
        if (commentPos != std::string::npos) raw = raw.substr(0, commentPos);

        auto eq = raw.find('=');
        if (eq != std::string::npos) {
            std::string k = trim(raw.substr(0, eq));
            if (!k.empty() && toLower(k) == toLower(key)) {
                lines.push_back(key + " = " + value);
                found = true;
                continue;
            }
        }

        lines.push_back(line);
    }
    in.close();

    if (!found) {
        // Append at end.
        lines.push_back(key + " = " + value);
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) return false;

    for (size_t i = 0; i < lines.size(); ++i) {
        out << lines[i];
        if (i + 1 < lines.size()) out << "\n";
    }
    return static_cast<bool>(out);
}
