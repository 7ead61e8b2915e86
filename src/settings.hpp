#pragma once

#include <cstdint>
#include <string>

// Simple user-editable settings file (INI-ish: key = value).
struct Settings {
    // Session seed. 0 means "pick one from the clock" (headless driver only;
    // the library never reads the clock).
    uint32_t seed = 0;

    // Level a new session (and restart) begins on.
    int initialLevel = 0;

    // Debug: every guard is always drawn and always heard.
    bool seeAll = false;

    int playerHealth = 5; // 1..99

    // Occasional creaky floorboards on deeper levels.
    bool creakyFloors = true;
};

// Parses a settings file into `out`. Unknown keys are ignored; malformed
// values keep their defaults and are listed in `err` (one per line).
// Returns false only if the file could not be opened.
bool loadSettingsFile(const std::string& path, Settings& out, std::string* err = nullptr);

// Loads settings from disk. If the file is missing or invalid, defaults are used.
Settings loadSettings(const std::string& path);

// Update (or append) a single key=value entry in the settings file.
// Returns false if the file could not be read/written.
bool updateIniKey(const std::string& path, const std::string& key, const std::string& value);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);
