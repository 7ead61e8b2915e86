#pragma once

#include "common.hpp"

#include <cstdint>
#include <string>
#include <vector>

// World-anchored events raised during one turn (speech bubbles, noises,
// damage). The presentation layer reads them after the turn; the session
// clears them at the start of the next accepted action.

enum class PopupType : uint8_t {
    Noise = 0,
    Damage,
    GuardSpeech,
    Narration,
};

struct Popup {
    PopupType type = PopupType::Narration;
    Vec2i worldPos;
    std::string text;
};

struct Popups {
    std::vector<Popup> list;

    void clear() { list.clear(); }
    bool empty() const { return list.empty(); }

    void guardSpeech(Vec2i pos, const std::string& s) { list.push_back({PopupType::GuardSpeech, pos, s}); }
    void damage(Vec2i pos, const std::string& s) { list.push_back({PopupType::Damage, pos, s}); }
    void noise(Vec2i pos, const std::string& s) { list.push_back({PopupType::Noise, pos, s}); }
    void narration(Vec2i pos, const std::string& s) { list.push_back({PopupType::Narration, pos, s}); }

    int count(PopupType t) const {
        int n = 0;
        for (const Popup& p : list) {
            if (p.type == t) ++n;
        }
        return n;
    }
};
