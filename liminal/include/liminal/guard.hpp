#pragma once
// Soft guard: last-line check on the merged turn
//
// High drift with good resonance only warns. High drift with weak
// resonance rephrases the utterance into a calmer form.

#include "types.hpp"
#include <cstdio>
#include <string>

namespace liminal {

struct GuardConfig {
    float drift_limit = 0.40f;
    float res_limit = 0.60f;
};

struct GuardAction {
    enum class Kind { None, Warn, Rephrased };

    Kind kind = Kind::None;
    std::string text;   // warning message or rephrased utterance

    bool rephrased() const { return kind == Kind::Rephrased; }

    const char* label() const {
        switch (kind) {
            case Kind::None: return "none";
            case Kind::Warn: return "warn";
            case Kind::Rephrased: return "rephrased";
        }
        return "none";
    }
};

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

inline GuardAction check_guard(const std::string& text, float drift, float res,
                               const GuardConfig& config = {}) {
    GuardAction action;
    if (drift <= config.drift_limit && res >= config.res_limit) {
        return action;
    }

    if (drift > config.drift_limit && res >= config.res_limit) {
        char buf[80];
        snprintf(buf, sizeof(buf), "[soft-guard] high drift %.2f -> adjusting tone", drift);
        action.kind = GuardAction::Kind::Warn;
        action.text = buf;
        return action;
    }

    if (drift > config.drift_limit && res < config.res_limit) {
        std::string t = trim(text);
        for (auto& c : t) {
            if (c == '!') c = '.';
        }
        size_t pos;
        while ((pos = t.find("  ")) != std::string::npos) {
            t.erase(pos, 1);
        }
        action.kind = GuardAction::Kind::Rephrased;
        action.text = t + " [recentered]";
    }

    return action;
}

} // namespace liminal
