#pragma once
// Core types: the atoms of a turn
//
// Every turn is a Signal. Every probability lives in [0,1].
// The stabilizer state is the one label all layers share.

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>

namespace liminal {

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

inline float clamp01(float v) {
    return std::clamp(v, 0.0f, 1.0f);
}

// Prosodic tone of a turn
enum class Tone {
    Neutral,
    Calm,
    Energetic
};

inline const char* to_string(Tone tone) {
    switch (tone) {
        case Tone::Neutral: return "Neutral";
        case Tone::Calm: return "Calm";
        case Tone::Energetic: return "Energetic";
    }
    return "Neutral";
}

inline bool tone_from_string(const std::string& s, Tone& out) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (v == "neutral") { out = Tone::Neutral; return true; }
    if (v == "calm") { out = Tone::Calm; return true; }
    if (v == "energetic") { out = Tone::Energetic; return true; }
    return false;
}

// Emotional temperature of the conversation, owned by the Stabilizer
// and passed by value to every later layer.
enum class StabilizerState {
    Normal,
    Warming,
    Overheat,
    Cooldown
};

inline const char* to_string(StabilizerState state) {
    switch (state) {
        case StabilizerState::Normal: return "Normal";
        case StabilizerState::Warming: return "Warming";
        case StabilizerState::Overheat: return "Overheat";
        case StabilizerState::Cooldown: return "Cooldown";
    }
    return "Normal";
}

// One turn's prosody reading
struct Signal {
    float drift = 0.0f;        // 0=stable, 1=chaotic
    float resonance = 0.0f;    // 0=absent, 1=fully present
    Tone tone = Tone::Neutral;
    float tempo_wpm = 150.0f;  // words per minute, > 0
    float pause_ms = 80.0f;    // inter-phrase pause, >= 0
    float silence_s = 0.0f;    // elapsed silence before this turn
    bool repeated_theme = false;
    std::string text;

    // Copy with every field forced into its domain
    Signal sanitized() const {
        Signal s = *this;
        s.drift = std::isfinite(drift) ? clamp01(drift) : 0.0f;
        s.resonance = std::isfinite(resonance) ? clamp01(resonance) : 0.0f;
        s.tempo_wpm = (std::isfinite(tempo_wpm) && tempo_wpm > 0.0f) ? tempo_wpm : 1.0f;
        s.pause_ms = (std::isfinite(pause_ms) && pause_ms > 0.0f) ? pause_ms : 0.0f;
        s.silence_s = (std::isfinite(silence_s) && silence_s > 0.0f) ? silence_s : 0.0f;
        return s;
    }
};

// FNV-1a over the text, folded into two [0,1] values
inline std::pair<float, float> hash01(const std::string& s) {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char b : s) {
        h ^= b;
        h *= 0x100000001b3ULL;
    }
    float a = static_cast<float>((h >> 11) & 0xFFFF) / 65535.0f;
    float b = static_cast<float>((h >> 27) & 0xFFFF) / 65535.0f;
    return {a, b};
}

} // namespace liminal
