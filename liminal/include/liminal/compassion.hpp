#pragma once
// Compassion: sensing distress and answering it gently
//
// Suffering is an additive score over independent signals, then
// thresholded into a type. Kindness is judged from what the controller
// actually did this turn. The compassion level blends both and, past
// 0.5, softens the voice.

#include "types.hpp"
#include <cstdio>
#include <string>

namespace liminal {

enum class SufferingType {
    None,
    Mild,
    Moderate,
    Severe
};

inline const char* to_string(SufferingType t) {
    switch (t) {
        case SufferingType::None: return "None";
        case SufferingType::Mild: return "Mild";
        case SufferingType::Moderate: return "Moderate";
        case SufferingType::Severe: return "Severe";
    }
    return "None";
}

inline SufferingType classify_suffering(float suffering) {
    if (suffering < 0.2f) return SufferingType::None;
    if (suffering < 0.4f) return SufferingType::Mild;
    if (suffering < 0.7f) return SufferingType::Moderate;
    return SufferingType::Severe;
}

struct CompassionAdjustments {
    float resonance_boost = 0.0f;
    float pace_adjustment = 0.0f;
    int64_t pause_adjustment_ms = 0;
    float drift_reduction = 0.0f;
};

struct CompassionState {
    float user_suffering = 0.0f;
    SufferingType suffering_type = SufferingType::None;
    float response_kindness = 0.5f;
    float healing_intent = 0.3f;
    float compassion_level = 0.0f;
    uint64_t suffering_count = 0;    // distinct episodes above 0.2
    uint64_t suffering_streak = 0;   // consecutive repeated-theme turns

    void detect_suffering(float drift, float resonance, Tone tone, float tempo_wpm,
                          StabilizerState state, bool repeated_theme) {
        drift = std::isfinite(drift) ? clamp01(drift) : 0.0f;
        resonance = std::isfinite(resonance) ? clamp01(resonance) : 0.0f;

        float score = 0.0f;

        // chaos
        if (drift > 0.5f && resonance < 0.6f) {
            score += (drift - 0.5f) * 2.0f;
            score += (0.6f - resonance) * 1.5f;
        }

        // overload
        if (state == StabilizerState::Overheat) score += 0.3f;

        // anxious tempo
        if (tone == Tone::Energetic && tempo_wpm > 180.0f) score += 0.2f;

        // stuck on the same theme
        if (repeated_theme) {
            score += 0.25f;
            suffering_streak++;
        } else {
            suffering_streak = 0;
        }

        if (suffering_streak > 2) score += 0.3f;

        bool was_suffering = user_suffering > 0.2f;
        user_suffering = clamp01(score);
        suffering_type = classify_suffering(user_suffering);

        if (user_suffering > 0.2f && !was_suffering) suffering_count++;

        healing_intent = clamp01(0.3f + user_suffering * 0.7f);
    }

    void calculate_kindness(bool was_rephrased, float pace_delta,
                            int64_t pause_delta_ms, float resonance_boost) {
        float kindness = 0.5f;
        if (was_rephrased) kindness += 0.2f;
        if (pace_delta < 0.0f) kindness += std::abs(pace_delta) * 0.5f;
        if (pause_delta_ms > 0) {
            kindness += std::min(static_cast<float>(pause_delta_ms) / 100.0f, 0.2f);
        }
        if (resonance_boost > 0.0f) kindness += resonance_boost * 2.0f;
        response_kindness = clamp01(kindness);
    }

    void update_compassion_level() {
        compassion_level = clamp01(user_suffering * 0.5f
                                   + healing_intent * 0.3f
                                   + response_kindness * 0.2f);
    }

    bool should_activate_compassion() const { return compassion_level > 0.5f; }

    bool should_offer_support() const {
        return suffering_type == SufferingType::Moderate
            || suffering_type == SufferingType::Severe;
    }

    CompassionAdjustments adjustments() const {
        float level = compassion_level;
        CompassionAdjustments adj;
        adj.resonance_boost = level * 0.1f;
        adj.pace_adjustment = -level * 0.05f;
        adj.pause_adjustment_ms = static_cast<int64_t>(level * 30.0f);
        adj.drift_reduction = level * 0.08f;
        return adj;
    }

    std::string status_message() const {
        char buf[128];
        switch (suffering_type) {
            case SufferingType::None:
                snprintf(buf, sizeof(buf), "Compassion: Observing (suffering=%.2f)", user_suffering);
                break;
            case SufferingType::Mild:
                snprintf(buf, sizeof(buf), "Compassion: Gentle Care (suffering=%.2f, healing=%.2f)",
                         user_suffering, healing_intent);
                break;
            case SufferingType::Moderate:
                snprintf(buf, sizeof(buf), "Compassion: Active Support (suffering=%.2f, kindness=%.2f)",
                         user_suffering, response_kindness);
                break;
            case SufferingType::Severe:
                snprintf(buf, sizeof(buf), "Compassion: Deep Care (suffering=%.2f, streak=%llu)",
                         user_suffering, static_cast<unsigned long long>(suffering_streak));
                break;
        }
        return buf;
    }
};

} // namespace liminal
