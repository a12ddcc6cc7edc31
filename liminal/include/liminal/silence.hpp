#pragma once
// Silence: reading the pauses between turns
//
// A pause shorter than the minimum is not a silence. Longer pauses are
// typed by a first-match rule list over the turn that preceded them,
// scored for quality, and given a type-specific patience before the
// controller should speak into them.
//
// Episodes: silence_count grows once per silence (first qualifying
// detection after a reset). reset() closes the episode and folds its
// longest qualifying duration, with that reading's quality, into the
// session totals. A short reading inside an episode does not shrink it.

#include "types.hpp"
#include <cstdio>
#include <string>

namespace liminal {

enum class SilenceType {
    None,
    Contemplation,
    Peace,
    Uncertainty,
    Fear,
    Disconnect
};

inline const char* to_string(SilenceType t) {
    switch (t) {
        case SilenceType::None: return "None";
        case SilenceType::Contemplation: return "Contemplation";
        case SilenceType::Peace: return "Peace";
        case SilenceType::Uncertainty: return "Uncertainty";
        case SilenceType::Fear: return "Fear";
        case SilenceType::Disconnect: return "Disconnect";
    }
    return "None";
}

struct SilenceConfig {
    float min_duration_s = 1.5f;
};

// First matching rule wins
inline SilenceType classify_silence(float duration_s, float drift, float resonance,
                                    Tone tone, float suffering, StabilizerState state) {
    if (drift < 0.3f && resonance > 0.7f && tone == Tone::Calm) {
        return SilenceType::Peace;
    }
    if (duration_s < 5.0f && drift < 0.5f && resonance > 0.5f
        && (tone == Tone::Neutral || tone == Tone::Calm)) {
        return SilenceType::Contemplation;
    }
    if (suffering > 0.6f && duration_s > 3.0f) {
        return SilenceType::Fear;
    }
    if (drift > 0.6f && resonance < 0.4f) {
        return SilenceType::Disconnect;
    }
    if (state == StabilizerState::Overheat || state == StabilizerState::Warming) {
        return SilenceType::Uncertainty;
    }
    return SilenceType::Contemplation;
}

inline float score_silence_quality(float drift, float resonance, float suffering) {
    return clamp01(0.5f
                   + 0.4f * (resonance - 0.5f)
                   + 0.3f * (0.5f - drift)
                   + 0.3f * (1.0f - suffering));
}

// Seconds of silence after which the controller should speak
inline bool past_patience(SilenceType type, float duration_s, float quality) {
    switch (type) {
        case SilenceType::Peace:
        case SilenceType::Contemplation:
            return quality > 0.6f ? duration_s > 12.0f : duration_s > 6.0f;
        case SilenceType::Fear:
        case SilenceType::Disconnect:
            return duration_s > 4.0f;
        case SilenceType::Uncertainty:
            return duration_s > 5.0f;
        case SilenceType::None:
            return false;
    }
    return false;
}

struct SilenceState {
    float current_silence_duration = 0.0f;
    SilenceType silence_type = SilenceType::None;
    float silence_quality = 0.0f;
    bool is_generative = false;
    bool should_interrupt = false;
    uint64_t silence_count = 0;
    float total_silence_time = 0.0f;
    float max_silence_duration = 0.0f;
    float avg_silence_quality = 0.0f;

    void detect(float duration_s, float drift, float resonance, Tone tone,
                float suffering, StabilizerState state,
                const SilenceConfig& config = {}) {
        if (!std::isfinite(duration_s) || duration_s < 0.0f) duration_s = 0.0f;
        drift = std::isfinite(drift) ? clamp01(drift) : 0.0f;
        resonance = std::isfinite(resonance) ? clamp01(resonance) : 0.0f;
        suffering = std::isfinite(suffering) ? clamp01(suffering) : 0.0f;

        current_silence_duration = duration_s;

        if (duration_s < config.min_duration_s) {
            silence_type = SilenceType::None;
            is_generative = false;
            should_interrupt = false;
            return;
        }

        if (!in_episode_) {
            in_episode_ = true;
            silence_count++;
            episode_duration_ = 0.0f;
        }
        max_silence_duration = std::max(max_silence_duration, duration_s);

        silence_type = classify_silence(duration_s, drift, resonance, tone, suffering, state);
        silence_quality = score_silence_quality(drift, resonance, suffering);

        // The episode is folded in at its longest qualifying reading
        if (duration_s >= episode_duration_) {
            episode_duration_ = duration_s;
            episode_quality_ = silence_quality;
        }
        is_generative = (silence_type == SilenceType::Peace
                         || silence_type == SilenceType::Contemplation)
                        && silence_quality > 0.6f;
        should_interrupt = past_patience(silence_type, duration_s, silence_quality);
    }

    // New user input: close the current episode
    void reset() {
        if (in_episode_) {
            total_silence_time += episode_duration_;
            closed_episodes_++;
            avg_silence_quality = clamp01(avg_silence_quality
                + (episode_quality_ - avg_silence_quality) / static_cast<float>(closed_episodes_));
            in_episode_ = false;
        }
        current_silence_duration = 0.0f;
        silence_type = SilenceType::None;
        silence_quality = 0.0f;
        is_generative = false;
        should_interrupt = false;
    }

    bool in_episode() const { return in_episode_; }

    std::string status_message() const {
        char buf[128];
        if (silence_type == SilenceType::None) {
            snprintf(buf, sizeof(buf), "Silence: none (%.1fs, episodes=%llu)",
                     current_silence_duration, static_cast<unsigned long long>(silence_count));
        } else {
            snprintf(buf, sizeof(buf), "Silence: %s (%.1fs, quality=%.2f%s%s)",
                     to_string(silence_type), current_silence_duration, silence_quality,
                     is_generative ? ", generative" : "",
                     should_interrupt ? ", interrupt" : "");
        }
        return buf;
    }

private:
    bool in_episode_ = false;
    float episode_duration_ = 0.0f;
    float episode_quality_ = 0.0f;
    uint64_t closed_episodes_ = 0;
};

} // namespace liminal
