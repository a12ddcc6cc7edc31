#pragma once
// Awareness: the controller watching itself
//
// MetaCognition reads the stabilizer state and the size of the sync
// correction each turn and turns them into confidence, clarity and doubt.
// MetaStabilizer smooths that self-view so one odd turn does not
// flip the assessment.

#include "types.hpp"
#include <cstdio>
#include <string>

namespace liminal {

// Resonance offset the system applies to itself per stabilizer state
inline float self_resonance_offset(StabilizerState state) {
    switch (state) {
        case StabilizerState::Normal: return 0.1f;
        case StabilizerState::Warming: return 0.0f;
        case StabilizerState::Overheat: return -0.2f;
        case StabilizerState::Cooldown: return -0.1f;
    }
    return 0.0f;
}

struct MetaCognition {
    float self_drift = 0.0f;       // how much our own parameters are moving
    float self_resonance = 1.0f;   // how present we are
    float confidence = 0.5f;       // trust in the current measurement
    float clarity = 0.5f;          // confidence plus familiarity
    float doubt = 0.5f;            // never below 0.1
    uint64_t observation_count = 0;

    void observe(float measured_drift, float measured_res,
                 StabilizerState state, float sync_correction) {
        measured_drift = std::isfinite(measured_drift) ? clamp01(measured_drift) : 0.0f;
        measured_res = std::isfinite(measured_res) ? clamp01(measured_res) : 0.0f;
        if (!std::isfinite(sync_correction)) sync_correction = 0.0f;

        observation_count++;

        self_drift = clamp01(std::abs(sync_correction) * 5.0f);
        self_resonance = clamp01(measured_res + self_resonance_offset(state));
        confidence = clamp01((1.0f - measured_drift) * measured_res);

        float familiarity = std::min(static_cast<float>(observation_count) * 0.05f, 0.3f);
        clarity = clamp01(confidence + familiarity);

        doubt = std::max(clamp01(1.0f - confidence), 0.1f);
    }

    bool should_express_doubt() const {
        return doubt > 0.6f && confidence < 0.4f;
    }

    bool is_clear_and_stable() const {
        return clarity > 0.7f && self_drift < 0.3f;
    }

    const char* self_state() const {
        if (is_clear_and_stable()) return "Clear & Stable";
        if (should_express_doubt()) return "Uncertain";
        if (self_drift > 0.5f) return "Self-Adjusting";
        return "Observing";
    }

    std::string self_assess() const {
        char buf[128];
        snprintf(buf, sizeof(buf), "self_state=%s conf=%.2f clarity=%.2f doubt=%.2f",
                 self_state(), confidence, clarity, doubt);
        return buf;
    }
};

class MetaStabilizer {
public:
    explicit MetaStabilizer(float alpha = 0.3f) : alpha_(clamp01(alpha)) {}

    void update(const MetaCognition& meta) {
        ema_self_drift_ = clamp01(alpha_ * meta.self_drift + (1.0f - alpha_) * ema_self_drift_);
        ema_confidence_ = clamp01(alpha_ * meta.confidence + (1.0f - alpha_) * ema_confidence_);
    }

    float ema_self_drift() const { return ema_self_drift_; }
    float ema_confidence() const { return ema_confidence_; }

    bool needs_more_awareness() const {
        return ema_self_drift_ > 0.4f || ema_confidence_ < 0.5f;
    }

private:
    float alpha_;
    float ema_self_drift_ = 0.0f;
    float ema_confidence_ = 0.5f;
};

} // namespace liminal
