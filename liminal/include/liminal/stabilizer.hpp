#pragma once
// Stabilizer: hysteresis over the conversation's temperature
//
// EMA-smoothed drift and resonance drive a four-state machine.
// Overheat is only reachable through Warming, and always falls into
// Cooldown. Any other state returns to Normal as soon as both EMAs are
// back under the Normal thresholds; Cooldown otherwise holds for
// cool_steps turns.

#include "types.hpp"
#include <cstdio>
#include <string>

namespace liminal {

struct StabilizerConfig {
    float ema_alpha = 0.4f;     // EMA smoothing factor
    float warm_drift = 0.32f;   // Normal -> Warming
    float hot_drift = 0.42f;    // Warming -> Overheat (with low resonance)
    float low_res = 0.58f;      // "cool" resonance threshold
    uint32_t cool_steps = 3;    // Turns held in Cooldown
    float calm_boost = 0.08f;   // Extra slowdown while overheated
};

// Per-state nudges for the voice
struct StabilizerAdvice {
    float pace_delta = 0.0f;
    int64_t pause_delta_ms = 0;
    float articulation_hint = 0.0f;
};

class Stabilizer {
public:
    explicit Stabilizer(StabilizerConfig config = {}) : config_(sanitize(config)) {}

    const StabilizerConfig& config() const { return config_; }
    StabilizerState state() const { return state_; }
    float ema_drift() const { return ema_drift_; }
    float ema_res() const { return ema_res_; }
    uint32_t steps_in_state() const { return steps_in_state_; }

    // Feed one turn. Exactly one transition is evaluated per push.
    void push(float drift, float res) {
        drift = std::isfinite(drift) ? clamp01(drift) : 0.0f;
        res = std::isfinite(res) ? clamp01(res) : 0.0f;

        if (!initialized_) {
            ema_drift_ = drift;
            ema_res_ = res;
            initialized_ = true;
        } else {
            float a = config_.ema_alpha;
            ema_drift_ = clamp01(a * drift + (1.0f - a) * ema_drift_);
            ema_res_ = clamp01(a * res + (1.0f - a) * ema_res_);
        }

        StabilizerState next = state_;
        if (state_ != StabilizerState::Overheat && settled()) {
            // Back under the Normal thresholds from any state but the latch
            next = StabilizerState::Normal;
        } else {
            switch (state_) {
                case StabilizerState::Normal:
                    if (ema_drift_ >= config_.warm_drift) next = StabilizerState::Warming;
                    break;
                case StabilizerState::Warming:
                    if (ema_drift_ >= config_.hot_drift && ema_res_ <= config_.low_res) {
                        next = StabilizerState::Overheat;
                    }
                    break;
                case StabilizerState::Overheat:
                    next = StabilizerState::Cooldown;
                    break;
                case StabilizerState::Cooldown:
                    if (steps_in_state_ + 1 >= config_.cool_steps) next = StabilizerState::Normal;
                    break;
            }
        }

        if (next != state_) {
            state_ = next;
            steps_in_state_ = 0;
        } else {
            steps_in_state_ = std::min(steps_in_state_ + 1, config_.cool_steps * 2);
        }
    }

    StabilizerAdvice advice() const {
        switch (state_) {
            case StabilizerState::Normal:
                return {0.0f, 0, 0.0f};
            case StabilizerState::Warming:
                return {-0.03f, 10, 0.02f};
            case StabilizerState::Overheat:
                return {-0.07f - config_.calm_boost,
                        30 + static_cast<int64_t>(std::lround(config_.calm_boost * 100.0f)),
                        0.05f};
            case StabilizerState::Cooldown:
                return {-0.04f, 20, 0.03f};
        }
        return {};
    }

    std::string status() const {
        char buf[96];
        snprintf(buf, sizeof(buf), "[stabilizer] state=%s ema_drift=%.2f ema_res=%.2f",
                 to_string(state_), ema_drift_, ema_res_);
        return buf;
    }

private:
    // Both EMAs back under the Normal thresholds
    bool settled() const {
        return ema_drift_ < config_.warm_drift && ema_res_ > config_.low_res;
    }

    static StabilizerConfig sanitize(StabilizerConfig c) {
        c.ema_alpha = clamp01(c.ema_alpha);
        c.warm_drift = clamp01(c.warm_drift);
        c.hot_drift = clamp01(c.hot_drift);
        c.low_res = clamp01(c.low_res);
        c.cool_steps = std::max<uint32_t>(c.cool_steps, 1);
        c.calm_boost = std::clamp(c.calm_boost, 0.0f, 0.2f);
        return c;
    }

    StabilizerConfig config_;
    StabilizerState state_ = StabilizerState::Normal;
    uint32_t steps_in_state_ = 0;
    float ema_drift_ = 0.0f;
    float ema_res_ = 0.0f;
    bool initialized_ = false;
};

} // namespace liminal
