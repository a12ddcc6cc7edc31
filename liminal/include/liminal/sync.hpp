#pragma once
// Neural Sync: residual correction against the session baselines
//
// Fast layer: per-turn corrections scaled by lr_fast, with the pace
// step bounded by sync_step no matter how large the residual.
// Slow layer: turn-averaged residuals scaled by lr_slow, handed to
// whoever consolidates across sessions.

#include "types.hpp"
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>

namespace liminal {

struct Baselines {
    float drift = 0.35f;
    float res = 0.65f;
};

// Warm-start biases carried over from earlier sessions
struct SyncSeeds {
    float pace_bias = 0.0f;
    int64_t pause_bias_ms = 0;
    float res_warm = 0.0f;
    float drift_soft = 0.0f;
};

struct SyncConfig {
    Baselines baselines;
    float lr_fast = 0.15f;
    float lr_slow = 0.05f;
    float sync_step = 0.02f;   // max |pace_delta| per turn
};

struct SyncCorrection {
    float pace_delta = 0.0f;
    int64_t pause_delta_ms = 0;
    float resonance_boost = 0.0f;
    float drift_reduction = 0.0f;

    // Magnitude of the correction as seen by meta-cognition
    float total() const {
        return std::abs(pace_delta) + static_cast<float>(pause_delta_ms) / 100.0f;
    }
};

class NeuralSync {
public:
    explicit NeuralSync(SyncConfig config = {}) : config_(config) {
        config_.sync_step = std::abs(config_.sync_step);
    }

    const SyncConfig& config() const { return config_; }
    const SyncSeeds& seeds() const { return seeds_; }
    const SyncCorrection& last() const { return last_; }
    size_t steps() const { return steps_; }

    void warm_start(const SyncSeeds& seeds, const Baselines& baselines) {
        seeds_ = seeds;
        config_.baselines = baselines;
        accum_drift_ = 0.0f;
        accum_res_ = 0.0f;
        steps_ = 0;
        last_ = {};
    }

    SyncCorrection step(float drift, float res, StabilizerState state) {
        drift = std::isfinite(drift) ? clamp01(drift) : 0.0f;
        res = std::isfinite(res) ? clamp01(res) : 0.0f;

        // residual = baseline - measured
        float r_drift = std::clamp(config_.baselines.drift - drift, -1.0f, 1.0f);
        float r_res = std::clamp(config_.baselines.res - res, -1.0f, 1.0f);

        accum_drift_ += r_drift;
        accum_res_ += r_res;
        steps_++;

        const float c = config_.sync_step;
        const float lr = config_.lr_fast;

        SyncCorrection out;
        out.pace_delta = std::clamp(r_res * lr, -c, c);
        out.pause_delta_ms = std::clamp<int64_t>(
            static_cast<int64_t>(std::lround(-r_drift * lr * 80.0f)), -20, 40);
        out.resonance_boost = std::clamp(std::max(r_res, 0.0f) * lr * 0.05f, 0.0f, c);
        out.drift_reduction = std::clamp(std::max(r_drift, 0.0f) * lr * 0.05f, 0.0f, c);

        if (state == StabilizerState::Overheat) {
            out.pace_delta = std::clamp(out.pace_delta - 0.01f, -c, c);
            out.pause_delta_ms += 10;
        }

        last_ = out;
        return out;
    }

    // (drift_bias, res_bias) for cross-session consolidation
    std::pair<float, float> slow_increments() const {
        if (steps_ == 0) return {0.0f, 0.0f};
        float mean_drift = accum_drift_ / static_cast<float>(steps_);
        float mean_res = accum_res_ / static_cast<float>(steps_);
        float drift_bias = std::clamp(mean_drift * config_.lr_slow, -0.03f, 0.03f);
        float res_bias = std::clamp(mean_res * config_.lr_slow, -0.03f, 0.03f);
        return {drift_bias, res_bias};
    }

    std::string status() const {
        char buf[112];
        snprintf(buf, sizeof(buf), "[sync] pace=%+.3f pause=%+lldms res_boost=%.3f drift_relief=%.3f",
                 last_.pace_delta, static_cast<long long>(last_.pause_delta_ms),
                 last_.resonance_boost, last_.drift_reduction);
        return buf;
    }

private:
    SyncConfig config_;
    SyncSeeds seeds_;
    SyncCorrection last_;
    float accum_drift_ = 0.0f;
    float accum_res_ = 0.0f;
    size_t steps_ = 0;
};

} // namespace liminal
