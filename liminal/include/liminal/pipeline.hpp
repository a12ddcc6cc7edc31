#pragma once
// Pipeline: one turn through every enabled layer
//
// Built once from Config as an ordered list of stages:
//   Stabilizer -> Sync -> Awareness -> Compassion -> Silence
// A disabled layer is simply not in the list. Each stage reads the
// turn context left by the ones before it and never reaches back.

#include "awareness.hpp"
#include "compassion.hpp"
#include "config.hpp"
#include "log.hpp"
#include "silence.hpp"
#include "stabilizer.hpp"
#include "sync.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace liminal {

// Working state of one turn, threaded through the stages
struct TurnContext {
    Signal signal;                   // measured, sanitized
    std::optional<Signal> previous;  // the turn before the silence
    bool was_rephrased = false;      // guard outcome of the previous turn

    // Values being corrected
    float drift = 0.0f;
    float resonance = 0.0f;
    float pace_delta = 0.0f;
    int64_t pause_delta_ms = 0;
    float articulation_hint = 0.0f;

    StabilizerState state = StabilizerState::Normal;
    std::optional<SyncCorrection> sync;
    std::optional<CompassionAdjustments> compassion;
    float suffering = 0.0f;
};

// Merged outcome of a turn
struct Adjustments {
    float pace = 1.0f;
    int64_t pause_ms = 80;
    float resonance = 0.0f;
    float drift = 0.0f;
    float articulation_hint = 0.0f;

    float measured_drift = 0.0f;
    float measured_resonance = 0.0f;
    StabilizerState state = StabilizerState::Normal;
    std::optional<SyncCorrection> sync;
    std::optional<CompassionAdjustments> compassion;  // set only when activated
};

class Stage {
public:
    virtual ~Stage() = default;

    virtual const char* name() const = 0;
    virtual void process(TurnContext& ctx) = 0;
    virtual std::string status() const = 0;

    // End of session
    virtual void finish() {}
};

class StabilizerStage : public Stage {
public:
    explicit StabilizerStage(StabilizerConfig config) : stabilizer_(config) {}

    const char* name() const override { return "stabilizer"; }

    void process(TurnContext& ctx) override {
        stabilizer_.push(ctx.drift, ctx.resonance);
        ctx.state = stabilizer_.state();

        auto advice = stabilizer_.advice();
        ctx.pace_delta += advice.pace_delta;
        ctx.pause_delta_ms += advice.pause_delta_ms;
        ctx.articulation_hint += advice.articulation_hint;
    }

    std::string status() const override { return stabilizer_.status(); }

    const Stabilizer& stabilizer() const { return stabilizer_; }

private:
    Stabilizer stabilizer_;
};

class SyncStage : public Stage {
public:
    explicit SyncStage(SyncConfig config) : sync_(config) {}

    const char* name() const override { return "sync"; }

    void warm_start(const SyncSeeds& seeds, const Baselines& baselines) {
        sync_.warm_start(seeds, baselines);
        seeds_applied_ = false;
    }

    void process(TurnContext& ctx) override {
        // Carried-over biases land once, on the first turn
        if (!seeds_applied_) {
            const auto& seeds = sync_.seeds();
            ctx.pace_delta += seeds.pace_bias;
            ctx.pause_delta_ms += seeds.pause_bias_ms;
            ctx.resonance = clamp01(ctx.resonance + seeds.res_warm);
            ctx.drift = clamp01(ctx.drift - seeds.drift_soft);
            seeds_applied_ = true;
        }

        SyncCorrection c = sync_.step(ctx.drift, ctx.resonance, ctx.state);
        ctx.pace_delta += c.pace_delta;
        ctx.pause_delta_ms += c.pause_delta_ms;
        ctx.resonance = clamp01(ctx.resonance + c.resonance_boost);
        ctx.drift = clamp01(ctx.drift - c.drift_reduction);
        ctx.sync = c;
    }

    std::string status() const override { return sync_.status(); }

    const NeuralSync& sync() const { return sync_; }

private:
    NeuralSync sync_;
    bool seeds_applied_ = false;
};

class AwarenessStage : public Stage {
public:
    explicit AwarenessStage(float meta_alpha) : meta_stabilizer_(meta_alpha) {}

    const char* name() const override { return "meta"; }

    void process(TurnContext& ctx) override {
        float correction = ctx.sync ? ctx.sync->total() : 0.0f;
        meta_.observe(ctx.signal.drift, ctx.signal.resonance, ctx.state, correction);
        meta_stabilizer_.update(meta_);
        if (meta_.should_express_doubt()) {
            log_debug("meta", "uncertain about measurements (doubt=%.2f)", meta_.doubt);
        }
    }

    std::string status() const override { return "[meta] " + meta_.self_assess(); }

    const MetaCognition& meta() const { return meta_; }
    const MetaStabilizer& meta_stabilizer() const { return meta_stabilizer_; }

private:
    MetaCognition meta_;
    MetaStabilizer meta_stabilizer_;
};

class CompassionStage : public Stage {
public:
    const char* name() const override { return "compassion"; }

    void process(TurnContext& ctx) override {
        const Signal& s = ctx.signal;
        state_.detect_suffering(s.drift, s.resonance, s.tone, s.tempo_wpm,
                                ctx.state, s.repeated_theme);

        SyncCorrection c = ctx.sync.value_or(SyncCorrection{});
        state_.calculate_kindness(ctx.was_rephrased, c.pace_delta,
                                  c.pause_delta_ms, c.resonance_boost);
        state_.update_compassion_level();
        ctx.suffering = state_.user_suffering;

        if (state_.should_activate_compassion()) {
            auto adj = state_.adjustments();
            ctx.resonance = clamp01(ctx.resonance + adj.resonance_boost);
            ctx.drift = clamp01(ctx.drift - adj.drift_reduction);
            ctx.pace_delta += adj.pace_adjustment;
            ctx.pause_delta_ms += adj.pause_adjustment_ms;
            ctx.compassion = adj;
        }
        if (state_.should_offer_support()) {
            log_debug("compassion", "offering support (%s)", to_string(state_.suffering_type));
        }
    }

    std::string status() const override { return "[compassion] " + state_.status_message(); }

    const CompassionState& compassion() const { return state_; }

private:
    CompassionState state_;
};

class SilenceStage : public Stage {
public:
    explicit SilenceStage(SilenceConfig config) : config_(config) {}

    const char* name() const override { return "silence"; }

    void process(TurnContext& ctx) override {
        // This turn is new user input: the previous silence is over
        state_.reset();

        const Signal& before = ctx.previous ? *ctx.previous : ctx.signal;
        state_.detect(ctx.signal.silence_s, before.drift, before.resonance, before.tone,
                      ctx.suffering, ctx.state, config_);
        if (state_.should_interrupt) {
            log_debug("silence", "%s silence past patience after %.1fs",
                      to_string(state_.silence_type), state_.current_silence_duration);
        }
    }

    void finish() override { state_.reset(); }

    std::string status() const override { return "[silence] " + state_.status_message(); }

    const SilenceState& silence() const { return state_; }

private:
    SilenceConfig config_;
    SilenceState state_;
};

// Warm-start hints for the first turn, straight from the settings
inline SyncSeeds seeds_from_config(const Config& cfg) {
    SyncSeeds seeds;
    seeds.pace_bias = cfg.seed_pace;
    seeds.pause_bias_ms = cfg.seed_pause_ms;
    seeds.res_warm = cfg.seed_res;
    seeds.drift_soft = cfg.seed_drift;
    return seeds;
}

class Pipeline {
public:
    Pipeline() = default;
    Pipeline(float base_pace, int64_t base_pause_ms)
        : base_pace_(base_pace), base_pause_ms_(base_pause_ms) {}

    Pipeline(Pipeline&&) = default;
    Pipeline& operator=(Pipeline&&) = default;

    static Pipeline from_config(const Config& cfg) {
        Pipeline p(cfg.base_pace, cfg.base_pause_ms);

        if (cfg.stabilizer) {
            StabilizerConfig sc;
            sc.ema_alpha = cfg.stab_alpha;
            sc.warm_drift = cfg.stab_warm;
            sc.hot_drift = cfg.stab_hot;
            sc.low_res = cfg.stab_low_res;
            sc.cool_steps = cfg.stab_cool;
            sc.calm_boost = cfg.stab_calm;
            p.add_stage(std::make_unique<StabilizerStage>(sc));
        }
        if (cfg.sync) {
            SyncConfig sc;
            sc.baselines = {cfg.baseline_drift, cfg.baseline_res};
            sc.lr_fast = cfg.sync_lr_fast;
            sc.lr_slow = cfg.sync_lr_slow;
            sc.sync_step = cfg.sync_step;
            auto stage = std::make_unique<SyncStage>(sc);
            stage->warm_start(seeds_from_config(cfg), sc.baselines);
            p.add_stage(std::move(stage));
        }
        if (cfg.awareness) {
            p.add_stage(std::make_unique<AwarenessStage>(cfg.meta_alpha));
        }
        if (cfg.compassion) {
            p.add_stage(std::make_unique<CompassionStage>());
        }
        if (cfg.silence) {
            SilenceConfig sc;
            sc.min_duration_s = cfg.silence_min_s;
            p.add_stage(std::make_unique<SilenceStage>(sc));
        }
        return p;
    }

    void add_stage(std::unique_ptr<Stage> stage) {
        log_debug("pipeline", "stage %zu: %s", stages_.size(), stage->name());
        stages_.push_back(std::move(stage));
    }

    const std::vector<std::unique_ptr<Stage>>& stages() const { return stages_; }

    // Guard outcome of the turn just finished; read by the next turn
    void note_rephrased(bool rephrased) { was_rephrased_ = rephrased; }

    Adjustments run_turn(const Signal& raw) {
        TurnContext ctx;
        ctx.signal = raw.sanitized();
        ctx.previous = previous_;
        ctx.was_rephrased = was_rephrased_;
        ctx.drift = ctx.signal.drift;
        ctx.resonance = ctx.signal.resonance;

        for (auto& stage : stages_) {
            stage->process(ctx);
        }

        Adjustments out;
        out.pace = std::clamp(base_pace_ + ctx.pace_delta, 0.7f, 1.3f);
        out.pause_ms = std::clamp<int64_t>(base_pause_ms_ + ctx.pause_delta_ms, 20, 250);
        out.resonance = clamp01(ctx.resonance);
        out.drift = clamp01(ctx.drift);
        out.articulation_hint = ctx.articulation_hint;
        out.measured_drift = ctx.signal.drift;
        out.measured_resonance = ctx.signal.resonance;
        out.state = ctx.state;
        out.sync = ctx.sync;
        out.compassion = ctx.compassion;

        previous_ = ctx.signal;
        was_rephrased_ = false;
        turns_++;
        return out;
    }

    void finish() {
        for (auto& stage : stages_) stage->finish();
    }

    std::vector<std::string> status_lines() const {
        std::vector<std::string> lines;
        for (const auto& stage : stages_) lines.push_back(stage->status());
        return lines;
    }

    size_t turns() const { return turns_; }

    // Layer views; nullptr when the layer is disabled
    const Stabilizer* stabilizer() const {
        auto* s = find<StabilizerStage>();
        return s ? &s->stabilizer() : nullptr;
    }
    const NeuralSync* sync() const {
        auto* s = find<SyncStage>();
        return s ? &s->sync() : nullptr;
    }
    SyncStage* sync_stage() { return find<SyncStage>(); }
    const MetaCognition* meta() const {
        auto* s = find<AwarenessStage>();
        return s ? &s->meta() : nullptr;
    }
    const MetaStabilizer* meta_stabilizer() const {
        auto* s = find<AwarenessStage>();
        return s ? &s->meta_stabilizer() : nullptr;
    }
    const CompassionState* compassion() const {
        auto* s = find<CompassionStage>();
        return s ? &s->compassion() : nullptr;
    }
    const SilenceState* silence() const {
        auto* s = find<SilenceStage>();
        return s ? &s->silence() : nullptr;
    }

private:
    template <typename T>
    const T* find() const {
        for (const auto& stage : stages_) {
            if (auto* typed = dynamic_cast<const T*>(stage.get())) return typed;
        }
        return nullptr;
    }

    template <typename T>
    T* find() {
        for (auto& stage : stages_) {
            if (auto* typed = dynamic_cast<T*>(stage.get())) return typed;
        }
        return nullptr;
    }

    std::vector<std::unique_ptr<Stage>> stages_;
    float base_pace_ = 1.0f;
    int64_t base_pause_ms_ = 80;
    std::optional<Signal> previous_;
    bool was_rephrased_ = false;
    size_t turns_ = 0;
};

} // namespace liminal
