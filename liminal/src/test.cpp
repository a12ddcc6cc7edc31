#include <liminal/liminal.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using namespace liminal;

static bool in01(float v) {
    return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}

static bool near(float a, float b, float eps = 0.001f) {
    return std::abs(a - b) < eps;
}

static Signal make_signal(float drift, float res, Tone tone = Tone::Neutral,
                          float silence_s = 0.0f) {
    Signal s;
    s.drift = drift;
    s.resonance = res;
    s.tone = tone;
    s.silence_s = silence_s;
    s.text = "turn";
    return s;
}

void test_adversarial_clamping() {
    std::cout << "Testing clamping under adversarial input..." << std::endl;

    const float inputs[][2] = {
        {2.0f, -1.0f}, {-3.0f, 5.0f}, {NAN, INFINITY}, {0.9f, 0.1f}, {1e9f, -1e9f}
    };

    Stabilizer stab;
    MetaCognition meta;
    MetaStabilizer meta_stab;
    CompassionState comp;
    SilenceState silence;
    NeuralSync sync;

    for (const auto& in : inputs) {
        stab.push(in[0], in[1]);
        assert(in01(stab.ema_drift()));
        assert(in01(stab.ema_res()));

        auto c = sync.step(in[0], in[1], stab.state());
        assert(in01(c.resonance_boost));
        assert(in01(c.drift_reduction));

        meta.observe(in[0], in[1], stab.state(), 50.0f);
        meta_stab.update(meta);
        assert(in01(meta.self_drift));
        assert(in01(meta.self_resonance));
        assert(in01(meta.confidence));
        assert(in01(meta.clarity));
        assert(in01(meta.doubt));
        assert(in01(meta_stab.ema_self_drift()));
        assert(in01(meta_stab.ema_confidence()));

        comp.detect_suffering(in[0], in[1], Tone::Energetic, 1e9f, StabilizerState::Overheat, true);
        comp.calculate_kindness(true, -5.0f, 1000, 5.0f);
        comp.update_compassion_level();
        assert(in01(comp.user_suffering));
        assert(in01(comp.response_kindness));
        assert(in01(comp.healing_intent));
        assert(in01(comp.compassion_level));

        silence.detect(100.0f, in[0], in[1], Tone::Calm, 7.0f, stab.state());
        assert(in01(silence.silence_quality));
        silence.reset();
        assert(in01(silence.avg_silence_quality));
    }

    Signal s = make_signal(2.0f, -1.0f).sanitized();
    assert(s.drift == 1.0f);
    assert(s.resonance == 0.0f);

    std::cout << "  PASS" << std::endl;
}

void test_stabilizer_progression() {
    std::cout << "Testing Stabilizer progression..." << std::endl;

    Stabilizer stab;
    assert(stab.state() == StabilizerState::Normal);

    stab.push(0.9f, 0.2f);
    assert(stab.state() == StabilizerState::Warming);
    stab.push(0.9f, 0.2f);
    assert(stab.state() == StabilizerState::Overheat);
    assert(stab.advice().pace_delta < -0.1f);
    assert(stab.advice().pause_delta_ms == 38);

    // Overheat always latches into Cooldown
    stab.push(0.0f, 1.0f);
    assert(stab.state() == StabilizerState::Cooldown);

    // Held for cool_steps turns
    stab.push(0.9f, 0.2f);
    assert(stab.state() == StabilizerState::Cooldown);
    stab.push(0.9f, 0.2f);
    assert(stab.state() == StabilizerState::Cooldown);
    stab.push(0.9f, 0.2f);
    assert(stab.state() == StabilizerState::Normal);

    // Warming settles back without overheating
    Stabilizer calm;
    calm.push(0.5f, 0.9f);
    assert(calm.state() == StabilizerState::Warming);
    for (int i = 0; i < 5; ++i) calm.push(0.05f, 0.95f);
    assert(calm.state() == StabilizerState::Normal);
    assert(calm.advice().pace_delta == 0.0f);

    std::cout << "  PASS" << std::endl;
}

void test_stabilizer_cooldown_settles() {
    std::cout << "Testing Stabilizer Cooldown settles early..." << std::endl;

    StabilizerConfig cfg;
    cfg.cool_steps = 6;
    Stabilizer stab(cfg);

    stab.push(0.9f, 0.2f);
    stab.push(0.9f, 0.2f);
    assert(stab.state() == StabilizerState::Overheat);
    stab.push(0.0f, 1.0f);
    assert(stab.state() == StabilizerState::Cooldown);

    // ema_drift 0.324 is still at or above warm_drift
    stab.push(0.0f, 1.0f);
    assert(stab.state() == StabilizerState::Cooldown);
    assert(stab.steps_in_state() == 1);

    // Both EMAs under the Normal thresholds, well inside the hold
    stab.push(0.0f, 1.0f);
    assert(stab.ema_drift() < cfg.warm_drift);
    assert(stab.ema_res() > cfg.low_res);
    assert(stab.state() == StabilizerState::Normal);
    assert(stab.steps_in_state() == 0);
    assert(stab.advice().pace_delta == 0.0f);

    // Overheat latches into Cooldown even when already settled
    StabilizerConfig instant;
    instant.ema_alpha = 1.0f;
    instant.cool_steps = 6;
    Stabilizer latch(instant);
    latch.push(0.9f, 0.2f);
    latch.push(0.9f, 0.2f);
    assert(latch.state() == StabilizerState::Overheat);
    latch.push(0.0f, 1.0f);
    assert(latch.state() == StabilizerState::Cooldown);
    latch.push(0.0f, 1.0f);
    assert(latch.state() == StabilizerState::Normal);

    std::cout << "  PASS" << std::endl;
}

void test_stabilizer_no_direct_overheat() {
    std::cout << "Testing Stabilizer never jumps Normal->Overheat..." << std::endl;

    StabilizerConfig cfg;
    cfg.ema_alpha = 1.0f;  // follow the input exactly
    Stabilizer stab(cfg);

    uint64_t x = 0x9e3779b97f4a7c15ULL;
    size_t overheats = 0;
    for (int i = 0; i < 2000; ++i) {
        x ^= x << 13; x ^= x >> 7; x ^= x << 17;
        float drift = static_cast<float>(x & 0xFFFF) / 65535.0f * 1.4f - 0.2f;
        float res = static_cast<float>((x >> 16) & 0xFFFF) / 65535.0f * 1.4f - 0.2f;

        StabilizerState before = stab.state();
        stab.push(drift, res);
        StabilizerState after = stab.state();

        if (before == StabilizerState::Normal) {
            assert(after != StabilizerState::Overheat);
        }
        if (after == StabilizerState::Overheat) {
            assert(before == StabilizerState::Warming);
            overheats++;
        }
    }
    assert(overheats > 0);

    std::cout << "  PASS" << std::endl;
}

void test_sync_bounds() {
    std::cout << "Testing NeuralSync bounds..." << std::endl;

    NeuralSync sync;
    const StabilizerState states[] = {
        StabilizerState::Normal, StabilizerState::Warming,
        StabilizerState::Overheat, StabilizerState::Cooldown
    };
    for (auto state : states) {
        for (float d = 0.0f; d <= 1.0f; d += 0.25f) {
            for (float r = 0.0f; r <= 1.0f; r += 0.25f) {
                auto c = sync.step(d, r, state);
                assert(std::abs(c.pace_delta) <= 0.02f + 1e-6f);
                assert(c.pause_delta_ms >= -20 && c.pause_delta_ms <= 50);
            }
        }
    }

    // High drift lengthens the pause, and Overheat slows further
    NeuralSync a;
    auto normal = a.step(0.95f, 0.65f, StabilizerState::Normal);
    auto hot = a.step(0.95f, 0.65f, StabilizerState::Overheat);
    assert(normal.pause_delta_ms > 0);
    assert(hot.pause_delta_ms == normal.pause_delta_ms + 10);
    assert(hot.pace_delta < normal.pace_delta);

    // Below-baseline resonance speeds up within the step
    NeuralSync b;
    auto low = b.step(0.35f, 0.0f, StabilizerState::Normal);
    assert(near(low.pace_delta, 0.02f));
    assert(low.resonance_boost > 0.0f);
    assert(near(low.total(), 0.02f));

    std::cout << "  PASS" << std::endl;
}

void test_sync_slow_increments() {
    std::cout << "Testing NeuralSync slow increments..." << std::endl;

    NeuralSync sync;
    auto [d0, r0] = sync.slow_increments();
    assert(d0 == 0.0f && r0 == 0.0f);

    for (int i = 0; i < 10; ++i) sync.step(1.0f, 0.0f, StabilizerState::Normal);
    auto [d1, r1] = sync.slow_increments();
    assert(near(d1, -0.03f));
    assert(near(r1, 0.03f));

    NeuralSync mild;
    mild.step(0.45f, 0.55f, StabilizerState::Normal);
    auto [d2, r2] = mild.slow_increments();
    assert(near(d2, -0.005f));
    assert(near(r2, 0.005f));

    // warm_start clears the accumulators
    Config seeded;
    seeded.seed_pace = 0.05f;
    seeded.seed_pause_ms = 10;
    seeded.seed_res = 0.03f;
    seeded.seed_drift = 0.02f;
    SyncSeeds seeds = seeds_from_config(seeded);
    assert(near(seeds.pace_bias, 0.05f));
    assert(near(seeds.res_warm, 0.03f));
    assert(near(seeds.drift_soft, 0.02f));
    mild.warm_start(seeds, {0.3f, 0.7f});
    assert(mild.steps() == 0);
    assert(mild.seeds().pause_bias_ms == 10);
    assert(mild.config().baselines.drift == 0.3f);

    std::cout << "  PASS" << std::endl;
}

void test_meta_doubt() {
    std::cout << "Testing MetaCognition doubt..." << std::endl;

    MetaCognition meta;
    meta.observe(0.9f, 0.2f, StabilizerState::Overheat, 0.5f);
    assert(meta.confidence < 0.5f);
    assert(meta.doubt > 0.5f);
    assert(meta.should_express_doubt());
    assert(std::string(meta.self_state()) == "Uncertain");

    // Floor holds at full confidence
    MetaCognition sure;
    for (int i = 0; i < 10; ++i) {
        sure.observe(0.0f, 1.0f, StabilizerState::Normal, 0.0f);
        assert(sure.confidence == 1.0f);
        assert(sure.doubt >= 0.1f);
    }
    assert(near(sure.doubt, 0.1f));

    std::cout << "  PASS" << std::endl;
}

void test_meta_clarity() {
    std::cout << "Testing MetaCognition clarity..." << std::endl;

    MetaCognition meta;
    MetaStabilizer meta_stab;
    for (int i = 0; i < 5; ++i) {
        meta.observe(0.15f, 0.85f, StabilizerState::Normal, 0.0f);
        meta_stab.update(meta);
    }
    assert(meta.observation_count == 5);
    assert(meta.confidence > 0.7f);
    assert(meta.clarity > 0.6f);
    assert(meta.doubt < 0.4f);
    assert(!meta.should_express_doubt());
    assert(meta.is_clear_and_stable());
    assert(near(meta.self_resonance, 0.95f));
    assert(meta_stab.ema_confidence() > 0.5f);
    assert(!meta_stab.needs_more_awareness());

    // Large corrections read as self-adjustment
    meta.observe(0.15f, 0.85f, StabilizerState::Normal, 0.4f);
    assert(!meta.is_clear_and_stable());

    std::cout << "  PASS" << std::endl;
}

void test_compassion_scenario() {
    std::cout << "Testing Compassion scenario..." << std::endl;

    CompassionState comp;
    comp.detect_suffering(0.85f, 0.3f, Tone::Energetic, 190.0f,
                          StabilizerState::Overheat, true);
    assert(comp.suffering_type == SufferingType::Moderate
           || comp.suffering_type == SufferingType::Severe);
    assert(comp.should_offer_support());
    assert(comp.suffering_count == 1);
    assert(comp.healing_intent > 0.9f);

    comp.calculate_kindness(true, -0.02f, 20, 0.01f);
    assert(near(comp.response_kindness, 0.93f));
    comp.update_compassion_level();
    assert(comp.should_activate_compassion());

    auto adj = comp.adjustments();
    assert(adj.resonance_boost > 0.0f);
    assert(adj.pace_adjustment < 0.0f);
    assert(adj.pause_adjustment_ms > 0);
    assert(adj.drift_reduction > 0.0f);

    CompassionState calm;
    calm.detect_suffering(0.2f, 0.8f, Tone::Calm, 110.0f, StabilizerState::Normal, false);
    assert(calm.suffering_type == SufferingType::None);
    calm.calculate_kindness(false, 0.0f, 0, 0.0f);
    assert(calm.response_kindness == 0.5f);
    calm.update_compassion_level();
    assert(!calm.should_activate_compassion());

    std::cout << "  PASS" << std::endl;
}

void test_compassion_streak_and_episodes() {
    std::cout << "Testing Compassion streak and episodes..." << std::endl;

    CompassionState comp;
    for (int i = 0; i < 4; ++i) {
        comp.detect_suffering(0.85f, 0.3f, Tone::Neutral, 150.0f, StabilizerState::Normal, true);
    }
    assert(comp.suffering_streak == 4);
    assert(comp.suffering_count == 1);  // one episode, many turns

    comp.detect_suffering(0.85f, 0.3f, Tone::Neutral, 150.0f, StabilizerState::Normal, false);
    assert(comp.suffering_streak == 0);

    comp.detect_suffering(0.1f, 0.9f, Tone::Calm, 100.0f, StabilizerState::Normal, false);
    assert(comp.suffering_type == SufferingType::None);

    comp.detect_suffering(0.9f, 0.1f, Tone::Neutral, 150.0f, StabilizerState::Overheat, false);
    assert(comp.suffering_count == 2);

    std::cout << "  PASS" << std::endl;
}

void test_silence_short() {
    std::cout << "Testing Silence below minimum..." << std::endl;

    const StabilizerState states[] = {
        StabilizerState::Normal, StabilizerState::Overheat
    };
    for (auto state : states) {
        for (float d = 0.0f; d < 1.5f; d += 0.1f) {
            SilenceState s;
            s.detect(d, 0.9f, 0.1f, Tone::Energetic, 1.0f, state);
            assert(s.silence_type == SilenceType::None);
            assert(!s.should_interrupt);
            assert(s.silence_count == 0);
        }
    }

    std::cout << "  PASS" << std::endl;
}

void test_silence_classification() {
    std::cout << "Testing Silence classification..." << std::endl;

    SilenceState peace;
    peace.detect(4.0f, 0.2f, 0.8f, Tone::Calm, 0.0f, StabilizerState::Normal);
    assert(peace.silence_type == SilenceType::Peace);
    assert(peace.is_generative);
    assert(!peace.should_interrupt);
    assert(peace.silence_count == 1);

    peace.detect(13.0f, 0.2f, 0.8f, Tone::Calm, 0.0f, StabilizerState::Normal);
    assert(peace.should_interrupt);
    assert(peace.silence_count == 1);  // same episode
    assert(peace.max_silence_duration == 13.0f);

    assert(classify_silence(3.0f, 0.4f, 0.6f, Tone::Neutral, 0.0f, StabilizerState::Normal)
           == SilenceType::Contemplation);
    assert(classify_silence(4.0f, 0.8f, 0.5f, Tone::Energetic, 0.7f, StabilizerState::Normal)
           == SilenceType::Fear);
    assert(classify_silence(2.0f, 0.8f, 0.3f, Tone::Energetic, 0.0f, StabilizerState::Normal)
           == SilenceType::Disconnect);
    assert(classify_silence(2.0f, 0.55f, 0.45f, Tone::Energetic, 0.0f, StabilizerState::Warming)
           == SilenceType::Uncertainty);
    assert(classify_silence(2.0f, 0.55f, 0.45f, Tone::Energetic, 0.0f, StabilizerState::Normal)
           == SilenceType::Contemplation);

    assert(past_patience(SilenceType::Fear, 4.5f, 0.9f));
    assert(!past_patience(SilenceType::Uncertainty, 5.0f, 0.5f));
    assert(past_patience(SilenceType::Contemplation, 7.0f, 0.5f));

    std::cout << "  PASS" << std::endl;
}

void test_silence_reset_idempotent() {
    std::cout << "Testing Silence reset..." << std::endl;

    SilenceState s;
    s.detect(4.0f, 0.2f, 0.8f, Tone::Calm, 0.0f, StabilizerState::Normal);
    s.reset();
    assert(near(s.total_silence_time, 4.0f));
    assert(s.silence_count == 1);
    assert(near(s.avg_silence_quality, 1.0f));

    float total = s.total_silence_time;
    uint64_t count = s.silence_count;
    s.reset();
    assert(s.total_silence_time == total);
    assert(s.silence_count == count);
    assert(s.silence_type == SilenceType::None);

    // Next qualifying silence is a new episode
    s.detect(2.0f, 0.4f, 0.6f, Tone::Neutral, 0.0f, StabilizerState::Normal);
    assert(s.silence_count == 2);

    std::cout << "  PASS" << std::endl;
}

void test_silence_episode_keeps_longest() {
    std::cout << "Testing Silence episode totals..." << std::endl;

    SilenceState s;
    s.detect(10.0f, 0.2f, 0.8f, Tone::Calm, 0.0f, StabilizerState::Normal);
    s.detect(3.0f, 0.6f, 0.4f, Tone::Neutral, 0.0f, StabilizerState::Normal);
    assert(s.silence_count == 1);
    assert(near(s.silence_quality, 0.73f));
    s.detect(1.0f, 0.6f, 0.4f, Tone::Neutral, 0.0f, StabilizerState::Normal);
    assert(s.silence_type == SilenceType::None);
    s.reset();

    assert(s.silence_count == 1);
    assert(near(s.total_silence_time, 10.0f));
    assert(s.max_silence_duration == 10.0f);
    assert(s.total_silence_time >= s.max_silence_duration);
    assert(near(s.avg_silence_quality, 1.0f));

    std::cout << "  PASS" << std::endl;
}

void test_guard() {
    std::cout << "Testing soft guard..." << std::endl;

    auto none = check_guard("fine", 0.3f, 0.7f);
    assert(none.kind == GuardAction::Kind::None);
    assert(std::string(none.label()) == "none");

    auto warn = check_guard("hot", 0.5f, 0.7f);
    assert(warn.kind == GuardAction::Kind::Warn);
    assert(warn.text.find("0.50") != std::string::npos);

    auto re = check_guard("  Stop  this!! ", 0.5f, 0.4f);
    assert(re.rephrased());
    assert(re.text == "Stop this.. [recentered]");

    // Low resonance alone is tolerated
    auto low = check_guard("quiet", 0.2f, 0.4f);
    assert(low.kind == GuardAction::Kind::None);

    std::cout << "  PASS" << std::endl;
}

void test_alerts() {
    std::cout << "Testing health alerts..." << std::endl;

    AlertStats stats;
    assert(stats.ok());
    stats.update(0.5f, 0.5f, 0.35f, 0.65f);
    stats.update(0.2f, 0.8f, 0.35f, 0.65f);
    assert(stats.drift_breaches == 1);
    assert(stats.res_breaches == 1);
    assert(stats.total == 2);
    assert(stats.max_drift == 0.5f);
    assert(stats.min_res == 0.5f);
    assert(!stats.ok());

    auto lines = stats.summary_lines(0.35f, 0.65f);
    assert(lines.size() == 4);
    assert(lines.back() == "[health] status: ATTENTION");

    assert(sparkline({}).empty());
    assert(sparkline({0.0f, 1.0f}) == std::string(" ") + "█");
    assert(sparkline({0.5f}) == "▄");

    std::cout << "  PASS" << std::endl;
}

void test_config_options() {
    std::cout << "Testing Config options..." << std::endl;

    Config cfg;
    assert(set_option(cfg, "stab_alpha", "0.5"));
    assert(cfg.stab_alpha == 0.5f);

    // Malformed values keep the previous value
    assert(!set_option(cfg, "stab_alpha", "fast"));
    assert(cfg.stab_alpha == 0.5f);
    assert(!set_option(cfg, "cycles", "-3"));
    assert(!set_option(cfg, "cycles", "0"));
    assert(cfg.cycles == 5);
    assert(!set_option(cfg, "sync", "maybe"));
    assert(cfg.sync);
    assert(!set_option(cfg, "no_such_key", "1"));

    assert(set_option(cfg, "sync", "off"));
    assert(!cfg.sync);
    assert(set_option(cfg, "seed_pause_ms", "-15"));
    assert(cfg.seed_pause_ms == -15);

    assert(env_name("stab_alpha") == "LIMINAL_STAB_ALPHA");
    assert(is_config_key("silence_min_s"));
    assert(!is_config_key("config"));

    std::cout << "  PASS" << std::endl;
}

void test_config_sources() {
    std::cout << "Testing Config sources..." << std::endl;

    setenv("LIMINAL_CYCLES", "9", 1);
    setenv("LIMINAL_GUARD_DRIFT", "oops", 1);
    Config cfg;
    apply_env(cfg);
    assert(cfg.cycles == 9);
    assert(cfg.guard_drift == 0.40f);
    unsetenv("LIMINAL_CYCLES");
    unsetenv("LIMINAL_GUARD_DRIFT");

    json doc = {
        {"cycles", 3},
        {"compassion", false},
        {"stab_alpha", "bad"},
        {"nested", {{"a", 1}}},
        {"bogus", 1}
    };
    assert(apply_json(cfg, doc) == 2);
    assert(cfg.cycles == 3);
    assert(!cfg.compassion);
    assert(cfg.stab_alpha == 0.4f);

    // File layer, then a flag on top
    std::system("rm -f /tmp/liminal_test_config.json");
    {
        std::ofstream out("/tmp/liminal_test_config.json");
        out << R"({"cycles": 7, "guard_res": 0.55, "silence": false})";
    }
    assert(load_config_file(cfg, "/tmp/liminal_test_config.json"));
    assert(cfg.cycles == 7);
    assert(cfg.guard_res == 0.55f);
    assert(!cfg.silence);
    set_option(cfg, "cycles", "11", "cli");
    assert(cfg.cycles == 11);

    {
        std::ofstream out("/tmp/liminal_test_config.json");
        out << "{ not json";
    }
    assert(!load_config_file(cfg, "/tmp/liminal_test_config.json"));
    assert(cfg.cycles == 11);
    assert(!load_config_file(cfg, "/tmp/liminal_test_missing.json"));

    json dumped = config_to_json(cfg);
    assert(dumped["cycles"] == 11);
    assert(dumped["compassion"] == false);

    std::cout << "  PASS" << std::endl;
}

void test_pipeline_layers() {
    std::cout << "Testing Pipeline layers..." << std::endl;

    Config cfg;
    Pipeline full = Pipeline::from_config(cfg);
    assert(full.stages().size() == 5);
    assert(std::string(full.stages()[0]->name()) == "stabilizer");
    assert(full.stabilizer() && full.sync() && full.meta() && full.meta_stabilizer());
    assert(full.compassion() && full.silence());

    cfg.sync = false;
    cfg.compassion = false;
    Pipeline partial = Pipeline::from_config(cfg);
    assert(partial.stages().size() == 3);
    assert(partial.sync() == nullptr);
    assert(partial.sync_stage() == nullptr);
    assert(partial.compassion() == nullptr);
    assert(partial.meta() != nullptr);

    auto adj = partial.run_turn(make_signal(0.9f, 0.2f));
    assert(!adj.sync.has_value());
    assert(!adj.compassion.has_value());
    assert(partial.status_lines().size() == 3);

    // No layers: the voice profile passes through untouched
    Config bare;
    bare.stabilizer = bare.sync = bare.awareness = bare.compassion = bare.silence = false;
    Pipeline empty = Pipeline::from_config(bare);
    auto plain = empty.run_turn(make_signal(0.9f, 0.2f));
    assert(plain.pace == 1.0f);
    assert(plain.pause_ms == 80);
    assert(near(plain.drift, 0.9f));
    assert(plain.state == StabilizerState::Normal);

    // Awareness without a stabilizer observes a Normal conversation
    Config no_stab;
    no_stab.stabilizer = false;
    Pipeline p = Pipeline::from_config(no_stab);
    p.run_turn(make_signal(0.15f, 0.85f));
    assert(p.stabilizer() == nullptr);
    assert(near(p.meta()->self_resonance, 0.95f));

    std::cout << "  PASS" << std::endl;
}

void test_pipeline_bounds() {
    std::cout << "Testing Pipeline output bounds..." << std::endl;

    Pipeline p = Pipeline::from_config(Config{});
    const float inputs[][2] = {
        {2.0f, -1.0f}, {0.95f, 0.05f}, {0.95f, 0.05f}, {0.0f, 1.0f}, {NAN, 0.5f}, {0.5f, 0.5f}
    };
    for (const auto& in : inputs) {
        Signal s = make_signal(in[0], in[1], Tone::Energetic, 3.0f);
        s.tempo_wpm = 200.0f;
        s.repeated_theme = true;
        auto adj = p.run_turn(s);
        assert(adj.pace >= 0.7f && adj.pace <= 1.3f);
        assert(adj.pause_ms >= 20 && adj.pause_ms <= 250);
        assert(in01(adj.drift));
        assert(in01(adj.resonance));
        assert(in01(adj.measured_drift));
        if (adj.sync) assert(std::abs(adj.sync->pace_delta) <= 0.02f + 1e-6f);
    }
    assert(p.turns() == 6);
    assert(p.compassion()->suffering_count >= 1);

    std::cout << "  PASS" << std::endl;
}

void test_pipeline_rephrase_feeds_kindness() {
    std::cout << "Testing Pipeline rephrase flag..." << std::endl;

    Config cfg;
    cfg.sync = false;
    Pipeline p = Pipeline::from_config(cfg);

    p.note_rephrased(true);
    p.run_turn(make_signal(0.2f, 0.8f));
    assert(near(p.compassion()->response_kindness, 0.7f));

    // The flag is consumed by one turn
    p.run_turn(make_signal(0.2f, 0.8f));
    assert(near(p.compassion()->response_kindness, 0.5f));

    std::cout << "  PASS" << std::endl;
}

void test_pipeline_silence() {
    std::cout << "Testing Pipeline silence episodes..." << std::endl;

    Pipeline p = Pipeline::from_config(Config{});
    p.run_turn(make_signal(0.2f, 0.8f, Tone::Calm));
    assert(p.silence()->silence_type == SilenceType::None);

    // A 4s pause after a calm, present turn
    p.run_turn(make_signal(0.2f, 0.8f, Tone::Calm, 4.0f));
    const SilenceState* s = p.silence();
    assert(s->silence_type == SilenceType::Peace);
    assert(s->is_generative);
    assert(!s->should_interrupt);
    assert(s->silence_count == 1);
    assert(s->total_silence_time == 0.0f);

    p.finish();
    assert(near(s->total_silence_time, 4.0f));
    assert(s->silence_count == 1);
    p.finish();
    assert(near(s->total_silence_time, 4.0f));

    // Uncertainty follows the stabilizer state after this turn's push
    Pipeline tense = Pipeline::from_config(Config{});
    tense.run_turn(make_signal(0.55f, 0.45f, Tone::Energetic));
    auto adj = tense.run_turn(make_signal(0.55f, 0.45f, Tone::Energetic, 2.0f));
    assert(adj.state == StabilizerState::Overheat);
    assert(tense.silence()->silence_type == SilenceType::Uncertainty);

    std::cout << "  PASS" << std::endl;
}

void test_pipeline_seeds() {
    std::cout << "Testing Pipeline warm-start seeds..." << std::endl;

    Config cfg;
    cfg.stabilizer = cfg.awareness = cfg.compassion = cfg.silence = false;
    cfg.seed_pace = 0.1f;
    cfg.seed_pause_ms = 40;
    Pipeline p = Pipeline::from_config(cfg);
    assert(p.sync()->seeds().pause_bias_ms == 40);

    // On the baselines the residual correction is zero
    auto first = p.run_turn(make_signal(0.35f, 0.65f));
    assert(near(first.pace, 1.1f));
    assert(first.pause_ms == 120);

    // Seeds land once
    auto second = p.run_turn(make_signal(0.35f, 0.65f));
    assert(near(second.pace, 1.0f));
    assert(second.pause_ms == 80);

    std::cout << "  PASS" << std::endl;
}

void test_session_log() {
    std::cout << "Testing SessionLog..." << std::endl;

    Config cfg;
    cfg.compassion = false;
    cfg.silence = false;
    Pipeline p = Pipeline::from_config(cfg);

    Signal s = make_signal(0.6f, 0.4f, Tone::Energetic);
    s.text = "hello \"liminal\"";
    auto adj = p.run_turn(s);

    json rec = turn_record(0, s, adj, GuardAction{}, p, 1700000000123LL);
    assert(rec["ts"] == "2023-11-14T22:13:20.123Z");
    assert(rec["utt"] == "hello \"liminal\"");
    assert(rec["tone"] == "Energetic");
    assert(rec.contains("state"));
    assert(rec.contains("ema_drift"));
    assert(rec.contains("sync"));
    assert(rec.contains("meta_doubt"));
    assert(rec["state_hold"] == 0);
    assert(rec["meta_observation_count"] == 1);
    assert(!rec.contains("guard"));
    const char* layer_keys[] = {
        "compassion_level", "compassion_healing", "compassion_streak",
        "silence_type", "silence_total_time", "silence_max_duration", "silence_avg_quality"
    };
    for (const char* key : layer_keys) assert(!rec.contains(key));

    // Every layer on: each one reports its counters
    Pipeline all = Pipeline::from_config(Config{});
    all.run_turn(make_signal(0.2f, 0.8f, Tone::Calm));
    Signal quiet = make_signal(0.2f, 0.8f, Tone::Calm, 4.0f);
    auto quiet_adj = all.run_turn(quiet);
    json full = turn_record(1, quiet, quiet_adj, GuardAction{}, all);
    assert(full["state_hold"] == 2);
    assert(full["meta_observation_count"] == 2);
    for (const char* key : layer_keys) assert(full.contains(key));
    assert(full["compassion_streak"] == 0);
    assert(full["silence_max_duration"] == 4.0f);
    assert(full["silence_total_time"] == 0.0f);

    // Stabilizer and awareness off
    Config lean_cfg;
    lean_cfg.stabilizer = false;
    lean_cfg.awareness = false;
    Pipeline lean = Pipeline::from_config(lean_cfg);
    auto lean_adj = lean.run_turn(s);
    json lean_rec = turn_record(0, s, lean_adj, GuardAction{}, lean);
    assert(!lean_rec.contains("state"));
    assert(!lean_rec.contains("state_hold"));
    assert(!lean_rec.contains("meta_observation_count"));
    assert(lean_rec.contains("compassion_healing"));
    assert(lean_rec.contains("silence_avg_quality"));

    GuardAction warn = check_guard(s.text, 0.5f, 0.7f);
    json rec2 = turn_record(1, s, adj, warn, p);
    assert(rec2["guard"] == "warn");

    std::system("rm -rf /tmp/liminal_test_session");
    SessionLog log;
    assert(log.open("/tmp/liminal_test_session", "t1"));
    assert(log.path() == "/tmp/liminal_test_session/session-t1.jsonl");
    assert(log.write(rec));
    assert(log.write(rec2));
    log.close();
    assert(!log.write(rec));
    assert(log.records() == 2);

    std::ifstream in("/tmp/liminal_test_session/session-t1.jsonl");
    std::string line;
    size_t n = 0;
    while (std::getline(in, line)) {
        json parsed = json::parse(line);
        assert(parsed["idx"] == n);
        n++;
    }
    assert(n == 2);

    std::cout << "  PASS" << std::endl;
}

void test_dialog_script() {
    std::cout << "Testing dialog script..." << std::endl;

    Config cfg;
    cfg.script = "a; b ;B ;";
    auto turns = load_turns(cfg);
    assert(turns.size() == 5);
    assert(turns[0].text == "a");
    assert(turns[1].text == "b");
    assert(!turns[1].repeated_theme);
    assert(turns[2].repeated_theme);
    assert(turns[3].text == DEFAULT_UTTERANCE);
    assert(!turns[3].repeated_theme);
    assert(turns[4].repeated_theme);

    // Same text, same signal
    Signal x = signal_from_text("steady", 1.0f, 80);
    Signal y = signal_from_text("steady", 1.0f, 80);
    assert(x.drift == y.drift && x.resonance == y.resonance);
    assert(in01(x.drift) && in01(x.resonance));
    assert(x.tone == Tone::Calm);
    assert(near(x.tempo_wpm, 82.5f, 0.01f));

    Config defaults;
    defaults.cycles = 3;
    auto plain = load_turns(defaults);
    assert(plain.size() == 3);
    assert(plain[2].text == DEFAULT_UTTERANCE);

    std::cout << "  PASS" << std::endl;
}

void test_dialog_inputs_file() {
    std::cout << "Testing dialog inputs file..." << std::endl;

    std::system("rm -f /tmp/liminal_test_inputs.jsonl");
    {
        std::ofstream out("/tmp/liminal_test_inputs.jsonl");
        out << "\"first\"\n"
            << R"({"text":"second","drift":0.7,"resonance":0.3,"tone":"energetic","silence_s":2.5})" << "\n"
            << "not json\n"
            << "\n"
            << R"({"text":"third","tempo":"fast"})" << "\n"
            << "[1, 2]\n";
    }

    Config cfg;
    cfg.cycles = 1;
    cfg.inputs_path = "/tmp/liminal_test_inputs.jsonl";
    auto turns = load_turns(cfg);
    assert(turns.size() == 2);
    assert(turns[0].text == "first");
    assert(turns[1].text == "second");
    assert(near(turns[1].drift, 0.7f));
    assert(near(turns[1].resonance, 0.3f));
    assert(turns[1].tone == Tone::Energetic);
    assert(near(turns[1].silence_s, 2.5f));
    assert(!turns[1].repeated_theme);

    // Missing file falls through to the script
    cfg.inputs_path = "/tmp/liminal_test_missing.jsonl";
    cfg.script = "only";
    auto fallback = load_turns(cfg);
    assert(fallback.size() == 1);
    assert(fallback[0].text == "only");

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Liminal C++ Tests ===" << std::endl;
    std::cout << std::endl;

    test_adversarial_clamping();
    test_stabilizer_progression();
    test_stabilizer_cooldown_settles();
    test_stabilizer_no_direct_overheat();
    test_sync_bounds();
    test_sync_slow_increments();
    test_meta_doubt();
    test_meta_clarity();
    test_compassion_scenario();
    test_compassion_streak_and_episodes();
    test_silence_short();
    test_silence_classification();
    test_silence_reset_idempotent();
    test_silence_episode_keeps_longest();

    std::cout << std::endl;
    std::cout << "=== Outer layers ===" << std::endl;
    test_guard();
    test_alerts();
    test_config_options();
    test_config_sources();
    test_pipeline_layers();
    test_pipeline_bounds();
    test_pipeline_rephrase_feeds_kindness();
    test_pipeline_silence();
    test_pipeline_seeds();
    test_session_log();
    test_dialog_script();
    test_dialog_inputs_file();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
