#pragma once
// Dialog: the scripted turns that stand in for a live conversation
//
// Sources, first non-empty wins:
//   --inputs FILE   JSONL, one turn per line (string or object)
//   --script "a;b"  semicolon separated utterances
//   cycles × "hello liminal"
// Any signal field a line leaves out is derived from the text itself,
// so the same script always produces the same run.

#include "config.hpp"
#include "guard.hpp"
#include "log.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace liminal {

constexpr const char* DEFAULT_UTTERANCE = "hello liminal";

struct Prosody {
    float wpm = 0.0f;
    float articulation = 0.0f;
    Tone tone = Tone::Neutral;
};

// Simulated prosody of the voice at a given pace and pause
inline Prosody analyze_prosody(float pace_factor, float pause_ms) {
    Prosody p;
    float pause = std::max(pause_ms, 20.0f);
    float raw = (150.0f * pace_factor * (40.0f / pause)) / 200.0f;
    p.wpm = clamp01(raw) * 220.0f;
    p.articulation = clamp01((0.85f / std::max(pace_factor, 0.1f)) * (pause / 80.0f));
    if (p.wpm < 120.0f) {
        p.tone = Tone::Calm;
    } else if (p.wpm > 180.0f) {
        p.tone = Tone::Energetic;
    } else {
        p.tone = Tone::Neutral;
    }
    return p;
}

inline std::string normalize_text(const std::string& text) {
    std::string t = trim(text);
    std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return t;
}

// Deterministic signal for an utterance
inline Signal signal_from_text(const std::string& text, float pace_factor, int64_t pause_ms) {
    Signal s;
    s.text = text;

    auto [drift, res] = hash01(text);
    Prosody p = analyze_prosody(pace_factor, static_cast<float>(pause_ms));
    switch (p.tone) {
        case Tone::Calm:
            res += 0.02f;
            break;
        case Tone::Energetic:
            res -= 0.01f;
            drift += 0.02f;
            break;
        case Tone::Neutral:
            break;
    }

    s.drift = clamp01(drift);
    s.resonance = clamp01(res);
    s.tone = p.tone;
    s.tempo_wpm = std::max(p.wpm, 1.0f);
    s.pause_ms = static_cast<float>(pause_ms);
    return s;
}

// One JSONL line -> Signal. Explicit fields override derived ones.
inline std::optional<Signal> parse_turn(const std::string& line, float pace_factor,
                                        int64_t pause_ms) {
    using json = nlohmann::json;
    try {
        json doc = json::parse(line);
        if (doc.is_string()) {
            return signal_from_text(doc.get<std::string>(), pace_factor, pause_ms);
        }
        if (!doc.is_object()) {
            log_warn("dialog", "turn must be a string or an object");
            return std::nullopt;
        }

        Signal s = signal_from_text(doc.value("text", std::string(DEFAULT_UTTERANCE)),
                                    pace_factor, pause_ms);
        s.drift = doc.value("drift", s.drift);
        s.resonance = doc.value("resonance", s.resonance);
        s.tempo_wpm = doc.value("tempo", s.tempo_wpm);
        s.pause_ms = doc.value("pause_ms", s.pause_ms);
        s.silence_s = doc.value("silence_s", s.silence_s);
        s.repeated_theme = doc.value("repeated_theme", false);
        if (doc.contains("tone")) {
            Tone tone;
            if (tone_from_string(doc["tone"].get<std::string>(), tone)) {
                s.tone = tone;
            } else {
                log_warn("dialog", "unknown tone %s, keeping %s",
                         doc["tone"].dump().c_str(), to_string(s.tone));
            }
        }
        return s;
    } catch (const nlohmann::json::parse_error& e) {
        log_warn("dialog", "skipping malformed turn: %s", e.what());
    } catch (const nlohmann::json::type_error& e) {
        log_warn("dialog", "skipping turn with bad field type: %s", e.what());
    }
    return std::nullopt;
}

// Repeated theme: same normalized text as the turn before
inline void mark_repeated_themes(std::vector<Signal>& turns) {
    for (size_t i = 1; i < turns.size(); ++i) {
        if (!turns[i].repeated_theme
            && normalize_text(turns[i].text) == normalize_text(turns[i - 1].text)) {
            turns[i].repeated_theme = true;
        }
    }
}

inline std::vector<Signal> load_turns_file(const std::string& path, float pace_factor,
                                           int64_t pause_ms) {
    std::vector<Signal> turns;
    std::ifstream in(path);
    if (!in) {
        log_error("dialog", "failed to read inputs file '%s'", path.c_str());
        return turns;
    }
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (trim(line).empty()) continue;
        if (auto s = parse_turn(line, pace_factor, pause_ms)) {
            turns.push_back(std::move(*s));
        } else {
            log_debug("dialog", "line %zu skipped", line_no);
        }
    }
    return turns;
}

inline std::vector<Signal> load_turns(const Config& cfg) {
    std::vector<Signal> turns;

    if (!cfg.inputs_path.empty()) {
        turns = load_turns_file(cfg.inputs_path, cfg.base_pace, cfg.base_pause_ms);
    }

    if (turns.empty() && !cfg.script.empty()) {
        size_t start = 0;
        while (start <= cfg.script.size()) {
            size_t end = cfg.script.find(';', start);
            if (end == std::string::npos) end = cfg.script.size();
            std::string part = trim(cfg.script.substr(start, end - start));
            if (!part.empty()) {
                turns.push_back(signal_from_text(part, cfg.base_pace, cfg.base_pause_ms));
            }
            start = end + 1;
        }
    }

    // Pad to the requested number of cycles
    size_t cycles = std::max<size_t>(cfg.cycles, 1);
    while (turns.size() < cycles) {
        turns.push_back(signal_from_text(DEFAULT_UTTERANCE, cfg.base_pace, cfg.base_pause_ms));
    }

    mark_repeated_themes(turns);
    return turns;
}

} // namespace liminal
