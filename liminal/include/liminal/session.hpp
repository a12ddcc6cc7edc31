#pragma once
// Session log: one JSON object per turn
//
//   <log_dir>/session-<id>.jsonl
//
// Each record carries the measured signal, the merged output and the
// state of every enabled layer. A disabled layer contributes no fields.

#include "guard.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace liminal {

namespace fs = std::filesystem;

inline std::string format_rfc3339(Timestamp ts) {
    time_t time = static_cast<time_t>(ts / 1000);
    struct tm tm_info;
    gmtime_r(&time, &tm_info);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_info);
    char out[48];
    snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ts % 1000));
    return out;
}

// Millisecond clock in hex, enough to keep runs apart
inline std::string generate_session_id(Timestamp ts = now()) {
    char buf[24];
    snprintf(buf, sizeof(buf), "%llx", static_cast<unsigned long long>(ts));
    return buf;
}

// Build the record for one turn
inline nlohmann::json turn_record(size_t idx, const Signal& signal, const Adjustments& adj,
                                  const GuardAction& guard, const Pipeline& pipeline,
                                  Timestamp ts = now()) {
    nlohmann::json rec = {
        {"ts", format_rfc3339(ts)},
        {"idx", idx},
        {"utt", signal.text},
        {"drift", adj.drift},
        {"resonance", adj.resonance},
        {"tempo", signal.tempo_wpm},
        {"tone", to_string(signal.tone)},
        {"pace", adj.pace},
        {"pause_ms", adj.pause_ms}
    };
    if (guard.kind != GuardAction::Kind::None) {
        rec["guard"] = guard.label();
    }

    if (const auto* stab = pipeline.stabilizer()) {
        rec["state"] = to_string(stab->state());
        rec["ema_drift"] = stab->ema_drift();
        rec["ema_res"] = stab->ema_res();
        rec["state_hold"] = stab->steps_in_state();
    }

    if (adj.sync) {
        rec["sync"] = {
            {"pace_delta", adj.sync->pace_delta},
            {"pause_delta_ms", adj.sync->pause_delta_ms},
            {"resonance_boost", adj.sync->resonance_boost},
            {"drift_reduction", adj.sync->drift_reduction}
        };
    }

    if (const auto* meta = pipeline.meta()) {
        rec["meta_self_state"] = meta->self_state();
        rec["meta_confidence"] = meta->confidence;
        rec["meta_clarity"] = meta->clarity;
        rec["meta_doubt"] = meta->doubt;
        rec["meta_self_drift"] = meta->self_drift;
        rec["meta_self_resonance"] = meta->self_resonance;
        rec["meta_observation_count"] = meta->observation_count;
    }

    if (const auto* comp = pipeline.compassion()) {
        rec["compassion_suffering"] = comp->user_suffering;
        rec["compassion_type"] = to_string(comp->suffering_type);
        rec["compassion_kindness"] = comp->response_kindness;
        rec["compassion_healing"] = comp->healing_intent;
        rec["compassion_level"] = comp->compassion_level;
        rec["compassion_count"] = comp->suffering_count;
        rec["compassion_streak"] = comp->suffering_streak;
        rec["compassion_active"] = adj.compassion.has_value();
    }

    if (const auto* sil = pipeline.silence()) {
        rec["silence_type"] = to_string(sil->silence_type);
        rec["silence_duration"] = sil->current_silence_duration;
        rec["silence_quality"] = sil->silence_quality;
        rec["silence_generative"] = sil->is_generative;
        rec["silence_interrupt"] = sil->should_interrupt;
        rec["silence_count"] = sil->silence_count;
        rec["silence_total_time"] = sil->total_silence_time;
        rec["silence_max_duration"] = sil->max_silence_duration;
        rec["silence_avg_quality"] = sil->avg_silence_quality;
    }

    return rec;
}

class SessionLog {
public:
    SessionLog() = default;
    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    // Creates log_dir if needed. False (and logged) on failure.
    bool open(const std::string& log_dir, const std::string& id = generate_session_id()) {
        std::error_code ec;
        fs::create_directories(log_dir, ec);
        if (ec) {
            log_error("session", "cannot create %s: %s", log_dir.c_str(), ec.message().c_str());
            return false;
        }

        path_ = (fs::path(log_dir) / ("session-" + id + ".jsonl")).string();
        out_.open(path_, std::ios::out | std::ios::app);
        if (!out_) {
            log_error("session", "cannot open %s", path_.c_str());
            path_.clear();
            return false;
        }
        log_debug("session", "logging to %s", path_.c_str());
        return true;
    }

    bool is_open() const { return out_.is_open(); }
    const std::string& path() const { return path_; }
    size_t records() const { return records_; }

    bool write(const nlohmann::json& record) {
        if (!out_.is_open()) return false;
        out_ << record.dump() << '\n';
        out_.flush();
        if (!out_) {
            log_error("session", "write failed on %s", path_.c_str());
            return false;
        }
        records_++;
        return true;
    }

    void close() {
        if (out_.is_open()) out_.close();
    }

private:
    std::string path_;
    std::ofstream out_;
    size_t records_ = 0;
};

} // namespace liminal
