#pragma once
// Config: run settings from defaults, environment, file and flags
//
// Every setting has one key ("stab_alpha"). The same key is reachable as
//   LIMINAL_STAB_ALPHA   (environment)
//   "stab_alpha": 0.4    (JSON config file)
//   --stab-alpha 0.4     (command line)
// Later sources win. A malformed value is reported and ignored, so the
// previous value (ultimately the default) stays in effect.

#include "log.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace liminal {

using json = nlohmann::json;

struct Config {
    // Run shape
    size_t cycles = 5;
    std::string script;
    std::string inputs_path;
    bool verbose = false;
    bool show_status = true;

    // Voice profile the adjustments are applied to
    float base_pace = 1.0f;
    int64_t base_pause_ms = 80;

    // Session log
    bool enable_logging = false;
    std::string log_dir = "logs";

    // Baselines and health alerts
    float baseline_drift = 0.35f;
    float baseline_res = 0.65f;
    bool alarm = true;
    bool strict = false;

    // Soft guard
    bool guard = true;
    float guard_drift = 0.40f;
    float guard_res = 0.60f;

    // Stabilizer
    bool stabilizer = true;
    float stab_alpha = 0.4f;
    float stab_warm = 0.32f;
    float stab_hot = 0.42f;
    float stab_low_res = 0.58f;
    uint32_t stab_cool = 3;
    float stab_calm = 0.08f;

    // Neural sync
    bool sync = true;
    float sync_lr_fast = 0.15f;
    float sync_lr_slow = 0.05f;
    float sync_step = 0.02f;

    // Carried-over hints for the first turn (device pace/pause, warmth)
    float seed_pace = 0.0f;
    int64_t seed_pause_ms = 0;
    float seed_res = 0.0f;
    float seed_drift = 0.0f;

    // Meta-cognition
    bool awareness = true;
    float meta_alpha = 0.3f;

    // Compassion
    bool compassion = true;

    // Silence
    bool silence = true;
    float silence_min_s = 1.5f;
};

namespace config_detail {

inline std::string trim_copy(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

inline bool parse_float(const std::string& v, float& out) {
    try {
        size_t used = 0;
        float f = std::stof(v, &used);
        if (used != v.size() || !std::isfinite(f)) return false;
        out = f;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

inline bool parse_u64(const std::string& v, uint64_t& out) {
    if (v.empty() || v[0] == '-') return false;
    try {
        size_t used = 0;
        unsigned long long n = std::stoull(v, &used);
        if (used != v.size()) return false;
        out = n;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

inline bool parse_i64(const std::string& v, int64_t& out) {
    try {
        size_t used = 0;
        long long n = std::stoll(v, &used);
        if (used != v.size()) return false;
        out = n;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

inline bool parse_bool(const std::string& v, bool& out) {
    std::string s = v;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
    if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
    return false;
}

using Setter = std::function<bool(Config&, const std::string&)>;

inline Setter float_field(float Config::*field) {
    return [field](Config& c, const std::string& v) { return parse_float(v, c.*field); };
}

inline Setter bool_field(bool Config::*field) {
    return [field](Config& c, const std::string& v) { return parse_bool(v, c.*field); };
}

inline Setter string_field(std::string Config::*field) {
    return [field](Config& c, const std::string& v) {
        if (trim_copy(v).empty()) return false;
        c.*field = v;
        return true;
    };
}

inline const std::unordered_map<std::string, Setter>& setters() {
    static const std::unordered_map<std::string, Setter> table = {
        {"cycles", [](Config& c, const std::string& v) {
            uint64_t n = 0;
            if (!parse_u64(v, n) || n == 0) return false;
            c.cycles = static_cast<size_t>(n);
            return true;
        }},
        {"script", string_field(&Config::script)},
        {"inputs", string_field(&Config::inputs_path)},
        {"verbose", bool_field(&Config::verbose)},
        {"status", bool_field(&Config::show_status)},
        {"base_pace", float_field(&Config::base_pace)},
        {"base_pause_ms", [](Config& c, const std::string& v) {
            uint64_t n = 0;
            if (!parse_u64(v, n)) return false;
            c.base_pause_ms = static_cast<int64_t>(n);
            return true;
        }},
        {"log", bool_field(&Config::enable_logging)},
        {"log_dir", string_field(&Config::log_dir)},
        {"baseline_drift", float_field(&Config::baseline_drift)},
        {"baseline_res", float_field(&Config::baseline_res)},
        {"alarm", bool_field(&Config::alarm)},
        {"strict", bool_field(&Config::strict)},
        {"guard", bool_field(&Config::guard)},
        {"guard_drift", float_field(&Config::guard_drift)},
        {"guard_res", float_field(&Config::guard_res)},
        {"stabilizer", bool_field(&Config::stabilizer)},
        {"stab_alpha", float_field(&Config::stab_alpha)},
        {"stab_warm", float_field(&Config::stab_warm)},
        {"stab_hot", float_field(&Config::stab_hot)},
        {"stab_lowres", float_field(&Config::stab_low_res)},
        {"stab_cool", [](Config& c, const std::string& v) {
            uint64_t n = 0;
            if (!parse_u64(v, n) || n == 0) return false;
            c.stab_cool = static_cast<uint32_t>(n);
            return true;
        }},
        {"stab_calm", float_field(&Config::stab_calm)},
        {"sync", bool_field(&Config::sync)},
        {"sync_lr_fast", float_field(&Config::sync_lr_fast)},
        {"sync_lr_slow", float_field(&Config::sync_lr_slow)},
        {"sync_step", float_field(&Config::sync_step)},
        {"seed_pace", float_field(&Config::seed_pace)},
        {"seed_pause_ms", [](Config& c, const std::string& v) {
            return parse_i64(v, c.seed_pause_ms);
        }},
        {"seed_res", float_field(&Config::seed_res)},
        {"seed_drift", float_field(&Config::seed_drift)},
        {"awareness", bool_field(&Config::awareness)},
        {"meta_alpha", float_field(&Config::meta_alpha)},
        {"compassion", bool_field(&Config::compassion)},
        {"silence", bool_field(&Config::silence)},
        {"silence_min_s", float_field(&Config::silence_min_s)},
    };
    return table;
}

} // namespace config_detail

// All keys a config source may set
inline std::vector<std::string> config_keys() {
    std::vector<std::string> keys;
    for (const auto& [key, setter] : config_detail::setters()) keys.push_back(key);
    std::sort(keys.begin(), keys.end());
    return keys;
}

inline bool is_config_key(const std::string& key) {
    return config_detail::setters().count(key) > 0;
}

// Apply one key=value. Unknown keys and malformed values are logged and
// leave the config untouched.
inline bool set_option(Config& config, const std::string& key, const std::string& value,
                       const char* source = "config") {
    const auto& table = config_detail::setters();
    auto it = table.find(key);
    if (it == table.end()) {
        log_warn(source, "unknown setting '%s'", key.c_str());
        return false;
    }
    if (!it->second(config, value)) {
        log_warn(source, "ignoring malformed value '%s' for '%s'", value.c_str(), key.c_str());
        return false;
    }
    return true;
}

// "stab_alpha" -> "LIMINAL_STAB_ALPHA"
inline std::string env_name(const std::string& key) {
    std::string name = "LIMINAL_";
    for (char c : key) {
        name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

inline void apply_env(Config& config) {
    for (const auto& [key, setter] : config_detail::setters()) {
        if (const char* v = std::getenv(env_name(key).c_str())) {
            set_option(config, key, v, "env");
        }
    }
}

inline size_t apply_json(Config& config, const json& doc) {
    if (!doc.is_object()) {
        log_error("config", "config file must hold a JSON object");
        return 0;
    }
    size_t applied = 0;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const json& v = it.value();
        std::string text;
        if (v.is_string()) {
            text = v.get<std::string>();
        } else if (v.is_boolean()) {
            text = v.get<bool>() ? "true" : "false";
        } else if (v.is_number()) {
            text = v.dump();
        } else {
            log_warn("config", "ignoring non-scalar value for '%s'", it.key().c_str());
            continue;
        }
        if (set_option(config, it.key(), text, "config")) applied++;
    }
    return applied;
}

// Unreadable or unparsable files are reported and skipped
inline bool load_config_file(Config& config, const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        log_error("config", "cannot open config file %s", path.c_str());
        return false;
    }
    try {
        json doc = json::parse(in);
        size_t n = apply_json(config, doc);
        log_debug("config", "applied %zu settings from %s", n, path.c_str());
        return true;
    } catch (const json::parse_error& e) {
        log_error("config", "cannot parse %s: %s", path.c_str(), e.what());
        return false;
    }
}

inline json config_to_json(const Config& c) {
    return {
        {"cycles", c.cycles},
        {"base_pace", c.base_pace},
        {"base_pause_ms", c.base_pause_ms},
        {"baseline_drift", c.baseline_drift},
        {"baseline_res", c.baseline_res},
        {"stabilizer", c.stabilizer},
        {"sync", c.sync},
        {"awareness", c.awareness},
        {"compassion", c.compassion},
        {"silence", c.silence},
        {"guard", c.guard},
        {"alarm", c.alarm},
        {"strict", c.strict}
    };
}

} // namespace liminal
